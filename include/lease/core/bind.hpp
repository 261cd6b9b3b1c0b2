#pragma once

#include "construct.hpp"
#include "detail.hpp"
#include "factory.hpp"
#include "handle.hpp"
#include <lease/effect/concepts.hpp>
#include <lease/effect/outcome.hpp>
#include <lease/log/macros.hpp>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace lease {

namespace detail {

/// Release of a sequential composite: inner (second acquired) first, then
/// outer. With an error channel both always run and the outer failure wins.
template<typename E>
release_function<E> chain_releases(release_function<E> inner, release_function<E> outer) {
    if constexpr (effect::error_effect<E>) {
        return [inner = std::move(inner), outer = std::move(outer)] {
            auto inner_released = attempt<E, unit>(run_release<E>(inner));
            return E::flat_map(std::move(inner_released), [outer](effect::outcome<unit> inner_result) {
                auto outer_released = attempt<E, unit>(run_release<E>(outer));
                return E::flat_map(std::move(outer_released),
                    [inner_result = std::move(inner_result)](effect::outcome<unit> outer_result) {
                        return surface_releases<E>(std::move(outer_result), std::move(inner_result));
                    });
            });
        };
    } else {
        return [inner = std::move(inner), outer = std::move(outer)] {
            return E::flat_map(run_release<E>(inner), [outer](unit) { return run_release<E>(outer); });
        };
    }
}

} // namespace detail

/// Sequential composition.
///
/// Acquires `fa`, derives the next factory from its value with `f`, acquires
/// that, and yields a handle on the second value whose release runs the
/// second release and then the first.
///
/// Over an effect with an error channel, a failure after `fa` was acquired
/// (including `f` throwing) releases `fa` before propagating; if that release
/// fails, its failure is the one propagated. Without an error channel
/// failures escape natively and nothing is released.
template<typename E, typename A, typename F>
std::invoke_result_t<F&, A> bind(const factory<E, A>& fa, F f) {
    using result_factory = std::invoke_result_t<F&, A>;
    static_assert(is_factory_v<result_factory>, "bind continuation must return a lease::factory");
    using B = typename result_factory::value_type;
    using handle_a = handle<E, A>;
    using handle_b = handle<E, B>;
    using acquisition_b = typename result_factory::acquisition_type;

    // One continuation per factory: a mutable f keeps its state across acquisitions
    return result_factory([fa, f = std::make_shared<F>(std::move(f))] {
        if constexpr (effect::error_effect<E>) {
            return E::flat_map(fa.acquire(), [f](handle_a a) -> acquisition_b {
                auto release_a = std::move(a.release);
                auto next = detail::invoke_guarded<E, handle_b>([&] { return (*f)(std::move(a.value)).acquire(); });
                return E::flat_map(detail::attempt<E, handle_b>(std::move(next)),
                    [release_a](effect::outcome<handle_b> b) -> acquisition_b {
                        if (!b) {
                            LEASE_LOG_DEBUG("acquisition failed while holding a resource, releasing it: {}",
                                            log::describe(b.error()));
                            return detail::release_then_raise<E, handle_b>(release_a, b.error());
                        }
                        handle_b acquired = std::move(b).get();
                        return E::pure(handle_b{
                            std::move(acquired.value),
                            detail::chain_releases<E>(std::move(acquired.release), release_a)});
                    });
            });
        } else {
            return E::flat_map(fa.acquire(), [f](handle_a a) -> acquisition_b {
                auto release_a = std::move(a.release);
                return detail::fmap<E, handle_b>((*f)(std::move(a.value)).acquire(), [release_a](handle_b b) {
                    return handle_b{
                        std::move(b.value),
                        detail::chain_releases<E>(std::move(b.release), release_a)};
                });
            });
        }
    });
}

/// Transform the value of a factory. The release is the original one.
///
/// Equivalent to `bind(fa, a -> pure(f(a)))`: with an error channel, `f`
/// throwing releases the resource and propagates.
template<typename E, typename A, typename F>
factory<E, std::decay_t<std::invoke_result_t<F&, A>>> map(const factory<E, A>& fa, F f) {
    using B = std::decay_t<std::invoke_result_t<F&, A>>;
    using handle_a = handle<E, A>;
    using handle_b = handle<E, B>;

    return factory<E, B>([fa, f = std::make_shared<F>(std::move(f))] {
        if constexpr (effect::error_effect<E>) {
            return E::flat_map(fa.acquire(), [f](handle_a a) -> typename E::template type<handle_b> {
                auto release = std::move(a.release);
                auto mapped = effect::outcome<B>::capture([&] { return B((*f)(std::move(a.value))); });
                if (!mapped) {
                    return detail::release_then_raise<E, handle_b>(std::move(release), mapped.error());
                }
                return E::pure(handle_b{std::move(mapped).get(), std::move(release)});
            });
        } else {
            return detail::fmap<E, handle_a>(fa.acquire(), [f](handle_a a) {
                B mapped = (*f)(std::move(a.value));
                return handle_b{std::move(mapped), std::move(a.release)};
            });
        }
    });
}

/// Acquire every factory in order; release in reverse order.
/// The value is the list of values, in acquisition order.
template<typename E, typename T>
factory<E, std::vector<T>> sequence(std::vector<factory<E, T>> factories) {
    factory<E, std::vector<T>> acc = pure<E>(std::vector<T>{});
    for (auto& next : factories) {
        // qualified: std::bind is reachable through ADL on std::vector
        acc = lease::bind(acc, [next](std::vector<T> values) {
            return lease::map(next, [values](T value) {
                auto appended = values;
                appended.push_back(std::move(value));
                return appended;
            });
        });
    }
    return acc;
}

} // namespace lease
