#pragma once

#include "detail.hpp"
#include "factory.hpp"
#include "handle.hpp"
#include <lease/effect/concepts.hpp>
#include <lease/effect/outcome.hpp>
#include <lease/log/macros.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace lease {

namespace detail {

/// Release of an independent composite: both releases combined with E::map2.
/// With an error channel both are always attempted and the left failure wins.
template<typename E>
release_function<E> join_releases(release_function<E> left, release_function<E> right) {
    if constexpr (effect::error_effect<E>) {
        return [left = std::move(left), right = std::move(right)] {
            using captured = effect::outcome<unit>;
            auto both = E::map2(attempt<E, unit>(run_release<E>(left)),
                                attempt<E, unit>(run_release<E>(right)),
                                [](captured l, captured r) { return std::make_pair(std::move(l), std::move(r)); });
            return E::flat_map(std::move(both), [](std::pair<captured, captured> released) {
                return surface_releases<E>(std::move(released.first), std::move(released.second));
            });
        };
    } else {
        return [left = std::move(left), right = std::move(right)] {
            return E::map2(run_release<E>(left), run_release<E>(right), [](unit, unit) { return unit{}; });
        };
    }
}

} // namespace detail

/// Independent composition.
///
/// Acquires `fa` and `fb` through E::map2, which may run them concurrently,
/// and combines their values with `combine`. The composite release runs both
/// releases through E::map2 as well, in no particular order.
///
/// Over an effect with an error channel, when one side fails the other side's
/// handle is released before the failure surfaces. The left operand's
/// failure wins when both fail, for acquisition and for release alike.
template<typename E, typename A, typename B, typename F>
factory<E, std::decay_t<std::invoke_result_t<F&, A, B>>> ap(const factory<E, A>& fa, const factory<E, B>& fb, F combine) {
    using C = std::decay_t<std::invoke_result_t<F&, A, B>>;
    using handle_a = handle<E, A>;
    using handle_b = handle<E, B>;
    using handle_c = handle<E, C>;
    using acquisition_c = typename E::template type<handle_c>;

    return factory<E, C>([fa, fb, combine = std::make_shared<F>(std::move(combine))]() -> acquisition_c {
        if constexpr (effect::error_effect<E>) {
            using captured_a = effect::outcome<handle_a>;
            using captured_b = effect::outcome<handle_b>;

            auto both = E::map2(
                detail::attempt<E, handle_a>(fa.acquire()),
                detail::attempt<E, handle_b>(fb.acquire()),
                [](captured_a a, captured_b b) { return std::make_pair(std::move(a), std::move(b)); });

            return E::flat_map(std::move(both),
                [combine](std::pair<captured_a, captured_b> acquired) -> acquisition_c {
                    auto& [a, b] = acquired;
                    if (!a && !b) {
                        LEASE_LOG_WARNING("both independent acquisitions failed; dropping: {}",
                                          log::describe(b.error()));
                        return E::template raise<handle_c>(a.error());
                    }
                    if (!a) {
                        return detail::release_then_raise<E, handle_c>(b.get().release, a.error());
                    }
                    if (!b) {
                        return detail::release_then_raise<E, handle_c>(a.get().release, b.error());
                    }

                    handle_a left = std::move(a).get();
                    handle_b right = std::move(b).get();
                    auto release = detail::join_releases<E>(std::move(left.release), std::move(right.release));
                    auto combined = effect::outcome<C>::capture(
                        [&] { return C((*combine)(std::move(left.value), std::move(right.value))); });
                    if (!combined) {
                        return detail::release_then_raise<E, handle_c>(std::move(release), combined.error());
                    }
                    return E::pure(handle_c{std::move(combined).get(), std::move(release)});
                });
        } else {
            return E::map2(fa.acquire(), fb.acquire(), [combine](handle_a a, handle_b b) {
                C combined = (*combine)(std::move(a.value), std::move(b.value));
                return handle_c{
                    std::move(combined),
                    detail::join_releases<E>(std::move(a.release), std::move(b.release))};
            });
        }
    });
}

/// Independent composition keeping both values
template<typename E, typename A, typename B>
factory<E, std::pair<A, B>> zip(const factory<E, A>& fa, const factory<E, B>& fb) {
    return lease::ap(fa, fb, [](A a, B b) { return std::pair<A, B>(std::move(a), std::move(b)); });
}

} // namespace lease
