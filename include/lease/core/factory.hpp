#pragma once

#include "detail.hpp"
#include "handle.hpp"
#include <lease/effect/concepts.hpp>
#include <lease/effect/outcome.hpp>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace lease {

template<effect::host_effect E, typename T>
class factory;

template<typename E, typename A, typename F>
std::invoke_result_t<F&, A> bind(const factory<E, A>& fa, F f);

template<typename E, typename A, typename F>
factory<E, std::decay_t<std::invoke_result_t<F&, A>>> map(const factory<E, A>& fa, F f);

template<typename>
struct is_factory : std::false_type {};

template<typename E, typename T>
struct is_factory<factory<E, T>> : std::true_type {};

template<typename F>
inline constexpr bool is_factory_v = is_factory<std::remove_cvref_t<F>>::value;

/// A reusable description of how to acquire a resource in host effect E.
///
/// Nothing happens until acquire() (or run()/use()) is called, and every call
/// performs a fresh acquisition. Copies share the same description, including
/// any state a mutable acquire function keeps between acquisitions.
template<effect::host_effect E, typename T>
class factory {
public:
    using effect_type = E;
    using value_type = T;
    using handle_type = handle<E, T>;
    using acquisition_type = typename E::template type<handle_type>;
    using acquire_function = std::function<acquisition_type()>;

    explicit factory(acquire_function acquire)
        : acquire_(std::make_shared<acquire_function>(std::move(acquire))) {}

    /// Acquire the resource. The caller owns the resulting handle.
    ///
    /// The computation holds a reference to the acquire function and may
    /// therefore outlive this factory.
    [[nodiscard]] acquisition_type acquire() const {
        return detail::invoke_retained<E, handle_type>([shared = acquire_] { return (*shared)(); });
    }

    /// Acquire, release, and yield the value
    [[nodiscard]] typename E::template type<T> run() const {
        return use([](T value) { return E::pure(std::move(value)); });
    }

    /// Acquire, run `f` on the value, release once f's computation is done,
    /// and yield f's result.
    ///
    /// With an error channel the release also runs when f fails, and a
    /// failing release takes precedence over f's failure.
    template<typename F>
    [[nodiscard]] std::invoke_result_t<F&, T> use(F f) const {
        using result_type = std::invoke_result_t<F&, T>;
        using U = typename E::template value_of<result_type>;

        return E::flat_map(acquire(), [f = std::move(f)](handle_type acquired) mutable -> result_type {
            auto release = std::move(acquired.release);

            if constexpr (effect::error_effect<E>) {
                auto body = detail::invoke_guarded<E, U>([&] { return f(std::move(acquired.value)); });
                return E::flat_map(detail::attempt<E, U>(std::move(body)),
                    [release](effect::outcome<U> result) mutable -> result_type {
                        auto released = detail::attempt<E, unit>(detail::run_release<E>(release));
                        return E::flat_map(std::move(released),
                            [result = std::move(result)](effect::outcome<unit> r) mutable -> result_type {
                                if (!r) {
                                    if (!result) {
                                        LEASE_LOG_WARNING("release failed after use failed; dropping: {}",
                                                          log::describe(result.error()));
                                    }
                                    return E::template raise<U>(r.error());
                                }
                                return detail::settle<E, U>(std::move(result));
                            });
                    });
            } else {
                return E::flat_map(f(std::move(acquired.value)), [release](U result) mutable {
                    return detail::fmap<E, unit>(detail::run_release<E>(release), [result = std::move(result)](unit) mutable {
                        return std::move(result);
                    });
                });
            }
        });
    }

    /// Sequential composition, see lease::bind
    template<typename F>
    [[nodiscard]] std::invoke_result_t<F&, T> flat_map(F f) const {
        return lease::bind(*this, std::move(f));
    }

    /// Transform the value, keeping the release, see lease::map
    template<typename F>
    [[nodiscard]] factory<E, std::decay_t<std::invoke_result_t<F&, T>>> map(F f) const {
        return lease::map(*this, std::move(f));
    }

private:
    std::shared_ptr<acquire_function> acquire_;
};

} // namespace lease
