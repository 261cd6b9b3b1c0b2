#pragma once

#include "handle.hpp"
#include <lease/effect/concepts.hpp>
#include <lease/effect/outcome.hpp>
#include <lease/log/macros.hpp>
#include <exception>
#include <type_traits>
#include <utility>

namespace lease::detail {

template<typename E, typename T>
using computation = typename E::template type<T>;

/// Call f, which produces a computation of T. With an error channel, a
/// synchronous throw becomes a failed computation.
template<typename E, typename T, typename F>
computation<E, T> invoke_guarded(F&& f) {
    if constexpr (effect::error_effect<E>) {
        try {
            return std::forward<F>(f)();
        } catch (...) {
            return E::template raise<T>(std::current_exception());
        }
    } else {
        return std::forward<F>(f)();
    }
}

/// Call f inside the host effect. The computation keeps its own copy of f,
/// so a coroutine lambda's captures live as long as the frame it returns.
/// With an error channel a synchronous throw becomes a failed computation.
template<typename E, typename T, typename F>
computation<E, T> invoke_retained(F f) {
    return E::flat_map(E::pure(unit{}), [f = std::move(f)](unit) mutable -> computation<E, T> {
        return f();
    });
}

/// Run a handle's release action
template<typename E>
computation<E, unit> run_release(release_function<E> release) {
    return invoke_retained<E, unit>(std::move(release));
}

/// Map the value of a computation with a plain function
template<typename E, typename T, typename F>
computation<E, std::decay_t<std::invoke_result_t<F&, T>>> fmap(computation<E, T> m, F f) {
    return E::flat_map(std::move(m), [f = std::move(f)](T value) mutable {
        return E::pure(std::decay_t<std::invoke_result_t<F&, T>>(f(std::move(value))));
    });
}

/// Turn a computation of T into one that always succeeds with the outcome
template<typename E, typename T>
computation<E, effect::outcome<T>> attempt(computation<E, T> m) {
    using captured = effect::outcome<T>;
    auto succeeded = E::flat_map(std::move(m), [](T value) {
        return E::pure(captured::success(std::move(value)));
    });
    return E::recover(std::move(succeeded), [](std::exception_ptr error) {
        return E::pure(captured::failure(std::move(error)));
    });
}

/// Put a captured outcome back into the error channel
template<typename E, typename T>
computation<E, T> settle(effect::outcome<T> result) {
    if (!result) {
        return E::template raise<T>(result.error());
    }
    return E::pure(std::move(result).get());
}

/// Run `release` and then fail with `error`. A failing release replaces
/// `error` with its own failure.
template<typename E, typename T>
computation<E, T> release_then_raise(release_function<E> release, std::exception_ptr error) {
    auto released = attempt<E, unit>(run_release<E>(std::move(release)));
    return E::flat_map(std::move(released), [error](effect::outcome<unit> result) -> computation<E, T> {
        if (!result) {
            LEASE_LOG_WARNING("release failed while a failure was propagating; dropping: {}",
                              log::describe(error));
            return E::template raise<T>(result.error());
        }
        return E::template raise<T>(error);
    });
}

/// Surface the outcome of two release attempts. A failure of `dominant`
/// wins over a failure of `other`; the dropped failure is logged.
template<typename E>
computation<E, unit> surface_releases(effect::outcome<unit> dominant, effect::outcome<unit> other) {
    if (!dominant) {
        if (!other) {
            LEASE_LOG_WARNING("dropping release failure in favour of another release failure: {}",
                              log::describe(other.error()));
        }
        return E::template raise<unit>(dominant.error());
    }
    if (!other) {
        return E::template raise<unit>(other.error());
    }
    return E::pure(unit{});
}

} // namespace lease::detail
