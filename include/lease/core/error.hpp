#pragma once

#include "detail.hpp"
#include "factory.hpp"
#include "handle.hpp"
#include <lease/effect/concepts.hpp>
#include <concepts>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace lease {

/// A factory whose acquisition fails with `error`. It never produces a
/// handle, so nothing is ever released.
template<effect::error_effect E, typename T>
factory<E, T> raise_error(std::exception_ptr error) {
    return factory<E, T>([error] {
        return E::template raise<handle<E, T>>(error);
    });
}

/// Convenience overload taking the exception object itself
template<effect::error_effect E, typename T, typename X>
    requires std::derived_from<std::decay_t<X>, std::exception>
factory<E, T> raise_error(X&& error) {
    return raise_error<E, T>(std::make_exception_ptr(std::forward<X>(error)));
}

/// Acquire `fa`; if that acquisition fails with `e`, acquire `handler(e)`
/// instead.
///
/// Only acquisition failures are intercepted. Failures of the handle's
/// release, or of whatever runs while the handle is held, are not.
template<typename E, typename T, typename H>
    requires effect::error_effect<E> &&
             std::same_as<std::invoke_result_t<H&, std::exception_ptr>, factory<E, T>>
factory<E, T> handle_error(const factory<E, T>& fa, H handler) {
    using acquisition = typename factory<E, T>::acquisition_type;

    return factory<E, T>([fa, handler = std::make_shared<H>(std::move(handler))] {
        return E::recover(fa.acquire(), [handler](std::exception_ptr error) -> acquisition {
            LEASE_LOG_DEBUG("acquisition failed, acquiring the replacement: {}", log::describe(error));
            return (*handler)(std::move(error)).acquire();
        });
    });
}

} // namespace lease
