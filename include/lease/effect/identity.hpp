#pragma once

#include "concepts.hpp"
#include <type_traits>
#include <utility>

namespace lease::effect {

/// The trivial host effect: a computation of T is a T, evaluated on the spot.
///
/// There is no error channel. An exception thrown by an acquisition, a
/// continuation or a release escapes natively, so compositions over
/// identity perform plain sequencing without releasing on failure.
struct identity {
    template<typename T>
    using type = T;

    template<typename M>
    using value_of = M;

    template<typename T>
    static T pure(T value) {
        return value;
    }

    template<typename F>
    static std::invoke_result_t<F> delay(F f) {
        return f();
    }

    template<typename T, typename F>
    static std::invoke_result_t<F, T> flat_map(T value, F f) {
        return f(std::move(value));
    }

    // Both operands were already evaluated by the caller, in whatever order
    // the compiler chose.
    template<typename A, typename B, typename F>
    static std::invoke_result_t<F, A, B> map2(A a, B b, F f) {
        return f(std::move(a), std::move(b));
    }
};

static_assert(host_effect<identity>);
static_assert(!error_effect<identity>);

} // namespace lease::effect
