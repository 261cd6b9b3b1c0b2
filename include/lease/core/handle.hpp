#pragma once

#include <lease/effect/concepts.hpp>
#include <functional>

namespace lease {

/// Release action of a handle, expressed in host effect E
template<typename E>
using release_function = std::function<typename E::template type<unit>()>;

/// An acquired resource: its value and the action that gives it back.
///
/// The composition holding a handle owns it and runs `release` exactly once.
/// After release, `value` must not be used as if the resource were open.
template<typename E, typename T>
struct handle {
    using effect_type = E;
    using value_type = T;

    T value;
    release_function<E> release;
};

/// Release action for values that hold nothing
template<typename E>
release_function<E> no_release() {
    return [] { return E::pure(unit{}); };
}

} // namespace lease
