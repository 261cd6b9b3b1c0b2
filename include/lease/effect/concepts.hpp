#pragma once

#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

namespace lease {

/// Result of a computation that produces nothing (release actions)
struct unit {
    friend constexpr bool operator==(unit, unit) noexcept { return true; }
};

} // namespace lease

namespace lease::effect {

/// What a racing host effect hands back: the first branch to settle and a
/// way to resume each of the other, still pending, branches.
template<typename E, typename T>
struct race_outcome {
    std::size_t index = 0;
    T winner;
    std::vector<std::function<typename E::template type<T>()>> residuals;
};

namespace detail {

// Probe callables for the requirements below. Never defined, only named in
// unevaluated operands.
template<typename E>
struct unit_continuation {
    typename E::template type<unit> operator()(unit) const;
};

struct unit_thunk {
    unit operator()() const;
};

struct unit_combiner {
    unit operator()(unit, unit) const;
};

template<typename E>
struct unit_recovery {
    typename E::template type<unit> operator()(std::exception_ptr) const;
};

} // namespace detail

/// Sequencing, independent combination, "succeed now" and deferred evaluation.
/// Every host effect must provide these, plus `value_of<M>`, the value type
/// of a computation type M.
template<typename E>
concept host_effect = requires(typename E::template type<unit> m,
                               typename E::template type<unit> n) {
    requires std::same_as<typename E::template value_of<typename E::template type<unit>>, unit>;
    { E::pure(unit{}) } -> std::same_as<typename E::template type<unit>>;
    { E::delay(detail::unit_thunk{}) } -> std::same_as<typename E::template type<unit>>;
    { E::flat_map(std::move(m), detail::unit_continuation<E>{}) }
        -> std::same_as<typename E::template type<unit>>;
    { E::map2(std::move(m), std::move(n), detail::unit_combiner{}) }
        -> std::same_as<typename E::template type<unit>>;
};

/// Host effect with an error channel carrying std::exception_ptr
template<typename E>
concept error_effect = host_effect<E> &&
    requires(typename E::template type<unit> m, std::exception_ptr error) {
        { E::template raise<unit>(error) } -> std::same_as<typename E::template type<unit>>;
        { E::recover(std::move(m), detail::unit_recovery<E>{}) }
            -> std::same_as<typename E::template type<unit>>;
    };

/// Host effect able to race a non-empty set of computations
template<typename E>
concept racing_effect = host_effect<E> &&
    requires(std::vector<typename E::template type<unit>> branches) {
        { E::choose_any(std::move(branches)) }
            -> std::same_as<typename E::template type<race_outcome<E, unit>>>;
    };

} // namespace lease::effect
