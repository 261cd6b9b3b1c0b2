#pragma once

#include "concepts.hpp"
#include "errors.hpp"
#include "outcome.hpp"
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace lease::effect {

/// Synchronous host effect whose computations are settled outcomes.
///
/// Everything is evaluated eagerly; failures travel as values in the error
/// channel instead of unwinding. Racing picks the first branch in order, since
/// every branch has settled by the time the race is asked for.
///
/// That holds for a failed first branch too: its failure is the race's result
/// even when a later branch succeeded, so lease::choose_any over immediate
/// fails whenever its head fails (after releasing the other branches).
struct immediate {
    template<typename T>
    using type = outcome<T>;

    template<typename M>
    using value_of = typename M::value_type;

    template<typename T>
    static outcome<T> pure(T value) {
        return outcome<T>::success(std::move(value));
    }

    template<typename F>
    static outcome<std::invoke_result_t<F>> delay(F f) {
        return outcome<std::invoke_result_t<F>>::capture(std::move(f));
    }

    template<typename T, typename F>
    static std::invoke_result_t<F, T> flat_map(outcome<T> m, F f) {
        using result_type = std::invoke_result_t<F, T>;
        if (!m) {
            return result_type::failure(m.error());
        }
        try {
            return f(std::move(m).get());
        } catch (...) {
            return result_type::failure(std::current_exception());
        }
    }

    template<typename A, typename B, typename F>
    static outcome<std::invoke_result_t<F, A, B>> map2(outcome<A> a, outcome<B> b, F f) {
        using result_type = outcome<std::invoke_result_t<F, A, B>>;
        if (!a) {
            return result_type::failure(a.error());
        }
        if (!b) {
            return result_type::failure(b.error());
        }
        return result_type::capture([&] { return f(std::move(a).get(), std::move(b).get()); });
    }

    template<typename T>
    static outcome<T> raise(std::exception_ptr error) {
        return outcome<T>::failure(std::move(error));
    }

    template<typename T, typename H>
    static outcome<T> recover(outcome<T> m, H handler) {
        if (m) {
            return m;
        }
        try {
            return handler(m.error());
        } catch (...) {
            return outcome<T>::failure(std::current_exception());
        }
    }

    template<typename T>
    static outcome<race_outcome<immediate, T>> choose_any(std::vector<outcome<T>> branches) {
        using result_type = outcome<race_outcome<immediate, T>>;
        if (branches.empty()) {
            return result_type::failure(std::make_exception_ptr(
                std::invalid_argument("choose_any requires at least one branch")));
        }
        // First in order wins, failed or not
        if (!branches.front()) {
            return result_type::failure(branches.front().error());
        }

        std::vector<std::function<outcome<T>()>> residuals;
        residuals.reserve(branches.size() - 1);
        for (std::size_t i = 1; i < branches.size(); ++i) {
            auto slot = std::make_shared<std::optional<outcome<T>>>(std::move(branches[i]));
            residuals.emplace_back([slot, i]() -> outcome<T> {
                if (!slot->has_value()) {
                    return outcome<T>::failure(std::make_exception_ptr(residual_consumed(i)));
                }
                outcome<T> settled = std::move(**slot);
                slot->reset();
                return settled;
            });
        }
        return result_type::success(race_outcome<immediate, T>{
            0, std::move(branches.front()).get(), std::move(residuals)});
    }
};

static_assert(error_effect<immediate>);
static_assert(racing_effect<immediate>);

} // namespace lease::effect
