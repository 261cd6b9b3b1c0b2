#pragma once

#include "concepts.hpp"
#include "errors.hpp"
#include <lease/coro/task.hpp>
#include <lease/log/macros.hpp>
#include <atomic>
#include <coroutine>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace lease::effect {

struct task_effect;

namespace detail {

template<typename T>
coro::task<T> pure_task(T value) {
    co_return value;
}

template<typename F>
coro::task<std::invoke_result_t<F>> delay_task(F f) {
    co_return f();
}

template<typename T>
coro::task<T> raise_task(std::exception_ptr error) {
    co_await std::suspend_never{};
    std::rethrow_exception(error);
}

template<typename T, typename F>
std::invoke_result_t<F, T> flat_map_task(coro::task<T> m, F f) {
    T value = co_await std::move(m);
    co_return co_await f(std::move(value));
}

template<typename T, typename H>
coro::task<T> recover_task(coro::task<T> m, H handler) {
    std::exception_ptr error;
    try {
        co_return co_await std::move(m);
    } catch (...) {
        error = std::current_exception();
    }
    co_return co_await handler(std::move(error));
}

/// Both operands are spawned before either is awaited, so they overlap on a
/// running scheduler. Both are always awaited; the left failure wins.
template<typename A, typename B, typename F>
coro::task<std::invoke_result_t<F, A, B>> map2_task(coro::task<A> a, coro::task<B> b, F f) {
    auto left = std::move(a).spawn();
    auto right = std::move(b).spawn();

    std::optional<A> left_value;
    std::optional<B> right_value;
    std::exception_ptr left_error;
    std::exception_ptr right_error;
    try {
        left_value.emplace(co_await std::move(left));
    } catch (...) {
        left_error = std::current_exception();
    }
    try {
        right_value.emplace(co_await std::move(right));
    } catch (...) {
        right_error = std::current_exception();
    }

    if (left_error) std::rethrow_exception(left_error);
    if (right_error) std::rethrow_exception(right_error);
    co_return f(std::move(*left_value), std::move(*right_value));
}

/// Shared bookkeeping of one race: a completion slot per branch and the index
/// of the first branch to settle.
template<typename T>
class race_state {
public:
    explicit race_state(std::size_t branches)
        : winner_(std::make_shared<coro::detail::join_state<std::size_t>>()) {
        slots_.reserve(branches);
        for (std::size_t i = 0; i < branches; ++i) {
            slots_.push_back(std::make_shared<coro::detail::join_state<T>>());
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }

    [[nodiscard]] const std::shared_ptr<coro::detail::join_state<T>>& slot(std::size_t index) const {
        return slots_[index];
    }

    [[nodiscard]] std::shared_ptr<coro::detail::join_state<std::size_t>> winner() const {
        return winner_;
    }

    /// Called by each branch after filling its slot; only the first call counts
    void settle(std::size_t index) {
        bool expected = false;
        if (settled_.compare_exchange_strong(expected, true)) {
            winner_->set_value(std::size_t{index});
        }
    }

private:
    std::vector<std::shared_ptr<coro::detail::join_state<T>>> slots_;
    std::shared_ptr<coro::detail::join_state<std::size_t>> winner_;
    std::atomic<bool> settled_{false};
};

template<typename T>
coro::task<void> race_branch(coro::task<T> branch, std::shared_ptr<race_state<T>> state, std::size_t index) {
    auto slot = state->slot(index);
    std::exception_ptr error;
    try {
        T value = co_await std::move(branch);
        slot->set_value(std::move(value));
    } catch (...) {
        error = std::current_exception();
    }
    if (error) {
        slot->set_exception(std::move(error));
    }
    state->settle(index);
}

template<typename T>
coro::task<T> consume_residual(std::shared_ptr<coro::detail::join_state<T>> slot,
                               std::shared_ptr<std::atomic<bool>> taken,
                               std::size_t index) {
    if (taken->exchange(true)) {
        throw residual_consumed(index);
    }
    co_return co_await coro::join_handle<T>(std::move(slot));
}

template<typename T>
coro::task<race_outcome<task_effect, T>> choose_any_task(std::vector<coro::task<T>> branches) {
    if (branches.empty()) {
        throw std::invalid_argument("choose_any requires at least one branch");
    }

    auto state = std::make_shared<race_state<T>>(branches.size());
    for (std::size_t i = 0; i < branches.size(); ++i) {
        race_branch(std::move(branches[i]), state, i).go();
    }

    std::size_t index = co_await coro::join_handle<std::size_t>(state->winner());
    LEASE_LOG_DEBUG("race settled by branch {} of {}", index, state->size());

    std::vector<std::function<coro::task<T>()>> residuals;
    residuals.reserve(state->size() - 1);
    for (std::size_t i = 0; i < state->size(); ++i) {
        if (i == index) continue;
        residuals.emplace_back([slot = state->slot(i), taken = std::make_shared<std::atomic<bool>>(false), i] {
            return consume_residual<T>(slot, taken, i);
        });
    }

    // Rethrows when the first branch to settle failed
    T winner = state->slot(index)->get_value();
    co_return race_outcome<task_effect, T>{index, std::move(winner), std::move(residuals)};
}

} // namespace detail

/// Host effect over lazily started coroutines.
///
/// Errors are exceptions. Independent combination and racing spawn their
/// branches on the current runtime::scheduler, so they run concurrently there;
/// without a running scheduler every branch runs inline, left to right.
///
/// Residuals of a race wait on the branch's own completion slot and can be
/// acquired once. A second acquisition fails with residual_consumed.
struct task_effect {
    template<typename T>
    using type = coro::task<T>;

    template<typename M>
    using value_of = typename M::value_type;

    template<typename T>
    static coro::task<T> pure(T value) {
        return detail::pure_task<T>(std::move(value));
    }

    template<typename F>
    static coro::task<std::invoke_result_t<F>> delay(F f) {
        return detail::delay_task(std::move(f));
    }

    template<typename T, typename F>
    static std::invoke_result_t<F, T> flat_map(coro::task<T> m, F f) {
        return detail::flat_map_task(std::move(m), std::move(f));
    }

    template<typename A, typename B, typename F>
    static coro::task<std::invoke_result_t<F, A, B>> map2(coro::task<A> a, coro::task<B> b, F f) {
        return detail::map2_task(std::move(a), std::move(b), std::move(f));
    }

    template<typename T>
    static coro::task<T> raise(std::exception_ptr error) {
        return detail::raise_task<T>(std::move(error));
    }

    template<typename T, typename H>
    static coro::task<T> recover(coro::task<T> m, H handler) {
        return detail::recover_task(std::move(m), std::move(handler));
    }

    template<typename T>
    static coro::task<race_outcome<task_effect, T>> choose_any(std::vector<coro::task<T>> branches) {
        return detail::choose_any_task(std::move(branches));
    }
};

static_assert(error_effect<task_effect>);
static_assert(racing_effect<task_effect>);

} // namespace lease::effect
