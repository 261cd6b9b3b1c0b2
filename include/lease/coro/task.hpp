#pragma once

#include "promise_base.hpp"
#include <atomic>
#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace lease::runtime {
class scheduler;  // Forward declaration
void schedule_handle(std::coroutine_handle<> handle) noexcept;
}

namespace lease::coro {

template<typename T = void>
class task;

template<typename T = void>
class join_handle;

namespace detail {

struct final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto& promise = h.promise();
        if (promise.state() != coroutine_state::failed) {
            promise.set_state(coroutine_state::completed);
        }
        if (auto continuation = promise.continuation()) {
            return continuation;
        }
        if (promise.detached()) {
            // Nobody owns the frame and nobody waits for it
            h.destroy();
        }
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

template<typename T>
struct task_promise : promise_base {
    std::optional<T> value_;

    [[nodiscard]] task<T> get_return_object() noexcept {
        return task<T>{std::coroutine_handle<task_promise>::from_promise(*this)};
    }

    [[nodiscard]] start_awaiter initial_suspend() noexcept { return {this}; }
    [[nodiscard]] final_awaiter final_suspend() noexcept { return {}; }

    template<typename U>
    void return_value(U&& value) {
        value_.emplace(std::forward<U>(value));
    }

    T take() {
        rethrow_if_failed();
        return std::move(*value_);
    }
};

template<>
struct task_promise<void> : promise_base {
    [[nodiscard]] task<void> get_return_object() noexcept;

    [[nodiscard]] start_awaiter initial_suspend() noexcept { return {this}; }
    [[nodiscard]] final_awaiter final_suspend() noexcept { return {}; }

    void return_void() noexcept {}

    void take() { rethrow_if_failed(); }
};

/// Completion shared between a spawned task and its join_handle.
/// At most one coroutine may wait on it.
class join_state_base {
public:
    void set_exception(std::exception_ptr ex) {
        exception_ = std::move(ex);
        complete();
    }

    [[nodiscard]] bool is_completed() const noexcept {
        return completed_.load();
    }

    /// Returns true if the waiter was parked and will be scheduled on
    /// completion, false if the result is already there.
    bool set_waiter(std::coroutine_handle<> h) noexcept {
        void* expected = nullptr;
        if (!waiter_.compare_exchange_strong(expected, h.address())) {
            return false;
        }
        if (completed_.load()) {
            // Completion raced with us. Whoever takes the waiter back resumes it.
            void* reclaimed = waiter_.exchange(nullptr);
            return reclaimed == nullptr;
        }
        return true;
    }

protected:
    void complete() {
        completed_.store(true);
        void* waiter = waiter_.exchange(nullptr);
        if (waiter) {
            runtime::schedule_handle(std::coroutine_handle<>::from_address(waiter));
        }
    }

    void rethrow_if_failed() const {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
    }

private:
    std::exception_ptr exception_;
    std::atomic<void*> waiter_{nullptr};
    std::atomic<bool> completed_{false};
};

template<typename T>
class join_state : public join_state_base {
public:
    void set_value(T&& value) {
        value_.emplace(std::move(value));
        complete();
    }

    /// Moves the result out; callable once
    T get_value() {
        rethrow_if_failed();
        return std::move(*value_);
    }

private:
    std::optional<T> value_;
};

template<>
class join_state<void> : public join_state_base {
public:
    void set_value() { complete(); }
    void get_value() { rethrow_if_failed(); }
};

} // namespace detail

/// Awaitable result of task<T>::spawn()
template<typename T>
class join_handle {
public:
    explicit join_handle(std::shared_ptr<detail::join_state<T>> state) noexcept
        : state_(std::move(state)) {}

    join_handle(join_handle&&) noexcept = default;
    join_handle& operator=(join_handle&&) noexcept = default;

    join_handle(const join_handle&) = delete;
    join_handle& operator=(const join_handle&) = delete;

    [[nodiscard]] bool await_ready() const noexcept {
        return state_->is_completed();
    }

    bool await_suspend(std::coroutine_handle<> awaiter) noexcept {
        return state_->set_waiter(awaiter);
    }

    T await_resume() {
        return state_->get_value();
    }

    /// Check if the spawned task has completed
    [[nodiscard]] bool is_ready() const noexcept {
        return state_->is_completed();
    }

private:
    std::shared_ptr<detail::join_state<T>> state_;
};

/// Lazily started coroutine. Awaiting it runs it to completion and yields its
/// value or rethrows its exception.
template<typename T>
class task {
public:
    using promise_type = detail::task_promise<T>;
    using handle_type = std::coroutine_handle<promise_type>;
    using value_type = T;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    /// Give up ownership; the frame destroys itself once it finishes
    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().set_detached();
        return std::exchange(handle_, nullptr);
    }

    /// Start on the current scheduler (inline when none runs), fire-and-forget
    void go() {
        runtime::schedule_handle(release());
    }

    /// Start like go() and return a handle to await the result
    [[nodiscard]] join_handle<T> spawn();

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().set_continuation(awaiter);
        return handle_;
    }

    T await_resume() {
        return handle_.promise().take();
    }

private:
    handle_type handle_;
};

namespace detail {

inline task<void> task_promise<void>::get_return_object() noexcept {
    return task<void>{std::coroutine_handle<task_promise>::from_promise(*this)};
}

/// Forwards the result of a spawned task into its join_state
template<typename T>
task<void> join_wrapper(task<T> t, std::shared_ptr<join_state<T>> state) {
    std::exception_ptr error;
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(t);
            state->set_value();
        } else {
            T result = co_await std::move(t);
            state->set_value(std::move(result));
        }
        co_return;
    } catch (...) {
        error = std::current_exception();
    }
    state->set_exception(std::move(error));
}

} // namespace detail

template<typename T>
join_handle<T> task<T>::spawn() {
    auto state = std::make_shared<detail::join_state<T>>();
    detail::join_wrapper(std::move(*this), state).go();
    return join_handle<T>(std::move(state));
}

} // namespace lease::coro

#include <lease/runtime/scheduler.hpp>
