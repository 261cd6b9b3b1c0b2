#pragma once

#include <coroutine>
#include <cstdint>
#include <exception>

namespace lease::coro {

/// Coroutine state, tracked for diagnostics
enum class coroutine_state : uint8_t {
    created = 0,    // Just created, not started
    running = 1,    // Resumed at least once, not finished
    completed = 2,  // Finished execution
    failed = 3      // Finished by throwing
};

/// Base class for all coroutine promise types.
/// Owns the exception that escaped the body, the continuation to resume on
/// completion, and whether the frame destroys itself when done.
class promise_base {
public:
    promise_base() noexcept = default;

    promise_base(const promise_base&) = delete;
    promise_base& operator=(const promise_base&) = delete;
    promise_base(promise_base&&) = delete;
    promise_base& operator=(promise_base&&) = delete;

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
        state_ = coroutine_state::failed;
    }

    [[nodiscard]] std::exception_ptr exception() const noexcept {
        return exception_;
    }

    void rethrow_if_failed() const {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
    }

    [[nodiscard]] coroutine_state state() const noexcept { return state_; }
    void set_state(coroutine_state state) noexcept { state_ = state; }

    [[nodiscard]] std::coroutine_handle<> continuation() const noexcept { return continuation_; }
    void set_continuation(std::coroutine_handle<> continuation) noexcept { continuation_ = continuation; }

    [[nodiscard]] bool detached() const noexcept { return detached_; }
    void set_detached() noexcept { detached_ = true; }

    /// Awaiter run at initial suspend point's resumption, marks the frame running
    struct start_awaiter {
        promise_base* promise;

        [[nodiscard]] bool await_ready() const noexcept { return false; }
        void await_suspend(std::coroutine_handle<>) const noexcept {}
        void await_resume() const noexcept { promise->set_state(coroutine_state::running); }
    };

private:
    std::exception_ptr exception_;
    std::coroutine_handle<> continuation_;
    bool detached_ = false;
    coroutine_state state_ = coroutine_state::created;
};

} // namespace lease::coro
