#pragma once

#include "scheduler.hpp"
#include <lease/coro/task.hpp>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace lease::runtime {

/// Configuration for running async tasks
struct run_config {
    /// Number of worker threads (0 = hardware concurrency)
    size_t num_threads = 0;
};

namespace detail {

/// Completion signal a blocking caller waits on
template<typename T>
class completion_signal {
public:
    void set_result(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        result_.emplace(std::move(value));
        completed_ = true;
        cv_.notify_one();
    }

    void set_exception(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mutex_);
        exception_ = std::move(e);
        completed_ = true;
        cv_.notify_one();
    }

    T wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return completed_; });
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        return std::move(*result_);
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> result_;
    std::exception_ptr exception_;
    bool completed_ = false;
};

template<typename T>
coro::task<void> completion_wrapper(coro::task<T> inner, completion_signal<T>* signal) {
    std::exception_ptr error;
    try {
        T result = co_await std::move(inner);
        signal->set_result(std::move(result));
        co_return;
    } catch (...) {
        error = std::current_exception();
    }
    signal->set_exception(std::move(error));
}

} // namespace detail

/// Run a task to completion on a fresh scheduler and return its result.
///
/// The calling thread blocks until the task finishes. Exceptions escaping the
/// task are rethrown here.
///
/// Example:
/// @code
/// lease::coro::task<int> async_main() {
///     co_return co_await connection_factory.use(send_request);
/// }
///
/// int main() {
///     return lease::run(async_main());
/// }
/// @endcode
template<typename T>
T run(coro::task<T> task, const run_config& config = {}) {
    static_assert(!std::is_void_v<T>, "run() needs a task producing a value");
    detail::completion_signal<T> signal;

    size_t threads = config.num_threads;
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 1;
    }

    scheduler sched(threads);
    sched.start();

    auto wrapper = detail::completion_wrapper(std::move(task), &signal);
    sched.spawn(wrapper.release());

    std::optional<T> result;
    std::exception_ptr error;
    try {
        result.emplace(signal.wait());
    } catch (...) {
        error = std::current_exception();
    }
    sched.shutdown();
    if (error) {
        std::rethrow_exception(error);
    }
    return std::move(*result);
}

/// Run a task with specified number of threads
template<typename T>
T run(coro::task<T> task, size_t num_threads) {
    return run(std::move(task), run_config{.num_threads = num_threads});
}

/// Drive a task on the calling thread without a scheduler.
///
/// Every spawn inside it runs inline, in program order. Throws
/// std::logic_error if the task suspends on something that is never resumed
/// inline.
template<typename T>
T run_inline(coro::task<T> task) {
    auto handle = task.handle();
    handle.resume();
    if (!handle.done()) {
        throw std::logic_error("run_inline: task suspended without a scheduler to resume it");
    }
    return handle.promise().take();
}

} // namespace lease::runtime

namespace lease {

/// Convenience alias - run a coroutine to completion
using runtime::run;

/// Convenience alias for run configuration
using runtime::run_config;

} // namespace lease
