#pragma once

#include <condition_variable>
#include <coroutine>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace lease::runtime {

/// Blocking FIFO of runnable coroutines shared by all workers of a scheduler.
class run_queue {
public:
    run_queue() = default;

    run_queue(const run_queue&) = delete;
    run_queue& operator=(const run_queue&) = delete;

    void push(std::coroutine_handle<> handle) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(handle);
        }
        ready_.notify_one();
    }

    /// Block until an item is available or the queue is closed.
    /// Returns nullopt once closed, even if items remain.
    std::optional<std::coroutine_handle<>> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (closed_) {
            return std::nullopt;
        }
        auto handle = items_.front();
        items_.pop_front();
        return handle;
    }

    /// Wake every blocked pop(); subsequent pops return nullopt
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    /// Remove and return everything still queued
    std::deque<std::coroutine_handle<>> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::exchange(items_, {});
    }

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::coroutine_handle<>> items_;
    bool closed_ = false;
};

} // namespace lease::runtime
