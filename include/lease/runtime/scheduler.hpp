#pragma once

#include "run_queue.hpp"
#include "worker_thread.hpp"
#include <lease/log/macros.hpp>
#include <atomic>
#include <coroutine>
#include <memory>
#include <thread>
#include <vector>

namespace lease::runtime {

/// Multi-threaded scheduler for coroutines.
///
/// Workers share one FIFO queue. A coroutine spawned on a running scheduler
/// is resumed by whichever worker dequeues it; once started it runs on that
/// worker until its next suspension point.
class scheduler {
    friend class worker_thread;  // Workers publish themselves as current_scheduler_

public:
    static constexpr size_t MAX_THREADS = 256;

    explicit scheduler(size_t num_threads = std::thread::hardware_concurrency())
        : running_(false) {
        if (num_threads == 0) num_threads = 1;
        if (num_threads > MAX_THREADS) num_threads = MAX_THREADS;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.push_back(std::make_unique<worker_thread>(this, &queue_));
        }
    }

    ~scheduler() {
        if (running_.load(std::memory_order_relaxed)) {
            shutdown();
        }
    }

    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;
    scheduler(scheduler&&) = delete;
    scheduler& operator=(scheduler&&) = delete;

    void start() {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return;
        }
        queue_.reopen();
        for (auto& worker : workers_) {
            worker->start();
        }
        current_scheduler_ = this;
        LEASE_LOG_DEBUG("scheduler started with {} workers", workers_.size());
    }

    /// Stop all workers, then destroy whatever was still queued.
    /// Must not be called from one of this scheduler's workers.
    void shutdown() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return;
        }

        queue_.close();
        for (auto& worker : workers_) {
            worker->join();
        }

        auto remaining = queue_.drain();
        if (!remaining.empty()) {
            LEASE_LOG_WARNING("scheduler shutdown discarded {} queued coroutines", remaining.size());
        }
        for (auto handle : remaining) {
            if (handle) handle.destroy();
        }

        if (current_scheduler_ == this) {
            current_scheduler_ = nullptr;
        }
        LEASE_LOG_DEBUG("scheduler stopped after {} resumptions", total_tasks_executed());
    }

    /// Queue a coroutine for resumption. A stopped scheduler destroys it.
    void spawn(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;
        if (!running_.load(std::memory_order_acquire)) [[unlikely]] {
            handle.destroy();
            return;
        }
        queue_.push(handle);
    }

    [[nodiscard]] size_t num_threads() const noexcept {
        return workers_.size();
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] static scheduler* current() noexcept {
        return current_scheduler_;
    }

    [[nodiscard]] size_t total_tasks_executed() const noexcept {
        size_t total = 0;
        for (const auto& worker : workers_) {
            total += worker->tasks_executed();
        }
        return total;
    }

private:
    run_queue queue_;
    std::vector<std::unique_ptr<worker_thread>> workers_;
    std::atomic<bool> running_;

    static inline thread_local scheduler* current_scheduler_ = nullptr;
};

inline scheduler* get_current_scheduler() noexcept {
    return scheduler::current();
}

/// Resume a coroutine on the current scheduler, or inline when no scheduler
/// is running on this thread.
inline void schedule_handle(std::coroutine_handle<> handle) noexcept {
    if (!handle) return;

    auto* sched = scheduler::current();
    if (sched && sched->is_running()) {
        sched->spawn(handle);
    } else {
        // Detached tasks self-destruct via final_suspend
        if (!handle.done()) handle.resume();
    }
}

inline void worker_thread::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    thread_ = std::thread(&worker_thread::run, this);
}

inline void worker_thread::run() {
    scheduler::current_scheduler_ = scheduler_;

    while (auto handle = queue_->pop()) {
        if (*handle && !handle->done()) {
            handle->resume();
            tasks_executed_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    scheduler::current_scheduler_ = nullptr;
}

} // namespace lease::runtime
