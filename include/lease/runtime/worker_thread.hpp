#pragma once

#include "run_queue.hpp"
#include <atomic>
#include <coroutine>
#include <cstddef>
#include <thread>

namespace lease::runtime {

class scheduler;

/// Worker thread that resumes coroutines taken from its scheduler's queue
class worker_thread {
public:
    worker_thread(scheduler* sched, run_queue* queue)
        : scheduler_(sched)
        , queue_(queue)
        , running_(false)
        , tasks_executed_(0) {}

    ~worker_thread() {
        join();
    }

    worker_thread(const worker_thread&) = delete;
    worker_thread& operator=(const worker_thread&) = delete;
    worker_thread(worker_thread&&) = delete;
    worker_thread& operator=(worker_thread&&) = delete;

    void start();

    /// Wait for the thread to leave its loop; the queue must be closed first
    void join() {
        if (thread_.joinable()) thread_.join();
        running_.store(false, std::memory_order_release);
    }

    [[nodiscard]] size_t tasks_executed() const noexcept {
        return tasks_executed_.load(std::memory_order_relaxed);
    }

private:
    void run();

    scheduler* scheduler_;
    run_queue* queue_;
    std::thread thread_;
    std::atomic<bool> running_;
    std::atomic<size_t> tasks_executed_;
};

} // namespace lease::runtime
