/**
 * @file thread_pool.hpp
 * @brief std::jthread-based pool serving client connections.
 *
 * Sandbox workers are owned by ExecutionService; this pool only runs
 * connection handlers, which may block for the length of an execution.
 * Shutdown drains: every task already queued still runs, with a stopped
 * token, so a queued connection is always answered or closed.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace runbox {

/**
 * @brief Fixed pool of named threads with an optional task backlog bound.
 */
class ThreadPool {
public:
    using Task = std::function<void(std::stop_token)>;

    /**
     * @param num_threads  0 = hardware concurrency.
     * @param name         Thread name prefix, truncated to the kernel's 15 chars.
     * @param max_queued   Backlog bound for try_submit(); 0 = unbounded.
     */
    explicit ThreadPool(size_t num_threads = 0, std::string name = "pool",
                        size_t max_queued = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Enqueue unless the backlog is full or the pool is stopping.
    [[nodiscard]] bool try_submit(Task task);

    /// Stop accepting, run what is queued, join. Idempotent.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept { return thread_count_; }

private:
    void worker_loop(std::stop_token stop, size_t index);

    const std::string name_;
    const size_t max_queued_;
    size_t thread_count_{0};

    std::vector<std::jthread> workers_;
    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool stopping_{false};
};

}  // namespace runbox
