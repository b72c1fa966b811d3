/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

#include <sys/prctl.h>

namespace runbox {

namespace {

void name_current_thread(const std::string& prefix, size_t index) {
    auto name = prefix + "-" + std::to_string(index);
    if (name.size() > 15) name.resize(15);
    ::prctl(PR_SET_NAME, name.c_str(), 0, 0, 0);
}

}  // anonymous namespace

ThreadPool::ThreadPool(size_t num_threads, std::string name, size_t max_queued)
    : name_(std::move(name))
    , max_queued_(max_queued) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }
    thread_count_ = num_threads;

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this, i](std::stop_token stop) {
            worker_loop(stop, i);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::try_submit(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stopping_) return false;
        if (max_queued_ > 0 && task_queue_.size() >= max_queued_) return false;
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    workers_.clear();   // joins after the queue drains
}

void ThreadPool::worker_loop(std::stop_token stop, size_t index) {
    name_current_thread(name_, index);
    for (;;) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !task_queue_.empty(); });
            if (task_queue_.empty()) return;    // stopping and drained

            task = std::move(task_queue_.front());
            task_queue_.pop();
            ++active_tasks_;
        }

        task(stop);
        --active_tasks_;
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

}  // namespace runbox
