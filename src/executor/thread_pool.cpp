/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

namespace cloudlet {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this, token = stop_source_.get_token()](std::stop_token) {
            worker_loop(token);
        });
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::lock_guard lock(queue_mutex_);
        if (stopped_) return;
        stopped_ = true;
    }
    stop_source_.request_stop();
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::enqueue(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!stopped_) {
            task_queue_.push(std::move(task));
            queue_cv_.notify_one();
            return;
        }
    }
    // Pool already stopped: resolve the task's future immediately
    task(stop_source_.get_token());
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            // Drain whatever is left even after stop so futures resolve
            if (task_queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
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

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace cloudlet
