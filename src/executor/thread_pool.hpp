/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with cooperative cancellation.
 *
 * Used for fire-and-forget invocations (timer fires) that must not block the
 * thread that produced them. On stop, tasks still queued are run with a
 * stop-requested token so every future resolves and no task is lost silently.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace cloudlet {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts a stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /**
     * @brief Request stop, drain the queue and join all workers. Idempotent.
     *
     * Tasks submitted after stop() run inline on the caller with a stopped token.
     */
    void stop();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    using Task = std::function<void(std::stop_token)>;

    void enqueue(Task task);
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::stop_source stop_source_;
    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool stopped_{false};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

}  // namespace cloudlet
