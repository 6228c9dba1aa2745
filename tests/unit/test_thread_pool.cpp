/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace cloudlet;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, CancellableTaskSeesStop) {
    ThreadPool pool(1);
    std::atomic<bool> started{false};

    auto future = pool.submit_cancellable([&started](std::stop_token stop) {
        started = true;
        while (!stop.stop_requested()) {
            std::this_thread::sleep_for(1ms);
        }
        return true;
    });

    while (!started) std::this_thread::sleep_for(1ms);
    pool.stop();
    EXPECT_TRUE(future.get());
}

TEST(ThreadPoolTest, SubmitAfterStopRunsWithStoppedToken) {
    ThreadPool pool(2);
    pool.stop();

    auto future = pool.submit_cancellable([](std::stop_token stop) {
        return stop.stop_requested();
    });
    EXPECT_TRUE(future.get());
}

TEST(ThreadPoolTest, StopDrainsQueuedTasks) {
    ThreadPool pool(1);
    std::atomic<int> ran{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([&ran] {
            std::this_thread::sleep_for(1ms);
            ++ran;
        }));
    }
    pool.stop();
    for (auto& f : futures) f.get();
    EXPECT_EQ(ran.load(), 10);
    EXPECT_EQ(pool.queued_count(), 0u);
}
