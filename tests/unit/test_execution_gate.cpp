/**
 * @file test_execution_gate.cpp
 * @brief Unit tests for the execution concurrency gate.
 */

#include "executor/execution_gate.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace cloudlet;
using namespace std::chrono_literals;

TEST(ExecutionGate, SlotsReleaseOnDestruction) {
    ExecutionGate gate(2);
    {
        auto a = gate.try_acquire();
        auto b = gate.try_acquire();
        ASSERT_TRUE(a && b);
        EXPECT_EQ(gate.in_use(), 2u);
        EXPECT_FALSE(gate.try_acquire().has_value());
    }
    EXPECT_EQ(gate.in_use(), 0u);
    EXPECT_EQ(gate.peak(), 2u);
}

TEST(ExecutionGate, MovedSlotReleasesOnce) {
    ExecutionGate gate(1);
    {
        auto first = gate.try_acquire();
        ASSERT_TRUE(first.has_value());
        ExecutionGate::Slot moved = std::move(*first);
        first.reset();
        EXPECT_EQ(gate.in_use(), 1u);
    }
    EXPECT_EQ(gate.in_use(), 0u);
}

TEST(ExecutionGate, AcquireGivesUpOnStop) {
    ExecutionGate gate(1);
    auto held = gate.try_acquire();
    ASSERT_TRUE(held.has_value());

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
    });
    auto slot = gate.acquire(stop.get_token());
    EXPECT_FALSE(slot.has_value());
    EXPECT_EQ(gate.waiting(), 0u);
}

TEST(ExecutionGate, NeverExceedsCapacity) {
    constexpr size_t kCapacity = 3;
    ExecutionGate gate(kCapacity);
    std::atomic<size_t> inside{0};
    std::atomic<size_t> worst{0};

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 12; ++i) {
            threads.emplace_back([&] {
                auto slot = gate.acquire({});
                ASSERT_TRUE(slot.has_value());
                size_t now = ++inside;
                size_t prev = worst.load();
                while (now > prev && !worst.compare_exchange_weak(prev, now)) {}
                std::this_thread::sleep_for(5ms);
                --inside;
            });
        }
    }

    EXPECT_LE(worst.load(), kCapacity);
    EXPECT_EQ(gate.peak(), kCapacity);
    EXPECT_EQ(gate.in_use(), 0u);
}
