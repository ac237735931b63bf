/**
 * @file test_command_queue.cpp
 * @brief Unit tests for the scheduler mailbox.
 */

#include "executor/command_queue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace backup_scheduler;

using namespace std::chrono_literals;

TEST(CommandQueueTest, DrainPreservesOrder) {
    CommandQueue queue;
    std::vector<int> order;
    queue.post([&] { order.push_back(1); });
    queue.post([&] { order.push_back(2); });
    queue.post([&] { order.push_back(3); });
    EXPECT_EQ(queue.pending(), 3u);

    for (auto& command : queue.drain()) command();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(queue.pending(), 0u);
    EXPECT_TRUE(queue.drain().empty());
}

TEST(CommandQueueTest, WaitTimesOutWhenEmpty) {
    CommandQueue queue;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.wait_until(std::stop_token{}, start + 20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(CommandQueueTest, WaitReturnsImmediatelyWhenPending) {
    CommandQueue queue;
    queue.post([] {});
    EXPECT_TRUE(queue.wait_until(std::stop_token{}, std::chrono::steady_clock::now() + 10s));
}

TEST(CommandQueueTest, PostWakesWaiter) {
    CommandQueue queue;
    std::jthread poster([&queue] {
        std::this_thread::sleep_for(20ms);
        queue.post([] {});
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(queue.wait_until(std::stop_token{}, start + 10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(CommandQueueTest, StopRequestWakesWaiter) {
    CommandQueue queue;
    std::stop_source stop;
    std::jthread stopper([&stop] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.wait_until(stop.get_token(), start + 10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}
