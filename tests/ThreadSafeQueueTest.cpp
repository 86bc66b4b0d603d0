#include <gtest/gtest.h>

#include "../common/ThreadSafeQueue.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using net_recon::common::ThreadSafeQueue;

TEST(ThreadSafeQueue, CloseDrainsRemainingItems)
{
    ThreadSafeQueue<std::string> queue;
    EXPECT_TRUE(queue.Push("a"));
    EXPECT_TRUE(queue.Push("b"));
    queue.Close();

    EXPECT_FALSE(queue.Push("c"));
    EXPECT_EQ(*queue.Pop(), "a");
    EXPECT_EQ(*queue.Pop(), "b");
    EXPECT_FALSE(queue.Pop().has_value());
}

TEST(ThreadSafeQueue, PushBlocksWhileFull)
{
    ThreadSafeQueue<int> queue(1);
    ASSERT_TRUE(queue.Push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        EXPECT_TRUE(queue.Push(2));
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed);
    EXPECT_EQ(*queue.Pop(), 1);

    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(queue.Size(), 1u);
}

TEST(ThreadSafeQueue, CloseReleasesBlockedProducer)
{
    ThreadSafeQueue<int> queue(1);
    ASSERT_TRUE(queue.Push(1));

    std::atomic<bool> accepted{true};
    std::thread producer([&]() { accepted = queue.Push(2); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Close();
    producer.join();

    EXPECT_FALSE(accepted);
    EXPECT_EQ(queue.Size(), 1u);
}

TEST(ThreadSafeQueue, CloseWakesWaitingConsumer)
{
    ThreadSafeQueue<int> queue;
    std::thread consumer([&]() { EXPECT_FALSE(queue.Pop().has_value()); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Close();
    consumer.join();
}
