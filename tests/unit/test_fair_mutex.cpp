#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "utils/fair_mutex.h"

using ssdptrack::utils::FairMutex;

TEST(FairMutexTest, LockAndUnlock) {
    FairMutex mutex;
    EXPECT_FALSE(mutex.is_locked());
    mutex.lock();
    EXPECT_TRUE(mutex.is_locked());
    mutex.unlock();
    EXPECT_FALSE(mutex.is_locked());
}

TEST(FairMutexTest, TryLockFailsWhileHeld) {
    FairMutex mutex;
    std::unique_lock<FairMutex> guard(mutex);
    EXPECT_FALSE(mutex.try_lock());
    guard.unlock();
    EXPECT_TRUE(mutex.try_lock());
    mutex.unlock();
}

TEST(FairMutexTest, ReleasedWhenScopeThrows) {
    FairMutex mutex;
    try {
        std::lock_guard<FairMutex> guard(mutex);
        throw std::runtime_error("callback failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(mutex.is_locked());
}

TEST(FairMutexTest, WaitersAreServedInArrivalOrder) {
    FairMutex mutex;
    std::vector<int> order;
    std::mutex order_mutex;

    mutex.lock();
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i) {
        waiters.emplace_back([&mutex, &order, &order_mutex, i]() {
            std::lock_guard<FairMutex> guard(mutex);
            std::lock_guard<std::mutex> record(order_mutex);
            order.push_back(i);
        });
        // Give each waiter time to take its ticket before the next one starts.
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
    }
    mutex.unlock();

    for (auto& waiter : waiters) {
        waiter.join();
    }
    ASSERT_EQ(order.size(), 4u);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(order[static_cast<size_t>(i)], i);
    }
}

TEST(FairMutexTest, ConcurrentIncrementsAreNotLost) {
    FairMutex mutex;
    int counter = 0;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&mutex, &counter]() {
            for (int i = 0; i < 1000; ++i) {
                std::lock_guard<FairMutex> guard(mutex);
                ++counter;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(counter, 4000);
}
