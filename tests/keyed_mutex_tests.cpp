#include <gtest/gtest.h>
#include "utilities/keyed_mutex.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using xferpress::KeyedMutex;

TEST(KeyedMutex, SameKeyIsExclusive) {
    KeyedMutex locks;
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                auto guard = locks.lock("upload-1");
                int now = ++inside;
                int seen = maxInside.load();
                while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(std::chrono::microseconds(50));
                --inside;
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(maxInside.load(), 1);
}

TEST(KeyedMutex, DifferentKeysDoNotBlock) {
    KeyedMutex locks;
    auto a = locks.lock("a");
    std::atomic<bool> acquired{false};
    std::thread other([&]() {
        auto b = locks.lock("b");
        acquired = true;
    });
    other.join();
    EXPECT_TRUE(acquired.load());
}

TEST(KeyedMutex, EntriesAreDroppedWhenReleased) {
    KeyedMutex locks;
    {
        auto a = locks.lock("a");
        auto b = locks.lock("b");
        EXPECT_EQ(locks.activeKeys(), 2u);
    }
    EXPECT_EQ(locks.activeKeys(), 0u);
}

TEST(KeyedMutex, GuardCanBeMoved) {
    KeyedMutex locks;
    {
        auto first = locks.lock("k");
        auto moved = std::move(first);
        EXPECT_EQ(locks.activeKeys(), 1u);
    }
    EXPECT_EQ(locks.activeKeys(), 0u);
    auto again = locks.lock("k");
    EXPECT_EQ(locks.activeKeys(), 1u);
}
