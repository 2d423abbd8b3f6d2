#include <gtest/gtest.h>
#include "gateway/keyed_mutex.hpp"
#include <atomic>
#include <thread>
#include <vector>

using agentgate::gateway::KeyedMutex;

TEST(KeyedMutex, SameKeyIsSerialized) {
    KeyedMutex locks;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 50; ++j) {
                auto guard = locks.lock("1:/work/app");
                int now = ++inside;
                int prev = max_inside.load();
                while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::yield();
                --inside;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(locks.size(), 0u);
}

TEST(KeyedMutex, DifferentKeysDoNotBlock) {
    KeyedMutex locks;
    auto a = locks.lock("1:/work/a");

    std::atomic<bool> acquired{false};
    std::thread other([&] {
        auto b = locks.lock("1:/work/b");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(locks.size(), 1u);
}

TEST(KeyedMutex, GuardCanBeMoved) {
    KeyedMutex locks;
    {
        auto first = locks.lock("k");
        KeyedMutex::Guard moved(std::move(first));
        EXPECT_EQ(locks.size(), 1u);
    }
    EXPECT_EQ(locks.size(), 0u);

    auto again = locks.lock("k");
    EXPECT_EQ(locks.size(), 1u);
}

TEST(KeyedMutex, ContainsTracksHeldKeys) {
    KeyedMutex locks;
    EXPECT_FALSE(locks.contains("1:/work/a"));
    {
        auto guard = locks.lock("1:/work/a");
        EXPECT_TRUE(locks.contains("1:/work/a"));
        EXPECT_FALSE(locks.contains("1:/work/b"));
    }
    EXPECT_FALSE(locks.contains("1:/work/a"));
}
