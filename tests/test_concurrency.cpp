#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include "ShardedLRU.hpp"
#include "TestSupport.hpp"

using namespace std::chrono_literals;

TEST(ShardedLRUConcurrencyTest, DisjointWritersFillSingleShard) {
    ShardedLRU<int, int> cache(1000, 1);
    std::vector<std::thread> threads;
    for (int t = 0; t < 10; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = t * 100; i < (t + 1) * 100; ++i) cache.put(i, i);
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(cache.size(), 1000u);
    EXPECT_TRUE(cache.consistent());
    for (int i = 0; i < 1000; ++i) ASSERT_EQ(cache.get(i), i);
}

TEST(ShardedLRUConcurrencyTest, DisjointWritersAcrossShards) {
    // 1000 keys over 16 shards of 63 slots: no shard overflows
    ShardedLRU<int, int, IdentityHash> cache(1000, 16);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = t; i < 1000; i += 8) cache.put(i, i * 3);
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(cache.size(), 1000u);
    EXPECT_EQ(cache.stats().evictions, 0u);
    for (int i = 0; i < 1000; ++i) ASSERT_EQ(cache.get(i), i * 3);
}

TEST(ShardedLRUConcurrencyTest, MixedOperationsKeepShardsConsistent) {
    ShardedLRU<int, int> cache(500);
    std::atomic<bool> done{false};
    std::atomic<int> violations{0};

    std::thread checker([&] {
        while (!done.load()) {
            if (!cache.consistent()) ++violations;
            if (cache.size() > cache.total_capacity()) ++violations;
        }
    });

    std::vector<std::thread> workers;
    for (int t = 0; t < 10; ++t) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < 5000; ++i) {
                cache.put(i % 1000, i);
                cache.get(i % 1000 - 100);
                if ((i + t) % 7 == 0) cache.erase((i * 13) % 1000);
                if ((i + t) % 11 == 0) cache.contains(i % 50);
            }
        });
    }
    for (auto& th : workers) th.join();
    done = true;
    checker.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_LE(cache.size(), cache.total_capacity());
    for (const auto& s : cache.shard_stats()) EXPECT_LE(s.size, s.capacity);
    EXPECT_TRUE(cache.consistent());
}

TEST(ShardedLRUConcurrencyTest, SameKeyWritersLeaveOneOfTheirValues) {
    ShardedLRU<std::string, int> cache(16, 4);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 2000; ++i) {
                cache.put("shared", t);
                auto v = cache.get("shared");
                ASSERT_TRUE(v.has_value());
                ASSERT_GE(*v, 0);
                ASSERT_LT(*v, 8);
            }
        });
    }
    for (auto& th : threads) th.join();

    auto v = cache.get("shared");
    ASSERT_TRUE(v.has_value());
    EXPECT_GE(*v, 0);
    EXPECT_LT(*v, 8);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(ShardedLRUConcurrencyTest, ExpiryUnderLoadStaysConsistent) {
    ShardedLRU<int, int>::Options opt;
    opt.shards = 8;
    opt.ttl = 1ms;
    ShardedLRU<int, int> cache(256, opt);

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 3000; ++i) {
                cache.put((i * 7 + t) % 400, i);
                cache.get(i % 400);
                if (i % 100 == 0) cache.purge_expired();
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_TRUE(cache.consistent());
    std::this_thread::sleep_for(5ms);
    EXPECT_EQ(cache.size(), 0u);
}
