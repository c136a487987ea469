#include <iostream>
#include <random>
#include <chrono>
#include <vector>
#include <string>
#include <functional>
#include <cmath> // std::pow
#include <algorithm>

#include "ShardedLRU.hpp"

using Key = int;
using Cache = ShardedLRU<Key, std::string>;
using Clock = std::chrono::steady_clock;

struct Workload {
    std::string name;
    std::function<Key()> next;
};

// Fill-on-miss loop; hit/miss numbers come from the cache's own counters,
// measured as the delta over the timed phase.
static void drive(Cache& cache, Workload& w, size_t ops, size_t warmup) {
    for (size_t i = 0; i < warmup; ++i) {
        Key k = w.next();
        if (!cache.get(k)) cache.put(k, "x");
    }
    const CacheStats before = cache.stats();

    const auto t0 = Clock::now();
    for (size_t i = 0; i < ops; ++i) {
        Key k = w.next();
        if (!cache.get(k)) cache.put(k, "x");
    }
    const std::chrono::duration<double> dt = Clock::now() - t0;

    const CacheStats after = cache.stats();
    CacheStats run;
    run.hits = after.hits - before.hits;
    run.misses = after.misses - before.misses;
    run.evictions = after.evictions - before.evictions;
    run.expirations = after.expirations - before.expirations;

    std::cout << w.name
              << " shards=" << cache.num_shards()
              << " ops=" << ops
              << " hit_rate=" << run.hit_rate()
              << " evictions=" << run.evictions
              << " expirations=" << run.expirations
              << " time=" << dt.count() << "s"
              << " throughput=" << (ops / std::max(1e-9, dt.count())) << " ops/s\n";
}

// Sequential writes, then reads of the last `capacity` keys.
static void run_sequential(Cache& cache, size_t iterations, size_t capacity) {
    auto t0 = Clock::now();
    for (size_t i = 0; i < iterations; ++i) cache.put(Key(i), "x");
    auto t1 = Clock::now();
    size_t hits = 0;
    for (size_t i = iterations - capacity; i < iterations; ++i) if (cache.get(Key(i))) ++hits;
    auto t2 = Clock::now();

    std::chrono::duration<double> wr = t1 - t0, rd = t2 - t1;
    std::cout << "sequential shards=" << cache.num_shards()
              << " writes=" << iterations << " write_time=" << wr.count() << "s"
              << " reads=" << capacity << " read_hits=" << hits
              << " read_time=" << rd.count() << "s\n";
}

int main() {
    const size_t key_space = 10'000;
    const size_t capacity  = 1'000;
    const size_t ops       = 1'000'000;
    const std::vector<size_t> shard_counts = {1, 8, 16};

    std::mt19937 rng(123);

    std::uniform_int_distribution<Key> uni(0, Key(key_space) - 1);

    std::vector<double> weights(key_space);
    for (size_t i = 0; i < key_space; ++i) weights[i] = 1.0 / std::pow(double(i + 1), 1.2);
    std::discrete_distribution<Key> zipf(weights.begin(), weights.end());

    // cyclic scan larger than the cache: the LRU worst case
    Key cursor = 0;

    std::vector<Workload> workloads = {
        {"uniform", [&] { return uni(rng); }},
        {"zipf", [&] { return zipf(rng); }},
        {"scan", [&] { Key k = cursor; cursor = (cursor + 1) % Key(key_space); return k; }},
    };

    for (auto& w : workloads) {
        for (size_t shards : shard_counts) {
            Cache cache(capacity, shards);
            drive(cache, w, ops, 10 * capacity);
        }
    }

    std::cout << "\n";
    for (auto ttl : {std::chrono::milliseconds(1), std::chrono::milliseconds(100)}) {
        Cache::Options opt;
        opt.ttl = ttl;
        Cache cache(capacity, opt);
        std::cout << "ttl=" << ttl.count() << "ms ";
        drive(cache, workloads[1], ops, 10 * capacity);
    }

    std::cout << "\n";
    for (size_t shards : shard_counts) {
        Cache cache(10'000, shards);
        run_sequential(cache, 100'000, 10'000);
    }

    return 0;
}
