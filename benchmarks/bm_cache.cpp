#include <benchmark/benchmark.h>
#include <random>
#include <vector>
#include <cmath>
#include <chrono>
#include <memory>
#include <string>
#include "ShardedLRU.hpp"

using Key = int;
using Cache = ShardedLRU<Key, std::string>;

// Pre-drawn Zipf key stream so the timed loop only measures the cache.
class ZipfKeys {
    public:
        ZipfKeys(size_t key_space, double skew, size_t length, unsigned seed = 123) {
            std::vector<double> w(key_space);
            for (size_t i = 0; i < key_space; ++i) w[i] = 1.0 / std::pow(double(i + 1), skew);
            std::discrete_distribution<Key> dist(w.begin(), w.end());
            std::mt19937 rng(seed);
            keys_.reserve(length);
            for (size_t i = 0; i < length; ++i) keys_.push_back(dist(rng));
        }

        Key next() {
            Key k = keys_[pos_];
            if (++pos_ == keys_.size()) pos_ = 0;
            return k;
        }

    private:
        std::vector<Key> keys_;
        size_t pos_ = 0;
};

// Get, and fill on miss: the usual memoization pattern.
static void get_or_fill(benchmark::State& st, Cache& cache, ZipfKeys& keys) {
    for (auto _ : st) {
        Key k = keys.next();
        if (!cache.get(k)) cache.put(k, "x");
    }
    const CacheStats s = cache.stats();
    st.counters["hit_rate"] = s.hit_rate();
    st.counters["evictions"] = double(s.evictions);
    st.counters["expirations"] = double(s.expirations);
}

// args: capacity, key_space, shards
static void BM_GetOrFill_Zipf(benchmark::State& st) {
    Cache cache(st.range(0), st.range(2));
    ZipfKeys keys(st.range(1), 1.2, 1 << 16);
    get_or_fill(st, cache, keys);
}
BENCHMARK(BM_GetOrFill_Zipf)
    ->Args({1000, 10000, 1})
    ->Args({1000, 10000, 16})
    ->Unit(benchmark::kNanosecond);

// args: capacity, key_space, ttl in ms
static void BM_GetOrFill_Zipf_TTL(benchmark::State& st) {
    Cache::Options opt;
    opt.ttl = std::chrono::milliseconds(st.range(2));
    Cache cache(st.range(0), opt);
    ZipfKeys keys(st.range(1), 1.2, 1 << 16);
    get_or_fill(st, cache, keys);
}
BENCHMARK(BM_GetOrFill_Zipf_TTL)
    ->Args({1000, 10000, 1})
    ->Args({1000, 10000, 1000})
    ->Unit(benchmark::kNanosecond);

// One cache shared by all benchmark threads; arg is the shard count.
// Thread 0 owns setup and teardown; the framework's start/stop barriers order them.
static std::unique_ptr<Cache> g_contended;

static void BM_Contention(benchmark::State& st) {
    if (st.thread_index() == 0) {
        g_contended = std::make_unique<Cache>(4096, st.range(0));
    }
    std::mt19937 rng(123 + st.thread_index());
    std::uniform_int_distribution<Key> uni(0, 16383);

    for (auto _ : st) {
        Key k = uni(rng);
        if (!g_contended->get(k)) g_contended->put(k, "x");
    }

    if (st.thread_index() == 0) {
        g_contended.reset();
    }
}
BENCHMARK(BM_Contention)->Arg(1)->Arg(16)->ThreadRange(1, 8)->UseRealTime();

BENCHMARK_MAIN();
