#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <string>
#include "ShardedLRU.hpp"

using namespace std::chrono_literals;

static void print_stats(const std::string& label, ShardedLRU<int, std::string>& cache) {
    const CacheStats s = cache.stats();
    std::cout << label
              << ": size=" << cache.size() << "/" << cache.total_capacity()
              << " hits=" << s.hits << " misses=" << s.misses
              << " evictions=" << s.evictions << " hit_rate=" << s.hit_rate() << "\n";
}

int main() {
    ShardedLRU<int, std::string> cache(8 /*total capacity*/, 4 /*shards*/);

    // Single-thread sanity
    cache.put(1, "A");
    cache.put(2, "B");
    cache.put(3, "C");
    std::cout << "get(2): " << cache.get(2).value_or("MISS") << "\n";
    std::cout << "contains(1): " << cache.contains(1) << "\n";
    std::cout << "erase(3): " << cache.erase(3).value_or("MISS") << "\n";
    std::cout << "erase(3) again: " << cache.erase(3).value_or("MISS") << "\n";
    print_stats("single-thread", cache);

    // Each worker writes its own key range and immediately reads back a
    // trailing window; the cache is shared by reference, never global.
    ShardedLRU<int, std::string> shared(4096);
    const int workers = 4;
    const int per_worker = 20000;
    const int window = 256;
    std::vector<std::thread> pool;
    std::vector<size_t> window_hits(workers, 0);
    for (int w = 0; w < workers; ++w) {
        pool.emplace_back([&shared, &window_hits, w, per_worker, window] {
            const int base = w * per_worker;
            for (int i = 0; i < per_worker; ++i) {
                shared.put(base + i, std::to_string(base + i));
                if (i >= window && shared.get(base + i - window)) ++window_hits[w];
            }
        });
    }
    for (auto& t : pool) t.join();

    for (int w = 0; w < workers; ++w) {
        std::cout << "worker " << w << " window hits: " << window_hits[w]
                  << "/" << (per_worker - window) << "\n";
    }
    std::cout << "shards=" << shared.num_shards()
              << " shard_capacity=" << shared.shard_capacity() << "\n";
    print_stats("multi-thread", shared);

    // TTL
    ShardedLRU<std::string, int>::Options opt;
    opt.shards = 2;
    opt.ttl = 50ms;
    ShardedLRU<std::string, int> session(4, opt);
    session.put("token", 42);
    std::cout << "token before ttl: " << session.get("token").value_or(-1) << "\n";
    std::this_thread::sleep_for(80ms);
    std::cout << "token after ttl: " << session.get("token").value_or(-1) << "\n";
    std::cout << "session size: " << session.size() << "\n";
    return 0;
}
