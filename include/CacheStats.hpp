#pragma once
#include <cstdint>
#include <cstddef>

// Counters since construction or the last clear().
// Expired entries found by get() count as misses and as expirations.
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;      // capacity pressure only
    uint64_t expirations = 0;

    double hit_rate() const {
        const uint64_t total = hits + misses;
        return total ? double(hits) / double(total) : 0.0;
    }

    CacheStats& operator+=(const CacheStats& o) {
        hits += o.hits;
        misses += o.misses;
        evictions += o.evictions;
        expirations += o.expirations;
        return *this;
    }
};

struct ShardStats {
    size_t size = 0;
    size_t capacity = 0;
    CacheStats counters;
};
