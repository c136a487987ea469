#pragma once
#include <vector>
#include <mutex>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include <stdexcept>
#include <limits>
#include "LRUCache.hpp"
#include "CacheStats.hpp"

// Thread-safe LRU split into independently locked shards.
// A key always routes to shard hash(key) % num_shards(). Each shard gets
// ceil(capacity / shards) slots (at least 1), so total_capacity() can exceed
// the requested capacity when it does not divide evenly.
// Every method holds at most one shard lock at a time.
template <typename Key, typename Value,
          typename Hash = std::hash<Key>,
          typename Clock = std::chrono::steady_clock>
class ShardedLRU {
    public:
        using Shard = LRUCache<Key, Value, Hash, Clock>;
        using Duration = typename Shard::Duration;

        static constexpr size_t kDefaultShards = 16;

        struct Options {
            size_t shards = kDefaultShards;
            std::optional<Duration> ttl;   // unset: entries never expire
        };

        explicit ShardedLRU(size_t capacity) : ShardedLRU(capacity, Options()) {}

        ShardedLRU(size_t capacity, size_t num_shards)
            : ShardedLRU(capacity, with_shards(num_shards)) {}

        ShardedLRU(size_t capacity, const Options& opt)
            : capacity_(capacity), ttl_(opt.ttl) {
            if (capacity == 0) {
                throw std::invalid_argument("capacity must be > 0");
            }
            if (opt.shards == 0) {
                throw std::invalid_argument("num_shards must be > 0");
            }
            if (opt.ttl && opt.ttl->count() <= 0) {
                throw std::invalid_argument("ttl must be > 0");
            }
            shard_capacity_ = capacity / opt.shards + (capacity % opt.shards != 0);
            locks_ = std::vector<std::mutex>(opt.shards);
            shards_.reserve(opt.shards);
            for (size_t i = 0; i < opt.shards; i++) {
                shards_.push_back(std::make_unique<Shard>(shard_capacity_, opt.ttl));
            }
        }

        std::optional<Value> get(const Key& key) {
            const size_t i = shard_index(key);
            std::scoped_lock lock(locks_[i]);
            return shards_[i]->get(key);
        }

        void put(const Key& key, const Value& value) {
            const size_t i = shard_index(key);
            std::scoped_lock lock(locks_[i]);
            shards_[i]->put(key, value);
        }

        std::optional<Value> erase(const Key& key) {
            const size_t i = shard_index(key);
            std::scoped_lock lock(locks_[i]);
            return shards_[i]->erase(key);
        }

        bool contains(const Key& key) {
            const size_t i = shard_index(key);
            std::scoped_lock lock(locks_[i]);
            return shards_[i]->contains(key);
        }

        // Approximate under concurrent writers: shards are summed one at a time.
        size_t size() {
            size_t s = 0;
            for (size_t i = 0; i < shards_.size(); i++) {
                std::scoped_lock lock(locks_[i]);
                s += shards_[i]->size();
            }
            return s;
        }

        void clear() {
            for (size_t i = 0; i < shards_.size(); i++) {
                std::scoped_lock lock(locks_[i]);
                shards_[i]->clear();
            }
        }

        size_t purge_expired() {
            size_t removed = 0;
            for (size_t i = 0; i < shards_.size(); i++) {
                std::scoped_lock lock(locks_[i]);
                removed += shards_[i]->purge_expired();
            }
            return removed;
        }

        CacheStats stats() {
            CacheStats total;
            for (size_t i = 0; i < shards_.size(); i++) {
                std::scoped_lock lock(locks_[i]);
                total += shards_[i]->stats();
            }
            return total;
        }

        // Indexed by shard; sizes exclude expired entries.
        std::vector<ShardStats> shard_stats() {
            std::vector<ShardStats> out;
            out.reserve(shards_.size());
            for (size_t i = 0; i < shards_.size(); i++) {
                std::scoped_lock lock(locks_[i]);
                shards_[i]->purge_expired();
                out.push_back(shards_[i]->shard_stats());
            }
            return out;
        }

        uint64_t hits() { return stats().hits; }
        uint64_t misses() { return stats().misses; }

        bool consistent() {
            for (size_t i = 0; i < shards_.size(); i++) {
                std::scoped_lock lock(locks_[i]);
                if (!shards_[i]->consistent()) {
                    return false;
                }
            }
            return true;
        }

        size_t shard_index(const Key& key) const {
            return hasher_(key) % shards_.size();
        }

        size_t num_shards() const {
            return shards_.size();
        }

        size_t capacity() const {
            return capacity_;
        }

        size_t shard_capacity() const {
            return shard_capacity_;
        }

        // Saturates at SIZE_MAX when the rounded-up sum does not fit.
        size_t total_capacity() const {
            if (shard_capacity_ > std::numeric_limits<size_t>::max() / shards_.size()) {
                return std::numeric_limits<size_t>::max();
            }
            return shard_capacity_ * shards_.size();
        }

        std::optional<Duration> ttl() const {
            return ttl_;
        }

    private:
        static Options with_shards(size_t num_shards) {
            Options opt;
            opt.shards = num_shards;
            return opt;
        }

        size_t capacity_;
        size_t shard_capacity_ = 0;
        std::optional<Duration> ttl_;
        std::vector<std::mutex> locks_;
        std::vector<std::unique_ptr<Shard>> shards_;
        Hash hasher_;
};
