#pragma once
#include <unordered_map>
#include <optional>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <utility>
#include "RecencyList.hpp"
#include "CacheStats.hpp"

// Single LRU partition with optional TTL. Not synchronized: the owner must
// serialize calls (ShardedLRU holds one mutex per instance).
template <typename Key, typename Value,
          typename Hash = std::hash<Key>,
          typename Clock = std::chrono::steady_clock>
class LRUCache {
    public:
        using Duration = typename Clock::duration;
        using TimePoint = typename Clock::time_point;

        explicit LRUCache(size_t capacity, std::optional<Duration> ttl = std::nullopt)
            : capacity_(capacity), ttl_(ttl) {
            if (capacity_ == 0) throw std::invalid_argument("capacity must be > 0");
            if (ttl_ && ttl_->count() <= 0) throw std::invalid_argument("ttl must be > 0");
        }

        // Returns value if present and live; moves key to MRU position
        std::optional<Value> get(const Key& key) {
            auto it = find_live(key);
            if (it == map_.end()) {
                ++stats_.misses;
                return std::nullopt;
            }
            items_.move_to_front(it->second);
            ++stats_.hits;
            return items_[it->second].value;
        }

        void put(const Key& key, const Value& value) {
            auto it = find_live(key);
            if (it != map_.end()) {
                Entry& e = items_[it->second];
                e.value = value;
                e.expires_at = expiry();
                items_.move_to_front(it->second);
                return;
            }
            // map slot first so a failed insert can be undone without touching the list
            auto slot = map_.try_emplace(key, RecencyList<Entry>::npos).first;
            try {
                slot->second = items_.emplace_front(Entry{key, value, expiry()});
            } catch (...) {
                map_.erase(slot);
                throw;
            }
            if (map_.size() > capacity_) {
                auto victim = items_.pop_back();
                map_.erase(victim->key);
                ++stats_.evictions;
            }
        }

        // Returns the removed value, or nullopt if the key was absent or expired.
        std::optional<Value> erase(const Key& key) {
            auto it = find_live(key);
            if (it == map_.end()) {
                return std::nullopt;
            }
            Entry e = items_.erase(it->second);
            map_.erase(it);
            return std::move(e.value);
        }

        // Does not touch recency. An expired entry is dropped, same as get().
        bool contains(const Key& key) {
            return find_live(key) != map_.end();
        }

        // Live entries only; expired ones are swept first.
        size_t size() {
            purge_expired();
            return map_.size();
        }

        size_t purge_expired() {
            if (!ttl_) return 0;
            const TimePoint now = Clock::now();
            size_t removed = 0;
            // expiry is not ordered by recency, so walk the whole list
            auto h = items_.back();
            while (h != RecencyList<Entry>::npos) {
                auto next = items_.more_recent(h);
                if (expired(items_[h], now)) {
                    drop(h);
                    ++removed;
                }
                h = next;
            }
            return removed;
        }

        void clear() {
            map_.clear();
            items_.clear();
            stats_ = CacheStats{};
        }

        size_t capacity() const {
            return capacity_;
        }

        std::optional<Duration> ttl() const {
            return ttl_;
        }

        std::optional<Key> peek_lru_key() const {
            auto h = items_.back();
            if (h == RecencyList<Entry>::npos) {
                return std::nullopt;
            }
            return items_[h].key;
        }

        CacheStats stats() const {
            return stats_;
        }

        ShardStats shard_stats() const {
            return ShardStats{map_.size(), capacity_, stats_};
        }

        // Walks the list and checks it agrees with the map in both directions.
        bool consistent() const {
            if (items_.size() != map_.size() || map_.size() > capacity_) {
                return false;
            }
            size_t walked = 0;
            for (auto h = items_.front(); h != RecencyList<Entry>::npos; h = items_.less_recent(h)) {
                auto it = map_.find(items_[h].key);
                if (it == map_.end() || it->second != h) {
                    return false;
                }
                ++walked;
            }
            return walked == map_.size();
        }

    private:
        struct Entry {
            Key key;
            Value value;
            std::optional<TimePoint> expires_at;
        };

        using Map = std::unordered_map<Key, typename RecencyList<Entry>::Handle, Hash>;

        std::optional<TimePoint> expiry() const {
            if (!ttl_) return std::nullopt;
            return Clock::now() + *ttl_;
        }

        static bool expired(const Entry& e, TimePoint now) {
            return e.expires_at && *e.expires_at <= now;
        }

        // Lookup with lazy expiry: an expired hit is removed and reported absent.
        typename Map::iterator find_live(const Key& key) {
            auto it = map_.find(key);
            if (it == map_.end() || !ttl_) {
                return it;
            }
            if (expired(items_[it->second], Clock::now())) {
                items_.erase(it->second);
                map_.erase(it);
                ++stats_.expirations;
                return map_.end();
            }
            return it;
        }

        void drop(typename RecencyList<Entry>::Handle h) {
            map_.erase(items_[h].key);
            items_.erase(h);
            ++stats_.expirations;
        }

        RecencyList<Entry> items_;
        Map map_;
        size_t capacity_;
        std::optional<Duration> ttl_;
        CacheStats stats_;
};
