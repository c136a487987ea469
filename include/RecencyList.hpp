#pragma once
#include <vector>
#include <optional>
#include <cstddef>
#include <utility>

// Doubly-linked recency list over an arena of nodes.
// Nodes are addressed by integer handles that stay valid until the node is
// erased; freed slots are recycled. Two permanent sentinels bound the list so
// linking never has to special-case an empty or single-element list.
// front() is the most-recently-used end, back() the least-recently-used end.
template <typename T>
class RecencyList {
    public:
        using Handle = size_t;
        static constexpr Handle npos = static_cast<Handle>(-1);

        RecencyList() {
            reset();
        }

        Handle emplace_front(T item) {
            Handle h;
            if (!free_.empty()) {
                h = free_.back();
                free_.pop_back();
                nodes_[h].item.emplace(std::move(item));
            } else {
                h = nodes_.size();
                nodes_.push_back(Node{std::move(item), npos, npos});
            }
            link_front(h);
            ++size_;
            return h;
        }

        void move_to_front(Handle h) {
            unlink(h);
            link_front(h);
        }

        // Removes the node and returns its item; the handle becomes invalid.
        T erase(Handle h) {
            unlink(h);
            T item = std::move(*nodes_[h].item);
            nodes_[h].item.reset();
            free_.push_back(h);
            --size_;
            return item;
        }

        std::optional<T> pop_back() {
            Handle h = back();
            if (h == npos) {
                return std::nullopt;
            }
            return erase(h);
        }

        Handle front() const {
            Handle h = nodes_[kMru].less_recent;
            return h == kLru ? npos : h;
        }

        Handle back() const {
            Handle h = nodes_[kLru].more_recent;
            return h == kMru ? npos : h;
        }

        Handle more_recent(Handle h) const {
            Handle n = nodes_[h].more_recent;
            return n == kMru ? npos : n;
        }

        Handle less_recent(Handle h) const {
            Handle n = nodes_[h].less_recent;
            return n == kLru ? npos : n;
        }

        T& operator[](Handle h) { return *nodes_[h].item; }
        const T& operator[](Handle h) const { return *nodes_[h].item; }

        size_t size() const { return size_; }
        bool empty() const { return size_ == 0; }

        void clear() {
            nodes_.clear();
            free_.clear();
            reset();
        }

    private:
        struct Node {
            std::optional<T> item;     // empty for sentinels and free slots
            Handle more_recent;
            Handle less_recent;
        };

        static constexpr Handle kMru = 0;
        static constexpr Handle kLru = 1;

        void reset() {
            nodes_.push_back(Node{std::nullopt, npos, kLru});
            nodes_.push_back(Node{std::nullopt, kMru, npos});
            size_ = 0;
        }

        void unlink(Handle h) {
            Node& n = nodes_[h];
            nodes_[n.more_recent].less_recent = n.less_recent;
            nodes_[n.less_recent].more_recent = n.more_recent;
            n.more_recent = npos;
            n.less_recent = npos;
        }

        void link_front(Handle h) {
            Handle first = nodes_[kMru].less_recent;
            nodes_[h].more_recent = kMru;
            nodes_[h].less_recent = first;
            nodes_[first].more_recent = h;
            nodes_[kMru].less_recent = h;
        }

        std::vector<Node> nodes_;
        std::vector<Handle> free_;
        size_t size_ = 0;
};
