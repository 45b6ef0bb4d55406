#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace lanscout {

// Size-capped memo table. Oldest insertions are evicted first once the
// capacity is reached. Empty values are cached like any other value so that
// negative results are remembered too.
template <typename K, typename V>
class BoundedCache {
public:
    explicit BoundedCache(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    std::optional<V> get(const K& key) const {
        std::shared_lock lock(mu_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    // First writer wins; a concurrent duplicate put keeps the stored value.
    V put(const K& key, V value) {
        std::unique_lock lock(mu_);
        auto it = entries_.find(key);
        if (it != entries_.end()) return it->second;
        while (entries_.size() >= capacity_ && !order_.empty()) {
            entries_.erase(order_.front());
            order_.pop_front();
        }
        order_.push_back(key);
        entries_.emplace(key, value);
        return value;
    }

    std::size_t size() const {
        std::shared_lock lock(mu_);
        return entries_.size();
    }

    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::shared_mutex mu_;
    std::unordered_map<K, V> entries_;
    std::deque<K> order_;
};

} // namespace lanscout
