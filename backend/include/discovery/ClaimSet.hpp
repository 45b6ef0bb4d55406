#pragma once
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace lanscout {

// Mutex-guarded key set with an atomic check-and-set.
template <typename Key>
class ClaimSet {
public:
    // True if the key was absent and is now claimed by the caller.
    bool try_claim(const Key& key) {
        std::lock_guard<std::mutex> lock(mu_);
        return keys_.insert(key).second;
    }

    // True if the key was present.
    bool release(const Key& key) {
        std::lock_guard<std::mutex> lock(mu_);
        return keys_.erase(key) > 0;
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        return keys_.count(key) > 0;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return keys_.size();
    }

private:
    mutable std::mutex mu_;
    std::set<Key> keys_;
};

// (service type, instance name)
using InstanceKey = std::pair<std::string, std::string>;

// Instances currently known; cleared by a remove event.
using InstanceKeySet = ClaimSet<InstanceKey>;

// Service types already being browsed; never cleared.
using ServiceTypeRegistry = ClaimSet<std::string>;

} // namespace lanscout
