#pragma once
#include <chrono>
#include <cstddef>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "core/BoundedCache.hpp"
#include "enrichment/INetworkProbe.hpp"
#include "enrichment/IVendorDatabase.hpp"

namespace lanscout {

/**
 * @brief Memoized IP -> hardware address and hardware address -> vendor lookups.
 *
 * Both tables are bounded and remember empty (negative) results. Concurrent
 * lookups of the same key share one resolution. A vendor miss refreshes the
 * database at most once per hardware address, even after the miss has been
 * evicted. Collaborator errors degrade to empty strings.
 */
class IdentityCache {
public:
    IdentityCache(INetworkProbe& probe, IVendorDatabase& vendors,
                  std::size_t capacity = 4096,
                  std::chrono::milliseconds probe_timeout = std::chrono::milliseconds(1000));

    /** @brief Layer-2 probe, then neighbor table, then reachability probe + neighbor table. */
    std::string hardware_address_for(const std::string& ip);

    /** @brief Vendor lookup; a miss triggers one database refresh and retry. */
    std::string vendor_for(const std::string& hardware_address);

    std::size_t cached_addresses() const { return addresses_.size(); }
    std::size_t cached_vendors() const { return vendors_.size(); }

private:
    using InFlight = std::unordered_map<std::string, std::shared_future<std::string>>;

    template <typename Resolve>
    std::string memoized(BoundedCache<std::string, std::string>& cache, InFlight& flights,
                         const std::string& key, Resolve resolve);

    std::string resolve_hardware_address(const std::string& ip);
    std::string resolve_vendor(const std::string& hardware_address);

    INetworkProbe& probe_;
    IVendorDatabase& vendor_db_;
    std::chrono::milliseconds probe_timeout_;
    BoundedCache<std::string, std::string> addresses_;
    BoundedCache<std::string, std::string> vendors_;

    std::mutex flights_m_;
    InFlight address_flights_;
    InFlight vendor_flights_;

    std::mutex refreshed_m_;
    std::unordered_set<std::string> refreshed_;
};

} // namespace lanscout
