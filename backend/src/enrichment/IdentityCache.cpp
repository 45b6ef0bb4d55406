#include "enrichment/IdentityCache.hpp"
#include "enrichment/HardwareAddress.hpp"

#include <iostream>
#include <stdexcept>

namespace lanscout {

IdentityCache::IdentityCache(INetworkProbe& probe, IVendorDatabase& vendors,
                             std::size_t capacity, std::chrono::milliseconds probe_timeout)
: probe_(probe), vendor_db_(vendors), probe_timeout_(probe_timeout),
  addresses_(capacity), vendors_(capacity) {}

// The first caller for a key resolves it; callers arriving meanwhile wait on its future.
template <typename Resolve>
std::string IdentityCache::memoized(BoundedCache<std::string, std::string>& cache, InFlight& flights,
                                    const std::string& key, Resolve resolve) {
    if (auto cached = cache.get(key)) return *cached;

    std::promise<std::string> promise;
    std::shared_future<std::string> pending;
    {
        std::lock_guard<std::mutex> lk(flights_m_);
        if (auto cached = cache.get(key)) return *cached;
        auto it = flights.find(key);
        if (it != flights.end()) pending = it->second;
        else flights.emplace(key, promise.get_future().share());
    }
    if (pending.valid()) return pending.get();

    std::string value;
    try {
        value = cache.put(key, resolve());
    } catch (...) {
        {
            std::lock_guard<std::mutex> lk(flights_m_);
            flights.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
    {
        // The cache is filled before the flight is removed, so late callers find the value.
        std::lock_guard<std::mutex> lk(flights_m_);
        flights.erase(key);
    }
    promise.set_value(value);
    return value;
}

std::string IdentityCache::hardware_address_for(const std::string& ip) {
    if (ip.empty()) return {};
    return memoized(addresses_, address_flights_, ip, [this, &ip]() { return resolve_hardware_address(ip); });
}

std::string IdentityCache::vendor_for(const std::string& hardware_address) {
    if (hardware_address.empty()) return {};
    return memoized(vendors_, vendor_flights_, hardware_address,
                    [this, &hardware_address]() { return resolve_vendor(hardware_address); });
}

std::string IdentityCache::resolve_hardware_address(const std::string& ip) {
    auto usable = [](const std::string& raw) {
        std::string mac = format_mac(raw);
        return is_null_mac(mac) ? std::string() : mac;
    };

    try {
        std::string mac = usable(probe_.probe_hardware_address(ip, probe_timeout_));
        if (!mac.empty()) return mac;
    } catch (const std::exception&) {
        // no raw socket access or no reply; fall through to the neighbor table
    }

    try {
        std::string mac = usable(probe_.lookup_neighbor(ip));
        if (!mac.empty()) return mac;
    } catch (const std::exception&) {
    }

    try {
        probe_.probe_reachability(ip, probe_timeout_);
    } catch (const std::exception&) {
    }

    try {
        return usable(probe_.lookup_neighbor(ip));
    } catch (const std::exception&) {
        return {};
    }
}

std::string IdentityCache::resolve_vendor(const std::string& hardware_address) {
    try {
        auto vendor = vendor_db_.lookup(hardware_address);
        if (vendor && !vendor->empty()) return *vendor;
    } catch (const std::exception&) {
        // unavailable database is treated like a miss
    }

    {
        std::lock_guard<std::mutex> lk(refreshed_m_);
        if (!refreshed_.insert(hardware_address).second) return {};
    }

    try {
        vendor_db_.refresh();
        auto vendor = vendor_db_.lookup(hardware_address);
        return vendor ? *vendor : std::string();
    } catch (const std::exception& e) {
        std::cerr << "Enrichment: vendor lookup for " << hardware_address << " failed: " << e.what() << std::endl;
        return {};
    }
}

} // namespace lanscout
