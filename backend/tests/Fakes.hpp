#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "discovery/IServiceBrowser.hpp"
#include "enrichment/HardwareAddress.hpp"
#include "enrichment/INetworkProbe.hpp"
#include "enrichment/IVendorDatabase.hpp"

namespace lanscout::fakes {

// Scripted discovery client. Events are injected by calling the listener directly.
class FakeServiceBrowser : public IServiceBrowser {
public:
    enum class Outcome { Found, Absent, Fail };

    void browse(const std::string& type, IServiceListener& listener) override {
        std::lock_guard<std::mutex> lk(m);
        if (failing_types.count(type)) throw std::runtime_error("browse refused");
        browsed.push_back(type);
        last_listener = &listener;
    }

    std::optional<ResolvedInstance> resolve(const std::string& type, const std::string& name,
                                            std::chrono::milliseconds /*timeout*/) override {
        ++resolve_calls;
        if (resolve_delay.count() > 0) std::this_thread::sleep_for(resolve_delay);
        std::lock_guard<std::mutex> lk(m);
        auto it = scripts.find(name);
        if (it == scripts.end()) return std::nullopt;
        if (it->second.outcome == Outcome::Fail) throw std::runtime_error("resolve timed out for " + type);
        if (it->second.outcome == Outcome::Absent) return std::nullopt;
        return it->second.instance;
    }

    void stop() override { stopped = true; }

    void script_found(const std::string& name, ResolvedInstance instance) {
        std::lock_guard<std::mutex> lk(m);
        scripts[name] = { Outcome::Found, std::move(instance) };
    }
    void script_outcome(const std::string& name, Outcome outcome) {
        std::lock_guard<std::mutex> lk(m);
        scripts[name] = { outcome, {} };
    }
    std::size_t browse_count(const std::string& type) {
        std::lock_guard<std::mutex> lk(m);
        std::size_t n = 0;
        for (const auto& t : browsed) if (t == type) ++n;
        return n;
    }

    struct Script {
        Outcome outcome = Outcome::Absent;
        ResolvedInstance instance;
    };

    std::mutex m;
    std::vector<std::string> browsed;
    std::set<std::string> failing_types;
    std::map<std::string, Script> scripts;
    IServiceListener* last_listener = nullptr;
    std::chrono::milliseconds resolve_delay{0};
    std::atomic<int> resolve_calls{0};
    std::atomic<bool> stopped{false};
};

inline ResolvedInstance make_instance(std::vector<std::string> addresses, std::string hostname,
                                      std::map<std::string, std::string> metadata = {}) {
    ResolvedInstance r;
    r.addresses = std::move(addresses);
    r.hostname = std::move(hostname);
    r.metadata = std::move(metadata);
    r.raw = { {"port", 80} };
    return r;
}

// Neighbor-table and probe stand-in. Lookups after a reachability probe use
// neighbor_after_probe, which models an entry appearing once traffic was sent.
class FakeNetworkProbe : public INetworkProbe {
public:
    std::string probe_hardware_address(const std::string& ip, std::chrono::milliseconds) override {
        ++layer2_calls;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (layer2_throws) throw std::runtime_error("raw socket not permitted");
        return value(layer2, ip);
    }
    std::string lookup_neighbor(const std::string& ip) override {
        ++neighbor_calls;
        if (reachability_calls > 0) {
            auto v = value(neighbor_after_probe, ip);
            if (!v.empty()) return v;
        }
        return value(neighbor, ip);
    }
    void probe_reachability(const std::string&, std::chrono::milliseconds) override {
        ++reachability_calls;
    }

    std::string value(const std::map<std::string, std::string>& table, const std::string& ip) {
        std::lock_guard<std::mutex> lk(m);
        auto it = table.find(ip);
        return it == table.end() ? std::string() : it->second;
    }

    std::mutex m;
    std::map<std::string, std::string> layer2;
    std::map<std::string, std::string> neighbor;
    std::map<std::string, std::string> neighbor_after_probe;
    bool layer2_throws = false;
    std::chrono::milliseconds delay{0};
    std::atomic<int> layer2_calls{0};
    std::atomic<int> neighbor_calls{0};
    std::atomic<int> reachability_calls{0};
};

// Prefix table keyed by six hex digits. refresh() merges after_refresh.
class FakeVendorDatabase : public IVendorDatabase {
public:
    std::optional<std::string> lookup(const std::string& hardware_address) override {
        ++lookup_calls;
        std::lock_guard<std::mutex> lk(m);
        if (unavailable) throw std::runtime_error("vendor database unavailable");
        auto it = prefixes.find(oui_prefix(hardware_address));
        if (it == prefixes.end()) return std::nullopt;
        return it->second;
    }
    void refresh() override {
        ++refresh_calls;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        std::lock_guard<std::mutex> lk(m);
        if (refresh_throws) throw std::runtime_error("refresh failed");
        unavailable = false;
        for (const auto& [k, v] : after_refresh) prefixes[k] = v;
    }

    std::mutex m;
    std::map<std::string, std::string> prefixes;
    std::map<std::string, std::string> after_refresh;
    bool unavailable = false;
    bool refresh_throws = false;
    std::chrono::milliseconds delay{0};
    std::atomic<int> lookup_calls{0};
    std::atomic<int> refresh_calls{0};
};

} // namespace lanscout::fakes
