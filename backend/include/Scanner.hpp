#pragma once
#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "Device.hpp"
#include "DeviceRegistry.hpp"
#include "core/Notifier.hpp"
#include "core/ScannerConfig.hpp"
#include "discovery/DiscoveryOrchestrator.hpp"
#include "dispatch/HandlerRegistry.hpp"
#include "enrichment/EnrichmentPipeline.hpp"
#include "enrichment/IdentityCache.hpp"

namespace lanscout {

class IServiceBrowser;
class INetworkProbe;
class IVendorDatabase;

/**
 * @brief One scanner instance: device store, discovery, enrichment and handlers.
 *
 * All state is owned per instance, so several scanners can coexist (tests do).
 * The collaborators must outlive the scanner.
 */
class Scanner {
public:
    Scanner(IServiceBrowser& browser, INetworkProbe& probe, IVendorDatabase& vendors,
            const ScannerConfig& config = ScannerConfig{}, std::ostream& out = std::cout);
    ~Scanner();

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    // Begin browsing the service-type enumeration meta-service.
    void start();
    // Stop the browser and abandon queued enrichment. Idempotent.
    void stop();

    std::vector<Device> list_devices() const;
    std::optional<Device> device_at(std::size_t index) const;
    void set_notifications_enabled(bool enabled);

    // Write the current snapshot as a JSON array; returns the record count.
    // Throws std::runtime_error if the file cannot be written.
    std::size_t export_json(const std::string& path) const;

    void register_handler(const std::string& key, HandlerEntry entry);
    std::vector<HandlerEntry> list_handlers() const;
    std::optional<HandlerEntry> find_handler(const Device& device) const;
    // Dispatch to the handler for the device at 0-based index.
    DispatchResult interact(std::size_t index) const;

    // Wait until queued enrichment work has drained.
    bool wait_for_enrichment(std::chrono::milliseconds timeout);

    DiscoveryOrchestrator& orchestrator() { return orchestrator_; }
    HandlerRegistry& handlers() { return handlers_; }
    const ScannerConfig& config() const { return config_; }

private:
    ScannerConfig config_;
    IServiceBrowser& browser_;
    DeviceRegistry registry_;
    Notifier notifier_;
    IdentityCache identity_;
    EnrichmentPipeline enrichment_;
    HandlerRegistry handlers_;
    DiscoveryOrchestrator orchestrator_;
    bool stopped_ = false;
};

} // namespace lanscout
