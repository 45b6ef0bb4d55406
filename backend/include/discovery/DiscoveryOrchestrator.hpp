#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "Device.hpp"
#include "discovery/ClaimSet.hpp"
#include "discovery/IServiceBrowser.hpp"

namespace lanscout {

class DeviceRegistry;
class EnrichmentPipeline;
class Notifier;

/**
 * @brief Turns browser events into DeviceRegistry entries.
 *
 * Browsing is two-phase: the enumeration meta-service announces service
 * types, and each type seen for the first time gets its own browser. Every
 * instance event claims its (type, name) key before resolving, so duplicate
 * or concurrent events cannot append twice. Resolved devices with an address
 * are handed to the enrichment pipeline without waiting for it.
 */
class DiscoveryOrchestrator : public IServiceListener {
public:
    DiscoveryOrchestrator(IServiceBrowser& browser, DeviceRegistry& registry,
                          EnrichmentPipeline& enrichment, Notifier& notifier,
                          std::chrono::milliseconds resolve_timeout = std::chrono::milliseconds(2500));

    // Subscribe to the service-type enumeration meta-service.
    void start();

    void on_service_added(const std::string& type, const std::string& name) override;
    void on_service_updated(const std::string& type, const std::string& name) override;
    void on_service_removed(const std::string& type, const std::string& name) override;

    const ServiceTypeRegistry& browsed_types() const { return browsed_types_; }
    const InstanceKeySet& known_instances() const { return known_instances_; }

    // Ensure a service type string ends in ".local."
    static std::string normalize_service_type(const std::string& type);

private:
    void handle_type_announcement(const std::string& announced);
    void handle_instance(const std::string& type, const std::string& name);
    std::size_t record_device(Device dev);

    IServiceBrowser& browser_;
    DeviceRegistry& registry_;
    EnrichmentPipeline& enrichment_;
    Notifier& notifier_;
    std::chrono::milliseconds resolve_timeout_;

    ServiceTypeRegistry browsed_types_;
    InstanceKeySet known_instances_;
};

} // namespace lanscout
