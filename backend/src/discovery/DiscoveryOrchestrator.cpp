#include "discovery/DiscoveryOrchestrator.hpp"
#include "discovery/FriendlyName.hpp"
#include "DeviceRegistry.hpp"
#include "enrichment/EnrichmentPipeline.hpp"
#include "core/Notifier.hpp"
#include "core/ErrorCatalog.hpp"

#include <iostream>
#include <stdexcept>

namespace lanscout {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

DiscoveryOrchestrator::DiscoveryOrchestrator(IServiceBrowser& browser, DeviceRegistry& registry,
                                             EnrichmentPipeline& enrichment, Notifier& notifier,
                                             std::chrono::milliseconds resolve_timeout)
: browser_(browser), registry_(registry), enrichment_(enrichment), notifier_(notifier),
  resolve_timeout_(resolve_timeout) {}

void DiscoveryOrchestrator::start() {
    browser_.browse(kServiceTypeEnumerationType, *this);
}

std::string DiscoveryOrchestrator::normalize_service_type(const std::string& type) {
    if (ends_with(type, ".local.")) return type;
    if (ends_with(type, ".local")) return type + ".";
    std::string t = type;
    while (!t.empty() && t.back() == '.') t.pop_back();
    return t + ".local.";
}

void DiscoveryOrchestrator::on_service_added(const std::string& type, const std::string& name) {
    if (type == kServiceTypeEnumerationType) {
        handle_type_announcement(name);
        return;
    }
    handle_instance(type, name);
}

void DiscoveryOrchestrator::on_service_updated(const std::string& type, const std::string& name) {
    on_service_added(type, name);
}

void DiscoveryOrchestrator::on_service_removed(const std::string& type, const std::string& name) {
    // Types stay browsed for the lifetime of the process.
    if (type == kServiceTypeEnumerationType) return;
    known_instances_.release(InstanceKey{type, name});
}

void DiscoveryOrchestrator::handle_type_announcement(const std::string& announced) {
    const std::string type = normalize_service_type(announced);
    if (!browsed_types_.try_claim(type)) return;
    try {
        browser_.browse(type, *this);
    } catch (const std::exception& e) {
        std::cerr << "Discovery: " << errors::with_detail(errors::MSG_E3100_BROWSE_FAILED_PREFIX, type + " (" + e.what() + ")") << std::endl;
    }
}

void DiscoveryOrchestrator::handle_instance(const std::string& type, const std::string& name) {
    const InstanceKey key{type, name};
    // Claim before resolving so a concurrent duplicate event cannot append a second entry.
    if (!known_instances_.try_claim(key)) return;

    std::optional<ResolvedInstance> info;
    try {
        info = browser_.resolve(type, name, resolve_timeout_);
    } catch (const std::exception& e) {
        // Drop the event; the claim is released so a later add/update can retry.
        known_instances_.release(key);
        std::cerr << "Discovery: " << errors::with_detail(errors::MSG_E3110_RESOLVE_FAILED_PREFIX, name + " (" + e.what() + ")") << std::endl;
        return;
    }

    Device dev;
    dev.service_type = type;
    dev.instance_name = name;

    if (!info) {
        // No record at all: still list the instance, without addresses.
        dev.friendly_name = friendly_name(type);
        record_device(std::move(dev));
        return;
    }

    dev.hostname = info->hostname;
    while (!dev.hostname.empty() && dev.hostname.back() == '.') dev.hostname.pop_back();

    // First IPv4 wins and ends the scan; the last IPv6 seen before it is kept as well.
    for (const auto& addr : info->addresses) {
        if (addr.find(':') != std::string::npos) {
            dev.ipv6 = addr;
        } else {
            dev.ipv4 = addr;
            break;
        }
    }

    dev.metadata = info->metadata;
    dev.friendly_name = friendly_name(type, dev.metadata);
    dev.raw_service_info = info->raw;
    record_device(std::move(dev));
}

std::size_t DiscoveryOrchestrator::record_device(Device dev) {
    const bool has_address = !dev.address().empty();
    auto [index, inserted] = registry_.upsert_device(dev);
    if (!inserted) {
        // Rediscovered after a remove: the entry was refreshed in place.
        auto current = registry_.get_device(index);
        if (current) dev = *current;
    }
    notifier_.notify(index, dev);
    if (has_address) enrichment_.submit(index);
    return index;
}

} // namespace lanscout
