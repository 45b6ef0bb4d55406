#pragma once
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace lanscout {

/**
 * @brief One discovered service instance.
 *
 * (service_type, instance_name) identifies the record. hardware_address and
 * vendor stay empty until the enrichment pipeline fills them, and are never
 * overwritten once non-empty.
 */
struct Device {
    /** @brief Raw protocol type string, e.g. "_hue._tcp.local." */
    std::string service_type;
    std::string instance_name;
    /** @brief Display label derived from the type and metadata */
    std::string friendly_name;
    std::string hostname;
    std::string ipv4;
    std::string ipv6;
    std::string hardware_address;
    std::string vendor;
    /** @brief Decoded TXT key/value records (empty when resolution failed) */
    std::map<std::string, std::string> metadata;
    /** @brief Opaque resolver payload. Never exported. */
    nlohmann::json raw_service_info;

    /** @brief Display address: IPv4 when known, IPv6 otherwise */
    std::string address() const { return ipv4.empty() ? ipv6 : ipv4; }
};

// Flat export record; raw_service_info is omitted.
void to_json(nlohmann::json& j, const Device& d);
void from_json(const nlohmann::json& j, Device& d);

} // namespace lanscout
