#include "Device.hpp"

namespace lanscout {

void to_json(nlohmann::json& j, const Device& d) {
    j = {
        {"type", d.service_type},
        {"name", d.instance_name},
        {"friendly", d.friendly_name},
        {"hostname", d.hostname},
        {"ip", d.address()},
        {"ipv4", d.ipv4},
        {"ipv6", d.ipv6},
        {"mac", d.hardware_address},
        {"vendor", d.vendor},
        {"properties", d.metadata}
    };
}

void from_json(const nlohmann::json& j, Device& d) {
    d.service_type = j.value("type", "");
    d.instance_name = j.value("name", "");
    d.friendly_name = j.value("friendly", "");
    d.hostname = j.value("hostname", "");
    d.ipv4 = j.value("ipv4", "");
    d.ipv6 = j.value("ipv6", "");
    d.hardware_address = j.value("mac", "");
    d.vendor = j.value("vendor", "");
    d.metadata.clear();
    if (j.contains("properties") && j["properties"].is_object()) {
        for (auto it = j["properties"].begin(); it != j["properties"].end(); ++it) {
            if (it.value().is_string()) d.metadata[it.key()] = it.value().get<std::string>();
        }
    }
    d.raw_service_info = nullptr;
}

} // namespace lanscout
