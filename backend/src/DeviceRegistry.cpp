#include "DeviceRegistry.hpp"

namespace lanscout {

DeviceRegistry::DeviceRegistry() {}

std::size_t DeviceRegistry::register_device(Device dev) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    devices.push_back(std::move(dev));
    return devices.size() - 1;
}

std::pair<std::size_t, bool> DeviceRegistry::upsert_device(Device dev) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto idx = find_index_locked(dev.service_type, dev.instance_name);
    if (!idx) {
        devices.push_back(std::move(dev));
        return { devices.size() - 1, true };
    }
    Device& existing = devices[*idx];
    if (!existing.hardware_address.empty()) dev.hardware_address = existing.hardware_address;
    if (!existing.vendor.empty()) dev.vendor = existing.vendor;
    existing = std::move(dev);
    return { *idx, false };
}

bool DeviceRegistry::update_device(std::size_t index, const std::function<void(Device&)>& fn) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    if (index >= devices.size()) return false;
    fn(devices[index]);
    return true;
}

std::optional<Device> DeviceRegistry::get_device(std::size_t index) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    if (index >= devices.size()) return std::nullopt;
    return devices[index];
}

std::optional<std::size_t> DeviceRegistry::find_index(const std::string& service_type, const std::string& instance_name) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return find_index_locked(service_type, instance_name);
}

std::optional<std::size_t> DeviceRegistry::find_index_locked(const std::string& service_type, const std::string& instance_name) const {
    for (std::size_t i = 0; i < devices.size(); ++i) {
        if (devices[i].service_type == service_type && devices[i].instance_name == instance_name) return i;
    }
    return std::nullopt;
}

std::vector<Device> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return devices;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return devices.size();
}

nlohmann::json DeviceRegistry::get_descriptor_graph() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    nlohmann::json graph = nlohmann::json::array();
    for (const auto& d : devices) {
        graph.push_back(d);
    }
    return graph;
}

} // namespace lanscout
