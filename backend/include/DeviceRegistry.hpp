#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "Device.hpp"

namespace lanscout {

/**
 * @brief Insertion-ordered store of discovered devices.
 *
 * Indices are 0-based and stable for the lifetime of the registry; later
 * updates never move an entry. All access goes through registry_mutex and
 * readers receive copies.
 */
class DeviceRegistry {
public:
    DeviceRegistry();

    // Append unconditionally; returns the new entry's index.
    std::size_t register_device(Device dev);

    // Append, or refresh the existing entry with the same (type, name) in place.
    // Non-empty hardware_address/vendor of an existing entry are preserved.
    // Returns {index, inserted}.
    std::pair<std::size_t, bool> upsert_device(Device dev);

    // Mutate one entry under the registry lock. fn must not call back into the registry.
    // Returns false when index is out of range.
    bool update_device(std::size_t index, const std::function<void(Device&)>& fn);

    std::optional<Device> get_device(std::size_t index) const;
    std::optional<std::size_t> find_index(const std::string& service_type, const std::string& instance_name) const;

    // Apply a function to each device (thread-safe, in insertion order)

    // Point-in-time copy of every entry
    std::vector<Device> snapshot() const;
    std::size_t size() const;

    // Export records for every device (raw_service_info omitted)
    nlohmann::json get_descriptor_graph() const;

private:
    std::optional<std::size_t> find_index_locked(const std::string& service_type, const std::string& instance_name) const;

    std::vector<Device> devices;
    mutable std::mutex registry_mutex;
};

} // namespace lanscout
