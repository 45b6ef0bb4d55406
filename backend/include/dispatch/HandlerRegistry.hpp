#pragma once
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "Device.hpp"

namespace lanscout {

/**
 * @brief Interaction handler for one class of device.
 *
 * interact runs a blocking session against a device snapshot and may throw.
 */
struct HandlerEntry {
    std::string key;
    std::string display_name;
    std::function<void(const Device&)> interact;
};

enum class DispatchStatus { Completed, NoHandler, InvalidIndex, HandlerFailed };

struct DispatchResult {
    DispatchStatus status = DispatchStatus::Completed;
    std::string message;
};

/**
 * @brief Maps devices to interaction handlers.
 *
 * find_handler tries three passes in order and returns the first hit:
 *  1. the device's short service name equals a registered key;
 *  2. a metadata key or value contains a known ecosystem marker
 *     ("matter", "homeassistant"/"hass") whose key is registered;
 *  3. a registered key is a substring of the friendly or instance name.
 * Pass 3 is best-effort: with overlapping keys the first key in sorted
 * order wins.
 */
class HandlerRegistry {
public:
    // Last registration for a key wins.
    void register_handler(const std::string& key, HandlerEntry entry);

    // Registered handlers sorted by key.
    std::vector<HandlerEntry> list_handlers() const;

    std::optional<HandlerEntry> find_handler(const Device& device) const;

    // Find and run the handler. Handler exceptions are caught and reported in the result.
    DispatchResult dispatch(const Device& device) const;

private:
    std::optional<HandlerEntry> match_exact(const Device& device) const;
    std::optional<HandlerEntry> match_metadata(const Device& device) const;
    std::optional<HandlerEntry> match_substring(const Device& device) const;

    mutable std::shared_mutex mu_;
    std::map<std::string, HandlerEntry> handlers_;
};

} // namespace lanscout
