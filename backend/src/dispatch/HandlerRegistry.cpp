#include "dispatch/HandlerRegistry.hpp"
#include "discovery/FriendlyName.hpp"
#include "core/ErrorCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace lanscout {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct EcosystemMarker {
    std::vector<std::string> needles;
    std::string key;
};

const std::vector<EcosystemMarker>& ecosystem_markers() {
    static const std::vector<EcosystemMarker> markers = {
        { {"matter"}, "matter" },
        { {"homeassistant", "hass"}, "home-assistant" },
    };
    return markers;
}

} // namespace

void HandlerRegistry::register_handler(const std::string& key, HandlerEntry entry) {
    entry.key = key;
    std::unique_lock lock(mu_);
    handlers_[key] = std::move(entry);
}

std::vector<HandlerEntry> HandlerRegistry::list_handlers() const {
    std::shared_lock lock(mu_);
    std::vector<HandlerEntry> out;
    out.reserve(handlers_.size());
    for (const auto& [key, entry] : handlers_) out.push_back(entry);
    return out;
}

std::optional<HandlerEntry> HandlerRegistry::find_handler(const Device& device) const {
    if (auto h = match_exact(device)) return h;
    if (auto h = match_metadata(device)) return h;
    return match_substring(device);
}

std::optional<HandlerEntry> HandlerRegistry::match_exact(const Device& device) const {
    const std::string short_name = short_service_name(device.service_type);
    std::shared_lock lock(mu_);
    auto it = handlers_.find(short_name);
    if (it == handlers_.end()) return std::nullopt;
    return it->second;
}

std::optional<HandlerEntry> HandlerRegistry::match_metadata(const Device& device) const {
    std::shared_lock lock(mu_);
    for (const auto& [k, v] : device.metadata) {
        const std::string text = lower(k + v);
        for (const auto& marker : ecosystem_markers()) {
            bool hit = std::any_of(marker.needles.begin(), marker.needles.end(),
                                   [&text](const std::string& n) { return text.find(n) != std::string::npos; });
            if (!hit) continue;
            auto it = handlers_.find(marker.key);
            if (it != handlers_.end()) return it->second;
        }
    }
    return std::nullopt;
}

std::optional<HandlerEntry> HandlerRegistry::match_substring(const Device& device) const {
    const std::string friendly = lower(device.friendly_name);
    const std::string name = lower(device.instance_name);
    std::shared_lock lock(mu_);
    for (const auto& [key, entry] : handlers_) {
        if (key.empty()) continue;
        if (friendly.find(key) != std::string::npos || name.find(key) != std::string::npos) return entry;
    }
    return std::nullopt;
}

DispatchResult HandlerRegistry::dispatch(const Device& device) const {
    auto handler = find_handler(device);
    if (!handler || !handler->interact) {
        std::string short_name = short_service_name(device.service_type);
        return { DispatchStatus::NoHandler,
                 std::string(errors::MSG_NO_HANDLER_PREFIX) + (short_name.empty() ? "unknown" : short_name) };
    }
    try {
        handler->interact(device);
    } catch (const std::exception& e) {
        return { DispatchStatus::HandlerFailed, errors::with_detail(errors::MSG_E3300_HANDLER_FAILED_PREFIX, e.what()) };
    } catch (...) {
        return { DispatchStatus::HandlerFailed, errors::with_detail(errors::MSG_E3300_HANDLER_FAILED_PREFIX, errors::D3300_UNKNOWN_EXCEPTION) };
    }
    return { DispatchStatus::Completed, handler->display_name };
}

} // namespace lanscout
