#include "core/Notifier.hpp"
#include "discovery/FriendlyName.hpp"

namespace lanscout {

Notifier::Notifier(std::ostream& out) : out_(out) {}

void Notifier::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mu_);
    enabled_ = enabled;
}

bool Notifier::enabled() const {
    std::lock_guard<std::mutex> lock(mu_);
    return enabled_;
}

bool Notifier::notify(std::size_t index, const Device& device) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!enabled_) return false;
    out_ << format_line(index, device) << std::endl;
    return true;
}

std::string Notifier::format_line(std::size_t index, const Device& device) {
    std::string friendly = device.friendly_name;
    if (friendly.empty()) friendly = short_service_name(device.service_type);
    if (friendly.empty()) friendly = "Device";

    std::string line = "[" + std::to_string(index + 1) + "] " + friendly;
    auto append = [&line](const char* label, const std::string& value) {
        if (value.empty()) return;
        line += " | ";
        line += label;
        line += value;
    };
    append("IP: ", device.address());
    append("Host: ", device.hostname);
    append("MAC: ", device.hardware_address);
    append("Vendor: ", device.vendor);
    line += " | Service: " + device.service_type;
    line += " | Name: " + device.instance_name;
    return line;
}

} // namespace lanscout
