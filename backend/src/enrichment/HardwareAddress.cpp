#include "enrichment/HardwareAddress.hpp"

#include <algorithm>
#include <cctype>

namespace lanscout {

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string format_mac(const std::string& raw) {
    std::string mac = trim(raw);
    if (mac.empty()) return {};
    for (char& c : mac) {
        if (c == '-' || c == '.') c = ':';
        else c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    bool bare_hex = mac.size() == 12 &&
        std::all_of(mac.begin(), mac.end(), [](unsigned char c) { return std::isxdigit(c); });
    if (bare_hex) {
        std::string out;
        for (std::size_t i = 0; i < 12; i += 2) {
            if (!out.empty()) out.push_back(':');
            out.append(mac, i, 2);
        }
        return out;
    }
    return mac;
}

std::string oui_prefix(const std::string& hardware_address) {
    std::string hex;
    for (unsigned char c : format_mac(hardware_address)) {
        if (c == ':') continue;
        if (!std::isxdigit(c)) return {};
        hex.push_back(static_cast<char>(std::toupper(c)));
        if (hex.size() == 6) return hex;
    }
    return {};
}

bool is_null_mac(const std::string& hardware_address) {
    std::string mac = format_mac(hardware_address);
    if (mac.empty()) return false;
    return std::all_of(mac.begin(), mac.end(), [](char c) { return c == '0' || c == ':'; });
}

} // namespace lanscout
