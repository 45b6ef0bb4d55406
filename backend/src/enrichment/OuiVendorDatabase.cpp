#include "enrichment/OuiVendorDatabase.hpp"
#include "enrichment/HardwareAddress.hpp"
#include "core/ErrorCatalog.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace lanscout {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool is_hex(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) if (!std::isxdigit(c)) return false;
    return true;
}

} // namespace

OuiVendorDatabase::OuiVendorDatabase(std::vector<std::string> paths)
: paths_(std::move(paths)) {}

std::optional<std::pair<std::string, std::string>> OuiVendorDatabase::parse_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return std::nullopt;

    auto ws = line.find_first_of(" \t");
    if (ws == std::string::npos) return std::nullopt;
    std::string token = line.substr(0, ws);
    std::string rest = trim(line.substr(ws));

    // IEEE: "00-00-0C   (hex)\t\tCISCO SYSTEMS, INC."
    if (token.size() == 8 && token[2] == '-' && token[5] == '-') {
        const std::string marker = "(hex)";
        if (rest.compare(0, marker.size(), marker) != 0) return std::nullopt;
        std::string vendor = trim(rest.substr(marker.size()));
        std::string prefix = oui_prefix(token);
        if (prefix.empty() || vendor.empty()) return std::nullopt;
        return std::make_pair(prefix, vendor);
    }

    // wireshark manuf: "00:00:0C\tCisco\tCisco Systems, Inc"; masked ranges ("/28") are skipped
    if (token.size() == 8 && token[2] == ':' && token[5] == ':') {
        std::string prefix = oui_prefix(token);
        if (prefix.empty() || rest.empty()) return std::nullopt;
        auto tab = rest.find('\t');
        std::string vendor = tab == std::string::npos ? rest : trim(rest.substr(tab + 1));
        if (vendor.empty()) vendor = trim(rest.substr(0, tab));
        return std::make_pair(prefix, vendor);
    }

    // nmap: "00000C Cisco Systems". IEEE "(base 16)" repeat lines are skipped.
    if (token.size() == 6 && is_hex(token)) {
        if (rest.empty() || rest[0] == '(') return std::nullopt;
        return std::make_pair(oui_prefix(token), rest);
    }

    return std::nullopt;
}

std::unordered_map<std::string, std::string> OuiVendorDatabase::load_all() const {
    std::unordered_map<std::string, std::string> out;
    bool any = false;
    for (const auto& path : paths_) {
        std::ifstream f(path);
        if (!f) continue;
        any = true;
        std::string line;
        while (std::getline(f, line)) {
            auto entry = parse_line(line);
            // Earlier files take precedence.
            if (entry) out.emplace(entry->first, entry->second);
        }
    }
    if (!any || out.empty()) throw std::runtime_error(errors::MSG_E3200_VENDOR_DB_UNAVAILABLE);
    return out;
}

std::optional<std::string> OuiVendorDatabase::lookup(const std::string& hardware_address) {
    {
        std::shared_lock lock(mu_);
        if (loaded_) {
            auto it = prefixes_.find(oui_prefix(hardware_address));
            if (it == prefixes_.end()) return std::nullopt;
            return it->second;
        }
    }
    // Concurrent first lookups share one load; a failed load is retried by the next lookup.
    std::call_once(first_load_, [this]() {
        std::shared_lock lock(mu_);
        if (loaded_) return;
        lock.unlock();
        refresh();
    });
    std::shared_lock lock(mu_);
    auto it = prefixes_.find(oui_prefix(hardware_address));
    if (it == prefixes_.end()) return std::nullopt;
    return it->second;
}

void OuiVendorDatabase::refresh() {
    auto fresh = load_all();
    std::unique_lock lock(mu_);
    const bool first = !loaded_;
    prefixes_ = std::move(fresh);
    loaded_ = true;
    if (first) std::cerr << "VendorDatabase: loaded " << prefixes_.size() << " prefixes" << std::endl;
}

std::size_t OuiVendorDatabase::size() const {
    std::shared_lock lock(mu_);
    return prefixes_.size();
}

} // namespace lanscout
