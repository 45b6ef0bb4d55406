#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "enrichment/IVendorDatabase.hpp"

namespace lanscout {

/**
 * @brief Offline vendor lookup keyed by the 24-bit OUI prefix.
 *
 * Understands the IEEE registry text export ("00-00-0C   (hex)  Vendor"),
 * nmap-mac-prefixes ("00000C Vendor") and wireshark manuf
 * ("00:00:0C<TAB>Short<TAB>Long"). Files are loaded lazily on first lookup;
 * refresh() re-reads them from disk.
 */
class OuiVendorDatabase : public IVendorDatabase {
public:
    explicit OuiVendorDatabase(std::vector<std::string> paths);

    std::optional<std::string> lookup(const std::string& hardware_address) override;
    void refresh() override;

    std::size_t size() const;

    // Parse one line of any supported format into {prefix, vendor}.
    static std::optional<std::pair<std::string, std::string>> parse_line(const std::string& line);

private:
    std::unordered_map<std::string, std::string> load_all() const;

    std::vector<std::string> paths_;
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::string> prefixes_;
    bool loaded_ = false;
    std::once_flag first_load_;
};

} // namespace lanscout
