#pragma once
#include <optional>
#include <string>

namespace lanscout {

class IVendorDatabase {
public:
    virtual ~IVendorDatabase() = default;
    // Vendor label for a hardware address, std::nullopt on a miss.
    // Throws std::runtime_error when the database is unavailable.
    virtual std::optional<std::string> lookup(const std::string& hardware_address) = 0;
    // Reload the database. Throws std::runtime_error on failure.
    virtual void refresh() = 0;
};

} // namespace lanscout
