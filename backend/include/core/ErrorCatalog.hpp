#pragma once

#include <string>
#include <string_view>

namespace lanscout::errors {

// 3100-3199: discovery / protocol collaborator
// 3200-3299: enrichment (probe, neighbor table, vendor database)
// 3300-3399: handler dispatch
// 3400-3499: export and configuration

inline constexpr const char* MSG_E3100_BROWSE_FAILED_PREFIX = "Error 3100: Cannot browse service type: ";
inline constexpr const char* MSG_E3110_RESOLVE_FAILED_PREFIX = "Error 3110: Instance resolution failed: ";
inline constexpr const char* MSG_E3200_VENDOR_DB_UNAVAILABLE = "Error 3200: No vendor database could be loaded";
inline constexpr const char* MSG_E3300_HANDLER_FAILED_PREFIX = "Handler failed: ";
inline constexpr const char* MSG_E3400_EXPORT_FAILED_PREFIX = "Error 3400: Export failed: ";
inline constexpr const char* MSG_E3410_CONFIG_INVALID_PREFIX = "Error 3410: Invalid configuration: ";

// Catalogued detail strings.
inline constexpr const char* D3110_RESOLVE_TIMEOUT = "resolve timed out";
inline constexpr const char* D3110_CLIENT_NOT_RUNNING = "mDNS client not running";
inline constexpr const char* D3300_UNKNOWN_EXCEPTION = "non-standard exception";
inline constexpr const char* D3400_OPEN_FILE_FAILED = "cannot open output file";
inline constexpr const char* D3410_CONFIG_OPEN_FAILED = "cannot open config file";
inline constexpr const char* D3410_CONFIG_NOT_OBJECT = "config root must be an object";
inline constexpr const char* MSG_NO_HANDLER_PREFIX = "No interaction handler for service type: ";
inline constexpr const char* MSG_INVALID_DEVICE_NUMBER = "Invalid device number";

inline std::string with_detail(const char* prefix, std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(prefix) + detail.size());
    out.append(prefix);
    out.append(detail.data(), detail.size());
    return out;
}

} // namespace lanscout::errors
