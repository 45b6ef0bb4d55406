#pragma once
#include <map>
#include <string>

namespace lanscout {

// "_hue._tcp.local." -> "hue". Strips one leading underscore, keeps the text
// before the first "._", drops any ".local" suffix and lower-cases.
std::string short_service_name(const std::string& service_type);

/**
 * @brief Human label for a service type.
 *
 * Precedence: exact full-type table, short-name table, metadata "fn" then
 * "name", and finally "<short> (service)". Never returns an empty string.
 */
std::string friendly_name(const std::string& service_type,
                          const std::map<std::string, std::string>& metadata = {});

} // namespace lanscout
