#pragma once
#include <string>

namespace lanscout {

// Canonical "AA:BB:CC:DD:EE:FF" form. Separators '-' and '.' become ':', a
// bare 12-digit hex string is split into pairs. Empty in, empty out.
std::string format_mac(const std::string& raw);

// First three octets as six upper-case hex digits ("AABBCC"), or empty when
// the address does not start with 24 bits of hex.
std::string oui_prefix(const std::string& hardware_address);

// All-zero addresses mark incomplete neighbor entries.
bool is_null_mac(const std::string& hardware_address);

} // namespace lanscout
