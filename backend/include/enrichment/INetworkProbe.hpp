#pragma once
#include <chrono>
#include <string>

namespace lanscout {

/**
 * @brief OS/network collaborators used to find a hardware address for an IP.
 *
 * Every call may throw std::runtime_error; callers degrade to an empty result.
 */
class INetworkProbe {
public:
    virtual ~INetworkProbe() = default;
    /** @brief Active layer-2 query (ARP request). Empty string when nothing answered. */
    virtual std::string probe_hardware_address(const std::string& ip, std::chrono::milliseconds timeout) = 0;
    /** @brief Look the address up in the OS neighbor table. */
    virtual std::string lookup_neighbor(const std::string& ip) = 0;
    /** @brief Best-effort nudge so the OS learns the neighbor (one ping-like probe). */
    virtual void probe_reachability(const std::string& ip, std::chrono::milliseconds timeout) = 0;
};

} // namespace lanscout
