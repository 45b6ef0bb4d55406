#pragma once
#include <chrono>
#include <string>

#include "enrichment/INetworkProbe.hpp"

namespace lanscout {

/**
 * @brief INetworkProbe backed by Linux sockets and procfs.
 *
 * - probe_hardware_address: broadcasts one ARP request on an AF_PACKET socket
 *   bound to the interface that routes to the target (needs CAP_NET_RAW).
 * - lookup_neighbor: reads the kernel neighbor table (/proc/net/arp).
 * - probe_reachability: sends one UDP datagram to the discard port so the
 *   kernel resolves the neighbor, then waits briefly for the entry to settle.
 *
 * IPv6 targets are not handled and yield empty results.
 */
class LinuxNetworkProbe : public INetworkProbe {
public:
    explicit LinuxNetworkProbe(std::string arp_table_path = "/proc/net/arp");

    std::string probe_hardware_address(const std::string& ip, std::chrono::milliseconds timeout) override;
    std::string lookup_neighbor(const std::string& ip) override;
    void probe_reachability(const std::string& ip, std::chrono::milliseconds timeout) override;

    // Parse /proc/net/arp formatted text and return the complete entry for ip.
    static std::string parse_arp_table(const std::string& table, const std::string& ip);

private:
    std::string arp_table_path_;
};

} // namespace lanscout
