/*
src/enrichment/LinuxNetworkProbe.cpp
Hardware address discovery on Linux: active ARP over a packet socket, the
kernel neighbor table, and a UDP nudge that makes the kernel ARP for us.
*/
#include "enrichment/LinuxNetworkProbe.hpp"
#include "enrichment/HardwareAddress.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/if_ether.h>
#include <netpacket/packet.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace lanscout {

namespace {

struct FdGuard {
    int fd = -1;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

std::runtime_error sys_error(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}

// Local IPv4 address the kernel would use to reach target.
asio::ip::address_v4 route_source(const asio::ip::address_v4& target) {
    asio::io_context ioc;
    udp::socket s(ioc);
    boost::system::error_code ec;
    s.open(udp::v4(), ec);
    if (!ec) s.connect(udp::endpoint(target, 9), ec);
    if (ec) throw std::runtime_error("no route to " + target.to_string() + ": " + ec.message());
    auto local = s.local_endpoint(ec);
    if (ec) throw std::runtime_error("local endpoint: " + ec.message());
    return local.address().to_v4();
}

std::string interface_for(const asio::ip::address_v4& local) {
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) throw sys_error("getifaddrs");
    std::string name;
    for (ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        if (ntohl(sin->sin_addr.s_addr) == local.to_uint()) {
            name = it->ifa_name;
            break;
        }
    }
    ::freeifaddrs(list);
    return name;
}

std::string mac_to_string(const uint8_t* bytes) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
    return buf;
}

} // namespace

LinuxNetworkProbe::LinuxNetworkProbe(std::string arp_table_path)
: arp_table_path_(std::move(arp_table_path)) {}

std::string LinuxNetworkProbe::probe_hardware_address(const std::string& ip, std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    auto target = asio::ip::make_address_v4(ip, ec);
    if (ec) return {};

    auto local = route_source(target);
    if (local.is_loopback() || local == target) return {};
    std::string ifname = interface_for(local);
    if (ifname.empty()) return {};

    unsigned ifindex = ::if_nametoindex(ifname.c_str());
    if (ifindex == 0) throw sys_error("if_nametoindex " + ifname);

    FdGuard sock(::socket(AF_PACKET, SOCK_DGRAM, htons(ETH_P_ARP)));
    if (sock.fd < 0) throw sys_error("packet socket");

    ifreq ifr{};
    std::strncpy(ifr.ifr_name, ifname.c_str(), IFNAMSIZ - 1);
    if (::ioctl(sock.fd, SIOCGIFHWADDR, &ifr) != 0) throw sys_error("SIOCGIFHWADDR " + ifname);

    ether_arp req{};
    req.arp_hrd = htons(ARPHRD_ETHER);
    req.arp_pro = htons(ETH_P_IP);
    req.arp_hln = ETH_ALEN;
    req.arp_pln = 4;
    req.arp_op = htons(ARPOP_REQUEST);
    std::memcpy(req.arp_sha, ifr.ifr_hwaddr.sa_data, ETH_ALEN);
    auto src_bytes = local.to_bytes();
    auto dst_bytes = target.to_bytes();
    std::memcpy(req.arp_spa, src_bytes.data(), 4);
    std::memcpy(req.arp_tpa, dst_bytes.data(), 4);

    sockaddr_ll dst{};
    dst.sll_family = AF_PACKET;
    dst.sll_protocol = htons(ETH_P_ARP);
    dst.sll_ifindex = static_cast<int>(ifindex);
    dst.sll_halen = ETH_ALEN;
    std::memset(dst.sll_addr, 0xff, ETH_ALEN);

    if (::sendto(sock.fd, &req, sizeof(req), 0, reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) < 0) {
        throw sys_error("ARP send");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return {};

        pollfd pfd{ sock.fd, POLLIN, 0 };
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw sys_error("poll");
        }
        if (rc == 0) return {};

        ether_arp reply{};
        ssize_t n = ::recv(sock.fd, &reply, sizeof(reply), 0);
        if (n < static_cast<ssize_t>(sizeof(reply))) continue;
        if (ntohs(reply.arp_op) != ARPOP_REPLY) continue;
        if (std::memcmp(reply.arp_spa, dst_bytes.data(), 4) != 0) continue;
        return mac_to_string(reply.arp_sha);
    }
}

std::string LinuxNetworkProbe::lookup_neighbor(const std::string& ip) {
    std::ifstream f(arp_table_path_);
    if (!f) throw std::runtime_error("cannot read " + arp_table_path_);
    std::stringstream ss;
    ss << f.rdbuf();
    return parse_arp_table(ss.str(), ip);
}

void LinuxNetworkProbe::probe_reachability(const std::string& ip, std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    auto target = asio::ip::make_address_v4(ip, ec);
    if (ec) return;

    asio::io_context ioc;
    udp::socket s(ioc);
    s.open(udp::v4(), ec);
    if (ec) throw std::runtime_error("udp socket: " + ec.message());
    std::array<char, 1> payload{ {0} };
    s.send_to(asio::buffer(payload), udp::endpoint(target, 9), 0, ec);
    if (ec) return;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!lookup_neighbor(ip).empty()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

std::string LinuxNetworkProbe::parse_arp_table(const std::string& table, const std::string& ip) {
    std::istringstream in(table);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) { header = false; continue; }
        std::istringstream row(line);
        std::string addr, hw_type, flags, hw;
        if (!(row >> addr >> hw_type >> flags >> hw)) continue;
        if (addr != ip) continue;
        // ATF_COM (0x2) marks a completed entry.
        unsigned long f = std::strtoul(flags.c_str(), nullptr, 16);
        if ((f & 0x2) == 0 || is_null_mac(hw)) return {};
        return format_mac(hw);
    }
    return {};
}

} // namespace lanscout
