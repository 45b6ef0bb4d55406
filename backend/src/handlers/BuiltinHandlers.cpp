#include "handlers/BuiltinHandlers.hpp"
#include "dispatch/HandlerRegistry.hpp"
#include "Scanner.hpp"

#include <stdexcept>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace lanscout {

namespace {

std::string target_host(const Device& device) {
    std::string host = device.address();
    if (host.empty()) host = device.hostname;
    return host;
}

unsigned short service_port(const Device& device, unsigned short fallback) {
    const auto& raw = device.raw_service_info;
    if (raw.is_object() && raw.contains("port") && raw["port"].is_number_integer()) {
        auto p = raw["port"].get<long>();
        if (p > 0 && p <= 65535) return static_cast<unsigned short>(p);
    }
    return fallback;
}

} // namespace

std::string http_get_summary(const std::string& host, unsigned short port, const std::string& target,
                             std::chrono::seconds timeout, std::size_t max_body) {
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "lanscout");

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code result;

    resolver.async_resolve(host, std::to_string(port),
        [&](beast::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) { result = ec; return; }
            stream.expires_after(timeout);
            stream.async_connect(endpoints, [&](beast::error_code ec, const tcp::endpoint&) {
                if (ec) { result = ec; return; }
                stream.expires_after(timeout);
                http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec) { result = ec; return; }
                    http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
                        result = ec;
                        beast::error_code ignored;
                        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
                    });
                });
            });
        });
    ioc.run();

    if (result) throw std::runtime_error("GET " + host + ":" + std::to_string(port) + target + " failed: " + result.message());

    std::string out = std::to_string(res.result_int());
    auto ct = res.find(http::field::content_type);
    out += " ";
    if (ct != res.end()) out.append(ct->value().data(), ct->value().size());
    else out += "None";
    out += "\n";
    out += res.body().substr(0, max_body);
    return out;
}

void register_builtin_handlers(HandlerRegistry& registry, std::ostream& out) {
    std::ostream* os = &out;

    registry.register_handler("ssh", { "", "SSH Service", [os](const Device& d) {
        const std::string host = target_host(d);
        *os << "SSH service detected for " << host << ". To connect use: ssh <user>@" << host << std::endl;
    }});

    registry.register_handler("http", { "", "HTTP Service", [os](const Device& d) {
        const std::string host = target_host(d);
        if (host.empty()) {
            *os << "No IP/hostname available for HTTP service." << std::endl;
            return;
        }
        *os << http_get_summary(host, service_port(d, 80), "/") << std::endl;
    }});

    registry.register_handler("https", { "", "HTTP Service (HTTPS)", [os](const Device& d) {
        const std::string host = target_host(d);
        if (host.empty()) {
            *os << "No IP/hostname available for HTTPS service." << std::endl;
            return;
        }
        *os << "HTTPS service at https://" << host << ":" << service_port(d, 443) << "/" << std::endl;
    }});

    registry.register_handler("home-assistant", { "", "Home Assistant", [os](const Device& d) {
        *os << "Home Assistant device discovered:" << std::endl;
        for (const auto& [k, v] : d.metadata) *os << "  " << k << ": " << v << std::endl;
    }});

    registry.register_handler("matter", { "", "Matter Device", [os](const Device&) {
        *os << "Matter device discovered. Matter interactions require a commissioning controller." << std::endl;
    }});
}

void register_builtin_handlers(Scanner& scanner, std::ostream& out) {
    register_builtin_handlers(scanner.handlers(), out);
}

} // namespace lanscout
