#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lanscout {

/** @brief Meta-service whose instances are the advertised service types. */
inline constexpr const char* kServiceTypeEnumerationType = "_services._dns-sd._udp.local.";

/** @brief Details returned by a successful instance resolution. */
struct ResolvedInstance {
    /** @brief Textual IPv4/IPv6 addresses in the order the resolver reported them */
    std::vector<std::string> addresses;
    /** @brief Server name, possibly with a trailing dot */
    std::string hostname;
    std::map<std::string, std::string> metadata;
    /** @brief Resolver-specific extras (port, interface, ...) */
    nlohmann::json raw;
};

/**
 * @brief Receiver of add/update/remove events for one or more service types.
 *
 * For the enumeration type the instance name carries the announced service type.
 */
class IServiceListener {
public:
    virtual ~IServiceListener() = default;
    virtual void on_service_added(const std::string& type, const std::string& name) = 0;
    virtual void on_service_updated(const std::string& type, const std::string& name) = 0;
    virtual void on_service_removed(const std::string& type, const std::string& name) = 0;
};

/**
 * @brief Abstract zero-configuration discovery client.
 *
 * Implementations deliver listener events from a single callback context.
 */
class IServiceBrowser {
public:
    virtual ~IServiceBrowser() = default;
    /** @brief Start delivering events for type. Throws std::runtime_error if the subscription fails. */
    virtual void browse(const std::string& type, IServiceListener& listener) = 0;
    /**
     * @brief Synchronously resolve one instance.
     * @return std::nullopt when the resolver reports no record for the instance.
     * Throws std::runtime_error on timeout or transport error.
     */
    virtual std::optional<ResolvedInstance> resolve(const std::string& type, const std::string& name,
                                                    std::chrono::milliseconds timeout) = 0;
    /** @brief Stop delivering events. Idempotent. */
    virtual void stop() = 0;
};

} // namespace lanscout
