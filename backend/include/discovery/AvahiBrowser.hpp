#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/thread-watch.h>

#include "discovery/IServiceBrowser.hpp"

namespace lanscout {

/**
 * @brief IServiceBrowser over the Avahi client library.
 *
 * Avahi callbacks fire on the threaded-poll thread. Listener events are
 * re-posted to a dedicated event thread so listeners may call resolve().
 * Constructor throws std::runtime_error if the daemon cannot be reached.
 */
class AvahiBrowser : public IServiceBrowser {
public:
    AvahiBrowser();
    ~AvahiBrowser() override;

    AvahiBrowser(const AvahiBrowser&) = delete;
    AvahiBrowser& operator=(const AvahiBrowser&) = delete;

    void browse(const std::string& type, IServiceListener& listener) override;
    std::optional<ResolvedInstance> resolve(const std::string& type, const std::string& name,
                                            std::chrono::milliseconds timeout) override;
    void stop() override;

private:
    struct Subscription {
        AvahiBrowser* self;
        std::string type;
        IServiceListener* listener;
    };

    static void client_callback(AvahiClient* c, AvahiClientState state, void* userdata);
    static void type_browse_callback(AvahiServiceTypeBrowser* b, AvahiIfIndex interface, AvahiProtocol protocol,
                                     AvahiBrowserEvent event, const char* type, const char* domain,
                                     AvahiLookupResultFlags flags, void* userdata);
    static void service_browse_callback(::AvahiServiceBrowser* b, AvahiIfIndex interface, AvahiProtocol protocol,
                                        AvahiBrowserEvent event, const char* name, const char* type,
                                        const char* domain, AvahiLookupResultFlags flags, void* userdata);

    enum class EventKind { Added, Removed };
    void post_event(IServiceListener* listener, EventKind kind, std::string type, std::string name);

    AvahiThreadedPoll* poll_ = nullptr;
    AvahiClient* client_ = nullptr;

    std::mutex m_;
    std::vector<std::unique_ptr<Subscription>> subscriptions_;
    std::vector<AvahiServiceTypeBrowser*> type_browsers_;
    std::vector<::AvahiServiceBrowser*> service_browsers_;
    bool stopped_ = false;

    boost::asio::io_context events_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> events_work_;
    std::thread event_thread_;
};

} // namespace lanscout
