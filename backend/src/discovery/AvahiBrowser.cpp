#include "discovery/AvahiBrowser.hpp"
#include "core/ErrorCatalog.hpp"

#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <boost/asio/post.hpp>

#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>

namespace lanscout {

namespace {

const std::string kLocalSuffix = ".local.";

// "_http._tcp.local." -> "_http._tcp"
std::string avahi_type(const std::string& type) {
    std::string t = type;
    if (t.size() > kLocalSuffix.size() && t.compare(t.size() - kLocalSuffix.size(), kLocalSuffix.size(), kLocalSuffix) == 0) {
        t.erase(t.size() - kLocalSuffix.size());
    }
    while (!t.empty() && t.back() == '.') t.pop_back();
    return t;
}

// "Kitchen._http._tcp.local." -> "Kitchen"
std::string instance_label(const std::string& name, const std::string& type) {
    const std::string suffix = "." + type;
    if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return name.substr(0, name.size() - suffix.size());
    }
    return name;
}

std::string qualified(const char* first, const char* second) {
    std::string out(first ? first : "");
    out += ".";
    out += second ? second : "local";
    out += ".";
    return out;
}

struct ResolveState {
    std::mutex m;
    std::condition_variable cv;
    bool done = false;
    bool found = false;
    int error = AVAHI_OK;
    ResolvedInstance result;
};

void resolve_callback(AvahiServiceResolver* r, AvahiIfIndex interface, AvahiProtocol protocol,
                      AvahiResolverEvent event, const char* /*name*/, const char* /*type*/, const char* domain,
                      const char* host_name, const AvahiAddress* address, uint16_t port, AvahiStringList* txt,
                      AvahiLookupResultFlags /*flags*/, void* userdata) {
    auto* state = static_cast<ResolveState*>(userdata);
    {
        std::lock_guard<std::mutex> lk(state->m);
        if (event == AVAHI_RESOLVER_FOUND) {
            state->found = true;
            if (address) {
                char buf[AVAHI_ADDRESS_STR_MAX];
                avahi_address_snprint(buf, sizeof(buf), address);
                state->result.addresses.emplace_back(buf);
            }
            state->result.hostname = host_name ? host_name : "";
            for (AvahiStringList* t = txt; t; t = avahi_string_list_get_next(t)) {
                char* key = nullptr;
                char* value = nullptr;
                size_t size = 0;
                if (avahi_string_list_get_pair(t, &key, &value, &size) != 0) continue;
                state->result.metadata[key] = value ? std::string(value, size) : std::string();
                avahi_free(key);
                avahi_free(value);
            }
            state->result.raw = {
                {"port", port},
                {"interface", interface},
                {"protocol", protocol == AVAHI_PROTO_INET6 ? "inet6" : "inet"},
                {"domain", domain ? domain : ""},
                {"host_name", host_name ? host_name : ""},
            };
        } else {
            state->error = avahi_client_errno(avahi_service_resolver_get_client(r));
        }
        state->done = true;
        state->cv.notify_all();
    }
    avahi_service_resolver_free(r);
}

} // namespace

AvahiBrowser::AvahiBrowser()
: events_work_(boost::asio::make_work_guard(events_)) {
    poll_ = avahi_threaded_poll_new();
    if (!poll_) throw std::runtime_error("AvahiBrowser: cannot create threaded poll");

    int error = 0;
    client_ = avahi_client_new(avahi_threaded_poll_get(poll_), static_cast<AvahiClientFlags>(0),
                               &AvahiBrowser::client_callback, this, &error);
    if (!client_) {
        avahi_threaded_poll_free(poll_);
        poll_ = nullptr;
        throw std::runtime_error(std::string("AvahiBrowser: cannot create client: ") + avahi_strerror(error));
    }
    if (avahi_threaded_poll_start(poll_) < 0) {
        avahi_client_free(client_);
        avahi_threaded_poll_free(poll_);
        client_ = nullptr;
        poll_ = nullptr;
        throw std::runtime_error("AvahiBrowser: cannot start poll thread");
    }
    event_thread_ = std::thread([this]() { events_.run(); });
}

AvahiBrowser::~AvahiBrowser() {
    stop();
}

void AvahiBrowser::client_callback(AvahiClient* c, AvahiClientState state, void* /*userdata*/) {
    if (state == AVAHI_CLIENT_FAILURE) {
        std::cerr << "AvahiBrowser: client failure: " << avahi_strerror(avahi_client_errno(c)) << std::endl;
    }
}

void AvahiBrowser::browse(const std::string& type, IServiceListener& listener) {
    std::lock_guard<std::mutex> lk(m_);
    if (stopped_) throw std::runtime_error("AvahiBrowser: stopped");

    auto sub = std::make_unique<Subscription>(Subscription{this, type, &listener});
    avahi_threaded_poll_lock(poll_);
    if (type == kServiceTypeEnumerationType) {
        AvahiServiceTypeBrowser* b = avahi_service_type_browser_new(
            client_, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, "local", static_cast<AvahiLookupFlags>(0),
            &AvahiBrowser::type_browse_callback, sub.get());
        if (b) type_browsers_.push_back(b);
        avahi_threaded_poll_unlock(poll_);
        if (!b) throw std::runtime_error(avahi_strerror(avahi_client_errno(client_)));
    } else {
        ::AvahiServiceBrowser* b = avahi_service_browser_new(
            client_, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, avahi_type(type).c_str(), "local",
            static_cast<AvahiLookupFlags>(0), &AvahiBrowser::service_browse_callback, sub.get());
        if (b) service_browsers_.push_back(b);
        avahi_threaded_poll_unlock(poll_);
        if (!b) throw std::runtime_error(avahi_strerror(avahi_client_errno(client_)));
    }
    subscriptions_.push_back(std::move(sub));
}

void AvahiBrowser::type_browse_callback(AvahiServiceTypeBrowser* /*b*/, AvahiIfIndex /*interface*/,
                                        AvahiProtocol /*protocol*/, AvahiBrowserEvent event, const char* type,
                                        const char* domain, AvahiLookupResultFlags /*flags*/, void* userdata) {
    auto* sub = static_cast<Subscription*>(userdata);
    switch (event) {
        case AVAHI_BROWSER_NEW:
            sub->self->post_event(sub->listener, EventKind::Added, sub->type, qualified(type, domain));
            break;
        case AVAHI_BROWSER_REMOVE:
            sub->self->post_event(sub->listener, EventKind::Removed, sub->type, qualified(type, domain));
            break;
        case AVAHI_BROWSER_FAILURE:
            std::cerr << "AvahiBrowser: " << errors::with_detail(errors::MSG_E3100_BROWSE_FAILED_PREFIX, sub->type) << std::endl;
            break;
        default:
            break;
    }
}

void AvahiBrowser::service_browse_callback(::AvahiServiceBrowser* /*b*/, AvahiIfIndex /*interface*/,
                                           AvahiProtocol /*protocol*/, AvahiBrowserEvent event, const char* name,
                                           const char* type, const char* domain,
                                           AvahiLookupResultFlags /*flags*/, void* userdata) {
    auto* sub = static_cast<Subscription*>(userdata);
    if (event == AVAHI_BROWSER_FAILURE) {
        std::cerr << "AvahiBrowser: " << errors::with_detail(errors::MSG_E3100_BROWSE_FAILED_PREFIX, sub->type) << std::endl;
        return;
    }
    if (event != AVAHI_BROWSER_NEW && event != AVAHI_BROWSER_REMOVE) return;
    const std::string full_type = qualified(type, domain);
    std::string full_name = name ? name : "";
    full_name += "." + full_type;
    sub->self->post_event(sub->listener, event == AVAHI_BROWSER_NEW ? EventKind::Added : EventKind::Removed,
                          full_type, full_name);
}

void AvahiBrowser::post_event(IServiceListener* listener, EventKind kind, std::string type, std::string name) {
    boost::asio::post(events_, [listener, kind, type = std::move(type), name = std::move(name)]() {
        try {
            if (kind == EventKind::Added) listener->on_service_added(type, name);
            else listener->on_service_removed(type, name);
        } catch (const std::exception& e) {
            std::cerr << "AvahiBrowser: listener error for " << name << ": " << e.what() << std::endl;
        }
    });
}

std::optional<ResolvedInstance> AvahiBrowser::resolve(const std::string& type, const std::string& name,
                                                      std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (stopped_) throw std::runtime_error(errors::D3110_CLIENT_NOT_RUNNING);
    }
    const std::string label = instance_label(name, type);
    ResolveState state;

    avahi_threaded_poll_lock(poll_);
    if (avahi_client_get_state(client_) != AVAHI_CLIENT_S_RUNNING) {
        avahi_threaded_poll_unlock(poll_);
        throw std::runtime_error(errors::D3110_CLIENT_NOT_RUNNING);
    }
    AvahiServiceResolver* r = avahi_service_resolver_new(
        client_, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, label.c_str(), avahi_type(type).c_str(), "local",
        AVAHI_PROTO_UNSPEC, static_cast<AvahiLookupFlags>(0), &resolve_callback, &state);
    avahi_threaded_poll_unlock(poll_);
    if (!r) throw std::runtime_error(avahi_strerror(avahi_client_errno(client_)));

    {
        std::unique_lock<std::mutex> lk(state.m);
        state.cv.wait_for(lk, timeout, [&state]() { return state.done; });
    }

    // The callback runs under the poll lock, so done cannot change while it is held.
    avahi_threaded_poll_lock(poll_);
    bool done = false;
    {
        std::lock_guard<std::mutex> lk(state.m);
        done = state.done;
    }
    if (!done) avahi_service_resolver_free(r);
    avahi_threaded_poll_unlock(poll_);

    if (!done) throw std::runtime_error(errors::D3110_RESOLVE_TIMEOUT);
    if (state.found) return std::move(state.result);
    if (state.error == AVAHI_ERR_TIMEOUT || state.error == AVAHI_ERR_NOT_FOUND) return std::nullopt;
    throw std::runtime_error(avahi_strerror(state.error));
}

void AvahiBrowser::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (stopped_) return;
        stopped_ = true;
    }
    if (poll_) avahi_threaded_poll_stop(poll_);

    events_work_.reset();
    events_.stop();
    if (event_thread_.joinable() && event_thread_.get_id() != std::this_thread::get_id()) event_thread_.join();

    for (auto* b : service_browsers_) avahi_service_browser_free(b);
    for (auto* b : type_browsers_) avahi_service_type_browser_free(b);
    service_browsers_.clear();
    type_browsers_.clear();
    if (client_) avahi_client_free(client_);
    if (poll_) avahi_threaded_poll_free(poll_);
    client_ = nullptr;
    poll_ = nullptr;
    subscriptions_.clear();
}

} // namespace lanscout
