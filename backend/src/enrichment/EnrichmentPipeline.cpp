#include "enrichment/EnrichmentPipeline.hpp"
#include "enrichment/IdentityCache.hpp"
#include "DeviceRegistry.hpp"
#include "core/Notifier.hpp"

#include <iostream>
#include <boost/asio/post.hpp>

namespace lanscout {

EnrichmentPipeline::EnrichmentPipeline(DeviceRegistry& registry, IdentityCache& identity, Notifier& notifier,
                                       std::size_t workers)
: registry_(registry), identity_(identity), notifier_(notifier), pool_(workers == 0 ? 1 : workers) {}

EnrichmentPipeline::~EnrichmentPipeline() {
    shutdown();
}

void EnrichmentPipeline::submit(std::size_t index) {
    {
        std::lock_guard<std::mutex> lk(pending_m_);
        if (stopped_) return;
        ++pending_;
    }
    boost::asio::post(pool_, [this, index]() {
        try {
            enrich(index);
        } catch (const std::exception& e) {
            std::cerr << "Enrichment: device " << index << ": " << e.what() << std::endl;
        }
        task_finished();
    });
}

bool EnrichmentPipeline::enrich(std::size_t index) {
    auto device = registry_.get_device(index);
    if (!device) return false;
    const std::string ip = device->address();
    if (ip.empty()) return false;

    const std::string mac = identity_.hardware_address_for(ip);
    const std::string vendor = mac.empty() ? std::string() : identity_.vendor_for(mac);
    if (mac.empty() && vendor.empty()) return false;

    bool changed = false;
    Device updated;
    registry_.update_device(index, [&](Device& d) {
        if (!mac.empty() && d.hardware_address.empty()) {
            d.hardware_address = mac;
            changed = true;
        }
        if (!vendor.empty() && d.vendor.empty()) {
            d.vendor = vendor;
            changed = true;
        }
        updated = d;
    });

    if (changed) notifier_.notify(index, updated);
    return changed;
}

void EnrichmentPipeline::task_finished() {
    std::lock_guard<std::mutex> lk(pending_m_);
    if (pending_ > 0) --pending_;
    if (pending_ == 0) idle_cv_.notify_all();
}

bool EnrichmentPipeline::wait_idle_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(pending_m_);
    return idle_cv_.wait_for(lk, timeout, [this]() { return pending_ == 0; });
}

std::size_t EnrichmentPipeline::pending() const {
    std::lock_guard<std::mutex> lk(pending_m_);
    return pending_;
}

void EnrichmentPipeline::shutdown() {
    {
        std::lock_guard<std::mutex> lk(pending_m_);
        if (stopped_) return;
        stopped_ = true;
    }
    pool_.stop();
    pool_.join();
    {
        // Queued tasks dropped by stop() never report back.
        std::lock_guard<std::mutex> lk(pending_m_);
        pending_ = 0;
    }
    idle_cv_.notify_all();
}

} // namespace lanscout
