#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <boost/asio/thread_pool.hpp>

namespace lanscout {

class DeviceRegistry;
class IdentityCache;
class Notifier;

/**
 * @brief Fixed-size worker pool that fills in hardware address and vendor.
 *
 * submit() never blocks: tasks queue when every worker is busy. In-flight
 * tasks are not cancelled; shutdown() drops queued work and waits only for
 * tasks already running.
 */
class EnrichmentPipeline {
public:
    EnrichmentPipeline(DeviceRegistry& registry, IdentityCache& identity, Notifier& notifier,
                       std::size_t workers = 8);
    ~EnrichmentPipeline();

    EnrichmentPipeline(const EnrichmentPipeline&) = delete;
    EnrichmentPipeline& operator=(const EnrichmentPipeline&) = delete;

    // Queue enrichment of the device at index (fire-and-forget).
    void submit(std::size_t index);

    // Enrich one device on the calling thread.
    // Returns true if hardware_address or vendor changed.
    bool enrich(std::size_t index);

    // Block until no task is queued or running, or the timeout passes.
    bool wait_idle_for(std::chrono::milliseconds timeout);

    std::size_t pending() const;
    void shutdown();

private:
    void task_finished();

    DeviceRegistry& registry_;
    IdentityCache& identity_;
    Notifier& notifier_;
    boost::asio::thread_pool pool_;

    mutable std::mutex pending_m_;
    std::condition_variable idle_cv_;
    std::size_t pending_ = 0;
    bool stopped_ = false;
};

} // namespace lanscout
