#include "Scanner.hpp"
#include "core/ErrorCatalog.hpp"
#include "discovery/IServiceBrowser.hpp"

#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace lanscout {

Scanner::Scanner(IServiceBrowser& browser, INetworkProbe& probe, IVendorDatabase& vendors,
                 const ScannerConfig& config, std::ostream& out)
: config_(config),
  browser_(browser),
  notifier_(out),
  identity_(probe, vendors, config.identity_cache_capacity, config.probe_timeout),
  enrichment_(registry_, identity_, notifier_, config.worker_count),
  orchestrator_(browser, registry_, enrichment_, notifier_, config.resolve_timeout) {}

Scanner::~Scanner() {
    stop();
}

void Scanner::start() {
    orchestrator_.start();
}

void Scanner::stop() {
    if (stopped_) return;
    stopped_ = true;
    browser_.stop();
    enrichment_.shutdown();
}

std::vector<Device> Scanner::list_devices() const {
    return registry_.snapshot();
}

std::optional<Device> Scanner::device_at(std::size_t index) const {
    return registry_.get_device(index);
}

void Scanner::set_notifications_enabled(bool enabled) {
    notifier_.set_enabled(enabled);
}

std::size_t Scanner::export_json(const std::string& path) const {
    nlohmann::json records = registry_.get_descriptor_graph();
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) {
        throw std::runtime_error(errors::with_detail(errors::MSG_E3400_EXPORT_FAILED_PREFIX,
                                                     std::string(errors::D3400_OPEN_FILE_FAILED) + " '" + path + "'"));
    }
    // TXT values are raw bytes; invalid UTF-8 is written as U+FFFD.
    f << records.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    f.flush();
    if (!f) throw std::runtime_error(errors::with_detail(errors::MSG_E3400_EXPORT_FAILED_PREFIX, path));
    return records.size();
}

void Scanner::register_handler(const std::string& key, HandlerEntry entry) {
    handlers_.register_handler(key, std::move(entry));
}

std::vector<HandlerEntry> Scanner::list_handlers() const {
    return handlers_.list_handlers();
}

std::optional<HandlerEntry> Scanner::find_handler(const Device& device) const {
    return handlers_.find_handler(device);
}

DispatchResult Scanner::interact(std::size_t index) const {
    auto device = registry_.get_device(index);
    if (!device) return { DispatchStatus::InvalidIndex, errors::MSG_INVALID_DEVICE_NUMBER };
    return handlers_.dispatch(*device);
}

bool Scanner::wait_for_enrichment(std::chrono::milliseconds timeout) {
    return enrichment_.wait_idle_for(timeout);
}

} // namespace lanscout
