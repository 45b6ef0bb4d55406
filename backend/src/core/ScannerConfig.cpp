/*
src/core/ScannerConfig.cpp
Scanner settings: built-in defaults, an optional JSON config file and
environment overrides. Command line flags are applied on top in main.cpp.
*/
#include "core/ScannerConfig.hpp"
#include "core/ErrorCatalog.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lanscout {

std::vector<std::string> ScannerConfig::default_oui_database_paths() {
    return {
        "/usr/share/ieee-data/oui.txt",
        "/usr/share/nmap/nmap-mac-prefixes",
        "/usr/share/wireshark/manuf",
        "/usr/local/share/nmap/nmap-mac-prefixes"
    };
}

static std::runtime_error config_error(const std::string& detail) {
    return std::runtime_error(errors::with_detail(errors::MSG_E3410_CONFIG_INVALID_PREFIX, detail));
}

void load_config_file(const std::string& path, ScannerConfig& cfg) {
    std::ifstream f(path);
    if (!f) throw config_error(std::string(errors::D3410_CONFIG_OPEN_FAILED) + " '" + path + "'");

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw config_error(e.what());
    }
    if (!j.is_object()) throw config_error(errors::D3410_CONFIG_NOT_OBJECT);

    try {
        if (j.contains("workers")) {
            auto n = j["workers"].get<int>();
            if (n < 1) throw config_error("workers must be >= 1");
            cfg.worker_count = static_cast<std::size_t>(n);
        }
        if (j.contains("resolve_timeout_ms")) cfg.resolve_timeout = std::chrono::milliseconds(j["resolve_timeout_ms"].get<int>());
        if (j.contains("probe_timeout_ms")) cfg.probe_timeout = std::chrono::milliseconds(j["probe_timeout_ms"].get<int>());
        if (j.contains("identity_cache_capacity")) cfg.identity_cache_capacity = j["identity_cache_capacity"].get<std::size_t>();
        if (j.contains("initial_scan_seconds")) cfg.initial_scan_seconds = j["initial_scan_seconds"].get<int>();
        if (j.contains("wait_initial_scan")) cfg.wait_initial_scan = j["wait_initial_scan"].get<bool>();
        if (j.contains("clear_screen")) cfg.clear_screen = j["clear_screen"].get<bool>();
        if (j.contains("oui_database_paths")) cfg.oui_database_paths = j["oui_database_paths"].get<std::vector<std::string>>();
    } catch (const json::type_error& e) {
        throw config_error(e.what());
    }
}

std::size_t parse_worker_count(const std::string& text) {
    long n = 0;
    std::size_t used = 0;
    try {
        n = std::stol(text, &used);
    } catch (const std::exception&) {
        throw config_error("workers must be an integer, got '" + text + "'");
    }
    if (used != text.size()) throw config_error("workers must be an integer, got '" + text + "'");
    if (n < 1) throw config_error("workers must be >= 1");
    return static_cast<std::size_t>(n);
}

void apply_environment(ScannerConfig& cfg) {
    const char* config_path = std::getenv("LANSCOUT_CONFIG");
    if (config_path && *config_path) load_config_file(config_path, cfg);

    const char* oui = std::getenv("LANSCOUT_OUI_DB");
    if (oui && *oui) cfg.oui_database_paths.insert(cfg.oui_database_paths.begin(), std::string(oui));
}

} // namespace lanscout
