#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace lanscout {

struct ScannerConfig {
    std::size_t worker_count = 8;
    std::chrono::milliseconds resolve_timeout{2500};
    std::chrono::milliseconds probe_timeout{1000};
    std::size_t identity_cache_capacity = 4096;
    int initial_scan_seconds = 12;
    bool wait_initial_scan = true;
    bool clear_screen = true;
    std::vector<std::string> oui_database_paths = default_oui_database_paths();

    // Common install locations of the IEEE registry, nmap and wireshark prefix files.
    static std::vector<std::string> default_oui_database_paths();
};

// Overlay the keys present in a JSON config file onto cfg.
// Throws std::runtime_error (catalogued message) on I/O, parse or type errors.
void load_config_file(const std::string& path, ScannerConfig& cfg);

// Command line worker count. Throws std::runtime_error unless it is an integer >= 1.
std::size_t parse_worker_count(const std::string& text);

// LANSCOUT_CONFIG names a config file to load; LANSCOUT_OUI_DB is tried
// before the other vendor database paths.
void apply_environment(ScannerConfig& cfg);

} // namespace lanscout
