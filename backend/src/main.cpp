#include "Scanner.hpp"
#include "core/BuildInfo.hpp"
#include "core/ScannerConfig.hpp"
#include "discovery/AvahiBrowser.hpp"
#include "core/ErrorCatalog.hpp"
#include "enrichment/LinuxNetworkProbe.hpp"
#include "enrichment/OuiVendorDatabase.hpp"
#include "handlers/BuiltinHandlers.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace lanscout;

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help            Show this help message and exit\n"
              << "      --version         Print build information and exit\n"
              << "  -c, --config PATH     Load settings from a JSON config file\n"
              << "  -t, --initial-scan N  Seconds to scan before the prompt (default 12)\n"
              << "      --no-wait         Skip the initial scan wait\n"
              << "      --no-clear        Do not clear the screen\n"
              << "  -w, --workers N       Enrichment worker threads (default 8)\n"
              << "      --export PATH     Scan, export devices to PATH and exit\n"
              << std::flush;
}

static void print_commands() {
    std::cout << "\nCommands:\n"
              << "  l, list        - List all discovered devices\n"
              << "  la, listall    - Detailed list with full stored device info\n"
              << "  show <n>       - Show detailed info for device number <n>\n"
              << "  interact <n>   - Interact with device number <n> (if supported)\n"
              << "  scan <seconds> - Temporarily re-enable discovery output and scan again\n"
              << "  export <path>  - Export discovered devices to JSON\n"
              << "  h, handlers    - List available device handlers\n"
              << "  c, clear       - Clear the screen\n"
              << "  q, quit        - Exit the program\n"
              << std::endl;
}

static void clear_screen() {
    std::cout << "\033[2J\033[H" << std::flush;
}

static void countdown(int seconds) {
    for (int remaining = seconds; remaining > 0; --remaining) {
        std::cout << "Scanning... [" << std::setw(2) << remaining << " seconds]\r" << std::flush;
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    std::cout << std::string(40, ' ') << "\r" << std::flush;
}

static std::string truncate(const std::string& s, std::size_t width) {
    if (s.size() <= width) return s;
    return s.substr(0, width - 3) + "...";
}

// Numbers shown are store positions, so "show" and "interact" accept them unchanged.
static void print_compact_table(const std::vector<Device>& devices) {
    std::vector<std::size_t> order(devices.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&devices](std::size_t a, std::size_t b) {
        const Device& da = devices[a];
        const Device& db = devices[b];
        std::string addr_a = da.address().empty() ? da.hostname : da.address();
        std::string addr_b = db.address().empty() ? db.hostname : db.address();
        if (da.friendly_name != db.friendly_name) return da.friendly_name < db.friendly_name;
        return addr_a < addr_b;
    });

    std::cout << "\nDiscovered Devices (short):\n"
              << std::right << std::setw(3) << "#" << "  " << std::left << std::setw(30) << "Friendly"
              << "  " << std::setw(20) << "Address" << "\n"
              << std::string(70, '-') << "\n";
    for (std::size_t idx : order) {
        const Device& d = devices[idx];
        std::string addr = d.address().empty() ? d.hostname : d.address();
        std::cout << std::right << std::setw(3) << (idx + 1) << ". " << std::left << std::setw(30)
                  << truncate(d.friendly_name, 30) << "  " << std::setw(20) << truncate(addr, 20) << "\n";
    }
    std::cout << std::right << std::flush;
}

static void print_device_fields(const Device& d, const std::string& indent) {
    nlohmann::json j = d;
    for (auto it = j.begin(); it != j.end(); ++it) {
        std::cout << indent << it.key() << ": " << (it->is_string() ? it->get<std::string>() : it->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)) << "\n";
    }
}

static bool parse_number(const std::string& arg, std::size_t& out) {
    if (arg.empty() || !std::all_of(arg.begin(), arg.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
    try {
        out = static_cast<std::size_t>(std::stoul(arg));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static void print_handlers(const Scanner& scanner) {
    auto handlers = scanner.list_handlers();
    if (handlers.empty()) {
        std::cout << "No handlers registered." << std::endl;
        return;
    }
    std::cout << "Available handlers:\n";
    int i = 1;
    for (const auto& h : handlers) {
        std::cout << std::setw(2) << i++ << ". " << std::left << std::setw(15) << h.key << std::right
                  << "  - " << h.display_name << "\n";
    }
    std::cout << std::flush;
}

static void run_export(const Scanner& scanner, const std::string& path) {
    try {
        std::size_t n = scanner.export_json(path);
        std::cout << "Exported " << n << " devices to " << path << std::endl;
    } catch (const std::exception& e) {
        std::cout << e.what() << std::endl;
    }
}

static void repl(Scanner& scanner, const ScannerConfig& cfg) {
    std::string line;
    while (true) {
        print_commands();
        std::cout << "CMD> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        const std::string cmd = trim(line);
        if (cmd.empty()) continue;

        std::istringstream iss(cmd);
        std::string verb;
        iss >> verb;
        std::string arg;
        std::getline(iss, arg);
        arg = trim(arg);

        if (verb == "q" || verb == "quit" || verb == "exit") break;

        if (verb == "c" || verb == "clear") {
            clear_screen();
            continue;
        }

        if (verb == "l" || verb == "list") {
            print_compact_table(scanner.list_devices());
            continue;
        }

        if (verb == "la" || verb == "listall") {
            auto devices = scanner.list_devices();
            if (devices.empty()) {
                std::cout << "No devices discovered yet." << std::endl;
                continue;
            }
            std::cout << "\nDiscovered Devices (detailed):\n";
            for (std::size_t i = 0; i < devices.size(); ++i) {
                std::cout << "\n" << std::string(60, '=') << "\n"
                          << "Device #" << (i + 1) << ": " << devices[i].friendly_name << "\n";
                print_device_fields(devices[i], "  ");
            }
            std::cout << "\n" << std::string(60, '=') << std::endl;
            continue;
        }

        if (verb == "show") {
            std::size_t n = 0;
            if (!parse_number(arg, n)) {
                std::cout << "Usage: show <number>" << std::endl;
                continue;
            }
            auto d = n > 0 ? scanner.device_at(n - 1) : std::nullopt;
            if (!d) {
                std::cout << errors::MSG_INVALID_DEVICE_NUMBER << std::endl;
                continue;
            }
            if (cfg.clear_screen) clear_screen();
            std::cout << "\nDevice #" << n << " Details:\n" << std::string(40, '-') << "\n";
            print_device_fields(*d, "");
            std::cout << std::flush;
            continue;
        }

        if (verb == "interact") {
            std::size_t n = 0;
            if (!parse_number(arg, n) || n == 0) {
                std::cout << "Usage: interact <number>" << std::endl;
                continue;
            }
            DispatchResult r = scanner.interact(n - 1);
            if (r.status != DispatchStatus::Completed) std::cout << r.message << std::endl;
            continue;
        }

        if (verb == "scan") {
            std::size_t seconds = 0;
            if (!parse_number(arg, seconds)) {
                std::cout << "Usage: scan <seconds>" << std::endl;
                continue;
            }
            scanner.set_notifications_enabled(true);
            countdown(static_cast<int>(seconds));
            scanner.set_notifications_enabled(false);
            continue;
        }

        if (verb == "export") {
            if (arg.empty()) {
                std::cout << "Usage: export <path>" << std::endl;
                continue;
            }
            run_export(scanner, arg);
            continue;
        }

        if (verb == "h" || verb == "handlers") {
            print_handlers(scanner);
            continue;
        }

        std::cout << "Commands: list, show <n>, interact <n>, handlers, scan <s>, export <path>, quit" << std::endl;
    }
}

int main(int argc, char** argv) {
    ScannerConfig cfg;
    std::string export_path;
    std::string config_path;

    try {
        apply_environment(cfg);

        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if (a == "-h" || a == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            if (a == "--version") {
                std::cout << buildinfo::version_line() << std::endl;
                return 0;
            }
            if ((a == "-c" || a == "--config") && i + 1 < argc) config_path = argv[++i];
            else if (a.rfind("--config=", 0) == 0) config_path = a.substr(9);
        }
        if (!config_path.empty()) load_config_file(config_path, cfg);

        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if ((a == "-c" || a == "--config") && i + 1 < argc) { ++i; continue; }
            if ((a == "-t" || a == "--initial-scan") && i + 1 < argc) cfg.initial_scan_seconds = std::stoi(argv[++i]);
            else if ((a == "-w" || a == "--workers") && i + 1 < argc) cfg.worker_count = parse_worker_count(argv[++i]);
            else if (a == "--export" && i + 1 < argc) export_path = argv[++i];
            else if (a == "--no-wait") cfg.wait_initial_scan = false;
            else if (a == "--no-clear") cfg.clear_screen = false;
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    try {
        AvahiBrowser browser;
        LinuxNetworkProbe probe;
        OuiVendorDatabase vendors(cfg.oui_database_paths);
        Scanner scanner(browser, probe, vendors, cfg);
        register_builtin_handlers(scanner);

        if (cfg.clear_screen) clear_screen();
        std::cout << "Searching for smart devices on the local network..." << std::endl;
        scanner.start();

        bool interactive_stdin = isatty(fileno(stdin));
        if (cfg.wait_initial_scan && cfg.initial_scan_seconds > 0) countdown(cfg.initial_scan_seconds);

        if (!export_path.empty()) {
            scanner.wait_for_enrichment(cfg.probe_timeout * 2);
            run_export(scanner, export_path);
            scanner.stop();
            return 0;
        }

        // Discovery messages only during the initial scan and explicit "scan" commands.
        scanner.set_notifications_enabled(false);
        if (cfg.clear_screen && interactive_stdin) clear_screen();

        repl(scanner, cfg);
        scanner.stop();
    } catch (const std::exception& e) {
        std::cerr << "lanscout: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Exiting." << std::endl;
    return 0;
}
