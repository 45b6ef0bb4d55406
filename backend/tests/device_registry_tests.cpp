#include <gtest/gtest.h>
#include "DeviceRegistry.hpp"
#include "Scanner.hpp"
#include "Fakes.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace lanscout;
using nlohmann::json;

static Device make_device(const std::string& type, const std::string& name, const std::string& ip = "") {
    Device d;
    d.service_type = type;
    d.instance_name = name;
    d.ipv4 = ip;
    d.friendly_name = "Test";
    return d;
}

TEST(DeviceRegistry, AppendKeepsInsertionOrder) {
    DeviceRegistry reg;
    EXPECT_EQ(reg.register_device(make_device("_a._tcp.local.", "one")), 0u);
    EXPECT_EQ(reg.register_device(make_device("_b._tcp.local.", "two")), 1u);
    auto all = reg.snapshot();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].instance_name, "one");
    EXPECT_EQ(all[1].instance_name, "two");
    EXPECT_EQ(reg.find_index("_b._tcp.local.", "two"), std::optional<std::size_t>(1));
    EXPECT_FALSE(reg.get_device(2).has_value());
}

TEST(DeviceRegistry, UpsertRefreshesInPlaceKeepingIdentity) {
    DeviceRegistry reg;
    Device first = make_device("_hue._tcp.local.", "bridge", "192.168.1.20");
    first.hardware_address = "00:17:88:AA:BB:CC";
    first.vendor = "Acme";
    reg.register_device(first);

    auto [idx, inserted] = reg.upsert_device(make_device("_hue._tcp.local.", "bridge", "192.168.1.30"));
    EXPECT_EQ(idx, 0u);
    EXPECT_FALSE(inserted);
    auto d = reg.get_device(0);
    ASSERT_TRUE(d);
    EXPECT_EQ(d->ipv4, "192.168.1.30");
    EXPECT_EQ(d->hardware_address, "00:17:88:AA:BB:CC");
    EXPECT_EQ(d->vendor, "Acme");
    EXPECT_EQ(reg.size(), 1u);

    auto other = reg.upsert_device(make_device("_hue._tcp.local.", "bridge-2"));
    EXPECT_TRUE(other.second);
    EXPECT_EQ(other.first, 1u);
}

TEST(DeviceRegistry, UpdateOutOfRange) {
    DeviceRegistry reg;
    EXPECT_FALSE(reg.update_device(0, [](Device&) {}));
}

TEST(DeviceRegistry, ExportRecordOmitsRawInfo) {
    DeviceRegistry reg;
    Device d = make_device("_http._tcp.local.", "printer._http._tcp.local.");
    d.ipv6 = "fe80::1";
    d.metadata = {{"path", "/"}};
    d.raw_service_info = {{"port", 631}};
    reg.register_device(d);

    json graph = reg.get_descriptor_graph();
    ASSERT_TRUE(graph.is_array());
    ASSERT_EQ(graph.size(), 1u);
    const auto& rec = graph[0];
    EXPECT_EQ(rec["type"], "_http._tcp.local.");
    EXPECT_EQ(rec["ip"], "fe80::1");
    EXPECT_EQ(rec["properties"]["path"], "/");
    EXPECT_FALSE(rec.contains("service_info"));
    EXPECT_FALSE(rec.dump().find("631") != std::string::npos);

    Device back = rec.get<Device>();
    EXPECT_EQ(back.instance_name, d.instance_name);
    EXPECT_TRUE(back.raw_service_info.is_null());
}

TEST(ScannerExport, WritesArrayOfRecords) {
    fakes::FakeServiceBrowser browser;
    fakes::FakeNetworkProbe probe;
    fakes::FakeVendorDatabase vendors;
    std::ostringstream out;
    Scanner scanner(browser, probe, vendors, ScannerConfig{}, out);

    browser.script_found("Kitchen._http._tcp.local.",
                         fakes::make_instance({"192.168.1.40"}, "kitchen.local.", {{"path", "/ui"}}));
    scanner.orchestrator().on_service_added("_http._tcp.local.", "Kitchen._http._tcp.local.");
    scanner.orchestrator().on_service_added("_ssh._tcp.local.", "pi._ssh._tcp.local.");
    ASSERT_TRUE(scanner.wait_for_enrichment(std::chrono::seconds(5)));

    auto path = (std::filesystem::temp_directory_path() / "lanscout_export_test.json").string();
    EXPECT_EQ(scanner.export_json(path), 2u);

    std::ifstream f(path);
    json j = json::parse(f);
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["name"], "Kitchen._http._tcp.local.");
    EXPECT_EQ(j[0]["hostname"], "kitchen.local");
    EXPECT_EQ(j[0]["friendly"], "HTTP Web Service");
    EXPECT_EQ(j[1]["ip"], "");
    for (const auto& rec : j) EXPECT_FALSE(rec.contains("service_info"));
    std::filesystem::remove(path);
}

TEST(ScannerExport, InvalidUtf8MetadataIsReplaced) {
    fakes::FakeServiceBrowser browser;
    fakes::FakeNetworkProbe probe;
    fakes::FakeVendorDatabase vendors;
    std::ostringstream out;
    Scanner scanner(browser, probe, vendors, ScannerConfig{}, out);

    browser.script_found("Bridge._hap._tcp.local.",
                         fakes::make_instance({"192.168.1.41"}, "bridge.local.", {{"k", "\xff"}, {"md", "ok"}}));
    scanner.orchestrator().on_service_added("_hap._tcp.local.", "Bridge._hap._tcp.local.");
    ASSERT_TRUE(scanner.wait_for_enrichment(std::chrono::seconds(5)));

    auto path = (std::filesystem::temp_directory_path() / "lanscout_export_utf8.json").string();
    EXPECT_EQ(scanner.export_json(path), 1u);

    std::ifstream f(path);
    json j = json::parse(f);
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["properties"]["k"], "\xEF\xBF\xBD");
    EXPECT_EQ(j[0]["properties"]["md"], "ok");
    std::filesystem::remove(path);
}

TEST(ScannerExport, UnwritablePathThrows) {
    fakes::FakeServiceBrowser browser;
    fakes::FakeNetworkProbe probe;
    fakes::FakeVendorDatabase vendors;
    std::ostringstream out;
    Scanner scanner(browser, probe, vendors, ScannerConfig{}, out);
    try {
        scanner.export_json("/nonexistent-lanscout-dir/out.json");
        FAIL() << "expected export to throw";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Error 3400"), std::string::npos);
    }
}
