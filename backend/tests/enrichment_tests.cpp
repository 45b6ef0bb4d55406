#include <gtest/gtest.h>
#include "DeviceRegistry.hpp"
#include "core/BoundedCache.hpp"
#include "core/Notifier.hpp"
#include "enrichment/EnrichmentPipeline.hpp"
#include "enrichment/IdentityCache.hpp"
#include "Fakes.hpp"

#include <cstdio>
#include <sstream>
#include <thread>
#include <vector>

using namespace lanscout;
using fakes::FakeNetworkProbe;
using fakes::FakeVendorDatabase;

namespace {

Device addressed(const std::string& name, const std::string& ip) {
    Device d;
    d.service_type = "_http._tcp.local.";
    d.instance_name = name;
    d.ipv4 = ip;
    return d;
}

struct PipelineFixture : public ::testing::Test {
    FakeNetworkProbe probe;
    FakeVendorDatabase vendors;
    std::ostringstream out;
    DeviceRegistry registry;
    Notifier notifier{out};
    IdentityCache identity{probe, vendors, 16, std::chrono::milliseconds(10)};
    EnrichmentPipeline pipeline{registry, identity, notifier, 4};
};

} // namespace

TEST_F(PipelineFixture, FillsHardwareAddressAndVendor) {
    probe.layer2["10.0.0.5"] = "aa-bb-cc-00-11-22";
    vendors.prefixes["AABBCC"] = "Acme";
    auto idx = registry.register_device(addressed("a", "10.0.0.5"));

    EXPECT_TRUE(pipeline.enrich(idx));
    auto d = registry.get_device(idx);
    EXPECT_EQ(d->hardware_address, "AA:BB:CC:00:11:22");
    EXPECT_EQ(d->vendor, "Acme");
    EXPECT_NE(out.str().find("MAC: AA:BB:CC:00:11:22 | Vendor: Acme"), std::string::npos);
}

TEST_F(PipelineFixture, NeverOverwritesExistingValues) {
    probe.layer2["10.0.0.5"] = "aa:bb:cc:00:11:22";
    vendors.prefixes["AABBCC"] = "Other";
    Device d = addressed("a", "10.0.0.5");
    d.vendor = "Acme";
    auto idx = registry.register_device(d);

    EXPECT_TRUE(pipeline.enrich(idx));
    EXPECT_EQ(registry.get_device(idx)->vendor, "Acme");
    EXPECT_EQ(registry.get_device(idx)->hardware_address, "AA:BB:CC:00:11:22");

    // A second pass has nothing left to change.
    EXPECT_FALSE(pipeline.enrich(idx));
}

TEST_F(PipelineFixture, NoAddressIsNoop) {
    Device d;
    d.service_type = "_acme._tcp.local.";
    d.instance_name = "x";
    auto idx = registry.register_device(d);
    EXPECT_FALSE(pipeline.enrich(idx));
    EXPECT_FALSE(pipeline.enrich(99));
    EXPECT_EQ(probe.layer2_calls.load(), 0);
}

TEST_F(PipelineFixture, NothingFoundLeavesDeviceUntouched) {
    auto idx = registry.register_device(addressed("a", "10.0.0.9"));
    EXPECT_FALSE(pipeline.enrich(idx));
    EXPECT_EQ(registry.get_device(idx)->hardware_address, "");
    EXPECT_EQ(out.str(), "");
}

TEST_F(PipelineFixture, SubmittedTasksPreserveOrder) {
    for (int i = 0; i < 20; ++i) {
        std::string ip = "10.0.1." + std::to_string(i + 1);
        char mac[18];
        std::snprintf(mac, sizeof(mac), "02:00:00:00:00:%02X", i + 1);
        probe.layer2[ip] = mac;
        registry.register_device(addressed("dev" + std::to_string(i), ip));
    }
    for (std::size_t i = 0; i < 20; ++i) pipeline.submit(i);
    ASSERT_TRUE(pipeline.wait_idle_for(std::chrono::seconds(10)));
    EXPECT_EQ(pipeline.pending(), 0u);

    auto all = registry.snapshot();
    ASSERT_EQ(all.size(), 20u);
    for (std::size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(all[i].instance_name, "dev" + std::to_string(i));
        EXPECT_FALSE(all[i].hardware_address.empty());
    }
}

TEST_F(PipelineFixture, ShutdownRejectsNewWork) {
    auto idx = registry.register_device(addressed("a", "10.0.0.5"));
    pipeline.shutdown();
    pipeline.submit(idx);
    EXPECT_EQ(pipeline.pending(), 0u);
    EXPECT_TRUE(pipeline.wait_idle_for(std::chrono::milliseconds(10)));
}

TEST(IdentityCache, NeighborTableFallback) {
    FakeNetworkProbe probe;
    FakeVendorDatabase vendors;
    probe.layer2_throws = true;
    probe.neighbor["10.0.0.7"] = "00:11:22:33:44:55";
    IdentityCache cache(probe, vendors, 16, std::chrono::milliseconds(10));
    EXPECT_EQ(cache.hardware_address_for("10.0.0.7"), "00:11:22:33:44:55");
    EXPECT_EQ(probe.reachability_calls.load(), 0);
}

TEST(IdentityCache, ReachabilityProbeThenNeighborTable) {
    FakeNetworkProbe probe;
    FakeVendorDatabase vendors;
    probe.layer2["10.0.0.8"] = "00:00:00:00:00:00";
    probe.neighbor_after_probe["10.0.0.8"] = "66:77:88:99:aa:bb";
    IdentityCache cache(probe, vendors, 16, std::chrono::milliseconds(10));
    EXPECT_EQ(cache.hardware_address_for("10.0.0.8"), "66:77:88:99:AA:BB");
    EXPECT_EQ(probe.reachability_calls.load(), 1);
}

TEST(IdentityCache, AddressLookupsMemoized) {
    FakeNetworkProbe probe;
    FakeVendorDatabase vendors;
    probe.layer2["10.0.0.5"] = "aa:bb:cc:00:11:22";
    IdentityCache cache(probe, vendors);
    cache.hardware_address_for("10.0.0.5");
    cache.hardware_address_for("10.0.0.5");
    EXPECT_EQ(probe.layer2_calls.load(), 1);

    // Misses are remembered as well.
    EXPECT_EQ(cache.hardware_address_for("10.0.0.6"), "");
    int calls = probe.layer2_calls.load();
    EXPECT_EQ(cache.hardware_address_for("10.0.0.6"), "");
    EXPECT_EQ(probe.layer2_calls.load(), calls);
    EXPECT_EQ(cache.cached_addresses(), 2u);
}

TEST(IdentityCache, VendorMissRefreshesOncePerAddress) {
    FakeNetworkProbe probe;
    FakeVendorDatabase vendors;
    IdentityCache cache(probe, vendors);
    EXPECT_EQ(cache.vendor_for("AA:BB:CC:00:11:22"), "");
    EXPECT_EQ(cache.vendor_for("AA:BB:CC:00:11:22"), "");
    EXPECT_EQ(vendors.refresh_calls.load(), 1);
}

TEST(IdentityCache, ConcurrentLookupsShareOneResolution) {
    FakeNetworkProbe probe;
    FakeVendorDatabase vendors;
    probe.layer2["10.0.0.5"] = "aa:bb:cc:00:11:22";
    probe.delay = std::chrono::milliseconds(50);
    vendors.delay = std::chrono::milliseconds(50);
    IdentityCache cache(probe, vendors);

    std::vector<std::thread> workers;
    std::vector<std::string> macs(4);
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&cache, &macs, i]() {
            macs[i] = cache.hardware_address_for("10.0.0.5");
            cache.vendor_for(macs[i]);
        });
    }
    for (auto& t : workers) t.join();

    for (const auto& mac : macs) EXPECT_EQ(mac, "AA:BB:CC:00:11:22");
    EXPECT_EQ(probe.layer2_calls.load(), 1);
    EXPECT_EQ(vendors.refresh_calls.load(), 1);
}

TEST(IdentityCache, EvictedVendorMissDoesNotRefreshAgain) {
    FakeNetworkProbe probe;
    FakeVendorDatabase vendors;
    IdentityCache cache(probe, vendors, 1);
    EXPECT_EQ(cache.vendor_for("AA:BB:CC:00:11:22"), "");
    EXPECT_EQ(cache.vendor_for("DD:EE:FF:00:11:22"), "");
    EXPECT_EQ(vendors.refresh_calls.load(), 2);
    // The first miss was evicted by the second; it is looked up again but not refreshed.
    EXPECT_EQ(cache.vendor_for("AA:BB:CC:00:11:22"), "");
    EXPECT_EQ(vendors.refresh_calls.load(), 2);
    EXPECT_EQ(cache.cached_vendors(), 1u);
}

TEST(IdentityCache, VendorFoundAfterRefresh) {
    FakeNetworkProbe probe;
    FakeVendorDatabase vendors;
    vendors.unavailable = true;
    vendors.after_refresh["AABBCC"] = "Acme";
    IdentityCache cache(probe, vendors);
    EXPECT_EQ(cache.vendor_for("AA:BB:CC:00:11:22"), "Acme");
    EXPECT_EQ(vendors.refresh_calls.load(), 1);
}

TEST(IdentityCache, VendorRefreshFailureDegradesToEmpty) {
    FakeNetworkProbe probe;
    FakeVendorDatabase vendors;
    vendors.unavailable = true;
    vendors.refresh_throws = true;
    IdentityCache cache(probe, vendors);
    EXPECT_EQ(cache.vendor_for("AA:BB:CC:00:11:22"), "");
}

TEST(BoundedCache, EvictsOldestInsertion) {
    BoundedCache<std::string, std::string> cache(2);
    cache.put("a", "1");
    cache.put("b", "2");
    cache.put("c", "3");
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.get("c").value(), "3");
}

TEST(BoundedCache, FirstWriterWins) {
    BoundedCache<std::string, std::string> cache(4);
    EXPECT_EQ(cache.put("k", "first"), "first");
    EXPECT_EQ(cache.put("k", "second"), "first");
    EXPECT_EQ(cache.get("k").value(), "first");
    EXPECT_EQ(cache.put("empty", ""), "");
    EXPECT_TRUE(cache.get("empty").has_value());
}
