/**
 * @file test_discovery_coordinator.cpp
 * @brief Тесты координатора обнаружения
 */

#include <gtest/gtest.h>

#include "discovery/discovery_coordinator.hpp"
#include "fakes.hpp"

#include <filesystem>
#include <string>

namespace axectl::tests {

using discovery::CoordinatorConfig;
using discovery::DiscoveredDevice;
using discovery::DiscoveryCoordinator;
using discovery::DiscoverySource;

namespace fs = std::filesystem;

namespace {

DiscoveredDevice tagged(const std::string& ip, const std::string& name, DiscoverySource source) {
    DiscoveredDevice discovered;
    discovered.device.name = name;
    discovered.device.ip_address = ip;
    discovered.device.status = device::DeviceStatus::Online;
    discovered.source = source;
    return discovered;
}

} // anonymous namespace

// =============================================================================
// Слияние
// =============================================================================

TEST(MergeByAddressTest, FirstOccurrenceWins) {
    std::vector<DiscoveredDevice> mdns{tagged("10.0.0.5", "from-mdns", DiscoverySource::Mdns)};
    std::vector<DiscoveredDevice> cache{
        tagged("10.0.0.5", "from-cache", DiscoverySource::CacheProbe),
        tagged("10.0.0.7", "cached-7", DiscoverySource::CacheProbe),
    };
    std::vector<DiscoveredDevice> scan{
        tagged("10.0.0.6", "scan-6", DiscoverySource::Scan),
        tagged("10.0.0.7", "scan-7", DiscoverySource::Scan),
    };

    auto merged = discovery::merge_by_address({mdns, cache, scan});
    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].device.name, "from-mdns");
    EXPECT_EQ(merged[0].source, DiscoverySource::Mdns);
    EXPECT_EQ(merged[1].device.name, "cached-7");
    EXPECT_EQ(merged[2].device.name, "scan-6");
}

/**
 * @brief Тест: повторное слияние с любым из входов ничего не меняет
 */
TEST(MergeByAddressTest, Idempotent) {
    std::vector<DiscoveredDevice> a{
        tagged("10.0.0.1", "a1", DiscoverySource::Mdns),
        tagged("10.0.0.1", "a1-dup", DiscoverySource::Mdns),
    };
    std::vector<DiscoveredDevice> b{
        tagged("10.0.0.2", "b2", DiscoverySource::Scan),
        tagged("10.0.0.1", "b1", DiscoverySource::Scan),
    };

    auto merged = discovery::merge_by_address({a, b});
    ASSERT_EQ(merged.size(), 2u);

    for (const auto& input : {a, b}) {
        auto again = discovery::merge_by_address({merged, input});
        ASSERT_EQ(again.size(), merged.size());
        for (std::size_t i = 0; i < merged.size(); ++i) {
            EXPECT_EQ(again[i].device.ip_address, merged[i].device.ip_address);
            EXPECT_EQ(again[i].device.name, merged[i].device.name);
        }
    }

    EXPECT_TRUE(discovery::merge_by_address({}).empty());
}

// =============================================================================
// Полный цикл
// =============================================================================

class DiscoveryCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("axectl_discovery_") + info->name());
        fs::remove_all(dir_);

        config_.scan_timeout = std::chrono::milliseconds(50);
        config_.quick_probe_timeout = std::chrono::milliseconds(50);
        config_.scan_parallel = 8;
        config_.retention = std::chrono::hours(24);
        config_.cache_dir = dir_;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    /// @brief Записать кэш с одним устройством на диск
    void seed_cache(const std::string& ip, const std::string& name, device::Timestamp last_seen) {
        cache::DeviceCache seed;
        device::Device device;
        device.name = name;
        device.ip_address = ip;
        device.device_type = device::DeviceType::BitaxeGamma;
        device.status = device::DeviceStatus::Online;
        device.discovered_at = last_seen;
        device.last_seen = last_seen;
        seed.upsert(device);
        ASSERT_TRUE(seed.save(dir_).has_value());
    }

    fs::path dir_;
    CoordinatorConfig config_;
    FakeDeviceClient client_;
    FakeMdnsResolver resolver_;
};

/**
 * @brief Тест: mDNS, кэш и сканирование сливаются в два устройства
 */
TEST_F(DiscoveryCoordinatorTest, EndToEnd) {
    resolver_.add_record(service_record("gamma", "bitaxe-gamma.local.", "10.0.0.5"));
    client_.add_device("10.0.0.5", "bitaxe-gamma");
    client_.add_device("10.0.0.6", "nerd-6", device::DeviceType::NerdqaxePlus);
    seed_cache("10.0.0.5", "bitaxe-gamma", std::chrono::system_clock::now());

    cache::DeviceCache cache;
    DiscoveryCoordinator coordinator(client_, resolver_, cache, config_);

    auto result = coordinator.discover("10.0.0.0/29", std::chrono::milliseconds(500), true);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->network_scanned, "10.0.0.0/29");
    ASSERT_EQ(result->devices.size(), 2u);
    EXPECT_EQ(result->devices[0].device.ip_address, "10.0.0.5");
    EXPECT_EQ(result->devices[0].source, DiscoverySource::Mdns);
    EXPECT_EQ(result->devices[1].device.ip_address, "10.0.0.6");
    EXPECT_EQ(result->devices[1].source, DiscoverySource::Scan);

    EXPECT_TRUE(result->mdns_enabled);
    EXPECT_EQ(result->mdns_count, 1u);
    EXPECT_EQ(result->cache_probe_count, 0u);
    EXPECT_EQ(result->scan_count, 1u);
    EXPECT_EQ(result->scan_info.addresses_scanned, 6u);
    EXPECT_EQ(result->scan_info.devices_found, 2u);

    // Кэш обновлён в памяти и на диске
    EXPECT_EQ(cache.size(), 2u);
    cache::DeviceCache reloaded;
    reloaded.load(dir_);
    EXPECT_EQ(reloaded.size(), 2u);
    EXPECT_TRUE(reloaded.find("nerd-6").has_value());
}

TEST_F(DiscoveryCoordinatorTest, CachedDeviceOutsideRange) {
    client_.add_device("192.168.50.9", "bitaxe-far");
    seed_cache("192.168.50.9", "bitaxe-far", std::chrono::system_clock::now());

    cache::DeviceCache cache;
    DiscoveryCoordinator coordinator(client_, resolver_, cache, config_);

    auto result = coordinator.discover("10.0.0.0/30", std::chrono::milliseconds(100), false);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->devices.size(), 1u);
    EXPECT_EQ(result->devices[0].source, DiscoverySource::CacheProbe);
    EXPECT_EQ(result->cache_probe_count, 1u);
    EXPECT_FALSE(result->mdns_enabled);
    EXPECT_TRUE(resolver_.slices().empty());
}

/**
 * @brief Тест: давно не виденное устройство удаляется из кэша
 */
TEST_F(DiscoveryCoordinatorTest, PrunesStaleDevices) {
    seed_cache("10.0.0.2", "stale", std::chrono::system_clock::now() - std::chrono::hours(48));

    cache::DeviceCache cache;
    DiscoveryCoordinator coordinator(client_, resolver_, cache, config_);

    auto result = coordinator.discover("10.0.0.0/30", std::chrono::milliseconds(100), false);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->devices.empty());
    EXPECT_TRUE(cache.empty());
}

/**
 * @brief Тест: некорректный диапазон отклоняется до любых проб
 */
TEST_F(DiscoveryCoordinatorTest, InvalidRangeFailsBeforeProbing) {
    resolver_.add_record(service_record("gamma", "bitaxe.local.", "10.0.0.5"));
    client_.add_device("10.0.0.5", "bitaxe");

    cache::DeviceCache cache;
    DiscoveryCoordinator coordinator(client_, resolver_, cache, config_);

    auto result = coordinator.discover("10.0.0.0/33", std::chrono::milliseconds(100), true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DiscoveryInvalidRange);
    EXPECT_EQ(client_.probe_count(), 0u);
    EXPECT_TRUE(resolver_.slices().empty());
    EXPECT_FALSE(fs::exists(dir_));
}

TEST_F(DiscoveryCoordinatorTest, WithoutCacheDir) {
    config_.cache_dir.reset();
    client_.add_device("10.0.0.1", "bitaxe-1");

    cache::DeviceCache cache;
    DiscoveryCoordinator coordinator(client_, resolver_, cache, config_);

    auto result = coordinator.discover("10.0.0.0/30", std::chrono::milliseconds(100), false);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->devices.size(), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(fs::exists(dir_));
}

TEST(ResolveRangeTest, ExplicitRange) {
    auto range = DiscoveryCoordinator::resolve_range("192.168.4.0/22");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->to_string(), "192.168.4.0/22");

    auto bad = DiscoveryCoordinator::resolve_range("garbage");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::DiscoveryInvalidRange);
}

} // namespace axectl::tests
