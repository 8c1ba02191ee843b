/**
 * @file test_scanner.cpp
 * @brief Тесты пробы адресов, сканера и пула потоков
 */

#include <gtest/gtest.h>

#include "core/worker_pool.hpp"
#include "discovery/prober.hpp"
#include "discovery/scanner.hpp"
#include "fakes.hpp"

#include <atomic>
#include <functional>
#include <numeric>
#include <system_error>
#include <thread>
#include <vector>

namespace axectl::tests {

using discovery::NetworkRange;
using discovery::ProbeResult;
using discovery::Prober;
using discovery::ScanConfig;
using discovery::Scanner;

// =============================================================================
// parallel_for / parallel_map
// =============================================================================

TEST(WorkerPoolTest, ParallelMapPreservesOrder) {
    std::vector<int> inputs(200);
    std::iota(inputs.begin(), inputs.end(), 0);

    auto squares = parallel_map<int>(inputs, 16, [](int x) { return x * x; });
    ASSERT_EQ(squares.size(), inputs.size());
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        EXPECT_EQ(squares[i], inputs[i] * inputs[i]);
    }
}

/**
 * @brief Тест: одновременно выполняется не больше max_parallel задач
 */
TEST(WorkerPoolTest, RespectsParallelLimit) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    parallel_for(64, 4, [&](std::size_t) {
        auto now = ++active;
        auto seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active;
    });

    EXPECT_LE(peak.load(), 4);
    EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, EmptyInput) {
    std::size_t calls = 0;
    parallel_for(0, 8, [&](std::size_t) { ++calls; });
    EXPECT_EQ(calls, 0u);
    EXPECT_TRUE(parallel_map<int>(std::vector<int>{}, 8, [](int x) { return x; }).empty());
}

/**
 * @brief Тест: сбой создания потока не теряет задачи и не роняет процесс
 */
TEST(WorkerPoolTest, ThreadStartFailureStillRunsAllTasks) {
    constexpr std::size_t COUNT = 40;
    std::vector<std::atomic<int>> hits(COUNT);

    std::size_t spawned = 0;
    auto failing_after_two = [&spawned](auto& worker) {
        if (spawned == 2) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        ++spawned;
        return std::thread(std::ref(worker));
    };

    parallel_for_with(COUNT, 8, [&](std::size_t i) { ++hits[i]; }, failing_after_two);

    EXPECT_EQ(spawned, 2u);
    for (std::size_t i = 0; i < COUNT; ++i) {
        EXPECT_EQ(hits[i].load(), 1) << "task " << i;
    }
}

TEST(WorkerPoolTest, NoThreadsRunsInline) {
    std::size_t calls = 0;
    parallel_for_with(10, 4, [&](std::size_t) { ++calls; }, [](auto&) -> std::thread {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    });
    EXPECT_EQ(calls, 10u);
}

// =============================================================================
// Prober
// =============================================================================

TEST(ProberTest, States) {
    FakeDeviceClient client;
    client.add_device("10.0.0.5", "bitaxe-5", device::DeviceType::BitaxeMax, "AA:BB");
    client.add_unclassified("10.0.0.6");

    Prober prober(client);

    auto identified = prober.probe("10.0.0.5", std::chrono::milliseconds(100));
    EXPECT_EQ(identified.state, ProbeResult::State::Identified);
    ASSERT_TRUE(identified.device.has_value());
    EXPECT_EQ(identified.device->name, "bitaxe-5");
    EXPECT_EQ(identified.device->ip_address, "10.0.0.5");
    EXPECT_EQ(identified.device->device_type, device::DeviceType::BitaxeMax);
    EXPECT_EQ(identified.device->serial_number, "AA:BB");
    EXPECT_TRUE(identified.device->is_online());

    auto unclassified = prober.probe("10.0.0.6", std::chrono::milliseconds(100));
    EXPECT_EQ(unclassified.state, ProbeResult::State::Unclassified);
    EXPECT_TRUE(unclassified.responsive());
    ASSERT_TRUE(unclassified.error.has_value());
    EXPECT_EQ(unclassified.error->code, ErrorCode::DeviceUnknownType);

    auto silent = prober.probe("10.0.0.7", std::chrono::milliseconds(100));
    EXPECT_EQ(silent.state, ProbeResult::State::Unreachable);
    EXPECT_FALSE(silent.responsive());
    EXPECT_FALSE(silent.device.has_value());
}

// =============================================================================
// Scanner
// =============================================================================

TEST(ScannerTest, CandidatesSkipNetworkAndBroadcast) {
    auto slash24 = NetworkRange::parse("192.168.1.0/24");
    ASSERT_TRUE(slash24.has_value());
    auto candidates = Scanner::candidate_addresses(*slash24);
    ASSERT_EQ(candidates.size(), 254u);
    EXPECT_EQ(candidates.front(), "192.168.1.1");
    EXPECT_EQ(candidates.back(), "192.168.1.254");

    auto single = NetworkRange::parse("192.168.1.9/32");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(Scanner::candidate_addresses(*single), std::vector<std::string>{"192.168.1.9"});

    auto pair = NetworkRange::parse("192.168.1.8/31");
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ(Scanner::candidate_addresses(*pair).size(), 2u);
}

/**
 * @brief Тест: каждый адрес /24 пробуется ровно один раз
 */
TEST(ScannerTest, ScanSlash24) {
    FakeDeviceClient client;
    client.add_device("192.168.1.10", "bitaxe-10");
    client.add_device("192.168.1.200", "nerd-200", device::DeviceType::NerdqaxePlus);
    client.add_unclassified("192.168.1.1");

    auto range = NetworkRange::parse("192.168.1.0/24");
    ASSERT_TRUE(range.has_value());

    ScanConfig config;
    config.per_host_timeout = std::chrono::milliseconds(50);
    config.max_parallel = 32;

    Scanner scanner(client);
    auto result = scanner.scan(*range, config);

    EXPECT_EQ(client.probe_count(), 254u);
    EXPECT_EQ(result.info.network, "192.168.1.0/24");
    EXPECT_EQ(result.info.addresses_scanned, 254u);
    EXPECT_EQ(result.info.responsive_addresses, 3u);
    EXPECT_EQ(result.info.devices_found, 2u);
    EXPECT_EQ(result.info.errors_encountered, 1u);

    // Порядок результатов совпадает с порядком адресов
    ASSERT_EQ(result.devices.size(), 2u);
    EXPECT_EQ(result.devices[0].ip_address, "192.168.1.10");
    EXPECT_EQ(result.devices[1].ip_address, "192.168.1.200");
}

TEST(ScannerTest, PlaceholdersWhenRequested) {
    FakeDeviceClient client;
    client.add_unclassified("10.1.1.1");

    auto range = NetworkRange::parse("10.1.1.0/30");
    ASSERT_TRUE(range.has_value());

    ScanConfig config;
    config.confirm_only_known_devices = false;
    config.include_unreachable = true;

    auto result = Scanner(client).scan(*range, config);
    ASSERT_EQ(result.devices.size(), 2u);

    EXPECT_EQ(result.devices[0].name, "Unknown-10.1.1.1");
    EXPECT_EQ(result.devices[0].device_type, device::DeviceType::Unknown);
    EXPECT_TRUE(result.devices[0].is_online());

    EXPECT_EQ(result.devices[1].name, "Offline-10.1.1.2");
    EXPECT_EQ(result.devices[1].status, device::DeviceStatus::Offline);
}

TEST(ScannerTest, EmptyNetwork) {
    FakeDeviceClient client;
    auto range = NetworkRange::parse("10.2.0.0/28");
    ASSERT_TRUE(range.has_value());

    auto result = Scanner(client).scan(*range);
    EXPECT_TRUE(result.devices.empty());
    EXPECT_EQ(result.info.addresses_scanned, 14u);
    EXPECT_EQ(result.info.responsive_addresses, 0u);
}

TEST(ScannerTest, ProbeSingle) {
    FakeDeviceClient client;
    client.add_device("10.0.0.5", "bitaxe-5");
    Scanner scanner(client);

    auto found = scanner.probe_single("10.0.0.5", std::chrono::milliseconds(100));
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found->has_value());
    EXPECT_EQ((*found)->name, "bitaxe-5");

    auto missing = scanner.probe_single("10.0.0.6", std::chrono::milliseconds(100));
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing->has_value());

    auto invalid = scanner.probe_single("bitaxe.local", std::chrono::milliseconds(100));
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, ErrorCode::DiscoveryInvalidAddress);
}

} // namespace axectl::tests
