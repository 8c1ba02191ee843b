/**
 * @file test_status_renderer.cpp
 * @brief Тесты текстового и JSON вывода
 */

#include <gtest/gtest.h>

#include "output/format.hpp"
#include "output/json_output.hpp"
#include "output/status_renderer.hpp"

#include <string>

namespace axectl::tests {

using namespace output;

namespace {

device::Device online_device(const std::string& name, const std::string& ip, double hashrate) {
    device::Device device;
    device.name = name;
    device.ip_address = ip;
    device.device_type = device::DeviceType::BitaxeGamma;
    device.status = device::DeviceStatus::Online;

    device::DeviceStats stats;
    stats.hashrate_mhs = hashrate;
    stats.temperature_celsius = 65.0;
    stats.power_watts = 15.0;
    stats.uptime_seconds = 7200;
    stats.pool_url = "public-pool.io:21496";
    device.stats = stats;
    return device;
}

monitor::TickEvent sample_tick() {
    monitor::TickEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.devices = {online_device("bitaxe-1", "10.0.0.1", 500.0)};
    event.stats_collected = true;
    event.summary = device::SwarmSummary::from_devices(event.devices);
    return event;
}

monitor::Alert sample_alert() {
    monitor::Alert alert;
    alert.timestamp = std::chrono::system_clock::now();
    alert.message = "bitaxe-1 went offline";
    alert.device_ip = "10.0.0.1";
    alert.kind = monitor::AlertKind::Offline;
    return alert;
}

} // anonymous namespace

// =============================================================================
// Форматирование величин
// =============================================================================

TEST(FormatTest, Hashrate) {
    EXPECT_EQ(format_hashrate(500.0), "500.0 MH/s");
    EXPECT_EQ(format_hashrate(1234.0), "1.2 GH/s");
    EXPECT_EQ(format_hashrate(2'500'000.0), "2.5 TH/s");
    EXPECT_EQ(format_hashrate(0.0), "0.0 MH/s");
}

TEST(FormatTest, TemperatureWithoutColor) {
    EXPECT_EQ(format_temperature(65.5, false), "65.5°C");
    EXPECT_EQ(format_temperature(85.0, false), "85.0°C");
}

TEST(FormatTest, TemperatureColorThresholds) {
    EXPECT_NE(format_temperature(60.0, true).find(ansi::GREEN), std::string::npos);
    EXPECT_NE(format_temperature(75.0, true).find(ansi::YELLOW), std::string::npos);
    EXPECT_NE(format_temperature(80.0, true).find(ansi::RED), std::string::npos);
}

TEST(FormatTest, Uptime) {
    EXPECT_EQ(format_uptime(90'000), "1d 1h");
    EXPECT_EQ(format_uptime(7'260), "2h 1m");
    EXPECT_EQ(format_uptime(300), "5m");
    EXPECT_EQ(format_uptime(0), "0m");
}

TEST(FormatTest, Power) {
    EXPECT_EQ(format_power(15.25), "15.2W");
}

/**
 * @brief Тест: ширина не учитывает ANSI коды и байты продолжения UTF-8
 */
TEST(FormatTest, DisplayWidth) {
    EXPECT_EQ(display_width("abc"), 3u);
    EXPECT_EQ(display_width(paint("abc", ansi::RED, true)), 3u);
    EXPECT_EQ(display_width("65.5°C"), 6u);
    EXPECT_EQ(pad_right(paint("ab", ansi::GREEN, true), 4).substr(ansi::GREEN.size()),
              std::string("ab") + std::string(ansi::RESET) + "  ");
}

TEST(FormatTest, Age) {
    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(format_age(now - std::chrono::seconds(5), now), "5s ago");
    EXPECT_EQ(format_age(now - std::chrono::minutes(3), now), "3m ago");
    EXPECT_EQ(format_age(now - std::chrono::hours(2), now), "2h ago");
    EXPECT_EQ(format_age(now - std::chrono::hours(49), now), "2d ago");
    EXPECT_EQ(format_age(now + std::chrono::seconds(10), now), "0s ago");
}

// =============================================================================
// StatusRenderer
// =============================================================================

/**
 * @brief Тест: экран без цвета не содержит escape-последовательностей
 */
TEST(StatusRendererTest, PlainTickHasNoAnsi) {
    auto event = sample_tick();
    event.recent_alerts = {sample_alert()};
    event.alert_count = 1;

    auto text = render_plain(event);
    EXPECT_EQ(text.find('\033'), std::string::npos);
    EXPECT_NE(text.find("bitaxe-1"), std::string::npos);
    EXPECT_NE(text.find("500.0 MH/s"), std::string::npos);
    EXPECT_NE(text.find("bitaxe-1 went offline"), std::string::npos);
    EXPECT_NE(text.find("Discovery: not run yet"), std::string::npos);
}

TEST(StatusRendererTest, EmptyTick) {
    monitor::TickEvent event;
    event.timestamp = std::chrono::system_clock::now();
    auto text = render_plain(event);
    EXPECT_NE(text.find("No devices to monitor"), std::string::npos);
}

TEST(StatusRendererTest, DiscoveryLine) {
    StatusRenderer renderer(false);
    auto now = std::chrono::system_clock::now();
    EXPECT_EQ(renderer.discovery_line(true, std::nullopt, now), "Discovery: running...");
    EXPECT_EQ(renderer.discovery_line(false, now - std::chrono::minutes(4), now),
              "Discovery: last completed 4m ago");
}

TEST(StatusRendererTest, ControlReport) {
    control::ControlOutcome ok;
    ok.device = online_device("bitaxe-1", "10.0.0.1", 500.0);
    ok.success = true;
    ok.message = "bitaxe-1: restart ok";

    control::ControlOutcome failed;
    failed.device = online_device("bitaxe-2", "10.0.0.2", 500.0);
    failed.message = "bitaxe-2: HTTP 500";

    auto text = StatusRenderer(false).control_report({ok, failed}, control::ControlAction::restart());
    EXPECT_NE(text.find("ok   bitaxe-1: restart ok"), std::string::npos);
    EXPECT_NE(text.find("FAIL bitaxe-2: HTTP 500"), std::string::npos);
    EXPECT_NE(text.find("restart: 1/2 succeeded"), std::string::npos);
}

// =============================================================================
// JSON
// =============================================================================

TEST(JsonOutputTest, DiscoveryDocument) {
    discovery::DiscoveryResult result;
    discovery::DiscoveredDevice discovered;
    discovered.device = online_device("bitaxe-1", "10.0.0.1", 500.0);
    discovered.source = discovery::DiscoverySource::Mdns;
    result.devices = {discovered};
    result.network_scanned = "10.0.0.0/24";
    result.mdns_enabled = true;
    result.mdns_count = 1;
    result.scan_info.addresses_scanned = 254;

    auto document = discovery_document(result, std::chrono::system_clock::now());

    EXPECT_EQ(document["total"], 1);
    EXPECT_EQ(document["network_scanned"], "10.0.0.0/24");
    EXPECT_EQ(document["discovery_methods"]["mdns"], true);
    EXPECT_EQ(document["sources"]["mdns"], 1);
    EXPECT_EQ(document["sources"]["scan"], 0);
    EXPECT_EQ(document["scan_info"]["addresses_scanned"], 254);
    ASSERT_EQ(document["devices"].size(), 1u);
    EXPECT_EQ(document["devices"][0]["discovery_source"].get<std::string>(),
              std::string(discovery::to_string(discovery::DiscoverySource::Mdns)));
    EXPECT_TRUE(document.contains("timestamp"));
}

/**
 * @brief Тест: ключи алертов появляются только в тиках с алертами
 */
TEST(JsonOutputTest, TickDocumentAlertsOnlyWhenPresent) {
    auto event = sample_tick();

    auto quiet = tick_document(event, false);
    EXPECT_FALSE(quiet.contains("alerts"));
    EXPECT_FALSE(quiet.contains("alert_count"));
    EXPECT_FALSE(quiet.contains("type_summaries"));
    EXPECT_FALSE(quiet.contains("last_discovery"));
    EXPECT_EQ(quiet["devices"].size(), 1u);
    EXPECT_EQ(quiet["discovery_active"], false);

    event.new_alerts = {sample_alert()};
    event.alert_count = 3;
    event.last_discovery = event.timestamp;

    auto loud = tick_document(event, true);
    ASSERT_TRUE(loud.contains("alerts"));
    EXPECT_EQ(loud["alert_count"], 3);
    EXPECT_EQ(loud["alerts"][0]["kind"], "offline");
    EXPECT_EQ(loud["alerts"][0]["device_ip"], "10.0.0.1");
    EXPECT_TRUE(loud.contains("type_summaries"));
    EXPECT_TRUE(loud.contains("last_discovery"));
}

TEST(JsonOutputTest, ControlDocument) {
    control::ControlOutcome ok;
    ok.device = online_device("bitaxe-1", "10.0.0.1", 500.0);
    ok.success = true;
    ok.message = "bitaxe-1: set fan speed to 80% ok";

    control::ControlOutcome failed;
    failed.device = online_device("bitaxe-2", "10.0.0.2", 500.0);
    failed.message = "bitaxe-2: HTTP 500";

    auto document = control_document({ok, failed}, control::ControlAction::set_fan(80));
    EXPECT_EQ(document["action"], "set fan speed to 80%");
    EXPECT_EQ(document["total"], 2);
    EXPECT_EQ(document["succeeded"], 1);
    EXPECT_EQ(document["failed"], 1);
    EXPECT_EQ(document["results"][1]["ip_address"], "10.0.0.2");
    EXPECT_EQ(document["results"][1]["success"], false);
}

TEST(JsonOutputTest, ListDocument) {
    std::vector<device::Device> devices{
        online_device("bitaxe-1", "10.0.0.1", 500.0),
        online_device("bitaxe-2", "10.0.0.2", 700.0),
    };
    auto document = list_document(devices, std::chrono::system_clock::now());
    EXPECT_EQ(document["total"], 2);
    EXPECT_EQ(document["devices"].size(), 2u);
    EXPECT_TRUE(document.contains("summary"));
}

} // namespace axectl::tests
