/**
 * @file test_device.cpp
 * @brief Тесты модели устройства и декодирования ответов прошивок
 */

#include <gtest/gtest.h>

#include "device/device.hpp"
#include "device/device_json.hpp"
#include "device/device_response.hpp"

#include <vector>

namespace axectl::tests {

using namespace device;

namespace {

const char* BITAXE_BODY = R"({
    "ASICModel": "BM1370",
    "boardVersion": "601",
    "version": "v2.4.0",
    "macAddr": "AA:BB:CC:DD:EE:01",
    "hostname": "bitaxe-gamma-1",
    "ssid": "farm",
    "wifiStatus": "Connected!",
    "wifiRSSI": -58,
    "stratumURL": "public-pool.io",
    "stratumPort": 21496,
    "stratumUser": "bc1q.worker",
    "frequency": 525,
    "voltage": 1150.0,
    "fanspeed": 4200,
    "temp": 61.5,
    "power": 17.8,
    "uptimeSeconds": 7260,
    "hashRate": 1180.4,
    "sharesAccepted": 512,
    "sharesRejected": 3,
    "bestDiff": "1.2G"
})";

const char* NERDQAXE_BODY = R"({
    "deviceModel": "NerdQAxe++",
    "ASICModel": "BM1370",
    "macAddr": "AA:BB:CC:DD:EE:02",
    "hostname": "nerdqaxe-1",
    "hostip": "10.0.0.8",
    "stratumURL": "solo.ckpool.org",
    "stratumPort": 3333,
    "stratumUser": "bc1q.nerd",
    "frequency": 600,
    "voltage": 1200.0,
    "fanspeed": 5100,
    "temp": 66.0,
    "power": 72.0,
    "uptimeSeconds": 600,
    "hashRate": 4800.0,
    "sharesAccepted": 90,
    "sharesRejected": 1,
    "bestDiff": 123456,
    "runningPartition": "ota_1"
})";

Device online_device(const std::string& ip, DeviceType type, double hashrate, double power, double temp) {
    Device device;
    device.name = ip;
    device.ip_address = ip;
    device.device_type = type;
    device.status = DeviceStatus::Online;

    DeviceStats stats;
    stats.hashrate_mhs = hashrate;
    stats.power_watts = power;
    stats.temperature_celsius = temp;
    device.stats = stats;
    return device;
}

} // anonymous namespace

// =============================================================================
// Декодирование ответов
// =============================================================================

/**
 * @brief Тест: ответ AxeOS декодируется в вариант Bitaxe
 */
TEST(DeviceResponseTest, DecodesBitaxe) {
    auto response = decode_device_response(BITAXE_BODY);
    ASSERT_TRUE(response.has_value()) << response.error().message;
    ASSERT_TRUE(std::holds_alternative<BitaxeInfo>(*response));

    EXPECT_EQ(device_type_of(*response), DeviceType::BitaxeGamma);

    auto info = to_unified_info(*response);
    EXPECT_EQ(info.hostname, "bitaxe-gamma-1");
    EXPECT_EQ(info.board_version, "601");
    EXPECT_EQ(info.firmware_version, "v2.4.0");
    EXPECT_EQ(info.wifi_rssi, -58);

    auto stats = to_unified_stats(*response);
    EXPECT_DOUBLE_EQ(stats.hashrate, 1180.4);
    EXPECT_EQ(stats.shares_accepted, 512u);
    EXPECT_EQ(stats.best_difficulty, "1.2G");
}

/**
 * @brief Тест: при наличии deviceModel выбирается NerdQAxe, даже если есть ключи Bitaxe
 */
TEST(DeviceResponseTest, NerdQaxeCheckedFirst) {
    auto response = decode_device_response(NERDQAXE_BODY);
    ASSERT_TRUE(response.has_value()) << response.error().message;
    ASSERT_TRUE(std::holds_alternative<NerdQaxeInfo>(*response));

    EXPECT_EQ(device_type_of(*response), DeviceType::NerdqaxePlus);

    auto info = to_unified_info(*response);
    EXPECT_EQ(info.board_version, "unknown");
    EXPECT_EQ(info.firmware_version, "unknown");

    // bestDiff числом превращается в текст
    auto stats = to_unified_stats(*response);
    EXPECT_EQ(stats.best_difficulty, "123456");
    EXPECT_EQ(stats.session_id, "ota_1");
}

TEST(DeviceResponseTest, AsicModelSelectsBitaxeVariant) {
    auto payload = nlohmann::json::parse(BITAXE_BODY);

    payload["ASICModel"] = "BM1366";
    auto ultra = decode_device_response(payload.dump());
    ASSERT_TRUE(ultra.has_value());
    EXPECT_EQ(device_type_of(*ultra), DeviceType::BitaxeUltra);

    payload["ASICModel"] = "bm1368";
    auto max = decode_device_response(payload.dump());
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(device_type_of(*max), DeviceType::BitaxeMax);

    payload["ASICModel"] = "BM1397";
    auto other = decode_device_response(payload.dump());
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(device_type_of(*other), DeviceType::Unknown);
}

TEST(DeviceResponseTest, DetectFamily) {
    EXPECT_EQ(detect_family(nlohmann::json::parse(R"({"deviceModel": "x"})")), DetectedFamily::NerdQaxe);
    EXPECT_EQ(detect_family(nlohmann::json::parse(R"({"ASICModel": "x", "hostname": "h"})")),
              DetectedFamily::Bitaxe);
    EXPECT_EQ(detect_family(nlohmann::json::parse(R"({"ASICModel": "x"})")), DetectedFamily::Unknown);
    EXPECT_EQ(detect_family(nlohmann::json::parse("[1, 2]")), DetectedFamily::Unknown);
}

TEST(DeviceResponseTest, Errors) {
    auto garbage = decode_device_response("<html>router login</html>");
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().code, ErrorCode::DeviceParseError);

    auto unknown = decode_device_response(R"({"model": "S19", "status": "ok"})");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::DeviceUnknownType);

    // Ключи схемы есть, но обязательного поля нет
    auto payload = nlohmann::json::parse(BITAXE_BODY);
    payload.erase("stratumURL");
    auto incomplete = decode_device_response(payload.dump());
    ASSERT_FALSE(incomplete.has_value());
    EXPECT_EQ(incomplete.error().code, ErrorCode::DeviceParseError);
}

TEST(DeviceResponseTest, MakeDeviceStats) {
    auto response = decode_device_response(BITAXE_BODY);
    ASSERT_TRUE(response.has_value());

    auto now = std::chrono::system_clock::now();
    auto stats = make_device_stats(to_unified_info(*response), to_unified_stats(*response), now);

    EXPECT_EQ(stats.timestamp, now);
    EXPECT_DOUBLE_EQ(stats.hashrate_mhs, 1180.4);
    EXPECT_DOUBLE_EQ(stats.temperature_celsius, 61.5);
    EXPECT_EQ(stats.fan_speed_rpm, 4200u);
    EXPECT_EQ(stats.uptime_seconds, 7260u);
    EXPECT_EQ(stats.pool_url, "public-pool.io:21496");
    EXPECT_EQ(stats.frequency, 525u);
}

// =============================================================================
// Типы и фильтры
// =============================================================================

TEST(DeviceTypeTest, CliNames) {
    EXPECT_EQ(parse_cli_name("bitaxe-gamma"), DeviceType::BitaxeGamma);
    EXPECT_EQ(parse_cli_name("BITAXE_MAX"), DeviceType::BitaxeMax);
    EXPECT_EQ(parse_cli_name("nerdqaxe-plus"), DeviceType::NerdqaxePlus);
    EXPECT_FALSE(parse_cli_name("bitaxe").has_value());

    for (auto type : ALL_DEVICE_TYPES) {
        EXPECT_EQ(parse_cli_name(cli_name(type)), type);
        EXPECT_EQ(parse_json_name(json_name(type)), type);
    }
}

TEST(DeviceFilterTest, Matching) {
    auto bitaxe = DeviceFilter::parse("bitaxe");
    ASSERT_TRUE(bitaxe.has_value());
    EXPECT_TRUE(bitaxe->matches(DeviceType::BitaxeUltra));
    EXPECT_TRUE(bitaxe->matches(DeviceType::BitaxeGamma));
    EXPECT_FALSE(bitaxe->matches(DeviceType::NerdqaxePlus));
    EXPECT_FALSE(bitaxe->matches(DeviceType::Unknown));

    auto specific = DeviceFilter::parse("bitaxe-max");
    ASSERT_TRUE(specific.has_value());
    EXPECT_TRUE(specific->matches(DeviceType::BitaxeMax));
    EXPECT_FALSE(specific->matches(DeviceType::BitaxeGamma));
    EXPECT_EQ(specific->to_string(), "bitaxe-max");

    EXPECT_TRUE(DeviceFilter::all().matches(DeviceType::Unknown));

    auto bad = DeviceFilter::parse("antminer");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::ConfigInvalidValue);
}

TEST(DeviceTest, MarkSeenIsMonotonic) {
    Device device;
    auto now = std::chrono::system_clock::now();

    device.mark_seen(now);
    EXPECT_EQ(device.last_seen, now);

    device.mark_seen(now - std::chrono::hours(1));
    EXPECT_EQ(device.last_seen, now);
}

// =============================================================================
// Сводки
// =============================================================================

/**
 * @brief Тест: офлайн-устройства учитываются в количестве, но не в суммах
 */
TEST(SwarmSummaryTest, OnlyOnlineDevicesContribute) {
    std::vector<Device> devices{
        online_device("10.0.0.1", DeviceType::BitaxeGamma, 1000.0, 20.0, 60.0),
        online_device("10.0.0.2", DeviceType::BitaxeGamma, 500.0, 10.0, 70.0),
        online_device("10.0.0.3", DeviceType::NerdqaxePlus, 4000.0, 70.0, 90.0),
    };
    devices[2].status = DeviceStatus::Offline;

    auto summary = SwarmSummary::from_devices(devices);
    EXPECT_EQ(summary.total_devices, 3u);
    EXPECT_EQ(summary.devices_online, 2u);
    EXPECT_EQ(summary.devices_offline, 1u);
    EXPECT_DOUBLE_EQ(summary.total_hashrate_mhs, 1500.0);
    EXPECT_DOUBLE_EQ(summary.total_power_watts, 30.0);
    EXPECT_DOUBLE_EQ(summary.average_temperature, 65.0);
    EXPECT_DOUBLE_EQ(summary.average_efficiency, 50.0);
}

TEST(SwarmSummaryTest, EmptyAndZeroPower) {
    auto empty = SwarmSummary::from_devices(std::vector<Device>{});
    EXPECT_EQ(empty.total_devices, 0u);
    EXPECT_DOUBLE_EQ(empty.average_temperature, 0.0);
    EXPECT_DOUBLE_EQ(empty.average_efficiency, 0.0);

    std::vector<Device> devices{online_device("10.0.0.1", DeviceType::BitaxeMax, 400.0, 0.0, 50.0)};
    EXPECT_DOUBLE_EQ(SwarmSummary::from_devices(devices).average_efficiency, 0.0);
}

TEST(TypeSummaryTest, GroupsInDeclarationOrder) {
    std::vector<Device> devices{
        online_device("10.0.0.3", DeviceType::NerdqaxePlus, 4000.0, 70.0, 60.0),
        online_device("10.0.0.1", DeviceType::BitaxeGamma, 1000.0, 20.0, 60.0),
        online_device("10.0.0.2", DeviceType::BitaxeGamma, 500.0, 10.0, 70.0),
    };

    auto summaries = TypeSummary::from_all_devices(devices);
    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].device_type, DeviceType::BitaxeGamma);
    EXPECT_EQ(summaries[0].total_devices, 2u);
    EXPECT_EQ(summaries[0].type_name, "Bitaxe Gamma");
    EXPECT_DOUBLE_EQ(summaries[0].total_hashrate_mhs, 1500.0);
    EXPECT_EQ(summaries[1].device_type, DeviceType::NerdqaxePlus);
}

// =============================================================================
// JSON
// =============================================================================

TEST(DeviceJsonTest, TimestampFormat) {
    auto parsed = parse_timestamp("2024-01-31T12:00:00Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(format_timestamp(*parsed), "2024-01-31T12:00:00Z");

    auto offset = parse_timestamp("2024-01-31T12:00:00.250+00:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*offset, *parsed);

    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
}

TEST(DeviceJsonTest, DeviceRoundTrip) {
    auto device = online_device("10.0.0.7", DeviceType::BitaxeUltra, 450.0, 12.0, 55.0);
    device.name = "bitaxe-ultra-7";
    device.serial_number = "AA:BB:CC:DD:EE:07";
    device.discovered_at = *parse_timestamp("2024-01-01T00:00:00Z");
    device.last_seen = *parse_timestamp("2024-01-02T00:00:00Z");

    nlohmann::json j = device;
    EXPECT_EQ(j.at("device_type"), "bitaxe_ultra");
    EXPECT_EQ(j.at("status"), "online");

    auto restored = j.get<Device>();
    EXPECT_EQ(restored.name, device.name);
    EXPECT_EQ(restored.ip_address, device.ip_address);
    EXPECT_EQ(restored.device_type, device.device_type);
    EXPECT_EQ(restored.serial_number, device.serial_number);
    EXPECT_EQ(restored.last_seen, device.last_seen);
    ASSERT_TRUE(restored.stats.has_value());
    EXPECT_DOUBLE_EQ(restored.stats->hashrate_mhs, 450.0);
}

} // namespace axectl::tests
