/**
 * @file device_json.cpp
 * @brief Реализация JSON представления модели устройства
 */

#include "device_json.hpp"

#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace axectl::device {

using nlohmann::json;

// =============================================================================
// Время
// =============================================================================

std::string format_timestamp(Timestamp timestamp) {
    auto seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

Result<Timestamp> parse_timestamp(std::string_view text) {
    // "YYYY-MM-DDTHH:MM:SS" занимает 19 символов, остальное (дробь, зона) отбрасываем
    constexpr std::size_t BASE_LENGTH = 19;
    if (text.size() < BASE_LENGTH) {
        return Err<Timestamp>(
            ErrorCode::CacheParseError,
            std::format("Некорректное время: '{}'", text)
        );
    }

    std::tm utc{};
    std::istringstream iss{std::string(text.substr(0, BASE_LENGTH))};
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return Err<Timestamp>(
            ErrorCode::CacheParseError,
            std::format("Некорректное время: '{}'", text)
        );
    }

    auto seconds = timegm(&utc);
    return std::chrono::system_clock::from_time_t(seconds);
}

namespace {

Timestamp timestamp_field(const json& j, const char* key) {
    auto parsed = parse_timestamp(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(parsed.error().message);
    }
    return *parsed;
}

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template<typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

} // anonymous namespace

// =============================================================================
// Перечисления
// =============================================================================

void to_json(json& j, DeviceType type) {
    j = std::string(json_name(type));
}

void from_json(const json& j, DeviceType& type) {
    auto parsed = parse_json_name(j.get<std::string>());
    // Неизвестные имена из старых версий не ломают кэш
    type = parsed.value_or(DeviceType::Unknown);
}

void to_json(json& j, DeviceStatus status) {
    j = std::string(to_string(status));
}

void from_json(const json& j, DeviceStatus& status) {
    status = parse_status(j.get<std::string>()).value_or(DeviceStatus::Offline);
}

// =============================================================================
// DeviceStats
// =============================================================================

void to_json(json& j, const DeviceStats& stats) {
    j = json{
        {"timestamp", format_timestamp(stats.timestamp)},
        {"hashrate_mhs", stats.hashrate_mhs},
        {"temperature_celsius", stats.temperature_celsius},
        {"power_watts", stats.power_watts},
        {"fan_speed_rpm", stats.fan_speed_rpm},
        {"shares_accepted", stats.shares_accepted},
        {"shares_rejected", stats.shares_rejected},
        {"uptime_seconds", stats.uptime_seconds},
    };
    put_optional(j, "pool_url", stats.pool_url);
    put_optional(j, "wifi_rssi", stats.wifi_rssi);
    put_optional(j, "voltage", stats.voltage);
    put_optional(j, "frequency", stats.frequency);
}

void from_json(const json& j, DeviceStats& stats) {
    stats.timestamp = timestamp_field(j, "timestamp");
    stats.hashrate_mhs = j.at("hashrate_mhs").get<double>();
    stats.temperature_celsius = j.at("temperature_celsius").get<double>();
    stats.power_watts = j.at("power_watts").get<double>();
    stats.fan_speed_rpm = j.value("fan_speed_rpm", uint32_t{0});
    stats.shares_accepted = j.value("shares_accepted", uint64_t{0});
    stats.shares_rejected = j.value("shares_rejected", uint64_t{0});
    stats.uptime_seconds = j.value("uptime_seconds", uint64_t{0});
    stats.pool_url = get_optional<std::string>(j, "pool_url");
    stats.wifi_rssi = get_optional<int32_t>(j, "wifi_rssi");
    stats.voltage = get_optional<double>(j, "voltage");
    stats.frequency = get_optional<uint32_t>(j, "frequency");
}

// =============================================================================
// Device
// =============================================================================

void to_json(json& j, const Device& device) {
    j = json{
        {"name", device.name},
        {"ip_address", device.ip_address},
        {"device_type", device.device_type},
        {"status", device.status},
        {"discovered_at", format_timestamp(device.discovered_at)},
        {"last_seen", format_timestamp(device.last_seen)},
    };
    put_optional(j, "serial_number", device.serial_number);
    put_optional(j, "stats", device.stats);
}

void from_json(const json& j, Device& device) {
    device.name = j.at("name").get<std::string>();
    device.ip_address = j.at("ip_address").get<std::string>();
    device.device_type = j.at("device_type").get<DeviceType>();
    device.serial_number = get_optional<std::string>(j, "serial_number");
    device.status = j.value("status", DeviceStatus::Offline);
    device.discovered_at = timestamp_field(j, "discovered_at");
    device.last_seen = timestamp_field(j, "last_seen");
    device.stats = get_optional<DeviceStats>(j, "stats");
}

// =============================================================================
// Сводки
// =============================================================================

void to_json(json& j, const SwarmSummary& summary) {
    j = json{
        {"total_devices", summary.total_devices},
        {"devices_online", summary.devices_online},
        {"devices_offline", summary.devices_offline},
        {"total_hashrate_mhs", summary.total_hashrate_mhs},
        {"total_power_watts", summary.total_power_watts},
        {"average_temperature", summary.average_temperature},
        {"average_efficiency", summary.average_efficiency},
    };
}

void to_json(json& j, const TypeSummary& summary) {
    j = json{
        {"device_type", summary.device_type},
        {"type_name", summary.type_name},
        {"total_devices", summary.total_devices},
        {"devices_online", summary.devices_online},
        {"devices_offline", summary.devices_offline},
        {"total_hashrate_mhs", summary.total_hashrate_mhs},
        {"total_power_watts", summary.total_power_watts},
        {"average_temperature", summary.average_temperature},
    };
}

} // namespace axectl::device
