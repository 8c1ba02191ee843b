/**
 * @file device_response.cpp
 * @brief Реализация декодирования ответов устройств
 *
 * Использует nlohmann/json. Исключения библиотеки не выходят за пределы
 * decode_device_response: они превращаются в DeviceParseError.
 */

#include "device_response.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace axectl::device {

using nlohmann::json;

namespace {

template<typename T>
T required(const json& object, const char* key) {
    return object.at(key).get<T>();
}

template<typename T>
std::optional<T> optional_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

/**
 * @brief Строковое поле, которое некоторые прошивки отдают числом (bestDiff)
 */
std::optional<std::string> optional_text(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

BitaxeInfo decode_bitaxe(const json& j) {
    BitaxeInfo info;
    info.asic_model = required<std::string>(j, "ASICModel");
    info.board_version = optional_text(j, "boardVersion");
    info.firmware_version = required<std::string>(j, "version");
    info.mac_address = required<std::string>(j, "macAddr");
    info.hostname = required<std::string>(j, "hostname");
    info.ssid = optional_field<std::string>(j, "ssid");
    info.wifi_status = optional_field<std::string>(j, "wifiStatus");
    info.wifi_rssi = optional_field<int32_t>(j, "wifiRSSI");
    info.pool_url = required<std::string>(j, "stratumURL");
    info.pool_port = required<uint16_t>(j, "stratumPort");
    info.pool_user = required<std::string>(j, "stratumUser");
    info.frequency = required<uint32_t>(j, "frequency");
    info.voltage = required<double>(j, "voltage");
    info.fanspeed = required<uint32_t>(j, "fanspeed");
    info.temp = required<double>(j, "temp");
    info.power = required<double>(j, "power");
    info.uptime_seconds = required<uint64_t>(j, "uptimeSeconds");
    info.hash_rate = required<double>(j, "hashRate");
    info.shares_accepted = required<uint64_t>(j, "sharesAccepted");
    info.shares_rejected = required<uint64_t>(j, "sharesRejected");
    info.best_difficulty = optional_text(j, "bestDiff");
    return info;
}

NerdQaxeInfo decode_nerdqaxe(const json& j) {
    NerdQaxeInfo info;
    info.device_model = required<std::string>(j, "deviceModel");
    info.asic_model = required<std::string>(j, "ASICModel");
    info.version = optional_field<std::string>(j, "version");
    info.mac_address = required<std::string>(j, "macAddr");
    info.hostname = required<std::string>(j, "hostname");
    info.host_ip = optional_field<std::string>(j, "hostip");
    info.ssid = optional_field<std::string>(j, "ssid");
    info.wifi_status = optional_field<std::string>(j, "wifiStatus");
    info.wifi_rssi = optional_field<int32_t>(j, "wifiRSSI");
    info.pool_url = required<std::string>(j, "stratumURL");
    info.pool_port = required<uint16_t>(j, "stratumPort");
    info.pool_user = required<std::string>(j, "stratumUser");
    info.frequency = required<uint32_t>(j, "frequency");
    info.voltage = required<double>(j, "voltage");
    info.fanspeed = required<uint32_t>(j, "fanspeed");
    info.temp = required<double>(j, "temp");
    info.power = required<double>(j, "power");
    info.uptime_seconds = required<uint64_t>(j, "uptimeSeconds");
    info.hash_rate = required<double>(j, "hashRate");
    info.shares_accepted = required<uint64_t>(j, "sharesAccepted");
    info.shares_rejected = required<uint64_t>(j, "sharesRejected");
    info.best_difficulty = optional_text(j, "bestDiff");
    info.running_partition = optional_field<std::string>(j, "runningPartition");
    return info;
}

// =============================================================================
// Конверсия вариантов
// =============================================================================

UnifiedInfo unify_info(const BitaxeInfo& bitaxe) {
    UnifiedInfo info;
    info.asic_model = bitaxe.asic_model;
    info.board_version = bitaxe.board_version.value_or("unknown");
    info.firmware_version = bitaxe.firmware_version;
    info.mac_address = bitaxe.mac_address;
    info.hostname = bitaxe.hostname;
    info.wifi_ssid = bitaxe.ssid;
    info.wifi_status = bitaxe.wifi_status;
    info.wifi_rssi = bitaxe.wifi_rssi;
    info.pool_url = bitaxe.pool_url;
    info.pool_port = bitaxe.pool_port;
    info.pool_user = bitaxe.pool_user;
    info.frequency = bitaxe.frequency;
    info.voltage = bitaxe.voltage;
    info.fanspeed = bitaxe.fanspeed;
    info.temp = bitaxe.temp;
    info.power = bitaxe.power;
    info.running_time = bitaxe.uptime_seconds;
    return info;
}

UnifiedInfo unify_info(const NerdQaxeInfo& nerd) {
    UnifiedInfo info;
    info.asic_model = nerd.asic_model;
    info.board_version = "unknown";  // NerdQAxe не сообщает версию платы
    info.firmware_version = nerd.version.value_or("unknown");
    info.mac_address = nerd.mac_address;
    info.hostname = nerd.hostname;
    info.wifi_ssid = nerd.ssid;
    info.wifi_status = nerd.wifi_status;
    info.wifi_rssi = nerd.wifi_rssi;
    info.pool_url = nerd.pool_url;
    info.pool_port = nerd.pool_port;
    info.pool_user = nerd.pool_user;
    info.frequency = nerd.frequency;
    info.voltage = nerd.voltage;
    info.fanspeed = nerd.fanspeed;
    info.temp = nerd.temp;
    info.power = nerd.power;
    info.running_time = nerd.uptime_seconds;
    return info;
}

UnifiedStats unify_stats(const BitaxeInfo& bitaxe) {
    UnifiedStats stats;
    stats.hashrate = bitaxe.hash_rate;
    stats.temp = bitaxe.temp;
    stats.power = bitaxe.power;
    stats.fanspeed = bitaxe.fanspeed;
    stats.shares_accepted = bitaxe.shares_accepted;
    stats.shares_rejected = bitaxe.shares_rejected;
    stats.uptime = bitaxe.uptime_seconds;
    stats.best_difficulty = bitaxe.best_difficulty;
    stats.session_id = bitaxe.firmware_version;
    return stats;
}

UnifiedStats unify_stats(const NerdQaxeInfo& nerd) {
    UnifiedStats stats;
    stats.hashrate = nerd.hash_rate;
    stats.temp = nerd.temp;
    stats.power = nerd.power;
    stats.fanspeed = nerd.fanspeed;
    stats.shares_accepted = nerd.shares_accepted;
    stats.shares_rejected = nerd.shares_rejected;
    stats.uptime = nerd.uptime_seconds;
    stats.best_difficulty = nerd.best_difficulty;
    stats.session_id = nerd.running_partition;
    return stats;
}

} // anonymous namespace

// =============================================================================
// Публичный API
// =============================================================================

DetectedFamily detect_family(const json& payload) noexcept {
    if (!payload.is_object()) {
        return DetectedFamily::Unknown;
    }
    if (payload.contains("deviceModel")) {
        return DetectedFamily::NerdQaxe;
    }
    if (payload.contains("ASICModel") && payload.contains("hostname")) {
        return DetectedFamily::Bitaxe;
    }
    return DetectedFamily::Unknown;
}

Result<DeviceResponse> decode_device_response(std::string_view body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<DeviceResponse>(ErrorCode::DeviceParseError, "Ответ устройства не является JSON");
    }

    try {
        switch (detect_family(parsed)) {
            case DetectedFamily::NerdQaxe:
                return DeviceResponse{decode_nerdqaxe(parsed)};
            case DetectedFamily::Bitaxe:
                return DeviceResponse{decode_bitaxe(parsed)};
            case DetectedFamily::Unknown:
                break;
        }
    } catch (const json::exception& e) {
        return Err<DeviceResponse>(
            ErrorCode::DeviceParseError,
            std::format("Некорректный ответ устройства: {}", e.what())
        );
    }

    return Err<DeviceResponse>(
        ErrorCode::DeviceUnknownType,
        "Не удалось определить тип устройства по ответу"
    );
}

DeviceType device_type_of(const DeviceResponse& response) {
    if (std::holds_alternative<NerdQaxeInfo>(response)) {
        return DeviceType::NerdqaxePlus;
    }

    auto model = to_lower(std::get<BitaxeInfo>(response).asic_model);
    if (model.find("bm1366") != std::string::npos) return DeviceType::BitaxeUltra;
    if (model.find("bm1368") != std::string::npos) return DeviceType::BitaxeMax;
    if (model.find("bm1370") != std::string::npos) return DeviceType::BitaxeGamma;
    return DeviceType::Unknown;
}

UnifiedInfo to_unified_info(const DeviceResponse& response) {
    return std::visit([](const auto& variant) { return unify_info(variant); }, response);
}

UnifiedStats to_unified_stats(const DeviceResponse& response) {
    return std::visit([](const auto& variant) { return unify_stats(variant); }, response);
}

DeviceStats make_device_stats(
    const UnifiedInfo& info,
    const UnifiedStats& stats,
    Timestamp captured_at
) {
    DeviceStats result;
    result.timestamp = captured_at;
    result.hashrate_mhs = stats.hashrate;
    result.temperature_celsius = stats.temp;
    result.power_watts = stats.power;
    result.fan_speed_rpm = stats.fanspeed;
    result.shares_accepted = stats.shares_accepted;
    result.shares_rejected = stats.shares_rejected;
    result.uptime_seconds = stats.uptime;
    result.pool_url = std::format("{}:{}", info.pool_url, info.pool_port);
    result.wifi_rssi = info.wifi_rssi;
    result.voltage = info.voltage;
    result.frequency = info.frequency;
    return result;
}

} // namespace axectl::device
