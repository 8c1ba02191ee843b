/**
 * @file device_response.hpp
 * @brief Декодирование ответов /api/system/info разных прошивок
 *
 * Ответ устройства декодируется в закрытое множество вариантов
 * (std::variant). Порядок проверки схем является контрактом:
 *
 * 1. NerdQAxe: присутствует ключ "deviceModel"
 * 2. Bitaxe: присутствуют "ASICModel" и "hostname"
 * 3. Иначе: DeviceUnknownType
 *
 * NerdQAxe проверяется первым, так как его ответ является надмножеством
 * ответа Bitaxe.
 */

#pragma once

#include "device.hpp"
#include "../core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace axectl::device {

// =============================================================================
// Унифицированные представления
// =============================================================================

/**
 * @brief Унифицированная информация об устройстве
 */
struct UnifiedInfo {
    std::string asic_model;
    std::string board_version;
    std::string firmware_version;
    std::string mac_address;
    std::string hostname;
    std::optional<std::string> wifi_ssid;
    std::optional<std::string> wifi_status;
    std::optional<int32_t> wifi_rssi;
    std::string pool_url;
    uint16_t pool_port = 0;
    std::string pool_user;
    uint32_t frequency = 0;
    double voltage = 0.0;
    uint32_t fanspeed = 0;
    double temp = 0.0;
    double power = 0.0;
    uint64_t running_time = 0;
};

/**
 * @brief Унифицированная статистика устройства
 */
struct UnifiedStats {
    double hashrate = 0.0;
    double temp = 0.0;
    double power = 0.0;
    uint32_t fanspeed = 0;
    uint64_t shares_accepted = 0;
    uint64_t shares_rejected = 0;
    uint64_t uptime = 0;
    std::optional<std::string> best_difficulty;
    std::optional<std::string> session_id;
};

// =============================================================================
// Варианты ответов
// =============================================================================

/**
 * @brief Ответ прошивки Bitaxe (AxeOS)
 */
struct BitaxeInfo {
    std::string asic_model;                    ///< "ASICModel"
    std::optional<std::string> board_version;  ///< "boardVersion"
    std::string firmware_version;              ///< "version"
    std::string mac_address;                   ///< "macAddr"
    std::string hostname;
    std::optional<std::string> ssid;
    std::optional<std::string> wifi_status;    ///< "wifiStatus"
    std::optional<int32_t> wifi_rssi;          ///< "wifiRSSI"
    std::string pool_url;                      ///< "stratumURL"
    uint16_t pool_port = 0;                    ///< "stratumPort"
    std::string pool_user;                     ///< "stratumUser"
    uint32_t frequency = 0;
    double voltage = 0.0;
    uint32_t fanspeed = 0;
    double temp = 0.0;
    double power = 0.0;
    uint64_t uptime_seconds = 0;               ///< "uptimeSeconds"
    double hash_rate = 0.0;                    ///< "hashRate"
    uint64_t shares_accepted = 0;              ///< "sharesAccepted"
    uint64_t shares_rejected = 0;              ///< "sharesRejected"
    std::optional<std::string> best_difficulty; ///< "bestDiff"
};

/**
 * @brief Ответ прошивки NerdQAxe
 */
struct NerdQaxeInfo {
    std::string device_model;                  ///< "deviceModel"
    std::string asic_model;                    ///< "ASICModel"
    std::optional<std::string> version;
    std::string mac_address;                   ///< "macAddr"
    std::string hostname;
    std::optional<std::string> host_ip;        ///< "hostip"
    std::optional<std::string> ssid;
    std::optional<std::string> wifi_status;
    std::optional<int32_t> wifi_rssi;
    std::string pool_url;
    uint16_t pool_port = 0;
    std::string pool_user;
    uint32_t frequency = 0;
    double voltage = 0.0;
    uint32_t fanspeed = 0;
    double temp = 0.0;
    double power = 0.0;
    uint64_t uptime_seconds = 0;
    double hash_rate = 0.0;
    uint64_t shares_accepted = 0;
    uint64_t shares_rejected = 0;
    std::optional<std::string> best_difficulty;
    std::optional<std::string> running_partition; ///< "runningPartition"
};

/**
 * @brief Ответ устройства: один из известных вариантов
 */
using DeviceResponse = std::variant<BitaxeInfo, NerdQaxeInfo>;

/**
 * @brief Семейство, определённое по структуре JSON
 */
enum class DetectedFamily {
    Bitaxe,
    NerdQaxe,
    Unknown
};

// =============================================================================
// Декодирование
// =============================================================================

/**
 * @brief Определить семейство по ключам ответа (порядок см. @file)
 */
[[nodiscard]] DetectedFamily detect_family(const nlohmann::json& payload) noexcept;

/**
 * @brief Декодировать тело ответа /api/system/info
 *
 * @return Вариант ответа, DeviceParseError (битый JSON или нет обязательного
 *         поля) или DeviceUnknownType
 */
[[nodiscard]] Result<DeviceResponse> decode_device_response(std::string_view body);

/**
 * @brief Тип устройства для варианта ответа
 *
 * Bitaxe по модели ASIC: BM1366 Ultra, BM1368 Max, BM1370 Gamma.
 * NerdQAxe всегда NerdqaxePlus.
 */
[[nodiscard]] DeviceType device_type_of(const DeviceResponse& response);

[[nodiscard]] UnifiedInfo to_unified_info(const DeviceResponse& response);

[[nodiscard]] UnifiedStats to_unified_stats(const DeviceResponse& response);

/**
 * @brief Собрать DeviceStats из унифицированных ответов
 *
 * pool_url имеет вид "url:port".
 */
[[nodiscard]] DeviceStats make_device_stats(
    const UnifiedInfo& info,
    const UnifiedStats& stats,
    Timestamp captured_at
);

} // namespace axectl::device
