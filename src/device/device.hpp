/**
 * @file device.hpp
 * @brief Модель устройства: тип, статус, статистика, сводки
 *
 * Общая семантическая модель поверх разнородных REST API устройств
 * (Bitaxe, NerdQAxe). Адрес однозначно идентифицирует устройство
 * в пределах одного процесса.
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace axectl::device {

/// @brief Момент времени (UTC)
using Timestamp = std::chrono::system_clock::time_point;

// =============================================================================
// Тип устройства
// =============================================================================

/**
 * @brief Семейство/модель устройства (закрытое множество)
 */
enum class DeviceType {
    BitaxeUltra,   ///< BM1366
    BitaxeMax,     ///< BM1368
    BitaxeGamma,   ///< BM1370
    NerdqaxePlus,  ///< NerdQAxe++
    Unknown
};

/// @brief Все типы устройств в порядке объявления
inline constexpr std::array<DeviceType, 5> ALL_DEVICE_TYPES = {
    DeviceType::BitaxeUltra,
    DeviceType::BitaxeMax,
    DeviceType::BitaxeGamma,
    DeviceType::NerdqaxePlus,
    DeviceType::Unknown,
};

/**
 * @brief Человекочитаемое имя типа
 */
[[nodiscard]] constexpr std::string_view display_name(DeviceType type) noexcept {
    switch (type) {
        case DeviceType::BitaxeUltra:  return "Bitaxe Ultra";
        case DeviceType::BitaxeMax:    return "Bitaxe Max";
        case DeviceType::BitaxeGamma:  return "Bitaxe Gamma";
        case DeviceType::NerdqaxePlus: return "NerdQaxe++";
        case DeviceType::Unknown:      return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Имя типа для фильтров командной строки
 */
[[nodiscard]] constexpr std::string_view cli_name(DeviceType type) noexcept {
    switch (type) {
        case DeviceType::BitaxeUltra:  return "bitaxe-ultra";
        case DeviceType::BitaxeMax:    return "bitaxe-max";
        case DeviceType::BitaxeGamma:  return "bitaxe-gamma";
        case DeviceType::NerdqaxePlus: return "nerdqaxe";
        case DeviceType::Unknown:      return "unknown";
    }
    return "unknown";
}

/**
 * @brief Имя типа в JSON (кэш, вывод)
 */
[[nodiscard]] constexpr std::string_view json_name(DeviceType type) noexcept {
    switch (type) {
        case DeviceType::BitaxeUltra:  return "bitaxe_ultra";
        case DeviceType::BitaxeMax:    return "bitaxe_max";
        case DeviceType::BitaxeGamma:  return "bitaxe_gamma";
        case DeviceType::NerdqaxePlus: return "nerdqaxe_plus";
        case DeviceType::Unknown:      return "unknown";
    }
    return "unknown";
}

/**
 * @brief Разобрать имя типа из командной строки
 *
 * Регистр не важен, допускаются формы через '-' и '_'.
 * "bitaxe" неоднозначно и даёт std::nullopt.
 */
[[nodiscard]] std::optional<DeviceType> parse_cli_name(std::string_view name);

/**
 * @brief Разобрать имя типа из JSON
 */
[[nodiscard]] std::optional<DeviceType> parse_json_name(std::string_view name);

[[nodiscard]] constexpr bool is_bitaxe(DeviceType type) noexcept {
    return type == DeviceType::BitaxeUltra ||
           type == DeviceType::BitaxeMax ||
           type == DeviceType::BitaxeGamma;
}

[[nodiscard]] constexpr bool is_nerdqaxe(DeviceType type) noexcept {
    return type == DeviceType::NerdqaxePlus;
}

// =============================================================================
// Фильтр устройств
// =============================================================================

/**
 * @brief Фильтр по типу: все, любой Bitaxe, любой NerdQAxe или конкретный тип
 */
class DeviceFilter {
public:
    enum class Kind {
        All,
        AnyBitaxe,
        AnyNerdQaxe,
        Specific
    };

    DeviceFilter() = default;

    [[nodiscard]] static DeviceFilter all() noexcept { return DeviceFilter{}; }
    [[nodiscard]] static DeviceFilter any_bitaxe() noexcept { return DeviceFilter{Kind::AnyBitaxe}; }
    [[nodiscard]] static DeviceFilter any_nerdqaxe() noexcept { return DeviceFilter{Kind::AnyNerdQaxe}; }
    [[nodiscard]] static DeviceFilter specific(DeviceType type) noexcept {
        return DeviceFilter{Kind::Specific, type};
    }

    /**
     * @brief Разобрать фильтр: "all", "bitaxe", "nerdqaxe" или имя типа
     *
     * @return Фильтр или ConfigInvalidValue
     */
    [[nodiscard]] static Result<DeviceFilter> parse(std::string_view text);

    /**
     * @brief Проверить тип устройства
     */
    [[nodiscard]] bool matches(DeviceType type) const noexcept;

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const DeviceFilter&) const = default;

private:
    explicit DeviceFilter(Kind kind, DeviceType type = DeviceType::Unknown)
        : kind_(kind), type_(type) {}

    Kind kind_ = Kind::All;
    DeviceType type_ = DeviceType::Unknown;
};

// =============================================================================
// Статус и статистика
// =============================================================================

/**
 * @brief Статус жизненного цикла устройства
 */
enum class DeviceStatus {
    Online,
    Offline,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(DeviceStatus status) noexcept {
    switch (status) {
        case DeviceStatus::Online:  return "online";
        case DeviceStatus::Offline: return "offline";
        case DeviceStatus::Error:   return "error";
    }
    return "error";
}

[[nodiscard]] std::optional<DeviceStatus> parse_status(std::string_view text);

/**
 * @brief Снимок измерений устройства на момент времени
 *
 * Неизменяем после создания: новое измерение это новое значение.
 */
struct DeviceStats {
    Timestamp timestamp{};
    double hashrate_mhs = 0.0;
    double temperature_celsius = 0.0;
    double power_watts = 0.0;
    uint32_t fan_speed_rpm = 0;
    uint64_t shares_accepted = 0;
    uint64_t shares_rejected = 0;
    uint64_t uptime_seconds = 0;
    std::optional<std::string> pool_url;
    std::optional<int32_t> wifi_rssi;
    std::optional<double> voltage;
    std::optional<uint32_t> frequency;
};

// =============================================================================
// Устройство
// =============================================================================

/**
 * @brief Обнаруженное устройство
 */
struct Device {
    std::string name;
    std::string ip_address;
    DeviceType device_type = DeviceType::Unknown;

    /// @brief MAC адрес, если известен
    std::optional<std::string> serial_number;

    DeviceStatus status = DeviceStatus::Offline;
    Timestamp discovered_at{};
    Timestamp last_seen{};

    /// @brief Последняя статистика (есть, когда устройство отвечало)
    std::optional<DeviceStats> stats;

    /**
     * @brief Отметить устройство как увиденное
     *
     * last_seen никогда не уменьшается.
     */
    void mark_seen(Timestamp now) noexcept {
        if (now > last_seen) {
            last_seen = now;
        }
    }

    [[nodiscard]] bool is_online() const noexcept {
        return status == DeviceStatus::Online;
    }
};

// =============================================================================
// Сводки
// =============================================================================

/**
 * @brief Агрегат по всему рою устройств
 *
 * Суммы и средние считаются только по онлайн-устройствам со статистикой.
 */
struct SwarmSummary {
    std::size_t total_devices = 0;
    std::size_t devices_online = 0;
    std::size_t devices_offline = 0;
    double total_hashrate_mhs = 0.0;
    double total_power_watts = 0.0;
    double average_temperature = 0.0;

    /// @brief MH/s на ватт (0 при нулевой мощности)
    double average_efficiency = 0.0;

    [[nodiscard]] static SwarmSummary from_devices(std::span<const Device> devices);
};

/**
 * @brief Агрегат по одному типу устройств
 */
struct TypeSummary {
    DeviceType device_type = DeviceType::Unknown;
    std::string type_name;
    std::size_t total_devices = 0;
    std::size_t devices_online = 0;
    std::size_t devices_offline = 0;
    double total_hashrate_mhs = 0.0;
    double total_power_watts = 0.0;
    double average_temperature = 0.0;

    [[nodiscard]] static TypeSummary from_devices(DeviceType type, std::span<const Device> devices);

    /**
     * @brief Сводки по всем типам, у которых есть устройства
     *
     * Порядок совпадает с ALL_DEVICE_TYPES.
     */
    [[nodiscard]] static std::vector<TypeSummary> from_all_devices(std::span<const Device> devices);
};

} // namespace axectl::device
