/**
 * @file device.cpp
 * @brief Реализация модели устройства и сводок
 */

#include "device.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace axectl::device {

namespace {

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/**
 * @brief Общие агрегаты по набору устройств
 */
struct Aggregate {
    std::size_t total = 0;
    std::size_t online = 0;
    std::size_t with_stats = 0;
    double hashrate = 0.0;
    double power = 0.0;
    double temperature_sum = 0.0;

    void add(const Device& device) {
        ++total;
        if (!device.is_online()) {
            return;
        }
        ++online;
        if (device.stats) {
            ++with_stats;
            hashrate += device.stats->hashrate_mhs;
            power += device.stats->power_watts;
            temperature_sum += device.stats->temperature_celsius;
        }
    }

    [[nodiscard]] double average_temperature() const noexcept {
        return with_stats > 0 ? temperature_sum / static_cast<double>(with_stats) : 0.0;
    }
};

} // anonymous namespace

// =============================================================================
// DeviceType
// =============================================================================

std::optional<DeviceType> parse_cli_name(std::string_view name) {
    auto lower = to_lower(name);

    if (lower == "bitaxe-ultra" || lower == "bitaxe_ultra") return DeviceType::BitaxeUltra;
    if (lower == "bitaxe-max" || lower == "bitaxe_max") return DeviceType::BitaxeMax;
    if (lower == "bitaxe-gamma" || lower == "bitaxe_gamma") return DeviceType::BitaxeGamma;
    if (lower == "nerdqaxe" || lower == "nerdqaxe-plus" || lower == "nerdqaxe_plus") {
        return DeviceType::NerdqaxePlus;
    }
    if (lower == "unknown") return DeviceType::Unknown;

    // "bitaxe" неоднозначен: пусть пользователь укажет вариант
    return std::nullopt;
}

std::optional<DeviceType> parse_json_name(std::string_view name) {
    for (auto type : ALL_DEVICE_TYPES) {
        if (json_name(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

// =============================================================================
// DeviceFilter
// =============================================================================

Result<DeviceFilter> DeviceFilter::parse(std::string_view text) {
    auto lower = to_lower(text);

    if (lower == "all") return DeviceFilter::all();
    if (lower == "bitaxe") return DeviceFilter::any_bitaxe();
    if (lower == "nerdqaxe") return DeviceFilter::any_nerdqaxe();

    if (auto type = parse_cli_name(lower)) {
        return DeviceFilter::specific(*type);
    }

    return Err<DeviceFilter>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестный фильтр устройств: '{}' (допустимо: all, bitaxe, nerdqaxe, "
                    "bitaxe-ultra, bitaxe-max, bitaxe-gamma, nerdqaxe-plus, unknown)", text)
    );
}

bool DeviceFilter::matches(DeviceType type) const noexcept {
    switch (kind_) {
        case Kind::All:         return true;
        case Kind::AnyBitaxe:   return is_bitaxe(type);
        case Kind::AnyNerdQaxe: return is_nerdqaxe(type);
        case Kind::Specific:    return type == type_;
    }
    return false;
}

std::string DeviceFilter::to_string() const {
    switch (kind_) {
        case Kind::All:         return "all";
        case Kind::AnyBitaxe:   return "bitaxe";
        case Kind::AnyNerdQaxe: return "nerdqaxe";
        case Kind::Specific:    return std::string(cli_name(type_));
    }
    return "all";
}

// =============================================================================
// DeviceStatus
// =============================================================================

std::optional<DeviceStatus> parse_status(std::string_view text) {
    auto lower = to_lower(text);
    if (lower == "online") return DeviceStatus::Online;
    if (lower == "offline") return DeviceStatus::Offline;
    if (lower == "error") return DeviceStatus::Error;
    return std::nullopt;
}

// =============================================================================
// Сводки
// =============================================================================

SwarmSummary SwarmSummary::from_devices(std::span<const Device> devices) {
    Aggregate agg;
    for (const auto& device : devices) {
        agg.add(device);
    }

    SwarmSummary summary;
    summary.total_devices = agg.total;
    summary.devices_online = agg.online;
    summary.devices_offline = agg.total - agg.online;
    summary.total_hashrate_mhs = agg.hashrate;
    summary.total_power_watts = agg.power;
    summary.average_temperature = agg.average_temperature();
    summary.average_efficiency = agg.power > 0.0 ? agg.hashrate / agg.power : 0.0;
    return summary;
}

TypeSummary TypeSummary::from_devices(DeviceType type, std::span<const Device> devices) {
    Aggregate agg;
    for (const auto& device : devices) {
        if (device.device_type == type) {
            agg.add(device);
        }
    }

    TypeSummary summary;
    summary.device_type = type;
    summary.type_name = std::string(display_name(type));
    summary.total_devices = agg.total;
    summary.devices_online = agg.online;
    summary.devices_offline = agg.total - agg.online;
    summary.total_hashrate_mhs = agg.hashrate;
    summary.total_power_watts = agg.power;
    summary.average_temperature = agg.average_temperature();
    return summary;
}

std::vector<TypeSummary> TypeSummary::from_all_devices(std::span<const Device> devices) {
    std::vector<TypeSummary> result;
    for (auto type : ALL_DEVICE_TYPES) {
        auto summary = from_devices(type, devices);
        if (summary.total_devices > 0) {
            result.push_back(std::move(summary));
        }
    }
    return result;
}

} // namespace axectl::device
