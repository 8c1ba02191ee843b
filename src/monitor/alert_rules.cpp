/**
 * @file alert_rules.cpp
 * @brief Реализация правил алертов
 */

#include "alert_rules.hpp"
#include "../output/format.hpp"

#include <algorithm>
#include <format>

namespace axectl::monitor {

std::optional<Alert> check_temperature(
    const device::Device& device,
    double celsius,
    double threshold,
    Timestamp now
) {
    if (!(celsius > threshold)) {
        return std::nullopt;
    }

    return Alert{
        .timestamp = now,
        .message = std::format("{} temperature alert: {:.1f}°C > {:.1f}°C", device.name, celsius, threshold),
        .device_ip = device.ip_address,
        .kind = AlertKind::Temperature,
    };
}

double hashrate_drop_percent(double previous_mhs, double current_mhs) noexcept {
    if (previous_mhs <= 0.0) {
        return 0.0;
    }
    return (previous_mhs - current_mhs) / previous_mhs * 100.0;
}

std::optional<Alert> check_hashrate_drop(
    const device::Device& device,
    double previous_mhs,
    double current_mhs,
    double threshold_percent,
    Timestamp now
) {
    auto drop = hashrate_drop_percent(previous_mhs, current_mhs);
    if (!(drop > threshold_percent)) {
        return std::nullopt;
    }

    return Alert{
        .timestamp = now,
        .message = std::format(
            "{} hashrate decreased by {:.1f}% ({} -> {})",
            device.name,
            drop,
            output::format_hashrate(previous_mhs),
            output::format_hashrate(current_mhs)
        ),
        .device_ip = device.ip_address,
        .kind = AlertKind::HashrateDrop,
    };
}

Alert offline_alert(const device::Device& device, Timestamp now) {
    return Alert{
        .timestamp = now,
        .message = std::format("{} went offline", device.name),
        .device_ip = device.ip_address,
        .kind = AlertKind::Offline,
    };
}

// =============================================================================
// AlertLog
// =============================================================================

AlertLog::AlertLog(std::size_t max_alerts)
    : max_alerts_(std::max<std::size_t>(1, max_alerts))
{
}

void AlertLog::append(Alert alert) {
    alerts_.push_back(std::move(alert));
    ++total_;

    // Ограничиваем размер журнала, удаляя самые старые
    while (alerts_.size() > max_alerts_) {
        alerts_.pop_front();
    }
}

void AlertLog::append(const std::vector<Alert>& alerts) {
    for (const auto& alert : alerts) {
        append(alert);
    }
}

std::vector<Alert> AlertLog::recent(std::size_t count) const {
    auto n = std::min(count, alerts_.size());
    return {alerts_.end() - static_cast<std::ptrdiff_t>(n), alerts_.end()};
}

} // namespace axectl::monitor
