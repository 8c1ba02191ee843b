/**
 * @file alert_rules.hpp
 * @brief Правила алертов монитора и журнал алертов
 *
 * Правила:
 * - Temperature: температура строго выше порога
 * - HashrateDrop: падение от предыдущего значения строго больше порога (%)
 * - Offline: неудачный сбор статистики
 */

#pragma once

#include "../device/device.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace axectl::monitor {

using device::Timestamp;

// =============================================================================
// Алерт
// =============================================================================

/**
 * @brief Тип алерта
 */
enum class AlertKind {
    Temperature,    ///< Перегрев
    HashrateDrop,   ///< Падение хешрейта
    Offline         ///< Устройство перестало отвечать
};

[[nodiscard]] constexpr std::string_view to_string(AlertKind kind) noexcept {
    switch (kind) {
        case AlertKind::Temperature:  return "temperature";
        case AlertKind::HashrateDrop: return "hashrate_drop";
        case AlertKind::Offline:      return "offline";
    }
    return "unknown";
}

/**
 * @brief Алерт
 */
struct Alert {
    Timestamp timestamp{};
    std::string message;

    /// @brief Адрес устройства-источника
    std::string device_ip;

    AlertKind kind = AlertKind::Offline;
};

// =============================================================================
// Правила
// =============================================================================

/**
 * @brief Проверить температуру
 *
 * @return Алерт, если celsius > threshold (строго)
 */
[[nodiscard]] std::optional<Alert> check_temperature(
    const device::Device& device,
    double celsius,
    double threshold,
    Timestamp now
);

/**
 * @brief Процент падения хешрейта ((prev - curr) / prev * 100)
 *
 * При prev <= 0 падение считается нулевым.
 */
[[nodiscard]] double hashrate_drop_percent(double previous_mhs, double current_mhs) noexcept;

/**
 * @brief Проверить падение хешрейта относительно предыдущего значения
 *
 * @return Алерт "... decreased by X.X% (prev -> curr)", если падение > threshold
 */
[[nodiscard]] std::optional<Alert> check_hashrate_drop(
    const device::Device& device,
    double previous_mhs,
    double current_mhs,
    double threshold_percent,
    Timestamp now
);

/**
 * @brief Алерт "{name} went offline"
 */
[[nodiscard]] Alert offline_alert(const device::Device& device, Timestamp now);

// =============================================================================
// Журнал алертов
// =============================================================================

/**
 * @brief Журнал алертов с ротацией
 *
 * Хранит не более max_alerts последних записей. Счётчик total()
 * не уменьшается при ротации.
 */
class AlertLog {
public:
    explicit AlertLog(std::size_t max_alerts);

    void append(Alert alert);

    void append(const std::vector<Alert>& alerts);

    /**
     * @brief Последние count алертов, старые первыми
     */
    [[nodiscard]] std::vector<Alert> recent(std::size_t count) const;

    [[nodiscard]] std::size_t size() const noexcept { return alerts_.size(); }

    /// @brief Всего алертов за сессию
    [[nodiscard]] std::size_t total() const noexcept { return total_; }

    [[nodiscard]] std::size_t max_alerts() const noexcept { return max_alerts_; }

private:
    std::size_t max_alerts_;
    std::deque<Alert> alerts_;
    std::size_t total_ = 0;
};

} // namespace axectl::monitor
