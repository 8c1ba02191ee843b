/**
 * @file status_renderer.hpp
 * @brief Текстовый вывод: таблицы устройств, сводка, алерты
 *
 * Таблица устройств:
 *   Name | IP | Type | Status | Hashrate | Temp | Power | Fan | Uptime | Pool
 *
 * Базовая таблица (без статистики):
 *   Name | IP | Type | Status | Last Seen
 */

#pragma once

#include "../control/bulk_controller.hpp"
#include "../device/device.hpp"
#include "../discovery/discovery_coordinator.hpp"
#include "../monitor/monitor_engine.hpp"
#include "../monitor/stats_snapshot.hpp"

#include <string>
#include <vector>

namespace axectl::output {

/**
 * @brief Текстовый рендерер
 */
class StatusRenderer {
public:
    explicit StatusRenderer(bool color = true)
        : color_(color) {}

    /**
     * @brief Таблица со статистикой
     */
    [[nodiscard]] std::string device_table(const std::vector<device::Device>& devices) const;

    /**
     * @brief Таблица без статистики
     */
    [[nodiscard]] std::string basic_table(
        const std::vector<device::Device>& devices,
        device::Timestamp now
    ) const;

    [[nodiscard]] std::string summary(const device::SwarmSummary& summary) const;

    [[nodiscard]] std::string alerts(const std::vector<monitor::Alert>& alerts) const;

    /**
     * @brief Строка состояния фонового обнаружения
     */
    [[nodiscard]] std::string discovery_line(
        bool active,
        const std::optional<device::Timestamp>& last_discovery,
        device::Timestamp now
    ) const;

    /**
     * @brief Итог обнаружения: таблица и счётчики по источникам
     */
    [[nodiscard]] std::string discovery_report(const discovery::DiscoveryResult& result) const;

    /**
     * @brief Полный экран тика монитора
     */
    [[nodiscard]] std::string tick(const monitor::TickEvent& event) const;

    [[nodiscard]] std::string control_report(
        const std::vector<control::ControlOutcome>& outcomes,
        const control::ControlAction& action
    ) const;

    /**
     * @brief Снимок статистики: таблица, не ответившие, сводка при 2+ устройствах
     */
    [[nodiscard]] std::string stats_report(const monitor::StatsSnapshot& snapshot) const;

    [[nodiscard]] bool color() const noexcept { return color_; }

private:
    bool color_;
};

/**
 * @brief Экран тика без ANSI кодов
 */
[[nodiscard]] std::string render_plain(const monitor::TickEvent& event);

/**
 * @brief "5s ago", "3m ago", "2h ago", "1d ago"
 */
[[nodiscard]] std::string format_age(device::Timestamp then, device::Timestamp now);

} // namespace axectl::output
