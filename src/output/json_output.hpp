/**
 * @file json_output.hpp
 * @brief JSON документы для машинного вывода (nlohmann/json)
 */

#pragma once

#include "../control/bulk_controller.hpp"
#include "../device/device.hpp"
#include "../discovery/discovery_coordinator.hpp"
#include "../monitor/monitor_engine.hpp"
#include "../monitor/stats_snapshot.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace axectl::output {

/**
 * @brief Документ результата обнаружения
 *
 * Ключи: devices, total, network_scanned, discovery_methods, scan_info,
 * sources, duration_seconds, timestamp.
 */
[[nodiscard]] nlohmann::json discovery_document(
    const discovery::DiscoveryResult& result,
    device::Timestamp now
);

/**
 * @brief Документ одного тика монитора
 *
 * alerts и alert_count присутствуют, только если в тике были алерты,
 * last_discovery только если обнаружение уже завершалось.
 */
[[nodiscard]] nlohmann::json tick_document(
    const monitor::TickEvent& event,
    bool include_type_summaries
);

/**
 * @brief Документ списка устройств
 */
[[nodiscard]] nlohmann::json list_document(
    const std::vector<device::Device>& devices,
    device::Timestamp now
);

/**
 * @brief Документ снимка статистики
 *
 * Ключи: statistics, failed (адреса не ответивших), summary, timestamp.
 */
[[nodiscard]] nlohmann::json stats_document(const monitor::StatsSnapshot& snapshot);

/**
 * @brief Документ итогов групповой команды
 */
[[nodiscard]] nlohmann::json control_document(
    const std::vector<control::ControlOutcome>& outcomes,
    const control::ControlAction& action
);

} // namespace axectl::output

namespace axectl::monitor {

void to_json(nlohmann::json& j, const Alert& alert);

} // namespace axectl::monitor
