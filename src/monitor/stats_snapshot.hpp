/**
 * @file stats_snapshot.hpp
 * @brief Разовый сбор статистики для команды stats
 *
 * Опрашивает выбранные устройства параллельно, обновляет кэш после
 * барьера и возвращает снимок: ответившие устройства со статистикой
 * и список не ответивших.
 */

#pragma once

#include "../cache/device_cache.hpp"
#include "../device/device.hpp"
#include "../device/device_client.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace axectl::monitor {

/**
 * @brief Снимок статистики
 */
struct StatsSnapshot {
    device::Timestamp timestamp{};

    /// @brief Ответившие устройства (Online, со статистикой), в порядке запроса
    std::vector<device::Device> devices;

    /// @brief Не ответившие устройства (помечены Offline)
    std::vector<device::Device> failed;

    device::SwarmSummary summary;
};

/**
 * @brief Выбрать устройства для stats
 *
 * Без идентификатора берутся все Online устройства кэша. С
 * идентификатором (ip или имя) ровно одно устройство или пустой
 * список, если его нет в кэше.
 */
[[nodiscard]] std::vector<device::Device> stats_targets(
    const cache::DeviceCache& cache,
    std::optional<std::string_view> identifier
);

/**
 * @brief Собрать статистику устройств
 *
 * Неудачный запрос переводит устройство в Offline и в кэше.
 */
[[nodiscard]] StatsSnapshot collect_stats(
    device::DeviceClient& client,
    cache::DeviceCache& cache,
    const std::vector<device::Device>& devices,
    std::chrono::milliseconds timeout,
    std::size_t max_parallel
);

} // namespace axectl::monitor
