/**
 * @file stats_snapshot.cpp
 * @brief Реализация разового сбора статистики
 */

#include "stats_snapshot.hpp"
#include "../core/worker_pool.hpp"
#include "../log/logger.hpp"

namespace axectl::monitor {

std::vector<device::Device> stats_targets(
    const cache::DeviceCache& cache,
    std::optional<std::string_view> identifier
) {
    if (!identifier) {
        return cache.devices_by_filter(device::DeviceFilter::all(), true);
    }
    if (auto found = cache.find(*identifier)) {
        return {*found};
    }
    return {};
}

StatsSnapshot collect_stats(
    device::DeviceClient& client,
    cache::DeviceCache& cache,
    const std::vector<device::Device>& devices,
    std::chrono::milliseconds timeout,
    std::size_t max_parallel
) {
    auto results = parallel_map<Result<device::DeviceStats>>(devices, max_parallel,
        [&client, timeout](const device::Device& device) {
            return client.fetch_stats(device.ip_address, timeout);
        });

    StatsSnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();

    for (std::size_t i = 0; i < devices.size(); ++i) {
        auto device = devices[i];

        if (results[i]) {
            device.stats = *results[i];
            device.status = device::DeviceStatus::Online;
            device.mark_seen(snapshot.timestamp);
            cache.update_stats(device.ip_address, *results[i]);
            snapshot.devices.push_back(std::move(device));
        } else {
            log::warn("Не удалось получить статистику {}: {}", device.ip_address, results[i].error().message);
            device.status = device::DeviceStatus::Offline;
            cache.mark_probe_failed(device.ip_address);
            snapshot.failed.push_back(std::move(device));
        }
    }

    snapshot.summary = device::SwarmSummary::from_devices(snapshot.devices);
    return snapshot;
}

} // namespace axectl::monitor
