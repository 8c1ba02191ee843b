/**
 * @file discovery_coordinator.cpp
 * @brief Реализация координатора обнаружения
 */

#include "discovery_coordinator.hpp"
#include "../core/worker_pool.hpp"
#include "../log/logger.hpp"

#include <format>
#include <set>

namespace axectl::discovery {

namespace {

std::vector<DiscoveredDevice> tag(std::vector<device::Device> devices, DiscoverySource source) {
    std::vector<DiscoveredDevice> result;
    result.reserve(devices.size());
    for (auto& device : devices) {
        result.push_back(DiscoveredDevice{std::move(device), source});
    }
    return result;
}

} // anonymous namespace

std::vector<device::Device> DiscoveryResult::plain_devices() const {
    std::vector<device::Device> result;
    result.reserve(devices.size());
    for (const auto& discovered : devices) {
        result.push_back(discovered.device);
    }
    return result;
}

std::vector<DiscoveredDevice> merge_by_address(const std::vector<std::vector<DiscoveredDevice>>& lists) {
    std::vector<DiscoveredDevice> merged;
    std::set<std::string, std::less<>> seen;

    for (const auto& list : lists) {
        for (const auto& discovered : list) {
            if (seen.insert(discovered.device.ip_address).second) {
                merged.push_back(discovered);
            }
        }
    }
    return merged;
}

// =============================================================================
// DiscoveryCoordinator
// =============================================================================

DiscoveryCoordinator::DiscoveryCoordinator(
    device::DeviceClient& client,
    MdnsResolver& resolver,
    cache::DeviceCache& cache,
    CoordinatorConfig config
)
    : client_(client)
    , resolver_(resolver)
    , cache_(cache)
    , config_(std::move(config))
{
}

Result<NetworkRange> DiscoveryCoordinator::resolve_range(std::string_view cidr) {
    if (cidr.empty()) {
        log::info("Автоопределение локальной сети...");
        return NetworkRange::detect();
    }
    return NetworkRange::parse(cidr);
}

std::vector<DiscoveredDevice> DiscoveryCoordinator::quick_probe(const std::vector<std::string>& addresses) {
    Prober prober(client_);
    auto timeout = config_.quick_probe_timeout;

    auto probes = parallel_map<ProbeResult>(addresses, config_.scan_parallel,
        [&prober, timeout](const std::string& address) {
            return prober.probe(address, timeout);
        });

    std::vector<DiscoveredDevice> found;
    for (auto& probe : probes) {
        if (probe.state == ProbeResult::State::Identified) {
            found.push_back(DiscoveredDevice{std::move(*probe.device), DiscoverySource::CacheProbe});
        }
    }
    return found;
}

Result<DiscoveryResult> DiscoveryCoordinator::discover(
    std::string_view cidr,
    std::chrono::milliseconds timeout,
    bool mdns_enabled
) {
    auto started = std::chrono::steady_clock::now();

    // Диапазон разрешается до любых проб
    auto range = resolve_range(cidr);
    if (!range) {
        return std::unexpected(range.error());
    }

    if (config_.reload_cache && config_.cache_dir) {
        cache_.load(*config_.cache_dir);
        if (!cache_.empty()) {
            log::info("Загружен кэш: {} устройств (возраст {} с)", cache_.size(), cache_.age().count());
        }
    }

    DiscoveryResult result;
    result.network_scanned = range->to_string();
    result.mdns_enabled = mdns_enabled;

    // mDNS
    std::vector<DiscoveredDevice> mdns_devices;
    if (mdns_enabled) {
        MdnsConfig mdns_config;
        mdns_config.budget = timeout;
        MdnsBrowser browser(resolver_, client_, mdns_config);
        mdns_devices = tag(browser.discover(), DiscoverySource::Mdns);
        log::info("Найдено через mDNS: {}", mdns_devices.size());
    }

    // Быстрая перепроверка кэша
    auto known = cache_.known_addresses();
    std::vector<DiscoveredDevice> cached_devices;
    if (!known.empty()) {
        log::info("Быстрая проверка {} адресов из кэша...", known.size());
        cached_devices = quick_probe(known);
        log::info("Отвечают из кэша: {}", cached_devices.size());
    }

    // Сканирование
    ScanConfig scan_config;
    scan_config.per_host_timeout = config_.scan_timeout;
    scan_config.max_parallel = config_.scan_parallel;

    Scanner scanner(client_);
    auto scan = scanner.scan(*range, scan_config);
    result.scan_info = scan.info;
    auto scanned_devices = tag(std::move(scan.devices), DiscoverySource::Scan);

    result.devices = merge_by_address({mdns_devices, cached_devices, scanned_devices});

    for (const auto& discovered : result.devices) {
        switch (discovered.source) {
            case DiscoverySource::Mdns:       ++result.mdns_count; break;
            case DiscoverySource::CacheProbe: ++result.cache_probe_count; break;
            case DiscoverySource::Scan:       ++result.scan_count; break;
        }
    }

    // Обновление кэша
    for (const auto& discovered : result.devices) {
        cache_.upsert(discovered.device);
    }
    cache_.prune_older_than(config_.retention);

    if (config_.cache_dir) {
        if (auto saved = cache_.save(*config_.cache_dir); !saved) {
            log::warn("Не удалось сохранить кэш: {}", saved.error().message);
        } else if (!result.devices.empty()) {
            log::debug("Кэш обновлён: {} устройств", result.devices.size());
        }
    }

    result.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started
    ).count();

    return result;
}

} // namespace axectl::discovery
