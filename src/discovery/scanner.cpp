/**
 * @file scanner.cpp
 * @brief Реализация сканера диапазона
 */

#include "scanner.hpp"
#include "../core/worker_pool.hpp"
#include "../log/logger.hpp"

#include <format>

namespace axectl::discovery {

namespace {

device::Device placeholder(const std::string& address, std::string_view prefix, device::DeviceStatus status) {
    auto now = std::chrono::system_clock::now();

    device::Device device;
    device.name = std::format("{}-{}", prefix, address);
    device.ip_address = address;
    device.device_type = device::DeviceType::Unknown;
    device.status = status;
    device.discovered_at = now;
    device.last_seen = now;
    return device;
}

} // anonymous namespace

std::vector<std::string> Scanner::candidate_addresses(const NetworkRange& range) {
    auto addresses = range.addresses();

    if (range.family() == NetworkRange::Family::V4 && addresses.size() > 2) {
        addresses.pop_back();
        addresses.erase(addresses.begin());
    }
    return addresses;
}

ScanResult Scanner::scan(const NetworkRange& range, const ScanConfig& config) const {
    auto started = std::chrono::steady_clock::now();
    auto candidates = candidate_addresses(range);

    log::info("Сканирование {}: {} адресов, таймаут {} мс, параллельно {}",
              range.to_string(), candidates.size(),
              config.per_host_timeout.count(), config.max_parallel);

    auto probes = parallel_map<ProbeResult>(candidates, config.max_parallel,
        [this, &config](const std::string& address) {
            return prober_.probe(address, config.per_host_timeout);
        });

    ScanResult result;
    result.info.network = range.to_string();
    result.info.addresses_scanned = candidates.size();

    for (auto& probe : probes) {
        switch (probe.state) {
            case ProbeResult::State::Identified:
                ++result.info.responsive_addresses;
                ++result.info.devices_found;
                result.devices.push_back(std::move(*probe.device));
                break;

            case ProbeResult::State::Unclassified:
                ++result.info.responsive_addresses;
                ++result.info.errors_encountered;
                if (!config.confirm_only_known_devices) {
                    result.devices.push_back(
                        placeholder(probe.address, "Unknown", device::DeviceStatus::Online)
                    );
                }
                break;

            case ProbeResult::State::Unreachable:
                if (config.include_unreachable) {
                    result.devices.push_back(
                        placeholder(probe.address, "Offline", device::DeviceStatus::Offline)
                    );
                }
                break;
        }
    }

    result.info.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started
    ).count();

    log::info("Сканирование {} завершено за {:.1f} с: отвечают {}, устройств {}",
              result.info.network, result.info.duration_seconds,
              result.info.responsive_addresses, result.info.devices_found);

    return result;
}

Result<std::optional<device::Device>> Scanner::probe_single(
    std::string_view address,
    std::chrono::milliseconds timeout
) const {
    if (!is_valid_address(address)) {
        return Err<std::optional<device::Device>>(
            ErrorCode::DiscoveryInvalidAddress,
            std::format("Некорректный IP адрес: '{}'", address)
        );
    }

    auto probe = prober_.probe(address, timeout);
    if (probe.state != ProbeResult::State::Identified) {
        return std::optional<device::Device>{};
    }
    return std::move(probe.device);
}

} // namespace axectl::discovery
