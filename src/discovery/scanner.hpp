/**
 * @file scanner.hpp
 * @brief Параллельное сканирование диапазона адресов
 *
 * Каждый адрес диапазона проверяется Prober'ом в пуле потоков
 * ограниченного размера. Результаты собираются после join.
 */

#pragma once

#include "network_range.hpp"
#include "prober.hpp"
#include "../core/constants.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace axectl::discovery {

/**
 * @brief Параметры сканирования
 */
struct ScanConfig {
    /// @brief Таймаут на один адрес
    std::chrono::milliseconds per_host_timeout = constants::DEFAULT_HOST_TIMEOUT;

    /// @brief Максимум одновременных проб
    std::size_t max_parallel = constants::DEFAULT_MAX_PARALLEL;

    /// @brief Не включать отвечающие, но не опознанные адреса
    bool confirm_only_known_devices = true;

    /// @brief Включать недоступные адреса как Offline-<ip>
    bool include_unreachable = false;
};

/**
 * @brief Статистика сканирования
 */
struct ScanInfo {
    std::string network;
    std::size_t addresses_scanned = 0;

    /// @brief Адреса с ответом 2xx
    std::size_t responsive_addresses = 0;

    /// @brief Опознанные устройства
    std::size_t devices_found = 0;

    /// @brief Неудачные идентификации отвечающих адресов
    std::size_t errors_encountered = 0;

    double duration_seconds = 0.0;
};

/**
 * @brief Результат сканирования
 */
struct ScanResult {
    std::vector<device::Device> devices;
    ScanInfo info;
};

/**
 * @brief Сканер диапазона
 */
class Scanner {
public:
    explicit Scanner(device::DeviceClient& client) : prober_(client) {}

    /**
     * @brief Просканировать диапазон
     */
    [[nodiscard]] ScanResult scan(const NetworkRange& range, const ScanConfig& config = {}) const;

    /**
     * @brief Проверить один адрес
     *
     * @return Устройство, std::nullopt или DiscoveryInvalidAddress
     */
    [[nodiscard]] Result<std::optional<device::Device>> probe_single(
        std::string_view address,
        std::chrono::milliseconds timeout
    ) const;

    /**
     * @brief Адреса-кандидаты
     *
     * Для IPv4 без адреса сети и broadcast (если в блоке больше двух адресов).
     */
    [[nodiscard]] static std::vector<std::string> candidate_addresses(const NetworkRange& range);

private:
    Prober prober_;
};

} // namespace axectl::discovery
