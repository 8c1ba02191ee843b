/**
 * @file discovery_coordinator.hpp
 * @brief Координатор цикла обнаружения
 *
 * Этапы:
 * 1. Разрешение диапазона (до любых проб; ошибка фатальна)
 * 2. mDNS обзор (если включён)
 * 3. Быстрая перепроверка адресов из кэша
 * 4. Сканирование диапазона
 * 5. Слияние по адресу в порядке этапов (первое вхождение побеждает)
 * 6. Обновление кэша: upsert, удаление устаревших, сохранение
 *
 * Этапы 2-4 и сохранение кэша выполняются по принципу best-effort:
 * ошибка логируется, цикл продолжается.
 */

#pragma once

#include "mdns_browser.hpp"
#include "network_range.hpp"
#include "scanner.hpp"
#include "../cache/device_cache.hpp"
#include "../core/constants.hpp"
#include "../device/device_client.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace axectl::discovery {

/**
 * @brief Этап, первым подтвердивший устройство
 */
enum class DiscoverySource {
    Mdns,
    CacheProbe,
    Scan
};

[[nodiscard]] constexpr std::string_view to_string(DiscoverySource source) noexcept {
    switch (source) {
        case DiscoverySource::Mdns:       return "mdns";
        case DiscoverySource::CacheProbe: return "cache";
        case DiscoverySource::Scan:       return "scan";
    }
    return "scan";
}

/**
 * @brief Устройство с меткой источника
 */
struct DiscoveredDevice {
    device::Device device;
    DiscoverySource source = DiscoverySource::Scan;
};

/**
 * @brief Итог цикла обнаружения
 */
struct DiscoveryResult {
    std::vector<DiscoveredDevice> devices;

    /// @brief Просканированный диапазон (CIDR)
    std::string network_scanned;

    ScanInfo scan_info;

    bool mdns_enabled = false;
    std::size_t mdns_count = 0;
    std::size_t cache_probe_count = 0;
    std::size_t scan_count = 0;

    double duration_seconds = 0.0;

    /**
     * @brief Устройства без меток источника
     */
    [[nodiscard]] std::vector<device::Device> plain_devices() const;
};

/**
 * @brief Слить списки по адресу, первое вхождение побеждает
 *
 * Чистая и идемпотентная функция: повторное слияние результата
 * с любым из входов ничего не меняет.
 */
[[nodiscard]] std::vector<DiscoveredDevice> merge_by_address(
    const std::vector<std::vector<DiscoveredDevice>>& lists
);

/**
 * @brief Параметры координатора
 */
struct CoordinatorConfig {
    /// @brief Таймаут на адрес при сканировании
    std::chrono::milliseconds scan_timeout = constants::DISCOVERY_SCAN_TIMEOUT;

    /// @brief Параллелизм сканирования и быстрой перепроверки
    std::size_t scan_parallel = constants::DISCOVERY_SCAN_PARALLEL;

    /// @brief Таймаут быстрой перепроверки кэша
    std::chrono::milliseconds quick_probe_timeout = constants::QUICK_PROBE_TIMEOUT;

    /// @brief Срок хранения невидимых устройств в кэше
    std::chrono::seconds retention = constants::DEFAULT_CACHE_RETENTION;

    /// @brief Директория кэша (без неё кэш не читается и не сохраняется)
    std::optional<std::filesystem::path> cache_dir;

    /// @brief Перечитывать кэш с диска в начале цикла
    bool reload_cache = true;
};

/**
 * @brief Координатор обнаружения
 */
class DiscoveryCoordinator {
public:
    DiscoveryCoordinator(
        device::DeviceClient& client,
        MdnsResolver& resolver,
        cache::DeviceCache& cache,
        CoordinatorConfig config = {}
    );

    /**
     * @brief Выполнить полный цикл обнаружения
     *
     * @param cidr CIDR или пустая строка (автоопределение)
     * @param timeout Бюджет mDNS обзора
     * @param mdns_enabled Выполнять mDNS этап
     * @return Результат или ошибка разрешения диапазона
     */
    [[nodiscard]] Result<DiscoveryResult> discover(
        std::string_view cidr,
        std::chrono::milliseconds timeout,
        bool mdns_enabled
    );

    /**
     * @brief Разрешить диапазон: разобрать или определить автоматически
     */
    [[nodiscard]] static Result<NetworkRange> resolve_range(std::string_view cidr);

private:
    [[nodiscard]] std::vector<DiscoveredDevice> quick_probe(const std::vector<std::string>& addresses);

    device::DeviceClient& client_;
    MdnsResolver& resolver_;
    cache::DeviceCache& cache_;
    CoordinatorConfig config_;
};

} // namespace axectl::discovery
