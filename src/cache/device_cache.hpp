/**
 * @file device_cache.hpp
 * @brief Долговременный кэш обнаруженных устройств
 *
 * Файл <dir>/devices.json, формат версии 2:
 * @code
 * {
 *   "version": 2,
 *   "last_updated": "2024-01-31T12:00:00Z",
 *   "devices": {
 *     "192.168.1.42": {
 *       "info": { ...Device... },
 *       "latest_stats": { ...DeviceStats... } | null,
 *       "stats_history": [ ... ],
 *       "last_seen": "...",
 *       "last_probed": "..."
 *     }
 *   }
 * }
 * @endcode
 *
 * Файл версии 1 мигрирует (устройства получают статус Offline), файл
 * любой другой версии или повреждённый файл дают пустой кэш.
 *
 * Все операции сериализованы внутренним мьютексом.
 */

#pragma once

#include "../core/types.hpp"
#include "../device/device.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace axectl::cache {

using device::Device;
using device::DeviceFilter;
using device::DeviceStats;
using device::Timestamp;

/**
 * @brief Запись кэша об одном устройстве
 */
struct CachedDevice {
    Device info;
    std::optional<DeviceStats> latest_stats;

    /// @brief Последние измерения, старые первыми
    std::vector<DeviceStats> stats_history;

    /// @brief Последний успешный контакт
    Timestamp last_seen{};

    /// @brief Последняя проба (в том числе неудачная)
    Timestamp last_probed{};
};

/**
 * @brief Кэш устройств
 */
class DeviceCache {
public:
    DeviceCache();
    ~DeviceCache();

    // Запрещаем копирование
    DeviceCache(const DeviceCache&) = delete;
    DeviceCache& operator=(const DeviceCache&) = delete;

    DeviceCache(DeviceCache&&) noexcept;
    DeviceCache& operator=(DeviceCache&&) noexcept;

    /**
     * @brief Загрузить кэш из директории
     *
     * Никогда не фатально: отсутствующий или повреждённый файл заменяет
     * содержимое пустым кэшем (с предупреждением в логе).
     */
    void load(const std::filesystem::path& directory);

    /**
     * @brief Сохранить кэш в директорию
     *
     * Создаёт директорию, пишет во временный файл и переименовывает его.
     *
     * @return CacheIOError при ошибке файловой системы
     */
    [[nodiscard]] Result<void> save(const std::filesystem::path& directory) const;

    /**
     * @brief Путь к файлу кэша внутри директории
     */
    [[nodiscard]] static std::filesystem::path file_path(const std::filesystem::path& directory);

    // =========================================================================
    // Изменение
    // =========================================================================

    /**
     * @brief Добавить или обновить устройство по адресу
     *
     * Для известного адреса сохраняются discovered_at и история,
     * last_seen не уменьшается.
     */
    void upsert(const Device& device);

    /**
     * @brief Записать свежую статистику
     *
     * История ограничена последними 10 измерениями. Устройство
     * становится Online. Неизвестный адрес игнорируется.
     */
    void update_stats(std::string_view address, const DeviceStats& stats);

    /**
     * @brief Отметить неудачную пробу (статус Offline)
     */
    void mark_probe_failed(std::string_view address);

    /**
     * @brief Отметить успешную пробу (статус Online)
     */
    void mark_probe_succeeded(std::string_view address);

    /**
     * @brief Удалить устройства, не виденные дольше max_age
     *
     * @return Количество удалённых
     */
    std::size_t prune_older_than(std::chrono::seconds max_age);

    // =========================================================================
    // Запросы
    // =========================================================================

    [[nodiscard]] std::vector<std::string> known_addresses() const;

    /**
     * @brief Все устройства (stats = последняя статистика)
     */
    [[nodiscard]] std::vector<Device> all_devices() const;

    [[nodiscard]] std::vector<Device> devices_by_filter(
        const DeviceFilter& filter,
        bool online_only
    ) const;

    /**
     * @brief Найти устройство по IP, затем по имени
     */
    [[nodiscard]] std::optional<Device> find(std::string_view identifier) const;

    [[nodiscard]] std::optional<DeviceStats> latest_stats(std::string_view address) const;

    [[nodiscard]] std::vector<DeviceStats> stats_history(std::string_view address) const;

    [[nodiscard]] std::optional<CachedDevice> entry(std::string_view address) const;

    [[nodiscard]] std::vector<device::TypeSummary> type_summaries() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] bool empty() const;

    /**
     * @brief Время с последнего изменения
     */
    [[nodiscard]] std::chrono::seconds age() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace axectl::cache
