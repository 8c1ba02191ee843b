/**
 * @file monitor_engine.hpp
 * @brief Непрерывный мониторинг устройств
 *
 * Каждый тик:
 * 1. Забрать сообщения фонового обнаружения (без ожидания)
 * 2. Снимок устройств по фильтру
 * 3. Параллельный сбор статистики (join перед изменением состояния)
 * 4. Алерты и обновление устройств
 * 5. Последовательное обновление и сохранение кэша
 * 6. Событие TickEvent для вывода
 *
 * Фоновое обнаружение работает в отдельном потоке со своим таймером
 * и общается с циклом только через BoundedChannel.
 */

#pragma once

#include "bounded_channel.hpp"
#include "monitor_state.hpp"
#include "../cache/device_cache.hpp"
#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../device/device_client.hpp"
#include "../discovery/discovery_coordinator.hpp"
#include "../discovery/mdns_browser.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace axectl::monitor {

/**
 * @brief Параметры монитора
 */
struct MonitorConfig {
    /// @brief Интервал между тиками
    std::chrono::seconds interval = constants::DEFAULT_MONITOR_INTERVAL;

    /// @brief Таймаут сбора статистики с одного устройства
    std::chrono::seconds stats_timeout = constants::DEFAULT_STATS_TIMEOUT;

    /// @brief Порог температуры (°C)
    std::optional<double> temp_threshold;

    /// @brief Порог падения хешрейта (%)
    std::optional<double> hashrate_drop_threshold;

    device::DeviceFilter filter;

    /// @brief Показывать и опрашивать также offline устройства
    bool include_offline = false;

    /// @brief Не собирать статистику (только список устройств)
    bool no_stats = false;

    bool background_discovery = false;
    std::chrono::seconds discovery_interval = constants::DEFAULT_DISCOVERY_INTERVAL;

    /// @brief Диапазон фонового обнаружения (пусто = автоопределение)
    std::string network;

    bool mdns_enabled = true;

    /// @brief Бюджет mDNS обзора в фоновом цикле
    std::chrono::milliseconds discovery_timeout = constants::MDNS_DEFAULT_TIMEOUT;

    std::size_t channel_capacity = constants::DEFAULT_CHANNEL_CAPACITY;
    std::size_t max_alerts = constants::DEFAULT_MAX_ALERTS;
    std::size_t max_parallel = 32;

    /// @brief Директория кэша (обязательна для run())
    std::optional<std::filesystem::path> cache_dir;

    /// @brief Параметры сканирования фонового обнаружения
    discovery::CoordinatorConfig coordinator;
};

/**
 * @brief Результат одного тика
 */
struct TickEvent {
    Timestamp timestamp{};

    /// @brief Снимок устройств после обновления
    std::vector<device::Device> devices;

    /// @brief Алерты этого тика
    std::vector<Alert> new_alerts;

    /// @brief Последние алерты сессии (для вывода)
    std::vector<Alert> recent_alerts;

    /// @brief Всего алертов за сессию
    std::size_t alert_count = 0;

    bool discovery_active = false;
    std::optional<Timestamp> last_discovery;

    /// @brief Статистика собиралась в этом тике
    bool stats_collected = false;

    device::SwarmSummary summary;
    std::vector<device::TypeSummary> type_summaries;
};

using TickCallback = std::function<void(const TickEvent&)>;

/**
 * @brief Движок мониторинга
 */
class MonitorEngine {
public:
    MonitorEngine(
        device::DeviceClient& client,
        discovery::MdnsResolver& resolver,
        cache::DeviceCache& cache,
        MonitorConfig config
    );

    ~MonitorEngine();

    // Запрещаем копирование
    MonitorEngine(const MonitorEngine&) = delete;
    MonitorEngine& operator=(const MonitorEngine&) = delete;

    /**
     * @brief Установить обработчик событий тика
     */
    void set_tick_callback(TickCallback callback);

    /**
     * @brief Загрузить кэш и заполнить состояние
     *
     * @return ConfigMissingPath без директории кэша,
     *         DiscoveryInvalidRange при некорректной сети
     */
    [[nodiscard]] Result<void> start();

    /**
     * @brief Выполнить один тик
     */
    TickEvent tick();

    /**
     * @brief Основной цикл до сброса флага running
     *
     * Возвращает ошибку конфигурации, не входя в цикл. При выходе
     * закрывает канал и дожидается фонового потока.
     */
    [[nodiscard]] Result<void> run(const std::atomic<bool>& running);

    /**
     * @brief Выполнить один цикл фонового обнаружения синхронно
     *
     * Отправляет DiscoveryStarted, NewDevices и DiscoveryComplete в канал.
     */
    void discovery_cycle();

    /**
     * @brief Остановить фоновое обнаружение
     */
    void stop();

    [[nodiscard]] const MonitorState& state() const noexcept;

    [[nodiscard]] BoundedChannel<DiscoveryMessage>& channel() noexcept;

    [[nodiscard]] const MonitorConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace axectl::monitor
