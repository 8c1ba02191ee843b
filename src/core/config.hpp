/**
 * @file config.hpp
 * @brief Конфигурация axectl
 *
 * Загрузка и парсинг конфигурации из TOML файла. Значения из командной
 * строки накладываются поверх загруженной конфигурации в main.cpp.
 *
 * Пример конфигурации (axectl.toml):
 * @code
 * [discovery]
 * network = "192.168.1.0/24"
 * timeout_seconds = 5
 * mdns = true
 * scan_timeout_ms = 2000
 * scan_parallel = 20
 * quick_probe_timeout_ms = 500
 * retention_days = 7
 *
 * [monitor]
 * interval_seconds = 30
 * temp_alert = 70.0
 * hashrate_alert = 10.0
 * discover = true
 * discover_interval_seconds = 300
 *
 * [client]
 * connect_timeout_seconds = 5
 * request_timeout_seconds = 60
 *
 * [cache]
 * directory = "/var/cache/axectl"
 *
 * [logging]
 * level = "info"
 * color = true
 * timestamps = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace axectl {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки цикла обнаружения
 */
struct DiscoveryConfig {
    /// @brief CIDR для сканирования (пусто = автоопределение)
    std::string network;

    /// @brief Бюджет времени mDNS обзора (секунды)
    uint32_t timeout_seconds = static_cast<uint32_t>(constants::MDNS_DEFAULT_TIMEOUT.count());

    /// @brief Включить mDNS обзор
    bool mdns = true;

    /// @brief Таймаут на адрес при полном сканировании (мс)
    uint32_t scan_timeout_ms = static_cast<uint32_t>(constants::DISCOVERY_SCAN_TIMEOUT.count());

    /// @brief Параллелизм полного сканирования
    std::size_t scan_parallel = constants::DISCOVERY_SCAN_PARALLEL;

    /// @brief Таймаут быстрой перепроверки кэша (мс)
    uint32_t quick_probe_timeout_ms = static_cast<uint32_t>(constants::QUICK_PROBE_TIMEOUT.count());

    /// @brief Сколько дней хранить невидимые устройства в кэше
    uint32_t retention_days = 7;
};

/**
 * @brief Настройки непрерывного мониторинга
 */
struct MonitorSettings {
    /// @brief Интервал опроса устройств (секунды)
    uint32_t interval_seconds = static_cast<uint32_t>(constants::DEFAULT_MONITOR_INTERVAL.count());

    /// @brief Таймаут сбора статистики с устройства (секунды)
    uint32_t stats_timeout_seconds = static_cast<uint32_t>(constants::DEFAULT_STATS_TIMEOUT.count());

    /// @brief Порог температуры (°C), 0 = выключен
    double temp_alert = 0.0;

    /// @brief Порог падения хешрейта (%), 0 = выключен
    double hashrate_alert = 0.0;

    /// @brief Запускать фоновое обнаружение
    bool discover = false;

    /// @brief Интервал фонового обнаружения (секунды)
    uint32_t discover_interval_seconds =
        static_cast<uint32_t>(constants::DEFAULT_DISCOVERY_INTERVAL.count());

    /// @brief Ёмкость канала фонового обнаружения
    std::size_t channel_capacity = constants::DEFAULT_CHANNEL_CAPACITY;

    /// @brief Максимальное количество хранимых алертов
    std::size_t max_alerts = constants::DEFAULT_MAX_ALERTS;

    /// @brief Максимум одновременных запросов статистики
    std::size_t max_parallel = 32;
};

/**
 * @brief Настройки HTTP клиента устройств
 */
struct ClientConfig {
    /// @brief Таймаут подключения (секунды)
    uint32_t connect_timeout_seconds =
        static_cast<uint32_t>(constants::DEFAULT_CONNECT_TIMEOUT.count());

    /// @brief Таймаут запроса по умолчанию (секунды)
    uint32_t request_timeout_seconds =
        static_cast<uint32_t>(constants::DEFAULT_REQUEST_TIMEOUT.count());

    /// @brief User-Agent
    std::string user_agent = std::string(constants::USER_AGENT);
};

/**
 * @brief Настройки кэша устройств
 */
struct CacheConfig {
    /// @brief Директория кэша (пусто = путь по умолчанию)
    std::string directory;

    /**
     * @brief Получить директорию кэша с учётом значения по умолчанию
     *
     * $XDG_CACHE_HOME/axectl, иначе ~/.cache/axectl.
     */
    [[nodiscard]] std::optional<std::filesystem::path> resolve_directory() const;
};

/**
 * @brief Настройки логирования
 */
struct LoggingSettings {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Включить ANSI цвета
    bool color = true;

    /// @brief Выводить метку времени
    bool timestamps = true;
};

/**
 * @brief Полная конфигурация axectl
 */
struct Config {
    DiscoveryConfig discovery;
    MonitorSettings monitor;
    ClientConfig client;
    CacheConfig cache;
    LoggingSettings logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь (должен существовать)
     * 2. ./axectl.toml
     * 3. $XDG_CONFIG_HOME/axectl/axectl.toml или ~/.config/axectl/axectl.toml
     * 4. /etc/axectl/axectl.toml
     *
     * Если явный путь не задан и файл не найден, возвращаются значения
     * по умолчанию.
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет диапазоны числовых значений, уровень логирования
     * и синтаксис сети, если она задана.
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace axectl
