/**
 * @file constants.hpp
 * @brief Константы axectl
 *
 * Таймауты, лимиты параллелизма и сетевые константы, используемые
 * подсистемами обнаружения и мониторинга.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace axectl::constants {

// =============================================================================
// Версия
// =============================================================================

/// @brief Версия программы
inline constexpr std::string_view VERSION = "0.1.0";

/// @brief User-Agent для HTTP запросов к устройствам
inline constexpr std::string_view USER_AGENT = "axectl/0.1.0";

// =============================================================================
// REST API устройств (AxeOS)
// =============================================================================

/// @brief Эндпоинт информации о системе (health, identity, stats)
inline constexpr std::string_view API_SYSTEM_INFO = "/api/system/info";

/// @brief Эндпоинт изменения настроек (PATCH)
inline constexpr std::string_view API_SYSTEM = "/api/system";

/// @brief Эндпоинт перезагрузки (POST)
inline constexpr std::string_view API_SYSTEM_RESTART = "/api/system/restart";

/// @brief Таймаут подключения по умолчанию
inline constexpr std::chrono::seconds DEFAULT_CONNECT_TIMEOUT{5};

/// @brief Таймаут запроса по умолчанию
inline constexpr std::chrono::seconds DEFAULT_REQUEST_TIMEOUT{60};

// =============================================================================
// Сканирование сети
// =============================================================================

/// @brief Таймаут на один адрес при сканировании (по умолчанию)
inline constexpr std::chrono::milliseconds DEFAULT_HOST_TIMEOUT{500};

/// @brief Максимум одновременных проб (по умолчанию)
inline constexpr std::size_t DEFAULT_MAX_PARALLEL = 50;

/// @brief Таймаут на адрес при полном сканировании в цикле обнаружения
inline constexpr std::chrono::milliseconds DISCOVERY_SCAN_TIMEOUT{2000};

/// @brief Параллелизм полного сканирования в цикле обнаружения
inline constexpr std::size_t DISCOVERY_SCAN_PARALLEL = 20;

/// @brief Таймаут быстрой перепроверки адресов из кэша
inline constexpr std::chrono::milliseconds QUICK_PROBE_TIMEOUT{500};

/// @brief Верхняя граница перечисления адресов IPv6 блока
inline constexpr std::size_t IPV6_ADDRESS_CAP = 1000;

// =============================================================================
// mDNS
// =============================================================================

/// @brief Бюджет времени mDNS обзора по умолчанию
inline constexpr std::chrono::seconds MDNS_DEFAULT_TIMEOUT{5};

/// @brief Максимальный шаг цикла событий avahi
inline constexpr std::chrono::milliseconds MDNS_EVENT_TIMEOUT{500};

/// @brief Таймаут подтверждающей пробы найденного через mDNS сервиса
inline constexpr std::chrono::seconds MDNS_PROBE_TIMEOUT{2};

/// @brief Просматриваемые типы сервисов
inline constexpr std::array<std::string_view, 5> MDNS_SERVICE_TYPES = {
    "_http._tcp.local.",
    "_https._tcp.local.",
    "_axeos._tcp.local.",
    "_bitaxe._tcp.local.",
    "_nerdqaxe._tcp.local.",
};

// =============================================================================
// Кэш и мониторинг
// =============================================================================

/// @brief Имя файла кэша в директории кэша
inline constexpr std::string_view CACHE_FILE_NAME = "devices.json";

/// @brief Текущая версия формата кэша
inline constexpr uint32_t CACHE_FORMAT_VERSION = 2;

/// @brief Длина истории статистики на устройство
inline constexpr std::size_t STATS_HISTORY_LIMIT = 10;

/// @brief Срок хранения устройств в кэше по умолчанию
inline constexpr std::chrono::hours DEFAULT_CACHE_RETENTION{24 * 7};

/// @brief Ёмкость канала фонового обнаружения
inline constexpr std::size_t DEFAULT_CHANNEL_CAPACITY = 100;

/// @brief Максимальное количество хранимых алертов
inline constexpr std::size_t DEFAULT_MAX_ALERTS = 1000;

/// @brief Интервал опроса монитора по умолчанию
inline constexpr std::chrono::seconds DEFAULT_MONITOR_INTERVAL{30};

/// @brief Таймаут сбора статистики с одного устройства
inline constexpr std::chrono::seconds DEFAULT_STATS_TIMEOUT{5};

/// @brief Интервал фонового обнаружения по умолчанию
inline constexpr std::chrono::seconds DEFAULT_DISCOVERY_INTERVAL{300};

} // namespace axectl::constants
