/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "../discovery/network_range.hpp"

#include <toml++/toml.hpp>

#include <array>
#include <cstdlib>
#include <format>
#include <vector>

namespace axectl {

namespace {

/**
 * @brief Заполнить Config из разобранной TOML таблицы
 */
Config from_table(const toml::table& table) {
    Config config;

    // === Секция [discovery] ===
    if (auto discovery = table["discovery"].as_table()) {
        if (auto val = (*discovery)["network"].value<std::string>()) {
            config.discovery.network = *val;
        }
        if (auto val = (*discovery)["timeout_seconds"].value<int64_t>()) {
            config.discovery.timeout_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*discovery)["mdns"].value<bool>()) {
            config.discovery.mdns = *val;
        }
        if (auto val = (*discovery)["scan_timeout_ms"].value<int64_t>()) {
            config.discovery.scan_timeout_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*discovery)["scan_parallel"].value<int64_t>()) {
            config.discovery.scan_parallel = static_cast<std::size_t>(*val);
        }
        if (auto val = (*discovery)["quick_probe_timeout_ms"].value<int64_t>()) {
            config.discovery.quick_probe_timeout_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*discovery)["retention_days"].value<int64_t>()) {
            config.discovery.retention_days = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [monitor] ===
    if (auto monitor = table["monitor"].as_table()) {
        if (auto val = (*monitor)["interval_seconds"].value<int64_t>()) {
            config.monitor.interval_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*monitor)["stats_timeout_seconds"].value<int64_t>()) {
            config.monitor.stats_timeout_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*monitor)["temp_alert"].value<double>()) {
            config.monitor.temp_alert = *val;
        }
        if (auto val = (*monitor)["hashrate_alert"].value<double>()) {
            config.monitor.hashrate_alert = *val;
        }
        if (auto val = (*monitor)["discover"].value<bool>()) {
            config.monitor.discover = *val;
        }
        if (auto val = (*monitor)["discover_interval_seconds"].value<int64_t>()) {
            config.monitor.discover_interval_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*monitor)["channel_capacity"].value<int64_t>()) {
            config.monitor.channel_capacity = static_cast<std::size_t>(*val);
        }
        if (auto val = (*monitor)["max_alerts"].value<int64_t>()) {
            config.monitor.max_alerts = static_cast<std::size_t>(*val);
        }
        if (auto val = (*monitor)["max_parallel"].value<int64_t>()) {
            config.monitor.max_parallel = static_cast<std::size_t>(*val);
        }
    }

    // === Секция [client] ===
    if (auto client = table["client"].as_table()) {
        if (auto val = (*client)["connect_timeout_seconds"].value<int64_t>()) {
            config.client.connect_timeout_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*client)["request_timeout_seconds"].value<int64_t>()) {
            config.client.request_timeout_seconds = static_cast<uint32_t>(*val);
        }
        if (auto val = (*client)["user_agent"].value<std::string>()) {
            config.client.user_agent = *val;
        }
    }

    // === Секция [cache] ===
    if (auto cache = table["cache"].as_table()) {
        if (auto val = (*cache)["directory"].value<std::string>()) {
            config.cache.directory = *val;
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
        if (auto val = (*logging)["timestamps"].value<bool>()) {
            config.logging.timestamps = *val;
        }
    }

    return config;
}

} // anonymous namespace

// =============================================================================
// CacheConfig
// =============================================================================

std::optional<std::filesystem::path> CacheConfig::resolve_directory() const {
    if (!directory.empty()) {
        return std::filesystem::path(directory);
    }
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "axectl";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".cache" / "axectl";
    }
    return std::nullopt;
}

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML ({}): {}", path.string(), e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный файл обязан существовать
    if (path.has_value()) {
        return load(*path);
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("axectl.toml");

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        search_paths.push_back(std::filesystem::path(xdg) / "axectl" / "axectl.toml");
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "axectl" / "axectl.toml"
        );
    }

    search_paths.push_back("/etc/axectl/axectl.toml");

    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    // Файла нет: работаем со значениями по умолчанию
    return Config{};
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (monitor.interval_seconds == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
                         "monitor.interval_seconds должен быть больше 0");
    }

    if (monitor.stats_timeout_seconds == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
                         "monitor.stats_timeout_seconds должен быть больше 0");
    }

    if (monitor.discover_interval_seconds == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
                         "monitor.discover_interval_seconds должен быть больше 0");
    }

    if (monitor.channel_capacity == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
                         "monitor.channel_capacity должен быть больше 0");
    }

    if (monitor.max_parallel == 0 || discovery.scan_parallel == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
                         "Параллелизм должен быть больше 0");
    }

    if (monitor.temp_alert < 0.0 || monitor.hashrate_alert < 0.0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
                         "Пороги алертов не могут быть отрицательными");
    }

    if (discovery.scan_timeout_ms == 0 || discovery.quick_probe_timeout_ms == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
                         "Таймауты сканирования должны быть больше 0");
    }

    constexpr std::array<std::string_view, 5> levels = {
        "error", "warn", "warning", "info", "debug"
    };
    bool level_ok = false;
    for (auto level : levels) {
        if (logging.level == level) {
            level_ok = true;
            break;
        }
    }
    if (!level_ok) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестный уровень логирования: {}", logging.level)
        );
    }

    if (!discovery.network.empty()) {
        auto range = discovery::NetworkRange::parse(discovery.network);
        if (!range) {
            return std::unexpected(Error{
                ErrorCode::ConfigInvalidValue,
                std::format("discovery.network: {}", range.error().message)
            });
        }
    }

    return {};
}

} // namespace axectl
