/**
 * @file main.cpp
 * @brief Точка входа axectl
 *
 * axectl обнаруживает майнинговые устройства (Bitaxe, NerdQAxe) в локальной
 * сети и непрерывно следит за их состоянием.
 *
 * Команды:
 * 1. discover - mDNS, перепроверка кэша и сканирование диапазона
 * 2. list     - устройства из кэша
 * 3. monitor  - периодический сбор статистики и алерты
 * 4. restart  - перезагрузка устройств
 * 5. set-fan  - скорость вентилятора
 *
 * Коды выхода: 0 успех, 1 ошибка выполнения, 2 ошибка конфигурации
 * или аргументов.
 */

#include "cache/device_cache.hpp"
#include "control/bulk_controller.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/types.hpp"
#include "device/device.hpp"
#include "device/http_device_client.hpp"
#include "discovery/avahi_resolver.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "discovery/network_range.hpp"
#include "log/logger.hpp"
#include "monitor/monitor_engine.hpp"
#include "monitor/stats_snapshot.hpp"
#include "output/format.hpp"
#include "output/json_output.hpp"
#include "output/status_renderer.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <csignal>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using namespace axectl;

/// @brief Ошибка выполнения
constexpr int EXIT_RUNTIME_ERROR = 1;

/// @brief Ошибка конфигурации или аргументов
constexpr int EXIT_CONFIG_ERROR = 2;

/// @brief Таймаут команд управления
constexpr std::chrono::seconds CONTROL_TIMEOUT{10};

/// @brief Параллелизм команд управления
constexpr std::size_t CONTROL_PARALLEL = 16;

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
axectl v)" << constants::VERSION << R"(
Обнаружение и мониторинг майнинговых устройств (Bitaxe, NerdQAxe)

ИСПОЛЬЗОВАНИЕ:
    axectl [ГЛОБАЛЬНЫЕ ОПЦИИ] <КОМАНДА> [ОПЦИИ]

ГЛОБАЛЬНЫЕ ОПЦИИ:
    -c, --config PATH        Путь к файлу конфигурации (axectl.toml)
    --cache-dir DIR          Директория кэша устройств
    --format text|json       Формат вывода (по умолчанию text)
    --no-color               Отключить ANSI цвета
    -v, --verbose            Подробный лог
    -h, --help               Показать эту справку
    --version                Показать версию программы

КОМАНДЫ:
    discover [--network CIDR] [--timeout SEC] [--no-mdns]
    list     [--type FILTER] [--all]
    monitor  [--interval SEC] [--temp-alert C] [--hashrate-alert PCT]
             [--type FILTER] [--all] [--no-stats]
             [--discover] [--discover-interval SEC] [--network CIDR] [--no-mdns]
    stats    [ip|name] [--watch] [--interval SEC]
    restart  <ip|name|all> [--type FILTER]
    set-fan  <ip|name|all> <percent> [--type FILTER]
    update-settings <ip|name|all> <json> [--type FILTER]

ФИЛЬТРЫ:
    all, bitaxe, nerdqaxe, bitaxe-ultra, bitaxe-max, bitaxe-gamma, unknown

ПРИМЕРЫ:
    axectl discover --network 192.168.1.0/24
    axectl monitor --temp-alert 70 --hashrate-alert 10 --discover
    axectl --format json list --all
    axectl stats bitaxe-1 --watch --interval 10
    axectl set-fan all 80 --type bitaxe
    axectl update-settings bitaxe-1 '{"frequency":525,"coreVoltage":1150}'

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "axectl v" << constants::VERSION << std::endl;
}

// =============================================================================
// Аргументы
// =============================================================================

enum class OutputFormat {
    Text,
    Json
};

/**
 * @brief Разобранные аргументы командной строки
 */
struct Args {
    // Глобальные
    std::optional<std::string> config_path;
    std::optional<std::string> cache_dir;
    OutputFormat format = OutputFormat::Text;
    bool no_color = false;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;

    std::string command;
    std::vector<std::string> positional;

    // Опции команд
    std::optional<std::string> network;
    std::optional<uint32_t> timeout_seconds;
    bool no_mdns = false;
    std::optional<std::string> type_filter;
    bool all = false;
    std::optional<uint32_t> interval_seconds;
    std::optional<double> temp_alert;
    std::optional<double> hashrate_alert;
    bool no_stats = false;
    bool discover = false;
    std::optional<uint32_t> discover_interval_seconds;
    bool watch = false;
};

Result<uint32_t> parse_uint(std::string_view option, std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Err<uint32_t>(
            ErrorCode::ConfigInvalidValue,
            std::format("{}: ожидается неотрицательное целое, получено '{}'", option, text)
        );
    }
    return value;
}

Result<uint32_t> parse_positive(std::string_view option, std::string_view text) {
    auto value = parse_uint(option, text);
    if (value && *value == 0) {
        return Err<uint32_t>(ErrorCode::ConfigInvalidValue, std::format("{}: значение должно быть больше 0", option));
    }
    return value;
}

Result<double> parse_threshold(std::string_view option, std::string_view text) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Err<double>(
            ErrorCode::ConfigInvalidValue,
            std::format("{}: ожидается число, получено '{}'", option, text)
        );
    }
    if (value < 0.0) {
        return Err<double>(ErrorCode::ConfigInvalidValue, std::format("{}: порог не может быть отрицательным", option));
    }
    return value;
}

/**
 * @brief Парсинг аргументов командной строки
 */
Result<Args> parse_args(int argc, char* argv[]) {
    Args args;

    auto value_of = [&](int& i, std::string_view option) -> Result<std::string_view> {
        if (i + 1 >= argc) {
            return Err<std::string_view>(ErrorCode::ConfigInvalidValue, std::format("{}: требуется значение", option));
        }
        return std::string_view(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "--version") {
            args.show_version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--no-color") {
            args.no_color = true;
        } else if (arg == "-c" || arg == "--config") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            args.config_path = std::string(*value);
        } else if (arg == "--cache-dir") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            args.cache_dir = std::string(*value);
        } else if (arg == "--format") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            if (*value == "text") {
                args.format = OutputFormat::Text;
            } else if (*value == "json") {
                args.format = OutputFormat::Json;
            } else {
                return Err<Args>(ErrorCode::ConfigInvalidValue, std::format("--format: неизвестный формат '{}'", *value));
            }
        } else if (arg == "--network") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            args.network = std::string(*value);
        } else if (arg == "--timeout") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            auto parsed = parse_positive(arg, *value);
            if (!parsed) return std::unexpected(parsed.error());
            args.timeout_seconds = *parsed;
        } else if (arg == "--no-mdns") {
            args.no_mdns = true;
        } else if (arg == "--type") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            args.type_filter = std::string(*value);
        } else if (arg == "--all") {
            args.all = true;
        } else if (arg == "--interval") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            auto parsed = parse_positive(arg, *value);
            if (!parsed) return std::unexpected(parsed.error());
            args.interval_seconds = *parsed;
        } else if (arg == "--temp-alert") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            auto parsed = parse_threshold(arg, *value);
            if (!parsed) return std::unexpected(parsed.error());
            args.temp_alert = *parsed;
        } else if (arg == "--hashrate-alert") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            auto parsed = parse_threshold(arg, *value);
            if (!parsed) return std::unexpected(parsed.error());
            args.hashrate_alert = *parsed;
        } else if (arg == "--no-stats") {
            args.no_stats = true;
        } else if (arg == "--discover") {
            args.discover = true;
        } else if (arg == "--watch") {
            args.watch = true;
        } else if (arg == "--discover-interval") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            auto parsed = parse_positive(arg, *value);
            if (!parsed) return std::unexpected(parsed.error());
            args.discover_interval_seconds = *parsed;
        } else if (arg.size() > 1 && arg.front() == '-') {
            return Err<Args>(ErrorCode::ConfigInvalidValue, std::format("Неизвестная опция '{}'", arg));
        } else if (args.command.empty()) {
            args.command = std::string(arg);
        } else {
            args.positional.emplace_back(arg);
        }
    }

    return args;
}

int exit_code_for(const Error& error) {
    return is_configuration_error(error.code) ? EXIT_CONFIG_ERROR : EXIT_RUNTIME_ERROR;
}

int report(const Error& error) {
    log::error("{}", error.message);
    return exit_code_for(error);
}

void print_json(const nlohmann::json& document, bool pretty) {
    constexpr auto replace = nlohmann::json::error_handler_t::replace;
    std::cout << (pretty ? document.dump(2, ' ', false, replace) : document.dump(-1, ' ', false, replace))
              << std::endl;
}

/**
 * @brief Контекст команды: конфигурация и общие зависимости
 */
struct Context {
    Config config;
    Args args;
    std::optional<std::filesystem::path> cache_dir;
    bool color = true;

    [[nodiscard]] bool json() const noexcept { return args.format == OutputFormat::Json; }
};

Result<device::DeviceFilter> resolve_filter(const Context& ctx) {
    if (!ctx.args.type_filter) {
        return device::DeviceFilter::all();
    }
    return device::DeviceFilter::parse(*ctx.args.type_filter);
}

Result<std::filesystem::path> require_cache_dir(const Context& ctx) {
    if (!ctx.cache_dir) {
        return Err<std::filesystem::path>(
            ErrorCode::ConfigMissingPath,
            "Не удалось определить директорию кэша, укажите --cache-dir"
        );
    }
    return *ctx.cache_dir;
}

discovery::CoordinatorConfig coordinator_config(const Context& ctx) {
    const auto& discovery = ctx.config.discovery;

    discovery::CoordinatorConfig config;
    config.scan_timeout = std::chrono::milliseconds(discovery.scan_timeout_ms);
    config.scan_parallel = discovery.scan_parallel;
    config.quick_probe_timeout = std::chrono::milliseconds(discovery.quick_probe_timeout_ms);
    config.retention = std::chrono::days(discovery.retention_days);
    config.cache_dir = ctx.cache_dir;
    return config;
}

// =============================================================================
// Команды
// =============================================================================

int cmd_discover(const Context& ctx) {
    auto network = ctx.args.network.value_or(ctx.config.discovery.network);

    // Диапазон проверяется до любой сетевой активности
    if (!network.empty()) {
        if (auto range = discovery::NetworkRange::parse(network); !range) {
            return report(range.error());
        }
    }

    auto timeout = std::chrono::seconds(ctx.args.timeout_seconds.value_or(ctx.config.discovery.timeout_seconds));
    bool mdns = ctx.config.discovery.mdns && !ctx.args.no_mdns;

    device::HttpDeviceClient client(ctx.config.client);
    discovery::AvahiMdnsResolver resolver;
    cache::DeviceCache cache;

    discovery::DiscoveryCoordinator coordinator(client, resolver, cache, coordinator_config(ctx));

    log::info("Обнаружение устройств{}...", mdns ? " (mDNS + сканирование)" : " (сканирование)");

    auto result = coordinator.discover(network, timeout, mdns);
    if (!result) {
        return report(result.error());
    }

    if (ctx.json()) {
        print_json(output::discovery_document(*result, std::chrono::system_clock::now()), true);
    } else {
        std::cout << output::StatusRenderer(ctx.color).discovery_report(*result);
    }
    return 0;
}

int cmd_list(const Context& ctx) {
    auto filter = resolve_filter(ctx);
    if (!filter) {
        return report(filter.error());
    }

    auto dir = require_cache_dir(ctx);
    if (!dir) {
        return report(dir.error());
    }

    cache::DeviceCache cache;
    cache.load(*dir);

    auto devices = cache.devices_by_filter(*filter, !ctx.args.all);
    auto now = std::chrono::system_clock::now();

    if (ctx.json()) {
        print_json(output::list_document(devices, now), true);
        return 0;
    }

    output::StatusRenderer renderer(ctx.color);
    if (devices.empty()) {
        log::warn("{}", ctx.args.all ? "Устройства не найдены" : "Нет online устройств (--all покажет все)");
        log::info("Запустите 'axectl discover' для поиска устройств");
        return 0;
    }

    std::cout << renderer.device_table(devices) << "\n"
              << renderer.summary(device::SwarmSummary::from_devices(devices));
    return 0;
}

int cmd_monitor(const Context& ctx) {
    auto filter = resolve_filter(ctx);
    if (!filter) {
        return report(filter.error());
    }

    const auto& settings = ctx.config.monitor;

    monitor::MonitorConfig config;
    config.interval = std::chrono::seconds(ctx.args.interval_seconds.value_or(settings.interval_seconds));
    config.stats_timeout = std::chrono::seconds(settings.stats_timeout_seconds);

    double temp = ctx.args.temp_alert.value_or(settings.temp_alert);
    if (temp > 0.0) {
        config.temp_threshold = temp;
    }
    double drop = ctx.args.hashrate_alert.value_or(settings.hashrate_alert);
    if (drop > 0.0) {
        config.hashrate_drop_threshold = drop;
    }

    config.filter = *filter;
    config.include_offline = ctx.args.all;
    config.no_stats = ctx.args.no_stats;
    config.background_discovery = ctx.args.discover || settings.discover;
    config.discovery_interval = std::chrono::seconds(
        ctx.args.discover_interval_seconds.value_or(settings.discover_interval_seconds)
    );
    config.network = ctx.args.network.value_or(ctx.config.discovery.network);
    config.mdns_enabled = ctx.config.discovery.mdns && !ctx.args.no_mdns;
    config.discovery_timeout = std::chrono::seconds(ctx.config.discovery.timeout_seconds);
    config.channel_capacity = settings.channel_capacity;
    config.max_alerts = settings.max_alerts;
    config.max_parallel = settings.max_parallel;
    config.cache_dir = ctx.cache_dir;
    config.coordinator = coordinator_config(ctx);

    device::HttpDeviceClient client(ctx.config.client);
    discovery::AvahiMdnsResolver resolver;
    cache::DeviceCache cache;

    monitor::MonitorEngine engine(client, resolver, cache, config);

    bool json = ctx.json();
    bool color = ctx.color;
    output::StatusRenderer renderer(color);

    engine.set_tick_callback([json, color, &renderer](const monitor::TickEvent& event) {
        if (json) {
            print_json(output::tick_document(event, true), false);
            return;
        }
        if (color) {
            std::cout << output::ansi::CLEAR_SCREEN << output::ansi::HOME;
        }
        std::cout << renderer.tick(event) << std::flush;
    });

    auto result = engine.run(g_running);
    if (!result) {
        return report(result.error());
    }
    return 0;
}

/**
 * @brief Ждать следующего опроса, просыпаясь для проверки сигнала
 */
void sleep_while_running(std::chrono::seconds interval) {
    constexpr auto STEP = std::chrono::milliseconds(100);
    auto deadline = std::chrono::steady_clock::now() + interval;
    while (g_running.load(std::memory_order_relaxed) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(STEP);
    }
}

int cmd_stats(const Context& ctx) {
    if (ctx.args.positional.size() > 1) {
        log::error("stats: допускается не более одной цели <ip|name>");
        return EXIT_CONFIG_ERROR;
    }

    auto dir = require_cache_dir(ctx);
    if (!dir) {
        return report(dir.error());
    }

    std::optional<std::string_view> identifier;
    if (!ctx.args.positional.empty()) {
        identifier = ctx.args.positional[0];
    }

    const auto& settings = ctx.config.monitor;
    auto interval = std::chrono::seconds(ctx.args.interval_seconds.value_or(settings.interval_seconds));
    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::seconds(settings.stats_timeout_seconds)
    );

    device::HttpDeviceClient client(ctx.config.client);
    output::StatusRenderer renderer(ctx.color);

    do {
        cache::DeviceCache cache;
        cache.load(*dir);

        auto targets = monitor::stats_targets(cache, identifier);
        if (targets.empty()) {
            if (identifier) {
                log::info("Список устройств: 'axectl list --all'");
                return report(Error{
                    ErrorCode::DiscoveryInvalidAddress,
                    std::format("Устройство '{}' не найдено в кэше", *identifier)
                });
            }
            if (ctx.json()) {
                print_json(output::stats_document(monitor::StatsSnapshot{std::chrono::system_clock::now(), {}, {}, {}}), true);
            } else {
                log::warn("Нет online устройств");
                log::info("Запустите 'axectl discover' для поиска устройств");
            }
            return 0;
        }

        auto snapshot = monitor::collect_stats(client, cache, targets, timeout, settings.max_parallel);

        if (auto saved = cache.save(*dir); !saved) {
            log::warn("Не удалось сохранить кэш: {}", saved.error().message);
        }

        if (ctx.json()) {
            print_json(output::stats_document(snapshot), !ctx.args.watch);
        } else {
            if (ctx.args.watch && ctx.color) {
                std::cout << output::ansi::CLEAR_SCREEN << output::ansi::HOME;
            }
            std::cout << renderer.stats_report(snapshot) << std::flush;
        }

        if (ctx.args.watch) {
            sleep_while_running(interval);
        }
    } while (ctx.args.watch && g_running.load(std::memory_order_relaxed));

    return 0;
}

/**
 * @brief Разрешить цель команды управления: ip, имя или "all"
 */
Result<std::vector<device::Device>> resolve_targets(
    const Context& ctx,
    const cache::DeviceCache& cache,
    std::string_view target
) {
    auto filter = resolve_filter(ctx);
    if (!filter) {
        return std::unexpected(filter.error());
    }

    if (target == "all") {
        return cache.devices_by_filter(*filter, true);
    }

    if (auto found = cache.find(target)) {
        return std::vector<device::Device>{*found};
    }

    // Неизвестный адрес: команда отправляется напрямую
    if (discovery::is_valid_address(target)) {
        device::Device device;
        device.name = std::string(target);
        device.ip_address = std::string(target);
        return std::vector<device::Device>{device};
    }

    return Err<std::vector<device::Device>>(
        ErrorCode::DiscoveryInvalidAddress,
        std::format("Устройство '{}' не найдено в кэше", target)
    );
}

int cmd_control(const Context& ctx, const control::ControlAction& action, std::string_view target) {
    // Фильтр проверяется до загрузки кэша
    if (auto filter = resolve_filter(ctx); !filter) {
        return report(filter.error());
    }

    cache::DeviceCache cache;
    if (ctx.cache_dir) {
        cache.load(*ctx.cache_dir);
    }

    auto targets = resolve_targets(ctx, cache, target);
    if (!targets) {
        return report(targets.error());
    }
    if (targets->empty()) {
        log::warn("Нет устройств для команды '{}'", action.describe());
        return 0;
    }

    device::HttpDeviceClient client(ctx.config.client);
    control::BulkController controller(client);

    auto outcomes = controller.run(*targets, action, CONTROL_TIMEOUT, CONTROL_PARALLEL);
    if (!outcomes) {
        return report(outcomes.error());
    }

    if (ctx.json()) {
        print_json(output::control_document(*outcomes, action), true);
    } else {
        std::cout << output::StatusRenderer(ctx.color).control_report(*outcomes, action);
    }

    bool all_ok = std::ranges::all_of(*outcomes, [](const auto& o) { return o.success; });
    return all_ok ? 0 : EXIT_RUNTIME_ERROR;
}

int cmd_restart(const Context& ctx) {
    if (ctx.args.positional.size() != 1) {
        log::error("restart: требуется цель <ip|name|all>");
        return EXIT_CONFIG_ERROR;
    }
    return cmd_control(ctx, control::ControlAction::restart(), ctx.args.positional[0]);
}

int cmd_set_fan(const Context& ctx) {
    if (ctx.args.positional.size() != 2) {
        log::error("set-fan: требуются цель <ip|name|all> и процент");
        return EXIT_CONFIG_ERROR;
    }

    auto percent = parse_uint("set-fan", ctx.args.positional[1]);
    if (!percent) {
        return report(percent.error());
    }
    if (*percent > 100) {
        log::error("set-fan: процент должен быть в диапазоне 0..100");
        return EXIT_CONFIG_ERROR;
    }

    return cmd_control(ctx, control::ControlAction::set_fan(*percent), ctx.args.positional[0]);
}

int cmd_update_settings(const Context& ctx) {
    if (ctx.args.positional.size() != 2) {
        log::error("update-settings: требуются цель <ip|name|all> и JSON объект");
        return EXIT_CONFIG_ERROR;
    }

    auto settings = nlohmann::json::parse(ctx.args.positional[1], nullptr, false);
    if (settings.is_discarded() || !settings.is_object() || settings.empty()) {
        log::error("update-settings: ожидается непустой JSON объект, например '{{\"frequency\":525}}'");
        return EXIT_CONFIG_ERROR;
    }

    return cmd_control(ctx, control::ControlAction::update_settings(std::move(settings)), ctx.args.positional[0]);
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace axectl;

    // Парсим аргументы
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << "[ERROR] " << args.error().message << std::endl;
        std::cerr << "Используйте --help для справки" << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    if (args->show_help) {
        print_help();
        return 0;
    }

    if (args->show_version) {
        print_version();
        return 0;
    }

    if (args->command.empty()) {
        print_help();
        return EXIT_CONFIG_ERROR;
    }

    // Загружаем конфигурацию
    auto config_result = Config::load_with_search(
        args->config_path ? std::optional<std::filesystem::path>(*args->config_path) : std::nullopt
    );
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    Context ctx{std::move(*config_result), std::move(*args), std::nullopt, true};

    // Опции командной строки перекрывают файл конфигурации
    if (ctx.args.cache_dir) {
        ctx.config.cache.directory = *ctx.args.cache_dir;
    }
    if (ctx.args.network) {
        ctx.config.discovery.network = *ctx.args.network;
    }

    // Валидируем конфигурацию
    if (auto validation = ctx.config.validate(); !validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: " << validation.error().message << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    ctx.color = ctx.config.logging.color && !ctx.args.no_color;
    ctx.cache_dir = ctx.config.cache.resolve_directory();

    log::LoggerConfig logger_config;
    logger_config.level = ctx.args.verbose ? log::LogLevel::Debug : log::parse_level(ctx.config.logging.level);
    logger_config.color = ctx.color;
    logger_config.timestamps = ctx.config.logging.timestamps;
    log::Logger::instance().configure(logger_config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const auto& command = ctx.args.command;

    if (command == "discover") {
        return cmd_discover(ctx);
    }
    if (command == "list") {
        return cmd_list(ctx);
    }
    if (command == "monitor") {
        return cmd_monitor(ctx);
    }
    if (command == "stats") {
        return cmd_stats(ctx);
    }
    if (command == "restart") {
        return cmd_restart(ctx);
    }
    if (command == "set-fan") {
        return cmd_set_fan(ctx);
    }
    if (command == "update-settings") {
        return cmd_update_settings(ctx);
    }

    log::error("Неизвестная команда '{}'", command);
    return EXIT_CONFIG_ERROR;
}
