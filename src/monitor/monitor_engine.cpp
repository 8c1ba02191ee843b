/**
 * @file monitor_engine.cpp
 * @brief Реализация движка мониторинга
 */

#include "monitor_engine.hpp"
#include "../core/worker_pool.hpp"
#include "../discovery/network_range.hpp"
#include "../log/logger.hpp"

#include <condition_variable>
#include <mutex>
#include <thread>

namespace axectl::monitor {

namespace {

/// @brief Шаг ожидания между тиками (реакция на сигнал остановки)
constexpr std::chrono::milliseconds SLEEP_SLICE{100};

/// @brief Сколько последних алертов передаётся в событие тика
constexpr std::size_t RECENT_ALERTS = 10;

} // anonymous namespace

// =============================================================================
// Внутренняя реализация
// =============================================================================

struct MonitorEngine::Impl {
    device::DeviceClient& client;
    discovery::MdnsResolver& resolver;
    cache::DeviceCache& cache;
    MonitorConfig config;

    MonitorState state;
    BoundedChannel<DiscoveryMessage> channel;
    TickCallback callback;

    // Фоновое обнаружение
    std::thread discovery_thread;
    std::mutex stop_mutex;
    std::condition_variable stop_cv;
    bool stop_requested = false;

    Impl(
        device::DeviceClient& c,
        discovery::MdnsResolver& r,
        cache::DeviceCache& dc,
        MonitorConfig cfg
    )
        : client(c)
        , resolver(r)
        , cache(dc)
        , config(std::move(cfg))
        , state(config.max_alerts)
        , channel(config.channel_capacity)
    {}

    [[nodiscard]] bool in_scope(const device::Device& device) const {
        return config.filter.matches(device.device_type) &&
               (config.include_offline || device.is_online());
    }

    std::vector<device::Device> snapshot() const {
        std::vector<device::Device> result;
        for (const auto& [address, device] : state.devices) {
            if (in_scope(device)) {
                result.push_back(device);
            }
        }
        return result;
    }

    void drain_channel() {
        while (auto message = channel.try_receive()) {
            if (auto changed = state.apply(*message); changed > 0) {
                log::info("Фоновое обнаружение: добавлено в мониторинг {}", changed);
            }
        }
    }

    /**
     * @brief Собрать статистику и применить результаты
     *
     * @return Алерты этого тика
     */
    std::vector<Alert> collect(const std::vector<device::Device>& devices) {
        std::vector<std::string> targets;
        for (const auto& device : devices) {
            // Offline устройства опрашиваются только при include_offline,
            // успешный ответ возвращает их в Online
            if (device.is_online() || config.include_offline) {
                targets.push_back(device.ip_address);
            }
        }

        if (targets.empty()) {
            return {};
        }

        auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.stats_timeout);
        auto results = parallel_map<Result<device::DeviceStats>>(targets, config.max_parallel,
            [this, timeout](const std::string& address) {
                return client.fetch_stats(address, timeout);
            });

        // Барьер пройден: дальше только этот поток трогает состояние
        std::vector<Alert> alerts;
        auto now = std::chrono::system_clock::now();

        for (std::size_t i = 0; i < targets.size(); ++i) {
            const auto& address = targets[i];
            auto it = state.devices.find(address);
            if (it == state.devices.end()) {
                continue;
            }
            auto& device = it->second;
            const auto& result = results[i];

            if (result) {
                const auto& stats = *result;

                if (config.temp_threshold) {
                    if (auto alert = check_temperature(device, stats.temperature_celsius, *config.temp_threshold, now)) {
                        alerts.push_back(std::move(*alert));
                    }
                }

                auto previous = state.previous_hashrates.find(address);
                if (config.hashrate_drop_threshold && previous != state.previous_hashrates.end()) {
                    if (auto alert = check_hashrate_drop(device, previous->second, stats.hashrate_mhs,
                                                         *config.hashrate_drop_threshold, now)) {
                        alerts.push_back(std::move(*alert));
                    }
                }
                state.previous_hashrates.insert_or_assign(address, stats.hashrate_mhs);

                device.stats = stats;
                device.status = device::DeviceStatus::Online;
                device.mark_seen(now);
            } else {
                log::warn("Не удалось получить статистику {}: {}", address, result.error().message);

                device.status = device::DeviceStatus::Offline;
                alerts.push_back(offline_alert(device, now));
            }
        }

        // Кэш обновляется последовательно после join
        for (std::size_t i = 0; i < targets.size(); ++i) {
            if (results[i]) {
                cache.update_stats(targets[i], *results[i]);
            } else {
                cache.mark_probe_failed(targets[i]);
            }
        }

        if (config.cache_dir) {
            if (auto saved = cache.save(*config.cache_dir); !saved) {
                log::warn("Не удалось сохранить кэш: {}", saved.error().message);
            }
        }

        return alerts;
    }

    void discovery_cycle() {
        auto coordinator_config = config.coordinator;
        coordinator_config.cache_dir = config.cache_dir;
        coordinator_config.reload_cache = false;

        discovery::DiscoveryCoordinator coordinator(client, resolver, cache, coordinator_config);

        if (!channel.send(DiscoveryStarted{})) {
            return;
        }

        std::size_t count = 0;
        auto result = coordinator.discover(config.network, config.discovery_timeout, config.mdns_enabled);
        if (!result) {
            log::warn("Фоновое обнаружение не удалось: {}", result.error().message);
        } else {
            count = result->devices.size();

            // Сверку с устройствами монитора делает основной поток
            NewDevices found;
            found.devices = result->plain_devices();

            log::debug("Фоновое обнаружение: найдено {}", count);

            if (!found.devices.empty() && !channel.send(std::move(found))) {
                return;
            }
        }

        (void)channel.send(DiscoveryComplete{count, std::chrono::system_clock::now()});
    }

    void discovery_loop() {
        log::info("Фоновое обнаружение каждые {} с", config.discovery_interval.count());

        for (;;) {
            {
                std::unique_lock lock(stop_mutex);
                if (stop_cv.wait_for(lock, config.discovery_interval, [this] { return stop_requested; })) {
                    return;
                }
            }
            discovery_cycle();
        }
    }

    void stop_background() {
        {
            std::lock_guard lock(stop_mutex);
            stop_requested = true;
        }
        stop_cv.notify_all();

        // Закрытие канала будит отправителя, заблокированного на полном канале
        channel.close();

        if (discovery_thread.joinable()) {
            discovery_thread.join();
        }
    }
};

// =============================================================================
// MonitorEngine публичный интерфейс
// =============================================================================

MonitorEngine::MonitorEngine(
    device::DeviceClient& client,
    discovery::MdnsResolver& resolver,
    cache::DeviceCache& cache,
    MonitorConfig config
)
    : impl_(std::make_unique<Impl>(client, resolver, cache, std::move(config)))
{
}

MonitorEngine::~MonitorEngine() {
    impl_->stop_background();
}

void MonitorEngine::set_tick_callback(TickCallback callback) {
    impl_->callback = std::move(callback);
}

Result<void> MonitorEngine::start() {
    const auto& config = impl_->config;

    if (!config.cache_dir) {
        return Err<void>(
            ErrorCode::ConfigMissingPath,
            "Для мониторинга нужна директория кэша (--cache-dir)"
        );
    }

    if (config.background_discovery && !config.network.empty()) {
        if (auto range = discovery::NetworkRange::parse(config.network); !range) {
            return std::unexpected(range.error());
        }
    }

    impl_->cache.load(*config.cache_dir);

    auto devices = impl_->cache.devices_by_filter(config.filter, !config.include_offline);
    for (const auto& device : devices) {
        impl_->state.insert_if_absent(device);
    }

    log::info("Мониторинг {} устройств (фильтр: {}), интервал {} с",
              impl_->state.devices.size(), config.filter.to_string(), config.interval.count());
    return {};
}

TickEvent MonitorEngine::tick() {
    impl_->drain_channel();

    auto devices = impl_->snapshot();

    std::vector<Alert> alerts;
    if (!impl_->config.no_stats) {
        alerts = impl_->collect(devices);
    }
    impl_->state.alerts.append(alerts);

    TickEvent event;
    event.timestamp = std::chrono::system_clock::now();

    // Снимок после обновления: те же адреса, свежие значения
    event.devices.reserve(devices.size());
    for (const auto& device : devices) {
        if (auto it = impl_->state.devices.find(device.ip_address); it != impl_->state.devices.end()) {
            event.devices.push_back(it->second);
        }
    }

    event.new_alerts = std::move(alerts);
    event.recent_alerts = impl_->state.alerts.recent(RECENT_ALERTS);
    event.alert_count = impl_->state.alerts.total();
    event.discovery_active = impl_->state.discovery_active;
    event.last_discovery = impl_->state.last_discovery;
    event.stats_collected = !impl_->config.no_stats;
    event.summary = device::SwarmSummary::from_devices(event.devices);
    event.type_summaries = device::TypeSummary::from_all_devices(event.devices);

    for (const auto& alert : event.new_alerts) {
        log::warn("{}", alert.message);
    }

    if (impl_->callback) {
        impl_->callback(event);
    }
    return event;
}

Result<void> MonitorEngine::run(const std::atomic<bool>& running) {
    if (auto started = start(); !started) {
        return started;
    }

    if (impl_->config.background_discovery) {
        impl_->discovery_thread = std::thread([this] { impl_->discovery_loop(); });
    }

    while (running.load()) {
        tick();

        auto deadline = std::chrono::steady_clock::now() + impl_->config.interval;
        while (running.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(SLEEP_SLICE);
        }
    }

    log::info("Мониторинг остановлен");
    impl_->stop_background();
    return {};
}

void MonitorEngine::discovery_cycle() {
    impl_->discovery_cycle();
}

void MonitorEngine::stop() {
    impl_->stop_background();
}

const MonitorState& MonitorEngine::state() const noexcept {
    return impl_->state;
}

BoundedChannel<DiscoveryMessage>& MonitorEngine::channel() noexcept {
    return impl_->channel;
}

const MonitorConfig& MonitorEngine::config() const noexcept {
    return impl_->config;
}

} // namespace axectl::monitor
