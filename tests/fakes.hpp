/**
 * @file fakes.hpp
 * @brief Поддельные сетевые зависимости для тестов
 *
 * FakeDeviceClient отвечает из таблиц в памяти, FakeMdnsResolver отдаёт
 * заранее заданные записи. Реальные сокеты не открываются.
 */

#pragma once

#include "device/device_client.hpp"
#include "discovery/mdns_browser.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace axectl::tests {

/**
 * @brief Поддельный клиент устройств
 *
 * Потокобезопасен: вызывается из пулов потоков сканера и монитора.
 */
class FakeDeviceClient : public device::DeviceClient {
public:
    /**
     * @brief Зарегистрировать опознаваемое устройство
     */
    void add_device(
        const std::string& address,
        const std::string& hostname,
        device::DeviceType type = device::DeviceType::BitaxeGamma,
        const std::string& mac = ""
    ) {
        std::lock_guard lock(mutex_);
        device::DeviceIdentity identity;
        identity.info.hostname = hostname;
        identity.info.mac_address = mac;
        identity.info.asic_model = "BM1370";
        identity.type = type;
        identities_[address] = identity;
        healthy_.insert(address);
    }

    /**
     * @brief Адрес отвечает, но идентификация не удаётся
     */
    void add_unclassified(const std::string& address) {
        std::lock_guard lock(mutex_);
        healthy_.insert(address);
        identities_.erase(address);
    }

    /**
     * @brief Адрес перестаёт отвечать
     */
    void remove(const std::string& address) {
        std::lock_guard lock(mutex_);
        healthy_.erase(address);
        identities_.erase(address);
        stats_.erase(address);
    }

    void set_stats(const std::string& address, const device::DeviceStats& stats) {
        std::lock_guard lock(mutex_);
        stats_[address] = stats;
    }

    void set_hashrate(const std::string& address, double hashrate_mhs, double temperature = 50.0) {
        device::DeviceStats stats;
        stats.timestamp = std::chrono::system_clock::now();
        stats.hashrate_mhs = hashrate_mhs;
        stats.temperature_celsius = temperature;
        stats.power_watts = 15.0;
        set_stats(address, stats);
    }

    void fail_stats(const std::string& address) {
        std::lock_guard lock(mutex_);
        stats_.erase(address);
    }

    void fail_control(const std::string& address) {
        std::lock_guard lock(mutex_);
        control_failures_.insert(address);
    }

    [[nodiscard]] std::size_t probe_count() const noexcept { return probes_.load(); }
    [[nodiscard]] std::size_t stats_count() const noexcept { return stats_calls_.load(); }

    [[nodiscard]] std::vector<std::string> restarted() const {
        std::lock_guard lock(mutex_);
        return restarted_;
    }

    [[nodiscard]] std::map<std::string, uint32_t> fan_speeds() const {
        std::lock_guard lock(mutex_);
        return fan_speeds_;
    }

    [[nodiscard]] std::map<std::string, nlohmann::json> applied_settings() const {
        std::lock_guard lock(mutex_);
        return settings_;
    }

    // =========================================================================
    // DeviceClient
    // =========================================================================

    device::HealthStatus probe(std::string_view address, std::chrono::milliseconds) override {
        ++probes_;
        std::lock_guard lock(mutex_);
        device::HealthStatus status;
        if (healthy_.contains(std::string(address))) {
            status.state = device::HealthStatus::State::Healthy;
            status.http_code = 200;
        }
        return status;
    }

    Result<device::DeviceIdentity> fetch_identity(std::string_view address, std::chrono::milliseconds) override {
        std::lock_guard lock(mutex_);
        auto it = identities_.find(std::string(address));
        if (it == identities_.end()) {
            return Err<device::DeviceIdentity>(ErrorCode::DeviceUnknownType, "unknown schema");
        }
        return it->second;
    }

    Result<device::DeviceStats> fetch_stats(std::string_view address, std::chrono::milliseconds) override {
        ++stats_calls_;
        std::lock_guard lock(mutex_);
        auto it = stats_.find(std::string(address));
        if (it == stats_.end()) {
            return Err<device::DeviceStats>(ErrorCode::NetworkTimeout, "timeout");
        }
        return it->second;
    }

    Result<void> restart(std::string_view address, std::chrono::milliseconds) override {
        std::lock_guard lock(mutex_);
        if (control_failures_.contains(std::string(address))) {
            return Err<void>(ErrorCode::DeviceControlFailed, "HTTP 500");
        }
        restarted_.emplace_back(address);
        return {};
    }

    Result<void> set_fan_speed(std::string_view address, uint32_t percent, std::chrono::milliseconds) override {
        std::lock_guard lock(mutex_);
        if (control_failures_.contains(std::string(address))) {
            return Err<void>(ErrorCode::DeviceControlFailed, "HTTP 500");
        }
        fan_speeds_[std::string(address)] = percent;
        return {};
    }

    Result<void> update_settings(std::string_view address, const nlohmann::json& settings,
                                 std::chrono::milliseconds) override {
        std::lock_guard lock(mutex_);
        if (control_failures_.contains(std::string(address))) {
            return Err<void>(ErrorCode::DeviceControlFailed, "HTTP 500");
        }
        settings_[std::string(address)] = settings;
        return {};
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> healthy_;
    std::map<std::string, device::DeviceIdentity> identities_;
    std::map<std::string, device::DeviceStats> stats_;
    std::set<std::string> control_failures_;
    std::vector<std::string> restarted_;
    std::map<std::string, uint32_t> fan_speeds_;
    std::map<std::string, nlohmann::json> settings_;
    std::atomic<std::size_t> probes_{0};
    std::atomic<std::size_t> stats_calls_{0};
};

/**
 * @brief Поддельный mDNS резолвер
 */
class FakeMdnsResolver : public discovery::MdnsResolver {
public:
    void add_record(const discovery::ServiceRecord& record) {
        std::lock_guard lock(mutex_);
        records_[record.service_type].push_back(record);
    }

    void fail_service(const std::string& service_type) {
        std::lock_guard lock(mutex_);
        failing_.insert(service_type);
    }

    [[nodiscard]] std::vector<std::chrono::milliseconds> slices() const {
        std::lock_guard lock(mutex_);
        return slices_;
    }

    Result<std::vector<discovery::ServiceRecord>> browse(
        std::string_view service_type,
        std::chrono::milliseconds slice
    ) override {
        std::lock_guard lock(mutex_);
        slices_.push_back(slice);

        std::string key(service_type);
        if (failing_.contains(key)) {
            return Err<std::vector<discovery::ServiceRecord>>(ErrorCode::MdnsBrowseFailed, "browser failure");
        }
        auto it = records_.find(key);
        if (it == records_.end()) {
            return std::vector<discovery::ServiceRecord>{};
        }
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<discovery::ServiceRecord>> records_;
    std::set<std::string> failing_;
    std::vector<std::chrono::milliseconds> slices_;
};

/**
 * @brief Запись сервиса для тестов
 */
inline discovery::ServiceRecord service_record(
    const std::string& instance,
    const std::string& hostname,
    const std::string& address,
    const std::string& service_type = "_http._tcp.local.",
    uint16_t port = 80
) {
    discovery::ServiceRecord record;
    record.fullname = instance + "." + service_type;
    record.hostname = hostname;
    record.addresses = {address};
    record.port = port;
    record.service_type = service_type;
    return record;
}

} // namespace axectl::tests
