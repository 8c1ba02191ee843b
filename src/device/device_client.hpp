/**
 * @file device_client.hpp
 * @brief Интерфейс клиента REST API устройства
 *
 * Все сетевые подсистемы (сканер, mDNS, монитор, массовое управление)
 * работают через этот интерфейс. Рабочая реализация использует libcurl
 * (HttpDeviceClient), в тестах подставляется поддельный клиент.
 *
 * Каждый вызов ограничен собственным таймаутом и потокобезопасен.
 */

#pragma once

#include "device.hpp"
#include "device_response.hpp"
#include "../core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace axectl::device {

/**
 * @brief Результат проверки доступности устройства
 */
struct HealthStatus {
    enum class State {
        Healthy,      ///< Ответ 2xx
        Unhealthy,    ///< Ответ получен, но код не 2xx
        Unreachable   ///< Нет ответа (таймаут, отказ в соединении)
    };

    State state = State::Unreachable;

    /// @brief HTTP код (0, если ответа не было)
    long http_code = 0;

    /// @brief Время ответа
    std::chrono::milliseconds latency{0};

    [[nodiscard]] bool is_healthy() const noexcept {
        return state == State::Healthy;
    }
};

/**
 * @brief Идентификация устройства по /api/system/info
 */
struct DeviceIdentity {
    UnifiedInfo info;
    DeviceType type = DeviceType::Unknown;
};

/**
 * @brief Абстрактный клиент устройства
 */
class DeviceClient {
public:
    virtual ~DeviceClient() = default;

    /**
     * @brief Проверить, отвечает ли устройство
     */
    [[nodiscard]] virtual HealthStatus probe(
        std::string_view address,
        std::chrono::milliseconds timeout
    ) = 0;

    /**
     * @brief Получить идентификацию устройства
     */
    [[nodiscard]] virtual Result<DeviceIdentity> fetch_identity(
        std::string_view address,
        std::chrono::milliseconds timeout
    ) = 0;

    /**
     * @brief Получить текущую статистику
     */
    [[nodiscard]] virtual Result<DeviceStats> fetch_stats(
        std::string_view address,
        std::chrono::milliseconds timeout
    ) = 0;

    /**
     * @brief Перезагрузить устройство
     */
    [[nodiscard]] virtual Result<void> restart(
        std::string_view address,
        std::chrono::milliseconds timeout
    ) = 0;

    /**
     * @brief Установить скорость вентилятора (0..100 %)
     */
    [[nodiscard]] virtual Result<void> set_fan_speed(
        std::string_view address,
        uint32_t percent,
        std::chrono::milliseconds timeout
    ) = 0;

    /**
     * @brief Изменить настройки устройства
     *
     * @param settings Объект JSON с изменяемыми полями, передаётся как есть
     */
    [[nodiscard]] virtual Result<void> update_settings(
        std::string_view address,
        const nlohmann::json& settings,
        std::chrono::milliseconds timeout
    ) = 0;
};

/**
 * @brief Собрать Device из идентификации
 *
 * Имя устройства берётся из hostname, серийный номер из MAC адреса.
 * Статус Online, discovered_at и last_seen равны now.
 */
[[nodiscard]] Device make_device(
    std::string_view address,
    const DeviceIdentity& identity,
    Timestamp now
);

} // namespace axectl::device
