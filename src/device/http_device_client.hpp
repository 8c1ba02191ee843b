/**
 * @file http_device_client.hpp
 * @brief HTTP клиент REST API устройств (libcurl)
 *
 * Эндпоинты AxeOS:
 * - GET   /api/system/info     - проверка, идентификация, статистика
 * - POST  /api/system/restart  - перезагрузка
 * - PATCH /api/system          - настройки ({"fanspeed":N} или произвольный объект)
 *
 * На каждый запрос создаётся отдельный CURL handle, поэтому один клиент
 * можно использовать из нескольких потоков одновременно.
 */

#pragma once

#include "device_client.hpp"
#include "../core/config.hpp"

#include <memory>

namespace axectl::device {

/**
 * @brief Клиент устройств поверх libcurl
 */
class HttpDeviceClient : public DeviceClient {
public:
    /**
     * @brief Создать клиент
     *
     * @param config Таймаут подключения и User-Agent
     */
    explicit HttpDeviceClient(const ClientConfig& config = {});
    ~HttpDeviceClient() override;

    // Запрещаем копирование
    HttpDeviceClient(const HttpDeviceClient&) = delete;
    HttpDeviceClient& operator=(const HttpDeviceClient&) = delete;

    HttpDeviceClient(HttpDeviceClient&&) noexcept;
    HttpDeviceClient& operator=(HttpDeviceClient&&) noexcept;

    [[nodiscard]] HealthStatus probe(
        std::string_view address,
        std::chrono::milliseconds timeout
    ) override;

    [[nodiscard]] Result<DeviceIdentity> fetch_identity(
        std::string_view address,
        std::chrono::milliseconds timeout
    ) override;

    [[nodiscard]] Result<DeviceStats> fetch_stats(
        std::string_view address,
        std::chrono::milliseconds timeout
    ) override;

    [[nodiscard]] Result<void> restart(
        std::string_view address,
        std::chrono::milliseconds timeout
    ) override;

    [[nodiscard]] Result<void> set_fan_speed(
        std::string_view address,
        uint32_t percent,
        std::chrono::milliseconds timeout
    ) override;

    [[nodiscard]] Result<void> update_settings(
        std::string_view address,
        const nlohmann::json& settings,
        std::chrono::milliseconds timeout
    ) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace axectl::device
