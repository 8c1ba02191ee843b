/**
 * @file bulk_controller.hpp
 * @brief Групповые команды управления устройствами
 */

#pragma once

#include "../core/types.hpp"
#include "../device/device.hpp"
#include "../device/device_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace axectl::control {

/**
 * @brief Команда управления
 */
struct ControlAction {
    enum class Kind {
        Restart,
        SetFanSpeed,
        UpdateSettings
    };

    Kind kind = Kind::Restart;

    /// @brief Скорость вентилятора (%), только для SetFanSpeed
    uint32_t fan_percent = 0;

    /// @brief Изменяемые поля, только для UpdateSettings
    nlohmann::json settings;

    [[nodiscard]] static ControlAction restart() { return {Kind::Restart, 0, {}}; }
    [[nodiscard]] static ControlAction set_fan(uint32_t percent) { return {Kind::SetFanSpeed, percent, {}}; }
    [[nodiscard]] static ControlAction update_settings(nlohmann::json fields) {
        return {Kind::UpdateSettings, 0, std::move(fields)};
    }

    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Итог команды для одного устройства
 */
struct ControlOutcome {
    device::Device device;
    bool success = false;
    std::string message;
};

/**
 * @brief Параллельное выполнение команды на наборе устройств
 *
 * Ошибка на одном устройстве не прерывает остальные.
 */
class BulkController {
public:
    explicit BulkController(device::DeviceClient& client)
        : client_(client) {}

    /**
     * @brief Выполнить команду
     *
     * @return Итоги в порядке входа или ConfigInvalidValue, если процент
     *         вентилятора вне 0..100 или настройки не JSON объект
     *         (до любых запросов)
     */
    [[nodiscard]] Result<std::vector<ControlOutcome>> run(
        const std::vector<device::Device>& devices,
        const ControlAction& action,
        std::chrono::milliseconds timeout,
        std::size_t max_parallel
    ) const;

private:
    device::DeviceClient& client_;
};

} // namespace axectl::control
