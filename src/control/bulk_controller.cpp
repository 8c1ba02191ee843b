/**
 * @file bulk_controller.cpp
 * @brief Реализация групповых команд
 */

#include "bulk_controller.hpp"
#include "../core/worker_pool.hpp"
#include "../log/logger.hpp"

#include <format>
#include <string>

namespace axectl::control {

std::string ControlAction::describe() const {
    switch (kind) {
        case Kind::Restart:     return "restart";
        case Kind::SetFanSpeed: return std::format("set fan speed to {}%", fan_percent);
        case Kind::UpdateSettings: {
            std::string keys;
            if (settings.is_object()) {
                for (const auto& item : settings.items()) {
                    keys += keys.empty() ? item.key() : ", " + item.key();
                }
            }
            return std::format("update settings ({})", keys);
        }
    }
    return "unknown";
}

Result<std::vector<ControlOutcome>> BulkController::run(
    const std::vector<device::Device>& devices,
    const ControlAction& action,
    std::chrono::milliseconds timeout,
    std::size_t max_parallel
) const {
    if (action.kind == ControlAction::Kind::SetFanSpeed && action.fan_percent > 100) {
        return Err<std::vector<ControlOutcome>>(
            ErrorCode::ConfigInvalidValue,
            std::format("Скорость вентилятора должна быть 0..100, получено {}", action.fan_percent)
        );
    }

    if (action.kind == ControlAction::Kind::UpdateSettings &&
        (!action.settings.is_object() || action.settings.empty())) {
        return Err<std::vector<ControlOutcome>>(
            ErrorCode::ConfigInvalidValue,
            "Настройки должны быть непустым JSON объектом"
        );
    }

    log::debug("Команда '{}' для {} устройств", action.describe(), devices.size());

    return parallel_map<ControlOutcome>(devices, max_parallel,
        [this, &action, timeout](const device::Device& device) {
            Result<void> result;
            switch (action.kind) {
                case ControlAction::Kind::Restart:
                    result = client_.restart(device.ip_address, timeout);
                    break;
                case ControlAction::Kind::SetFanSpeed:
                    result = client_.set_fan_speed(device.ip_address, action.fan_percent, timeout);
                    break;
                case ControlAction::Kind::UpdateSettings:
                    result = client_.update_settings(device.ip_address, action.settings, timeout);
                    break;
            }

            ControlOutcome outcome;
            outcome.device = device;
            outcome.success = result.has_value();
            if (result) {
                outcome.message = std::format("{}: {} ok", device.name, action.describe());
            } else {
                outcome.message = std::format("{}: {}", device.name, result.error().message);
            }
            return outcome;
        });
}

} // namespace axectl::control
