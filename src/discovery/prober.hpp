/**
 * @file prober.hpp
 * @brief Проба одного адреса: проверка доступности и идентификация
 */

#pragma once

#include "../device/device_client.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace axectl::discovery {

/**
 * @brief Итог пробы адреса
 */
struct ProbeResult {
    enum class State {
        Identified,    ///< Устройство ответило и опознано
        Unclassified,  ///< Ответ 2xx, но идентификация не удалась
        Unreachable    ///< Нет ответа или ответ не 2xx
    };

    std::string address;
    State state = State::Unreachable;
    device::HealthStatus health;

    /// @brief Устройство (только для Identified)
    std::optional<device::Device> device;

    /// @brief Причина неудачной идентификации (для Unclassified)
    std::optional<Error> error;

    [[nodiscard]] bool responsive() const noexcept {
        return state != State::Unreachable;
    }
};

/**
 * @brief Проба адреса через DeviceClient
 *
 * Сначала проверка доступности, затем запрос /api/system/info. Каждый
 * шаг ограничен переданным таймаутом. Повторов нет.
 */
class Prober {
public:
    explicit Prober(device::DeviceClient& client) : client_(client) {}

    [[nodiscard]] ProbeResult probe(std::string_view address, std::chrono::milliseconds timeout) const;

private:
    device::DeviceClient& client_;
};

} // namespace axectl::discovery
