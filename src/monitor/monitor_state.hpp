/**
 * @file monitor_state.hpp
 * @brief Состояние сессии монитора и сообщения фонового обнаружения
 *
 * MonitorState принадлежит только циклу монитора. Фоновое обнаружение
 * не изменяет его напрямую, а отправляет DiscoveryMessage через канал.
 */

#pragma once

#include "alert_rules.hpp"
#include "../device/device.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace axectl::monitor {

// =============================================================================
// Сообщения фонового обнаружения
// =============================================================================

/// @brief Цикл обнаружения начался
struct DiscoveryStarted {};

/// @brief Устройства, подтверждённые циклом обнаружения (сверка на стороне монитора)
struct NewDevices {
    std::vector<device::Device> devices;
};

/// @brief Цикл обнаружения завершён
struct DiscoveryComplete {
    /// @brief Всего устройств найдено за цикл
    std::size_t count = 0;
    Timestamp finished_at{};
};

using DiscoveryMessage = std::variant<DiscoveryStarted, NewDevices, DiscoveryComplete>;

// =============================================================================
// Состояние
// =============================================================================

/**
 * @brief Состояние одной сессии монитора
 */
struct MonitorState {
    explicit MonitorState(std::size_t max_alerts)
        : alerts(max_alerts) {}

    /// @brief Устройства по адресу
    std::map<std::string, device::Device, std::less<>> devices;

    AlertLog alerts;

    /// @brief Идёт фоновый цикл обнаружения
    bool discovery_active = false;

    /// @brief Окончание последнего цикла обнаружения
    std::optional<Timestamp> last_discovery;

    /// @brief Последний хешрейт по адресу (база для процента падения)
    std::map<std::string, double, std::less<>> previous_hashrates;

    /**
     * @brief Добавить устройство, если адрес ещё неизвестен
     *
     * @return true если устройство добавлено
     */
    bool insert_if_absent(const device::Device& device) {
        return devices.try_emplace(device.ip_address, device).second;
    }

    /**
     * @brief Принять устройства, найденные обнаружением
     *
     * Неизвестные адреса добавляются, известные Offline устройства,
     * снова ответившие при обнаружении, возвращаются в Online.
     *
     * @return Сколько устройств добавлено или возвращено
     */
    std::size_t merge_discovered(const std::vector<device::Device>& found) {
        std::size_t changed = 0;
        for (const auto& device : found) {
            if (insert_if_absent(device)) {
                ++changed;
                continue;
            }
            auto& existing = devices.at(device.ip_address);
            if (!existing.is_online() && device.is_online()) {
                existing.status = device::DeviceStatus::Online;
                existing.mark_seen(device.last_seen);
                ++changed;
            }
        }
        return changed;
    }

    /**
     * @brief Применить сообщение фонового обнаружения
     *
     * @return Сколько устройств добавлено или возвращено
     */
    std::size_t apply(const DiscoveryMessage& message) {
        if (std::holds_alternative<DiscoveryStarted>(message)) {
            discovery_active = true;
        } else if (const auto* found = std::get_if<NewDevices>(&message)) {
            return merge_discovered(found->devices);
        } else if (const auto* complete = std::get_if<DiscoveryComplete>(&message)) {
            discovery_active = false;
            last_discovery = complete->finished_at;
        }
    }
};

} // namespace axectl::monitor
