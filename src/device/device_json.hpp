/**
 * @file device_json.hpp
 * @brief JSON представление модели устройства
 *
 * Функции to_json/from_json находятся в пространстве имён модели, чтобы
 * nlohmann/json находил их через ADL. Время хранится в RFC 3339 (UTC).
 */

#pragma once

#include "device.hpp"
#include "../core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace axectl::device {

/**
 * @brief Время в формате "2024-01-31T12:00:00Z"
 */
[[nodiscard]] std::string format_timestamp(Timestamp timestamp);

/**
 * @brief Разобрать время RFC 3339
 *
 * Дробные секунды и смещение "+00:00" допускаются. Учитываются только
 * целые секунды.
 */
[[nodiscard]] Result<Timestamp> parse_timestamp(std::string_view text);

void to_json(nlohmann::json& j, DeviceType type);
void from_json(const nlohmann::json& j, DeviceType& type);

void to_json(nlohmann::json& j, DeviceStatus status);
void from_json(const nlohmann::json& j, DeviceStatus& status);

void to_json(nlohmann::json& j, const DeviceStats& stats);
void from_json(const nlohmann::json& j, DeviceStats& stats);

void to_json(nlohmann::json& j, const Device& device);
void from_json(const nlohmann::json& j, Device& device);

void to_json(nlohmann::json& j, const SwarmSummary& summary);
void to_json(nlohmann::json& j, const TypeSummary& summary);

} // namespace axectl::device
