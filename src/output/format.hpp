/**
 * @file format.hpp
 * @brief Форматирование величин для терминала
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace axectl::output {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    inline constexpr std::string_view RESET = "\033[0m";
    inline constexpr std::string_view BOLD = "\033[1m";
    inline constexpr std::string_view DIM = "\033[2m";

    inline constexpr std::string_view RED = "\033[31m";
    inline constexpr std::string_view GREEN = "\033[32m";
    inline constexpr std::string_view YELLOW = "\033[33m";
    inline constexpr std::string_view BLUE = "\033[34m";
    inline constexpr std::string_view CYAN = "\033[36m";

    // Управление курсором
    inline constexpr std::string_view CLEAR_SCREEN = "\033[2J";
    inline constexpr std::string_view HOME = "\033[H";
}

/// @brief Температура, начиная с которой значение выделяется жёлтым
inline constexpr double TEMP_WARNING_CELSIUS = 70.0;

/// @brief Температура, начиная с которой значение выделяется красным
inline constexpr double TEMP_CRITICAL_CELSIUS = 80.0;

/**
 * @brief Хешрейт в MH/s, GH/s или TH/s с одним знаком после точки
 *
 * @code
 * format_hashrate(500.0)     // "500.0 MH/s"
 * format_hashrate(1200.0)    // "1.2 GH/s"
 * format_hashrate(2.5e6)     // "2.5 TH/s"
 * @endcode
 */
[[nodiscard]] std::string format_hashrate(double hashrate_mhs);

/**
 * @brief Температура "65.5°C", цвет по порогам 70/80
 */
[[nodiscard]] std::string format_temperature(double celsius, bool color);

[[nodiscard]] std::string format_power(double watts);

/**
 * @brief Аптайм "Xd Yh", "Xh Ym" или "Xm"
 */
[[nodiscard]] std::string format_uptime(uint64_t seconds);

/**
 * @brief Обернуть текст в ANSI код, если цвет включён
 */
[[nodiscard]] std::string paint(std::string_view text, std::string_view code, bool color);

/**
 * @brief Дополнить строку пробелами до ширины (в символах UTF-8)
 */
[[nodiscard]] std::string pad_right(std::string_view text, std::size_t width);

/**
 * @brief Видимая ширина строки: UTF-8 символы без ANSI последовательностей
 */
[[nodiscard]] std::size_t display_width(std::string_view text) noexcept;

} // namespace axectl::output
