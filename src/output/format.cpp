/**
 * @file format.cpp
 * @brief Реализация форматирования величин
 */

#include "format.hpp"

#include <format>

namespace axectl::output {

std::string format_hashrate(double hashrate_mhs) {
    if (hashrate_mhs >= 1'000'000.0) {
        return std::format("{:.1f} TH/s", hashrate_mhs / 1'000'000.0);
    }
    if (hashrate_mhs >= 1'000.0) {
        return std::format("{:.1f} GH/s", hashrate_mhs / 1'000.0);
    }
    return std::format("{:.1f} MH/s", hashrate_mhs);
}

std::string format_temperature(double celsius, bool color) {
    auto text = std::format("{:.1f}°C", celsius);
    if (!color) {
        return text;
    }

    if (celsius >= TEMP_CRITICAL_CELSIUS) {
        return paint(text, ansi::RED, true);
    }
    if (celsius >= TEMP_WARNING_CELSIUS) {
        return paint(text, ansi::YELLOW, true);
    }
    return paint(text, ansi::GREEN, true);
}

std::string format_power(double watts) {
    return std::format("{:.1f}W", watts);
}

std::string format_uptime(uint64_t seconds) {
    auto days = seconds / 86400;
    auto hours = (seconds % 86400) / 3600;
    auto minutes = (seconds % 3600) / 60;

    if (days > 0) {
        return std::format("{}d {}h", days, hours);
    }
    if (hours > 0) {
        return std::format("{}h {}m", hours, minutes);
    }
    return std::format("{}m", minutes);
}

std::string paint(std::string_view text, std::string_view code, bool color) {
    if (!color) {
        return std::string(text);
    }
    std::string result;
    result.reserve(text.size() + code.size() + ansi::RESET.size());
    result.append(code);
    result.append(text);
    result.append(ansi::RESET);
    return result;
}

std::size_t display_width(std::string_view text) noexcept {
    std::size_t width = 0;
    std::size_t i = 0;

    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);

        // ESC [ ... буква
        if (c == 0x1B && i + 1 < text.size() && text[i + 1] == '[') {
            i += 2;
            while (i < text.size() && !((text[i] >= 'A' && text[i] <= 'Z') || (text[i] >= 'a' && text[i] <= 'z'))) {
                ++i;
            }
            ++i;
            continue;
        }

        // Продолжающие байты UTF-8 не занимают места
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
        ++i;
    }
    return width;
}

std::string pad_right(std::string_view text, std::size_t width) {
    std::string result(text);
    auto current = display_width(text);
    if (current < width) {
        result.append(width - current, ' ');
    }
    return result;
}

} // namespace axectl::output
