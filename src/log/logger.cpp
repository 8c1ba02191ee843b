/**
 * @file logger.cpp
 * @brief Реализация консольного логгера
 */

#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace axectl::log {

LogLevel parse_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "warn" || text == "warning") return LogLevel::Warning;
    if (text == "error") return LogLevel::Error;
    return LogLevel::Info;
}

// =============================================================================
// Singleton
// =============================================================================

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

// =============================================================================
// Конфигурация
// =============================================================================

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    level_.store(config.level, std::memory_order_relaxed);
}

void Logger::set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

bool Logger::enabled(LogLevel level) const noexcept {
    return level >= level_.load(std::memory_order_relaxed);
}

// =============================================================================
// Вывод
// =============================================================================

std::string Logger::format_line(LogLevel level, std::string_view message) const {
    std::ostringstream ss;

    if (config_.timestamps) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&time, &tm);
        ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    }

    ss << "[" << to_string(level) << "] " << message;
    return ss.str();
}

void Logger::write(LogLevel level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto line = format_line(level, message);

    if (sink_) {
        sink_(level, line);
        return;
    }

    if (!config_.color) {
        std::cerr << line << std::endl;
        return;
    }

    // Цвет в зависимости от уровня
    switch (level) {
        case LogLevel::Debug:
            std::cerr << "\033[2m" << line << "\033[0m" << std::endl;
            break;
        case LogLevel::Info:
            std::cerr << "\033[32m" << line << "\033[0m" << std::endl;
            break;
        case LogLevel::Warning:
            std::cerr << "\033[33m" << line << "\033[0m" << std::endl;
            break;
        case LogLevel::Error:
            std::cerr << "\033[31m" << line << "\033[0m" << std::endl;
            break;
    }
}

} // namespace axectl::log
