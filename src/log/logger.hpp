/**
 * @file logger.hpp
 * @brief Консольный логгер axectl
 *
 * Строки вида "[2024-01-01 12:00:00] [INFO] сообщение" с опциональным
 * ANSI цветом. Весь диагностический вывод идёт в stderr, чтобы stdout
 * оставался чистым для JSON.
 */

#pragma once

#include <atomic>
#include <format>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace axectl::log {

// =============================================================================
// Уровни логирования
// =============================================================================

/**
 * @brief Уровень сообщения
 */
enum class LogLevel {
    Debug,    ///< Отладка
    Info,     ///< Информационное сообщение
    Warning,  ///< Предупреждение
    Error     ///< Ошибка
};

/**
 * @brief Преобразовать уровень в строку
 */
[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из строки конфигурации
 *
 * Неизвестная строка даёт Info.
 */
[[nodiscard]] LogLevel parse_level(std::string_view text) noexcept;

// =============================================================================
// Logger
// =============================================================================

/**
 * @brief Конфигурация логгера
 */
struct LoggerConfig {
    /// @brief Минимальный выводимый уровень
    LogLevel level{LogLevel::Info};

    /// @brief Включить ANSI цвета
    bool color{true};

    /// @brief Выводить метку времени
    bool timestamps{true};
};

/**
 * @brief Приёмник строк лога (по умолчанию stderr)
 */
using LogSink = std::function<void(LogLevel level, std::string_view line)>;

/**
 * @brief Логгер процесса
 */
class Logger {
public:
    /**
     * @brief Получить единственный экземпляр
     */
    static Logger& instance();

    // Запрещаем копирование
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Установить конфигурацию
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Перенаправить вывод (пустой sink = stderr)
     */
    void set_sink(LogSink sink);

    /**
     * @brief Записать сообщение
     */
    void write(LogLevel level, std::string_view message);

    /**
     * @brief Будет ли выведен уровень
     */
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

private:
    Logger() = default;
    ~Logger() = default;

    std::string format_line(LogLevel level, std::string_view message) const;

    LoggerConfig config_;
    std::atomic<LogLevel> level_{LogLevel::Info};
    LogSink sink_;
    std::mutex mutex_;
};

// =============================================================================
// Свободные функции
// =============================================================================

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    auto& logger = Logger::instance();
    if (logger.enabled(LogLevel::Debug)) {
        logger.write(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    auto& logger = Logger::instance();
    if (logger.enabled(LogLevel::Info)) {
        logger.write(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    auto& logger = Logger::instance();
    if (logger.enabled(LogLevel::Warning)) {
        logger.write(LogLevel::Warning, std::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    Logger::instance().write(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace axectl::log
