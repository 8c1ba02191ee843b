/**
 * @file types.hpp
 * @brief Базовые типы axectl
 *
 * Определяет основные типы, используемые во всём проекте:
 * - ErrorCode: коды ошибок, сгруппированные по подсистемам
 * - Error: код + человекочитаемое сообщение
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Ошибки передаются значениями. Исключения сторонних библиотек
 *       (toml++, nlohmann/json) перехватываются на месте вызова.
 */

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace axectl {

// =============================================================================
// Коды ошибок axectl
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Диапазоны соответствуют подсистемам. Ошибки сети и разбора ответов
 * устройств восстанавливаются локально (устройство считается недоступным),
 * ошибки конфигурации фатальны до входа в любой цикл.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,
    ConfigMissingPath = 103,

    // Ошибки сети (200-299)
    NetworkConnectionFailed = 200,
    NetworkTimeout = 201,
    NetworkUnreachable = 202,
    NetworkSocketError = 203,

    // Ошибки REST API устройства (300-399)
    DeviceHttpError = 300,
    DeviceParseError = 301,
    DeviceUnknownType = 302,
    DeviceControlFailed = 303,

    // Ошибки обнаружения (400-499)
    DiscoveryInvalidRange = 400,
    DiscoveryInvalidAddress = 401,
    DiscoveryNoLocalAddress = 402,
    DiscoveryIpv6Unsupported = 403,

    // Ошибки mDNS (500-599)
    MdnsClientError = 500,
    MdnsBrowseFailed = 501,

    // Ошибки кэша устройств (600-699)
    CacheIOError = 600,
    CacheParseError = 601,

    // Системные ошибки (800-899)
    SystemIOError = 801,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::ConfigMissingPath: return "Не указан обязательный путь";
        case ErrorCode::NetworkConnectionFailed: return "Ошибка подключения";
        case ErrorCode::NetworkTimeout: return "Таймаут сети";
        case ErrorCode::NetworkUnreachable: return "Узел недоступен";
        case ErrorCode::NetworkSocketError: return "Ошибка сокета";
        case ErrorCode::DeviceHttpError: return "HTTP ошибка устройства";
        case ErrorCode::DeviceParseError: return "Некорректный ответ устройства";
        case ErrorCode::DeviceUnknownType: return "Неизвестный тип устройства";
        case ErrorCode::DeviceControlFailed: return "Команда управления не выполнена";
        case ErrorCode::DiscoveryInvalidRange: return "Некорректный диапазон адресов";
        case ErrorCode::DiscoveryInvalidAddress: return "Некорректный IP адрес";
        case ErrorCode::DiscoveryNoLocalAddress: return "Не найден локальный IPv4 адрес";
        case ErrorCode::DiscoveryIpv6Unsupported: return "Обнаружение по IPv6 не поддерживается";
        case ErrorCode::MdnsClientError: return "avahi-daemon недоступен";
        case ErrorCode::MdnsBrowseFailed: return "Сбой mDNS обзора";
        case ErrorCode::CacheIOError: return "Ошибка ввода/вывода кэша";
        case ErrorCode::CacheParseError: return "Ошибка разбора кэша";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        default: return "Неизвестная ошибка";
    }
}

/**
 * @brief Ошибка конфигурации (фатальна до входа в цикл)?
 */
[[nodiscard]] constexpr bool is_configuration_error(ErrorCode code) noexcept {
    auto value = static_cast<int>(code);
    return (value >= 100 && value < 200) ||
           code == ErrorCode::DiscoveryInvalidRange ||
           code == ErrorCode::DiscoveryInvalidAddress;
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * Result<NetworkRange> range = NetworkRange::parse("192.168.1.0/24");
 * if (!range) {
 *     std::cerr << range.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace axectl
