/**
 * @file network_range.hpp
 * @brief Диапазон адресов для сканирования
 *
 * Диапазон задаётся строкой CIDR ("192.168.1.0/24") или определяется
 * автоматически по локальному интерфейсу. Биты хоста маскируются при
 * разборе, поэтому "192.168.1.77/24" даёт 192.168.1.0/24.
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace axectl::discovery {

/**
 * @brief Приватный ли адрес
 *
 * IPv4: RFC1918, loopback, link-local. IPv6: loopback, ULA (fc00::/7),
 * link-local (fe80::/10). Некорректная строка даёт false.
 */
[[nodiscard]] bool is_private_address(std::string_view address);

/**
 * @brief Проверить синтаксис IPv4/IPv6 адреса
 */
[[nodiscard]] bool is_valid_address(std::string_view address);

/**
 * @brief Неизменяемый блок адресов CIDR
 */
class NetworkRange {
public:
    enum class Family {
        V4,
        V6
    };

    /**
     * @brief Разобрать "a.b.c.d/p" или "x::/p"
     *
     * Адрес без префикса означает один узел (/32 или /128).
     *
     * @return Диапазон или DiscoveryInvalidRange
     */
    [[nodiscard]] static Result<NetworkRange> parse(std::string_view text);

    /**
     * @brief Определить /24 по основному локальному IPv4 адресу
     *
     * Loopback и выключенные интерфейсы пропускаются, приватные адреса
     * предпочтительнее.
     *
     * @return Диапазон, DiscoveryNoLocalAddress или DiscoveryIpv6Unsupported
     */
    [[nodiscard]] static Result<NetworkRange> detect();

    /**
     * @brief /24, содержащий локальный IPv4 адрес
     */
    [[nodiscard]] static Result<NetworkRange> from_local_address(std::string_view address);

    /**
     * @brief Типичные домашние сети для перебора вслепую
     */
    [[nodiscard]] static std::vector<NetworkRange> fallback_networks();

    /**
     * @brief Все адреса блока по возрастанию
     *
     * Для IPv4 включает адрес сети и broadcast. Для IPv6 не более 1000.
     */
    [[nodiscard]] std::vector<std::string> addresses() const;

    /**
     * @brief Каноническая запись CIDR
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] Family family() const noexcept { return family_; }
    [[nodiscard]] uint8_t prefix_length() const noexcept { return prefix_; }

    [[nodiscard]] std::string first_host() const;
    [[nodiscard]] std::string last_host() const;

    /**
     * @brief Количество адресов (для IPv6 с учётом ограничения)
     */
    [[nodiscard]] std::size_t host_count() const noexcept;

    [[nodiscard]] bool is_private() const;

    /**
     * @brief Оценка длительности последовательного сканирования
     */
    [[nodiscard]] uint64_t estimated_scan_seconds(uint64_t ms_per_host) const noexcept {
        return static_cast<uint64_t>(host_count()) * ms_per_host / 1000;
    }

    [[nodiscard]] bool operator==(const NetworkRange&) const = default;

private:
    using Bytes = std::array<uint8_t, 16>;

    NetworkRange(Family family, const Bytes& network, uint8_t prefix) noexcept
        : family_(family), network_(network), prefix_(prefix) {}

    [[nodiscard]] std::size_t width() const noexcept {
        return family_ == Family::V4 ? 4 : 16;
    }

    [[nodiscard]] std::string format_address(const Bytes& bytes) const;

    [[nodiscard]] Bytes nth_address(uint64_t offset) const noexcept;

    Family family_ = Family::V4;
    Bytes network_{};
    uint8_t prefix_ = 32;
};

} // namespace axectl::discovery
