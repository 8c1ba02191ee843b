/**
 * @file network_range.cpp
 * @brief Реализация диапазона адресов
 */

#include "network_range.hpp"
#include "../core/constants.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>

// POSIX сокеты
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace axectl::discovery {

namespace {

/**
 * @brief Разобрать адрес в сетевой порядок байт
 *
 * @return Количество байт (4 или 16) или 0 при ошибке
 */
std::size_t parse_address(std::string_view text, std::array<uint8_t, 16>& out) {
    std::string address(text);
    out.fill(0);

    struct in_addr addr4{};
    if (inet_pton(AF_INET, address.c_str(), &addr4) == 1) {
        std::memcpy(out.data(), &addr4, 4);
        return 4;
    }

    struct in6_addr addr6{};
    if (inet_pton(AF_INET6, address.c_str(), &addr6) == 1) {
        std::memcpy(out.data(), &addr6, 16);
        return 16;
    }

    return 0;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

} // anonymous namespace

// =============================================================================
// Свободные функции
// =============================================================================

bool is_valid_address(std::string_view address) {
    std::array<uint8_t, 16> bytes{};
    return parse_address(address, bytes) != 0;
}

bool is_private_address(std::string_view address) {
    std::array<uint8_t, 16> b{};
    auto size = parse_address(address, b);

    if (size == 4) {
        return b[0] == 10 ||
               (b[0] == 172 && b[1] >= 16 && b[1] <= 31) ||
               (b[0] == 192 && b[1] == 168) ||
               b[0] == 127 ||
               (b[0] == 169 && b[1] == 254);
    }

    if (size == 16) {
        bool loopback = std::all_of(b.begin(), b.begin() + 15, [](uint8_t v) { return v == 0; }) &&
                        b[15] == 1;
        bool unique_local = (b[0] & 0xFE) == 0xFC;
        bool link_local = b[0] == 0xFE && (b[1] & 0xC0) == 0x80;
        return loopback || unique_local || link_local;
    }

    return false;
}

// =============================================================================
// NetworkRange
// =============================================================================

Result<NetworkRange> NetworkRange::parse(std::string_view text) {
    auto input = trim(text);
    if (input.empty()) {
        return Err<NetworkRange>(ErrorCode::DiscoveryInvalidRange, "Пустой диапазон адресов");
    }

    auto slash = input.find('/');
    auto address_part = input.substr(0, slash);

    Bytes bytes{};
    auto size = parse_address(address_part, bytes);
    if (size == 0) {
        return Err<NetworkRange>(
            ErrorCode::DiscoveryInvalidRange,
            std::format("Некорректный адрес в диапазоне '{}'", text)
        );
    }

    const uint8_t max_prefix = size == 4 ? 32 : 128;
    uint8_t prefix = max_prefix;

    if (slash != std::string_view::npos) {
        auto prefix_part = input.substr(slash + 1);
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(prefix_part.data(), prefix_part.data() + prefix_part.size(), value);
        if (prefix_part.empty() || ec != std::errc{} ||
            ptr != prefix_part.data() + prefix_part.size() || value > max_prefix) {
            return Err<NetworkRange>(
                ErrorCode::DiscoveryInvalidRange,
                std::format("Некорректная длина префикса в диапазоне '{}'", text)
            );
        }
        prefix = static_cast<uint8_t>(value);
    }

    // Маскируем биты хоста
    for (std::size_t i = 0; i < size; ++i) {
        auto bit_start = i * 8;
        if (bit_start >= prefix) {
            bytes[i] = 0;
        } else if (bit_start + 8 > prefix) {
            auto keep = prefix - bit_start;
            bytes[i] &= static_cast<uint8_t>(0xFF << (8 - keep));
        }
    }

    return NetworkRange(size == 4 ? Family::V4 : Family::V6, bytes, prefix);
}

Result<NetworkRange> NetworkRange::from_local_address(std::string_view address) {
    Bytes bytes{};
    auto size = parse_address(address, bytes);
    if (size == 16) {
        return Err<NetworkRange>(
            ErrorCode::DiscoveryIpv6Unsupported,
            "Автоопределение сети по IPv6 не поддерживается"
        );
    }
    if (size != 4) {
        return Err<NetworkRange>(
            ErrorCode::DiscoveryInvalidAddress,
            std::format("Некорректный локальный адрес '{}'", address)
        );
    }

    // 192.168.x.0/24, 10.a.b.0/24, 172.N.x.0/24 и остальные: всегда /24 адреса
    return parse(std::format("{}/24", address));
}

Result<NetworkRange> NetworkRange::detect() {
    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        return Err<NetworkRange>(
            ErrorCode::DiscoveryNoLocalAddress,
            std::format("getifaddrs: {}", std::strerror(errno))
        );
    }

    std::vector<std::string> ipv4;
    bool has_ipv6 = false;

    for (auto* it = list; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr) {
            continue;
        }
        if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }

        if (it->ifa_addr->sa_family == AF_INET) {
            char ip_str[INET_ADDRSTRLEN];
            auto* addr = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
            if (inet_ntop(AF_INET, &addr->sin_addr, ip_str, sizeof(ip_str)) != nullptr) {
                ipv4.emplace_back(ip_str);
            }
        } else if (it->ifa_addr->sa_family == AF_INET6) {
            has_ipv6 = true;
        }
    }

    freeifaddrs(list);

    if (ipv4.empty()) {
        if (has_ipv6) {
            return Err<NetworkRange>(
                ErrorCode::DiscoveryIpv6Unsupported,
                "Найдены только IPv6 адреса, автоопределение сети не поддерживается"
            );
        }
        return Err<NetworkRange>(ErrorCode::DiscoveryNoLocalAddress);
    }

    auto chosen = std::find_if(ipv4.begin(), ipv4.end(), [](const std::string& ip) {
        return is_private_address(ip);
    });
    const auto& local = chosen != ipv4.end() ? *chosen : ipv4.front();

    log::debug("Локальный адрес для автоопределения сети: {}", local);
    return from_local_address(local);
}

std::vector<NetworkRange> NetworkRange::fallback_networks() {
    static constexpr std::array<std::string_view, 5> NETWORKS = {
        "192.168.1.0/24",
        "192.168.0.0/24",
        "10.0.0.0/24",
        "172.16.0.0/24",
        "192.168.100.0/24",
    };

    std::vector<NetworkRange> result;
    for (auto network : NETWORKS) {
        if (auto range = parse(network)) {
            result.push_back(*range);
        }
    }
    return result;
}

std::size_t NetworkRange::host_count() const noexcept {
    auto host_bits = static_cast<unsigned>(width() * 8 - prefix_);

    if (family_ == Family::V4) {
        return static_cast<std::size_t>(uint64_t{1} << host_bits);
    }

    // 2^10 уже больше ограничения
    if (host_bits >= 10) {
        return constants::IPV6_ADDRESS_CAP;
    }
    return std::min<std::size_t>(std::size_t{1} << host_bits, constants::IPV6_ADDRESS_CAP);
}

NetworkRange::Bytes NetworkRange::nth_address(uint64_t offset) const noexcept {
    Bytes result = network_;
    uint64_t carry = offset;

    for (std::size_t i = width(); i-- > 0 && carry > 0;) {
        uint64_t sum = result[i] + (carry & 0xFF);
        result[i] = static_cast<uint8_t>(sum & 0xFF);
        carry = (carry >> 8) + (sum >> 8);
    }
    return result;
}

std::string NetworkRange::format_address(const Bytes& bytes) const {
    if (family_ == Family::V4) {
        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, bytes.data(), ip_str, sizeof(ip_str));
        return ip_str;
    }

    char ip_str[INET6_ADDRSTRLEN];
    inet_ntop(AF_INET6, bytes.data(), ip_str, sizeof(ip_str));
    return ip_str;
}

std::vector<std::string> NetworkRange::addresses() const {
    auto count = host_count();
    std::vector<std::string> result;
    result.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        result.push_back(format_address(nth_address(i)));
    }
    return result;
}

std::string NetworkRange::to_string() const {
    return std::format("{}/{}", format_address(network_), prefix_);
}

std::string NetworkRange::first_host() const {
    return format_address(network_);
}

std::string NetworkRange::last_host() const {
    return format_address(nth_address(host_count() - 1));
}

bool NetworkRange::is_private() const {
    return is_private_address(first_host());
}

} // namespace axectl::discovery
