/**
 * @file avahi_resolver.hpp
 * @brief Резолвер mDNS поверх avahi-client
 *
 * Каждый вызов browse() открывает собственное соединение с avahi-daemon,
 * просматривает тип сервиса и разрешает найденные экземпляры, пока
 * не истечёт отведённое время.
 */

#pragma once

#include "mdns_browser.hpp"

#include <chrono>
#include <memory>
#include <string_view>
#include <vector>

namespace axectl::discovery {

/**
 * @brief Резолвер через avahi-daemon
 *
 * Обзор завершается раньше срока, когда демон сообщил, что кэш
 * исчерпан, и все начатые разрешения закончились.
 */
class AvahiMdnsResolver : public MdnsResolver {
public:
    /**
     * @param poll_step Максимальный шаг ожидания событий avahi
     */
    explicit AvahiMdnsResolver(
        std::chrono::milliseconds poll_step = constants::MDNS_EVENT_TIMEOUT
    );
    ~AvahiMdnsResolver() override;

    // Запрещаем копирование
    AvahiMdnsResolver(const AvahiMdnsResolver&) = delete;
    AvahiMdnsResolver& operator=(const AvahiMdnsResolver&) = delete;

    [[nodiscard]] Result<std::vector<ServiceRecord>> browse(
        std::string_view service_type,
        std::chrono::milliseconds slice
    ) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace axectl::discovery
