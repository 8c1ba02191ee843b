/**
 * @file avahi_resolver.cpp
 * @brief Реализация резолвера avahi-client
 *
 * Цикл событий avahi_simple_poll крутится в вызывающем потоке шагами
 * не длиннее poll_step. Ответы, пришедшие после истечения slice,
 * не обрабатываются: соединение закрывается вместе с незавершёнными
 * разрешениями.
 */

#include "avahi_resolver.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <string>

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/simple-watch.h>
#include <avahi-common/strlst.h>

namespace axectl::discovery {

namespace {

using PollPtr = std::unique_ptr<AvahiSimplePoll, decltype(&avahi_simple_poll_free)>;
using ClientPtr = std::unique_ptr<AvahiClient, decltype(&avahi_client_free)>;
using BrowserPtr = std::unique_ptr<AvahiServiceBrowser, decltype(&avahi_service_browser_free)>;

/**
 * @brief Состояние одного обзора, общее для обратных вызовов
 */
struct BrowseSession {
    AvahiSimplePoll* poll = nullptr;
    std::vector<ResolvedService> resolved;

    /// @brief Начатые и ещё не завершённые разрешения
    std::size_t pending = 0;

    /// @brief Демон выдал всё, что знал на момент запроса
    bool all_for_now = false;

    std::optional<std::string> failure;

    [[nodiscard]] bool finished() const noexcept {
        return failure.has_value() || (all_for_now && pending == 0);
    }
};

void client_callback(AvahiClient* client, AvahiClientState state, void* userdata) {
    auto* session = static_cast<BrowseSession*>(userdata);
    if (state == AVAHI_CLIENT_FAILURE) {
        session->failure = avahi_strerror(avahi_client_errno(client));
        avahi_simple_poll_quit(session->poll);
    }
}

void resolve_callback(
    AvahiServiceResolver* resolver,
    AvahiIfIndex /*interface*/,
    AvahiProtocol /*protocol*/,
    AvahiResolverEvent event,
    const char* name,
    const char* type,
    const char* domain,
    const char* host_name,
    const AvahiAddress* address,
    uint16_t port,
    AvahiStringList* txt,
    AvahiLookupResultFlags /*flags*/,
    void* userdata
) {
    auto* session = static_cast<BrowseSession*>(userdata);

    if (event == AVAHI_RESOLVER_FOUND) {
        ResolvedService service;
        service.name = name;
        service.type = type;
        service.domain = domain;
        service.hostname = host_name ? host_name : "";
        service.port = port;

        if (address) {
            char text[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(text, sizeof(text), address);
            service.address = text;
        }

        for (AvahiStringList* item = txt; item; item = avahi_string_list_get_next(item)) {
            std::string_view entry(
                reinterpret_cast<const char*>(avahi_string_list_get_text(item)),
                avahi_string_list_get_size(item)
            );
            auto [key, value] = parse_txt_entry(entry);
            if (!key.empty()) {
                service.txt.insert_or_assign(std::move(key), std::move(value));
            }
        }

        session->resolved.push_back(std::move(service));
    } else {
        log::debug("mDNS: не удалось разрешить {}: {}", name,
                   avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(resolver))));
    }

    if (session->pending > 0) {
        --session->pending;
    }
    avahi_service_resolver_free(resolver);
}

void browse_callback(
    AvahiServiceBrowser* browser,
    AvahiIfIndex interface,
    AvahiProtocol protocol,
    AvahiBrowserEvent event,
    const char* name,
    const char* type,
    const char* domain,
    AvahiLookupResultFlags /*flags*/,
    void* userdata
) {
    auto* session = static_cast<BrowseSession*>(userdata);
    AvahiClient* client = avahi_service_browser_get_client(browser);

    switch (event) {
        case AVAHI_BROWSER_NEW:
            if (avahi_service_resolver_new(client, interface, protocol, name, type, domain,
                                           AVAHI_PROTO_UNSPEC, static_cast<AvahiLookupFlags>(0),
                                           resolve_callback, session)) {
                ++session->pending;
            } else {
                log::debug("mDNS: резолвер для {} не создан: {}", name,
                           avahi_strerror(avahi_client_errno(client)));
            }
            break;

        case AVAHI_BROWSER_ALL_FOR_NOW:
            session->all_for_now = true;
            break;

        case AVAHI_BROWSER_FAILURE:
            session->failure = avahi_strerror(avahi_client_errno(client));
            avahi_simple_poll_quit(session->poll);
            break;

        case AVAHI_BROWSER_REMOVE:
        case AVAHI_BROWSER_CACHE_EXHAUSTED:
            break;
    }
}

} // anonymous namespace

// =============================================================================
// AvahiMdnsResolver
// =============================================================================

struct AvahiMdnsResolver::Impl {
    std::chrono::milliseconds poll_step;

    explicit Impl(std::chrono::milliseconds step) : poll_step(step) {}

    /**
     * @brief Крутить цикл событий до конца slice или завершения обзора
     */
    void run(BrowseSession& session, std::chrono::milliseconds slice) const {
        auto deadline = std::chrono::steady_clock::now() + slice;

        while (!session.finished()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()
            );
            if (remaining.count() <= 0) {
                break;
            }

            auto wait = std::min(remaining, poll_step);
            if (avahi_simple_poll_iterate(session.poll, static_cast<int>(wait.count())) != 0) {
                break;  // Выход по avahi_simple_poll_quit или ошибка цикла
            }
        }
    }
};

AvahiMdnsResolver::AvahiMdnsResolver(std::chrono::milliseconds poll_step)
    : impl_(std::make_unique<Impl>(poll_step))
{
}

AvahiMdnsResolver::~AvahiMdnsResolver() = default;

Result<std::vector<ServiceRecord>> AvahiMdnsResolver::browse(
    std::string_view service_type,
    std::chrono::milliseconds slice
) {
    using Records = std::vector<ServiceRecord>;

    BrowseSession session;

    PollPtr poll(avahi_simple_poll_new(), &avahi_simple_poll_free);
    if (!poll) {
        return Err<Records>(ErrorCode::MdnsClientError, "Не удалось создать цикл событий avahi");
    }
    session.poll = poll.get();

    int error = 0;
    ClientPtr client(
        avahi_client_new(avahi_simple_poll_get(poll.get()), static_cast<AvahiClientFlags>(0),
                         client_callback, &session, &error),
        &avahi_client_free
    );
    if (!client) {
        return Err<Records>(
            ErrorCode::MdnsClientError,
            std::format("Не удалось подключиться к avahi-daemon: {}", avahi_strerror(error))
        );
    }

    auto type = avahi_service_type(service_type);
    BrowserPtr browser(
        avahi_service_browser_new(client.get(), AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, type.c_str(),
                                  nullptr, static_cast<AvahiLookupFlags>(0), browse_callback, &session),
        &avahi_service_browser_free
    );
    if (!browser) {
        return Err<Records>(
            ErrorCode::MdnsBrowseFailed,
            std::format("Не удалось начать обзор {}: {}", type, avahi_strerror(avahi_client_errno(client.get())))
        );
    }

    impl_->run(session, slice);

    if (session.failure) {
        return Err<Records>(
            ErrorCode::MdnsBrowseFailed,
            std::format("Обзор {} прерван: {}", type, *session.failure)
        );
    }

    if (session.pending > 0) {
        log::debug("mDNS {}: не завершено разрешений {}", type, session.pending);
    }
    return assemble_records(service_type, session.resolved);
}

} // namespace axectl::discovery
