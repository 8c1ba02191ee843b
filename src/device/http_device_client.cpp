/**
 * @file http_device_client.cpp
 * @brief Реализация HTTP клиента устройств
 *
 * Использует libcurl. Один easy handle на запрос, глобальная
 * инициализация выполняется один раз.
 */

#include "http_device_client.hpp"
#include "../log/logger.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <format>

namespace axectl::device {

// =============================================================================
// CURL callback
// =============================================================================

namespace {

std::size_t write_callback(
    char* ptr,
    std::size_t size,
    std::size_t nmemb,
    void* userdata
) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

// Глобальная инициализация CURL
std::atomic<bool> curl_initialized{false};

void ensure_curl_init() {
    bool expected = false;
    if (curl_initialized.compare_exchange_strong(expected, true)) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
}

/**
 * @brief Ответ HTTP запроса
 */
struct HttpResponse {
    long http_code = 0;
    std::string body;
    std::chrono::milliseconds latency{0};
};

enum class Method {
    Get,
    Post,
    Patch
};

/**
 * @brief Транспортная ошибка CURL в код ошибки
 */
ErrorCode classify_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::NetworkTimeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
            return ErrorCode::NetworkUnreachable;
        default:
            return ErrorCode::NetworkConnectionFailed;
    }
}

bool is_success(long http_code) noexcept {
    return http_code >= 200 && http_code < 300;
}

} // anonymous namespace

// =============================================================================
// HttpDeviceClient::Impl
// =============================================================================

struct HttpDeviceClient::Impl {
    ClientConfig config;

    explicit Impl(const ClientConfig& cfg) : config(cfg) {
        ensure_curl_init();
    }

    /**
     * @brief URL эндпоинта (IPv6 адрес берётся в скобки)
     */
    static std::string make_url(std::string_view address, std::string_view path) {
        if (address.find(':') != std::string_view::npos) {
            return std::format("http://[{}]{}", address, path);
        }
        return std::format("http://{}{}", address, path);
    }

    /**
     * @brief Выполнить HTTP запрос
     *
     * Ошибка возвращается только при отсутствии ответа. Код ответа
     * проверяет вызывающий.
     */
    Result<HttpResponse> perform(
        Method method,
        std::string_view address,
        std::string_view path,
        std::chrono::milliseconds timeout,
        const std::string& body = {}
    ) const {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Err<HttpResponse>(ErrorCode::NetworkConnectionFailed, "CURL не инициализирован");
        }

        auto url = make_url(address, path);
        HttpResponse response;

        // Подключение не дольше общего таймаута запроса
        auto connect_timeout = std::min<long>(
            static_cast<long>(config.connect_timeout_seconds) * 1000,
            static_cast<long>(timeout.count())
        );

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

        struct curl_slist* headers = nullptr;
        switch (method) {
            case Method::Get:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case Method::Post:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
                break;
            case Method::Patch:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PATCH");
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
                headers = curl_slist_append(headers, "Content-Type: application/json");
                curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
                break;
        }

        auto started = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started
        );

        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.http_code);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            return Err<HttpResponse>(
                classify_curl_error(res),
                std::format("{}: {}", url, curl_easy_strerror(res))
            );
        }

        return response;
    }

    /**
     * @brief Получить и декодировать /api/system/info
     */
    Result<DeviceResponse> fetch_info(std::string_view address, std::chrono::milliseconds timeout) const {
        auto response = perform(Method::Get, address, constants::API_SYSTEM_INFO, timeout);
        if (!response) {
            return std::unexpected(response.error());
        }

        if (!is_success(response->http_code)) {
            return Err<DeviceResponse>(
                ErrorCode::DeviceHttpError,
                std::format("{}: HTTP ошибка: {}", address, response->http_code)
            );
        }

        return decode_device_response(response->body);
    }

    /**
     * @brief Выполнить команду управления
     */
    Result<void> control(
        Method method,
        std::string_view address,
        std::string_view path,
        std::chrono::milliseconds timeout,
        const std::string& body
    ) const {
        auto response = perform(method, address, path, timeout, body);
        if (!response) {
            return std::unexpected(response.error());
        }

        if (!is_success(response->http_code)) {
            return Err<void>(
                ErrorCode::DeviceControlFailed,
                std::format("{}: HTTP ошибка: {}", address, response->http_code)
            );
        }

        return {};
    }
};

// =============================================================================
// HttpDeviceClient
// =============================================================================

HttpDeviceClient::HttpDeviceClient(const ClientConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

HttpDeviceClient::~HttpDeviceClient() = default;

HttpDeviceClient::HttpDeviceClient(HttpDeviceClient&&) noexcept = default;
HttpDeviceClient& HttpDeviceClient::operator=(HttpDeviceClient&&) noexcept = default;

HealthStatus HttpDeviceClient::probe(std::string_view address, std::chrono::milliseconds timeout) {
    HealthStatus status;

    auto response = impl_->perform(Method::Get, address, constants::API_SYSTEM_INFO, timeout);
    if (!response) {
        log::debug("Проба {}: {}", address, response.error().message);
        return status;
    }

    status.http_code = response->http_code;
    status.latency = response->latency;
    status.state = is_success(response->http_code)
        ? HealthStatus::State::Healthy
        : HealthStatus::State::Unhealthy;
    return status;
}

Result<DeviceIdentity> HttpDeviceClient::fetch_identity(
    std::string_view address,
    std::chrono::milliseconds timeout
) {
    auto response = impl_->fetch_info(address, timeout);
    if (!response) {
        return std::unexpected(response.error());
    }

    return DeviceIdentity{to_unified_info(*response), device_type_of(*response)};
}

Result<DeviceStats> HttpDeviceClient::fetch_stats(
    std::string_view address,
    std::chrono::milliseconds timeout
) {
    auto response = impl_->fetch_info(address, timeout);
    if (!response) {
        return std::unexpected(response.error());
    }

    return make_device_stats(
        to_unified_info(*response),
        to_unified_stats(*response),
        std::chrono::system_clock::now()
    );
}

Result<void> HttpDeviceClient::restart(std::string_view address, std::chrono::milliseconds timeout) {
    return impl_->control(Method::Post, address, constants::API_SYSTEM_RESTART, timeout, {});
}

Result<void> HttpDeviceClient::set_fan_speed(
    std::string_view address,
    uint32_t percent,
    std::chrono::milliseconds timeout
) {
    if (percent > 100) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Скорость вентилятора вне диапазона 0..100: {}", percent)
        );
    }

    nlohmann::json body = {{"fanspeed", percent}};
    return impl_->control(Method::Patch, address, constants::API_SYSTEM, timeout, body.dump());
}

Result<void> HttpDeviceClient::update_settings(
    std::string_view address,
    const nlohmann::json& settings,
    std::chrono::milliseconds timeout
) {
    if (!settings.is_object() || settings.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Настройки должны быть непустым JSON объектом");
    }

    auto body = settings.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return impl_->control(Method::Patch, address, constants::API_SYSTEM, timeout, body);
}

} // namespace axectl::device
