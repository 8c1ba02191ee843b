/**
 * @file mdns_browser.hpp
 * @brief Обнаружение устройств через mDNS
 *
 * Обзор известных типов сервисов, отбор правдоподобных записей
 * эвристикой и подтверждение пробой. Сетевой обмен вынесен
 * за интерфейс MdnsResolver: рабочая реализация AvahiMdnsResolver
 * (avahi_resolver.hpp) работает через avahi-daemon, тесты подставляют
 * поддельный резолвер.
 */

#pragma once

#include "prober.hpp"
#include "../core/constants.hpp"
#include "../device/device_client.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace axectl::discovery {

/**
 * @brief Разрешённый экземпляр сервиса
 */
struct ServiceRecord {
    /// @brief Полное имя экземпляра ("bitaxe._http._tcp.local.")
    std::string fullname;

    /// @brief Имя узла из SRV ("bitaxe.local.")
    std::string hostname;

    std::vector<std::string> addresses;
    uint16_t port = 0;

    /// @brief Тип сервиса ("_http._tcp.local.")
    std::string service_type;

    std::map<std::string, std::string> txt;
};

/**
 * @brief Источник записей mDNS
 */
class MdnsResolver {
public:
    virtual ~MdnsResolver() = default;

    /**
     * @brief Собрать экземпляры сервиса за отведённое время
     *
     * Ответы, пришедшие после истечения slice, отбрасываются.
     */
    [[nodiscard]] virtual Result<std::vector<ServiceRecord>> browse(
        std::string_view service_type,
        std::chrono::milliseconds slice
    ) = 0;
};

/**
 * @brief Один ответ резолвера сервиса
 *
 * Экземпляр, видимый по нескольким интерфейсам или протоколам,
 * приходит несколькими ответами с разными адресами.
 */
struct ResolvedService {
    /// @brief Имя экземпляра ("bitaxe")
    std::string name;

    /// @brief Тип без домена ("_http._tcp")
    std::string type;

    std::string domain = "local";

    /// @brief Имя узла ("bitaxe.local")
    std::string hostname;

    std::string address;
    uint16_t port = 0;
    std::map<std::string, std::string> txt;
};

/**
 * @brief Собрать записи сервиса из ответов резолвера
 *
 * Ответы одного экземпляра объединяются: адреса без повторов, IPv4
 * первыми. Ответы другого типа сервиса пропускаются.
 */
[[nodiscard]] std::vector<ServiceRecord> assemble_records(
    std::string_view service_type,
    const std::vector<ResolvedService>& resolved
);

/**
 * @brief Тип сервиса в форме avahi ("_http._tcp.local." -> "_http._tcp")
 */
[[nodiscard]] std::string avahi_service_type(std::string_view service_type);

/**
 * @brief Разобрать строку TXT "key=value"
 *
 * Строка без '=' даёт ключ с пустым значением.
 */
[[nodiscard]] std::pair<std::string, std::string> parse_txt_entry(std::string_view entry);

/**
 * @brief Параметры mDNS обнаружения
 */
struct MdnsConfig {
    /// @brief Общий бюджет обзора (делится поровну между типами сервисов)
    std::chrono::milliseconds budget = constants::MDNS_DEFAULT_TIMEOUT;

    /// @brief Таймаут подтверждающей пробы
    std::chrono::milliseconds probe_timeout = constants::MDNS_PROBE_TIMEOUT;

    /// @brief Просматриваемые типы сервисов
    std::vector<std::string> service_types{
        constants::MDNS_SERVICE_TYPES.begin(),
        constants::MDNS_SERVICE_TYPES.end()
    };
};

/**
 * @brief Обзор mDNS и подтверждение устройств
 */
class MdnsBrowser {
public:
    MdnsBrowser(MdnsResolver& resolver, device::DeviceClient& client, MdnsConfig config = {})
        : resolver_(resolver), prober_(client), config_(std::move(config)) {}

    /**
     * @brief Собрать записи всех типов сервисов
     *
     * Дубликаты по fullname схлопываются, побеждает последняя запись.
     * Ошибка резолвера по одному типу не прерывает обзор.
     */
    [[nodiscard]] std::vector<ServiceRecord> browse() const;

    /**
     * @brief Обзор, отбор и подтверждение устройств
     *
     * Результат без повторов адресов.
     */
    [[nodiscard]] std::vector<device::Device> discover() const;

    /**
     * @brief Подтвердить запись пробой её адресов по порядку
     *
     * Останавливается на первом отвечающем адресе. Если идентификация
     * не удалась, устройство добавляется как Unknown с именем узла.
     */
    [[nodiscard]] std::optional<device::Device> confirm(const ServiceRecord& record) const;

    /**
     * @brief Эвристика: похожа ли запись на управляемое устройство
     */
    [[nodiscard]] static bool is_potential_device(const ServiceRecord& record);

    [[nodiscard]] const MdnsConfig& config() const noexcept { return config_; }

private:
    MdnsResolver& resolver_;
    Prober prober_;
    MdnsConfig config_;
};

/**
 * @brief Имя устройства из имени узла mDNS ("bitaxe.local." -> "bitaxe")
 */
[[nodiscard]] std::string strip_local_suffix(std::string_view hostname);

} // namespace axectl::discovery
