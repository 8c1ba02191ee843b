/**
 * @file mdns_browser.cpp
 * @brief Реализация mDNS обнаружения
 */

#include "mdns_browser.hpp"
#include "../core/worker_pool.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace axectl::discovery {

namespace {

/// @brief Параллелизм подтверждения записей
constexpr std::size_t CONFIRM_PARALLEL = 8;

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

/**
 * @brief Сравнение имён DNS без учёта регистра и завершающей точки
 */
bool same_name(std::string_view a, std::string_view b) {
    if (!a.empty() && a.back() == '.') a.remove_suffix(1);
    if (!b.empty() && b.back() == '.') b.remove_suffix(1);
    return to_lower(a) == to_lower(b);
}

} // anonymous namespace

std::string strip_local_suffix(std::string_view hostname) {
    constexpr std::string_view SUFFIX = ".local.";
    std::string name(hostname);
    if (name.size() > SUFFIX.size() && to_lower(name).ends_with(SUFFIX)) {
        name.resize(name.size() - SUFFIX.size());
    } else if (name.size() > 6 && to_lower(name).ends_with(".local")) {
        name.resize(name.size() - 6);
    }
    return name;
}

// =============================================================================
// Сборка записей
// =============================================================================

std::vector<ServiceRecord> assemble_records(
    std::string_view service_type,
    const std::vector<ResolvedService>& resolved
) {
    std::vector<ServiceRecord> result;
    std::map<std::string, std::size_t> index_by_fullname;

    for (const auto& service : resolved) {
        if (!same_name(service.type + "." + service.domain, service_type)) {
            continue;
        }

        auto fullname = service.name + "." + service.type + "." + service.domain + ".";
        auto [it, inserted] = index_by_fullname.try_emplace(to_lower(fullname), result.size());

        if (inserted) {
            ServiceRecord record;
            record.fullname = fullname;
            record.hostname = service.hostname;
            if (!record.hostname.empty() && record.hostname.back() != '.') {
                record.hostname += '.';
            }
            record.port = service.port;
            record.service_type = std::string(service_type);
            record.txt = service.txt;
            result.push_back(std::move(record));
        }

        auto& record = result[it->second];
        if (!service.address.empty() &&
            std::find(record.addresses.begin(), record.addresses.end(), service.address) == record.addresses.end()) {
            record.addresses.push_back(service.address);
        }
        // Первый ответ мог прийти без TXT
        for (const auto& [key, value] : service.txt) {
            record.txt.try_emplace(key, value);
        }
    }

    // IPv4 первыми: именно их проверяет проба
    for (auto& record : result) {
        std::stable_partition(record.addresses.begin(), record.addresses.end(),
                              [](const std::string& a) { return a.find(':') == std::string::npos; });
    }

    return result;
}

std::string avahi_service_type(std::string_view service_type) {
    if (service_type.ends_with('.')) {
        service_type.remove_suffix(1);
    }
    constexpr std::string_view DOMAIN = ".local";
    if (service_type.size() > DOMAIN.size() && to_lower(service_type).ends_with(DOMAIN)) {
        service_type.remove_suffix(DOMAIN.size());
    }
    return std::string(service_type);
}

std::pair<std::string, std::string> parse_txt_entry(std::string_view entry) {
    auto eq = entry.find('=');
    if (eq == std::string_view::npos) {
        return {std::string(entry), std::string()};
    }
    return {std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1))};
}

// =============================================================================
// MdnsBrowser
// =============================================================================

bool MdnsBrowser::is_potential_device(const ServiceRecord& record) {
    auto hostname = to_lower(record.hostname);
    if (contains(hostname, "bitaxe") || contains(hostname, "nerdqaxe") || contains(hostname, "axe")) {
        return true;
    }

    if (contains(record.service_type, "_axeos") ||
        contains(record.service_type, "_bitaxe") ||
        contains(record.service_type, "_nerdqaxe")) {
        return true;
    }

    for (const auto& [key, value] : record.txt) {
        auto key_lower = to_lower(key);
        auto value_lower = to_lower(value);

        if (contains(key_lower, "model") &&
            (contains(value_lower, "bitaxe") || contains(value_lower, "nerdqaxe"))) {
            return true;
        }
        if (contains(key_lower, "firmware") && contains(value_lower, "axeos")) {
            return true;
        }
    }

    if (record.port == 80) {
        return true;
    }

    return contains(record.service_type, "_http._tcp");
}

std::vector<ServiceRecord> MdnsBrowser::browse() const {
    if (config_.service_types.empty()) {
        return {};
    }

    auto slice = config_.budget / static_cast<int64_t>(config_.service_types.size());

    std::map<std::string, ServiceRecord> by_fullname;
    for (const auto& service : config_.service_types) {
        auto records = resolver_.browse(service, slice);
        if (!records) {
            log::warn("mDNS обзор {} не удался: {}", service, records.error().message);
            continue;
        }

        log::debug("mDNS {}: записей {}", service, records->size());
        for (auto& record : *records) {
            auto key = record.fullname;
            by_fullname.insert_or_assign(std::move(key), std::move(record));
        }
    }

    std::vector<ServiceRecord> result;
    result.reserve(by_fullname.size());
    for (auto& [name, record] : by_fullname) {
        result.push_back(std::move(record));
    }
    return result;
}

std::optional<device::Device> MdnsBrowser::confirm(const ServiceRecord& record) const {
    for (const auto& address : record.addresses) {
        auto probe = prober_.probe(address, config_.probe_timeout);

        switch (probe.state) {
            case ProbeResult::State::Identified:
                return std::move(probe.device);

            case ProbeResult::State::Unclassified: {
                auto now = std::chrono::system_clock::now();
                device::Device device;
                device.name = strip_local_suffix(record.hostname);
                device.ip_address = address;
                device.device_type = device::DeviceType::Unknown;
                device.status = device::DeviceStatus::Online;
                device.discovered_at = now;
                device.last_seen = now;
                return device;
            }

            case ProbeResult::State::Unreachable:
                break;
        }
    }
    return std::nullopt;
}

std::vector<device::Device> MdnsBrowser::discover() const {
    auto records = browse();

    std::vector<ServiceRecord> candidates;
    for (auto& record : records) {
        if (is_potential_device(record)) {
            candidates.push_back(std::move(record));
        }
    }

    log::info("mDNS: записей {}, правдоподобных {}", records.size(), candidates.size());

    auto confirmed = parallel_map<std::optional<device::Device>>(candidates, CONFIRM_PARALLEL,
        [this](const ServiceRecord& record) { return confirm(record); });

    std::vector<device::Device> devices;
    std::set<std::string> seen;
    for (auto& device : confirmed) {
        if (device && seen.insert(device->ip_address).second) {
            devices.push_back(std::move(*device));
        }
    }
    return devices;
}

} // namespace axectl::discovery
