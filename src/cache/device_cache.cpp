/**
 * @file device_cache.cpp
 * @brief Реализация кэша устройств
 *
 * Сериализация через nlohmann/json. Исключения библиотеки не выходят
 * за пределы load(): повреждённый кэш заменяется пустым.
 */

#include "device_cache.hpp"
#include "../core/constants.hpp"
#include "../device/device_json.hpp"
#include "../log/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace axectl::cache {

namespace fs = std::filesystem;
using nlohmann::json;
using device::DeviceStatus;
using device::DeviceType;

// =============================================================================
// JSON записи кэша
// =============================================================================

void to_json(json& j, const CachedDevice& cached) {
    j = json{
        {"info", cached.info},
        {"stats_history", cached.stats_history},
        {"last_seen", device::format_timestamp(cached.last_seen)},
        {"last_probed", device::format_timestamp(cached.last_probed)},
    };
    if (cached.latest_stats) {
        j["latest_stats"] = *cached.latest_stats;
    } else {
        j["latest_stats"] = nullptr;
    }
}

void from_json(const json& j, CachedDevice& cached) {
    cached.info = j.at("info").get<Device>();
    cached.info.stats.reset();

    auto latest = j.find("latest_stats");
    if (latest != j.end() && !latest->is_null()) {
        cached.latest_stats = latest->get<DeviceStats>();
    }
    cached.stats_history = j.value("stats_history", std::vector<DeviceStats>{});

    auto parse_time = [&j](const char* key) {
        auto parsed = device::parse_timestamp(j.at(key).get<std::string>());
        if (!parsed) {
            throw std::invalid_argument(parsed.error().message);
        }
        return *parsed;
    };
    cached.last_seen = parse_time("last_seen");
    cached.last_probed = parse_time("last_probed");
}

namespace {

/**
 * @brief Тип устройства в формате версии 1 ("BitaxeUltra", ...)
 */
DeviceType parse_legacy_type(std::string_view name) {
    if (name == "BitaxeUltra") return DeviceType::BitaxeUltra;
    if (name == "BitaxeMax") return DeviceType::BitaxeMax;
    if (name == "BitaxeGamma") return DeviceType::BitaxeGamma;
    if (name == "NerdqaxePlus") return DeviceType::NerdqaxePlus;
    return device::parse_json_name(name).value_or(DeviceType::Unknown);
}

} // anonymous namespace

// =============================================================================
// DeviceCache::Impl
// =============================================================================

struct DeviceCache::Impl {
    mutable std::mutex mutex;

    /// @brief Сериализует запись файла: один временный файл на директорию
    mutable std::mutex save_mutex;

    std::map<std::string, CachedDevice, std::less<>> devices;
    Timestamp last_updated = std::chrono::system_clock::now();

    void reset() {
        devices.clear();
        last_updated = std::chrono::system_clock::now();
    }

    void touch() {
        last_updated = std::chrono::system_clock::now();
    }

    CachedDevice* lookup(std::string_view address) {
        auto it = devices.find(address);
        return it != devices.end() ? &it->second : nullptr;
    }

    const CachedDevice* lookup(std::string_view address) const {
        auto it = devices.find(address);
        return it != devices.end() ? &it->second : nullptr;
    }

    static void push_stats(CachedDevice& cached, const DeviceStats& stats) {
        cached.latest_stats = stats;
        cached.stats_history.push_back(stats);
        if (cached.stats_history.size() > constants::STATS_HISTORY_LIMIT) {
            auto excess = cached.stats_history.size() - constants::STATS_HISTORY_LIMIT;
            cached.stats_history.erase(
                cached.stats_history.begin(),
                cached.stats_history.begin() + static_cast<std::ptrdiff_t>(excess)
            );
        }
    }

    /**
     * @brief Устройство для выдачи наружу (stats из latest_stats)
     */
    static Device materialize(const CachedDevice& cached) {
        Device device = cached.info;
        device.stats = cached.latest_stats;
        return device;
    }

    void read_v2(const json& root) {
        if (auto it = root.find("last_updated"); it != root.end() && it->is_string()) {
            if (auto parsed = device::parse_timestamp(it->get<std::string>())) {
                last_updated = *parsed;
            }
        }

        for (const auto& [address, value] : root.at("devices").items()) {
            auto cached = value.get<CachedDevice>();
            cached.info.ip_address = address;
            devices.insert_or_assign(address, std::move(cached));
        }
    }

    void migrate_v1(const json& root) {
        log::debug("Миграция кэша с версии 1 на версию 2");

        for (const auto& [address, value] : root.at("devices").items()) {
            auto seen = device::parse_timestamp(value.at("last_seen").get<std::string>());
            if (!seen) {
                throw std::invalid_argument(seen.error().message);
            }

            CachedDevice cached;
            cached.info.name = value.at("name").get<std::string>();
            cached.info.ip_address = address;
            cached.info.device_type = parse_legacy_type(value.value("device_type", std::string{}));
            if (auto mac = value.find("mac_address"); mac != value.end() && mac->is_string()) {
                cached.info.serial_number = mac->get<std::string>();
            }
            cached.info.status = DeviceStatus::Offline;
            cached.info.discovered_at = *seen;
            cached.info.last_seen = *seen;
            cached.last_seen = *seen;
            cached.last_probed = *seen;

            devices.insert_or_assign(address, std::move(cached));
        }
    }

    json to_document() const {
        json devices_json = json::object();
        for (const auto& [address, cached] : devices) {
            devices_json[address] = cached;
        }

        return json{
            {"version", constants::CACHE_FORMAT_VERSION},
            {"last_updated", device::format_timestamp(last_updated)},
            {"devices", std::move(devices_json)},
        };
    }
};

// =============================================================================
// DeviceCache
// =============================================================================

DeviceCache::DeviceCache()
    : impl_(std::make_unique<Impl>())
{
}

DeviceCache::~DeviceCache() = default;

DeviceCache::DeviceCache(DeviceCache&&) noexcept = default;
DeviceCache& DeviceCache::operator=(DeviceCache&&) noexcept = default;

fs::path DeviceCache::file_path(const fs::path& directory) {
    return directory / constants::CACHE_FILE_NAME;
}

void DeviceCache::load(const fs::path& directory) {
    std::lock_guard lock(impl_->mutex);
    impl_->reset();

    auto path = file_path(directory);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return;
    }

    std::ifstream file(path);
    if (!file) {
        log::warn("Не удалось открыть кэш {}", path.string());
        return;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json root = json::parse(buffer.str(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        log::warn("Кэш {} повреждён, начинаем с пустого", path.string());
        return;
    }

    try {
        auto version = root.value("version", 0u);
        if (version == 1) {
            impl_->migrate_v1(root);
        } else if (version == constants::CACHE_FORMAT_VERSION) {
            impl_->read_v2(root);
        } else {
            log::warn("Неподдерживаемая версия кэша {}, начинаем с пустого", version);
        }
    } catch (const json::exception& e) {
        log::warn("Ошибка разбора кэша {}: {}", path.string(), e.what());
        impl_->reset();
    } catch (const std::invalid_argument& e) {
        log::warn("Ошибка разбора кэша {}: {}", path.string(), e.what());
        impl_->reset();
    }
}

Result<void> DeviceCache::save(const fs::path& directory) const {
    // Держится до rename: монитор и фоновое обнаружение сохраняют из разных потоков
    std::lock_guard save_lock(impl_->save_mutex);

    std::string content;
    {
        std::lock_guard lock(impl_->mutex);
        // Имена из mDNS могут быть не UTF-8
        content = impl_->to_document().dump(2, ' ', false, json::error_handler_t::replace);
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return Err<void>(
            ErrorCode::CacheIOError,
            std::format("Не удалось создать директорию кэша {}: {}", directory.string(), ec.message())
        );
    }

    auto path = file_path(directory);
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            return Err<void>(
                ErrorCode::CacheIOError,
                std::format("Не удалось открыть {} для записи", temp_path.string())
            );
        }
        file << content;
        file.flush();
        if (!file) {
            return Err<void>(
                ErrorCode::CacheIOError,
                std::format("Ошибка записи {}", temp_path.string())
            );
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return Err<void>(
            ErrorCode::CacheIOError,
            std::format("Не удалось заменить {}: {}", path.string(), ec.message())
        );
    }

    return {};
}

void DeviceCache::upsert(const Device& device) {
    std::lock_guard lock(impl_->mutex);
    auto now = std::chrono::system_clock::now();

    auto* existing = impl_->lookup(device.ip_address);
    if (!existing) {
        CachedDevice cached;
        cached.info = device;
        cached.info.stats.reset();
        cached.last_seen = device.last_seen;
        cached.last_probed = now;
        if (device.stats) {
            Impl::push_stats(cached, *device.stats);
        }
        impl_->devices.emplace(device.ip_address, std::move(cached));
        impl_->touch();
        return;
    }

    auto discovered_at = existing->info.discovered_at;
    auto last_seen = std::max(existing->info.last_seen, device.last_seen);

    existing->info = device;
    existing->info.stats.reset();
    existing->info.discovered_at = discovered_at;
    existing->info.last_seen = last_seen;
    existing->last_seen = std::max(existing->last_seen, device.last_seen);
    existing->last_probed = now;
    if (device.stats) {
        Impl::push_stats(*existing, *device.stats);
    }
    impl_->touch();
}

void DeviceCache::update_stats(std::string_view address, const DeviceStats& stats) {
    std::lock_guard lock(impl_->mutex);
    auto* cached = impl_->lookup(address);
    if (!cached) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    Impl::push_stats(*cached, stats);
    cached->info.status = DeviceStatus::Online;
    cached->info.mark_seen(now);
    cached->last_seen = std::max(cached->last_seen, now);
    cached->last_probed = now;
    impl_->touch();
}

void DeviceCache::mark_probe_failed(std::string_view address) {
    std::lock_guard lock(impl_->mutex);
    auto* cached = impl_->lookup(address);
    if (!cached) {
        return;
    }

    cached->info.status = DeviceStatus::Offline;
    cached->last_probed = std::chrono::system_clock::now();
    impl_->touch();
}

void DeviceCache::mark_probe_succeeded(std::string_view address) {
    std::lock_guard lock(impl_->mutex);
    auto* cached = impl_->lookup(address);
    if (!cached) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    cached->info.status = DeviceStatus::Online;
    cached->info.mark_seen(now);
    cached->last_seen = std::max(cached->last_seen, now);
    cached->last_probed = now;
    impl_->touch();
}

std::size_t DeviceCache::prune_older_than(std::chrono::seconds max_age) {
    std::lock_guard lock(impl_->mutex);
    auto cutoff = std::chrono::system_clock::now() - max_age;

    auto removed = std::erase_if(impl_->devices, [cutoff](const auto& item) {
        return item.second.last_seen <= cutoff;
    });

    if (removed > 0) {
        log::debug("Из кэша удалено устаревших устройств: {}", removed);
        impl_->touch();
    }
    return removed;
}

std::vector<std::string> DeviceCache::known_addresses() const {
    std::lock_guard lock(impl_->mutex);
    std::vector<std::string> result;
    result.reserve(impl_->devices.size());
    for (const auto& [address, cached] : impl_->devices) {
        result.push_back(address);
    }
    return result;
}

std::vector<Device> DeviceCache::all_devices() const {
    std::lock_guard lock(impl_->mutex);
    std::vector<Device> result;
    result.reserve(impl_->devices.size());
    for (const auto& [address, cached] : impl_->devices) {
        result.push_back(Impl::materialize(cached));
    }
    return result;
}

std::vector<Device> DeviceCache::devices_by_filter(const DeviceFilter& filter, bool online_only) const {
    std::lock_guard lock(impl_->mutex);
    std::vector<Device> result;
    for (const auto& [address, cached] : impl_->devices) {
        if (!filter.matches(cached.info.device_type)) {
            continue;
        }
        if (online_only && !cached.info.is_online()) {
            continue;
        }
        result.push_back(Impl::materialize(cached));
    }
    return result;
}

std::optional<Device> DeviceCache::find(std::string_view identifier) const {
    std::lock_guard lock(impl_->mutex);

    if (const auto* cached = impl_->lookup(identifier)) {
        return Impl::materialize(*cached);
    }

    for (const auto& [address, cached] : impl_->devices) {
        if (cached.info.name == identifier) {
            return Impl::materialize(cached);
        }
    }
    return std::nullopt;
}

std::optional<DeviceStats> DeviceCache::latest_stats(std::string_view address) const {
    std::lock_guard lock(impl_->mutex);
    const auto* cached = impl_->lookup(address);
    return cached ? cached->latest_stats : std::nullopt;
}

std::vector<DeviceStats> DeviceCache::stats_history(std::string_view address) const {
    std::lock_guard lock(impl_->mutex);
    const auto* cached = impl_->lookup(address);
    return cached ? cached->stats_history : std::vector<DeviceStats>{};
}

std::optional<CachedDevice> DeviceCache::entry(std::string_view address) const {
    std::lock_guard lock(impl_->mutex);
    const auto* cached = impl_->lookup(address);
    if (!cached) {
        return std::nullopt;
    }
    return *cached;
}

std::vector<device::TypeSummary> DeviceCache::type_summaries() const {
    auto devices = all_devices();
    return device::TypeSummary::from_all_devices(devices);
}

std::size_t DeviceCache::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->devices.size();
}

bool DeviceCache::empty() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->devices.empty();
}

std::chrono::seconds DeviceCache::age() const {
    std::lock_guard lock(impl_->mutex);
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - impl_->last_updated
    );
}

} // namespace axectl::cache
