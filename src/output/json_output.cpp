/**
 * @file json_output.cpp
 * @brief Реализация JSON документов
 */

#include "json_output.hpp"
#include "../device/device_json.hpp"

namespace axectl::monitor {

void to_json(nlohmann::json& j, const Alert& alert) {
    j = nlohmann::json{
        {"timestamp", device::format_timestamp(alert.timestamp)},
        {"message", alert.message},
        {"device_ip", alert.device_ip},
        {"kind", std::string(to_string(alert.kind))},
    };
}

} // namespace axectl::monitor

namespace axectl::output {

using nlohmann::json;

nlohmann::json discovery_document(const discovery::DiscoveryResult& result, device::Timestamp now) {
    json devices = json::array();
    for (const auto& discovered : result.devices) {
        json entry = discovered.device;
        entry["discovery_source"] = std::string(discovery::to_string(discovered.source));
        devices.push_back(std::move(entry));
    }

    const auto& info = result.scan_info;

    return json{
        {"devices", std::move(devices)},
        {"total", result.devices.size()},
        {"network_scanned", result.network_scanned},
        {"discovery_methods", {
            {"mdns", result.mdns_enabled},
            {"ip_scan", true},
        }},
        {"scan_info", {
            {"network", info.network},
            {"addresses_scanned", info.addresses_scanned},
            {"responsive_addresses", info.responsive_addresses},
            {"devices_found", info.devices_found},
            {"errors_encountered", info.errors_encountered},
            {"duration_seconds", info.duration_seconds},
        }},
        {"sources", {
            {"mdns", result.mdns_count},
            {"cache", result.cache_probe_count},
            {"scan", result.scan_count},
        }},
        {"duration_seconds", result.duration_seconds},
        {"timestamp", device::format_timestamp(now)},
    };
}

nlohmann::json tick_document(const monitor::TickEvent& event, bool include_type_summaries) {
    json document{
        {"devices", event.devices},
        {"summary", event.summary},
        {"timestamp", device::format_timestamp(event.timestamp)},
        {"discovery_active", event.discovery_active},
    };

    if (!event.new_alerts.empty()) {
        document["alerts"] = event.new_alerts;
        document["alert_count"] = event.alert_count;
    }

    if (include_type_summaries) {
        document["type_summaries"] = event.type_summaries;
    }

    if (event.last_discovery) {
        document["last_discovery"] = device::format_timestamp(*event.last_discovery);
    }

    return document;
}

nlohmann::json list_document(const std::vector<device::Device>& devices, device::Timestamp now) {
    return json{
        {"devices", devices},
        {"total", devices.size()},
        {"summary", device::SwarmSummary::from_devices(devices)},
        {"timestamp", device::format_timestamp(now)},
    };
}

nlohmann::json stats_document(const monitor::StatsSnapshot& snapshot) {
    json failed = json::array();
    for (const auto& device : snapshot.failed) {
        failed.push_back(device.ip_address);
    }

    return json{
        {"statistics", snapshot.devices},
        {"failed", std::move(failed)},
        {"summary", snapshot.summary},
        {"timestamp", device::format_timestamp(snapshot.timestamp)},
    };
}

nlohmann::json control_document(
    const std::vector<control::ControlOutcome>& outcomes,
    const control::ControlAction& action
) {
    json results = json::array();
    std::size_t succeeded = 0;

    for (const auto& outcome : outcomes) {
        if (outcome.success) {
            ++succeeded;
        }
        results.push_back({
            {"name", outcome.device.name},
            {"ip_address", outcome.device.ip_address},
            {"success", outcome.success},
            {"message", outcome.message},
        });
    }

    return json{
        {"action", action.describe()},
        {"results", std::move(results)},
        {"total", outcomes.size()},
        {"succeeded", succeeded},
        {"failed", outcomes.size() - succeeded},
    };
}

} // namespace axectl::output
