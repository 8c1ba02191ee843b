/**
 * @file status_renderer.cpp
 * @brief Реализация текстового вывода
 */

#include "status_renderer.hpp"
#include "format.hpp"

#include <algorithm>
#include <format>
#include <sstream>

namespace axectl::output {

namespace {

using Row = std::vector<std::string>;

/**
 * @brief Таблица с выравниванием по видимой ширине
 */
std::string render_table(const Row& header, const std::vector<Row>& rows, bool color) {
    std::vector<std::size_t> widths(header.size(), 0);
    for (std::size_t c = 0; c < header.size(); ++c) {
        widths[c] = display_width(header[c]);
    }
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < row.size() && c < widths.size(); ++c) {
            widths[c] = std::max(widths[c], display_width(row[c]));
        }
    }

    std::ostringstream out;

    auto write_row = [&](const Row& row) {
        for (std::size_t c = 0; c < widths.size(); ++c) {
            std::string_view cell = c < row.size() ? std::string_view(row[c]) : std::string_view();
            if (c + 1 < widths.size()) {
                out << pad_right(cell, widths[c]) << "  ";
            } else {
                out << cell;
            }
        }
        out << "\n";
    };

    Row bold_header;
    for (const auto& title : header) {
        bold_header.push_back(paint(title, ansi::BOLD, color));
    }
    write_row(bold_header);

    std::size_t total = 0;
    for (auto w : widths) {
        total += w + 2;
    }
    out << std::string(total > 2 ? total - 2 : 0, '-') << "\n";

    for (const auto& row : rows) {
        write_row(row);
    }
    return out.str();
}

std::string status_cell(device::DeviceStatus status, bool color) {
    switch (status) {
        case device::DeviceStatus::Online:  return paint("online", ansi::GREEN, color);
        case device::DeviceStatus::Offline: return paint("offline", ansi::RED, color);
        case device::DeviceStatus::Error:   return paint("error", ansi::YELLOW, color);
    }
    return "error";
}

} // anonymous namespace

std::string format_age(device::Timestamp then, device::Timestamp now) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now - then).count();
    if (seconds < 0) {
        seconds = 0;
    }
    if (seconds < 60) {
        return std::format("{}s ago", seconds);
    }
    if (seconds < 3600) {
        return std::format("{}m ago", seconds / 60);
    }
    if (seconds < 86400) {
        return std::format("{}h ago", seconds / 3600);
    }
    return std::format("{}d ago", seconds / 86400);
}

// =============================================================================
// StatusRenderer
// =============================================================================

std::string StatusRenderer::device_table(const std::vector<device::Device>& devices) const {
    static const Row header{"Name", "IP", "Type", "Status", "Hashrate", "Temp", "Power", "Fan", "Uptime", "Pool"};

    std::vector<Row> rows;
    rows.reserve(devices.size());

    for (const auto& device : devices) {
        Row row{
            device.name,
            device.ip_address,
            std::string(device::display_name(device.device_type)),
            status_cell(device.status, color_),
        };

        if (device.stats) {
            const auto& stats = *device.stats;
            row.push_back(format_hashrate(stats.hashrate_mhs));
            row.push_back(format_temperature(stats.temperature_celsius, color_));
            row.push_back(format_power(stats.power_watts));
            row.push_back(std::format("{} RPM", stats.fan_speed_rpm));
            row.push_back(format_uptime(stats.uptime_seconds));
            row.push_back(stats.pool_url.value_or("-"));
        } else {
            row.insert(row.end(), {"-", "-", "-", "-", "-", "-"});
        }

        rows.push_back(std::move(row));
    }

    return render_table(header, rows, color_);
}

std::string StatusRenderer::basic_table(
    const std::vector<device::Device>& devices,
    device::Timestamp now
) const {
    static const Row header{"Name", "IP", "Type", "Status", "Last Seen"};

    std::vector<Row> rows;
    rows.reserve(devices.size());
    for (const auto& device : devices) {
        rows.push_back(Row{
            device.name,
            device.ip_address,
            std::string(device::display_name(device.device_type)),
            status_cell(device.status, color_),
            format_age(device.last_seen, now),
        });
    }

    return render_table(header, rows, color_);
}

std::string StatusRenderer::summary(const device::SwarmSummary& summary) const {
    std::ostringstream out;

    out << paint("Swarm Summary", ansi::BOLD, color_) << "\n";
    out << "  Devices:     " << summary.total_devices
        << " (" << paint(std::format("{} online", summary.devices_online), ansi::GREEN, color_)
        << ", " << paint(std::format("{} offline", summary.devices_offline),
                         summary.devices_offline > 0 ? ansi::RED : ansi::DIM, color_)
        << ")\n";
    out << "  Hashrate:    " << format_hashrate(summary.total_hashrate_mhs) << "\n";
    out << "  Power:       " << format_power(summary.total_power_watts) << "\n";

    if (summary.devices_online > 0) {
        out << "  Avg Temp:    " << format_temperature(summary.average_temperature, color_) << "\n";
        out << "  Efficiency:  " << std::format("{:.2f} MH/W", summary.average_efficiency) << "\n";
    }

    return out.str();
}

std::string StatusRenderer::alerts(const std::vector<monitor::Alert>& alerts) const {
    if (alerts.empty()) {
        return {};
    }

    std::ostringstream out;
    out << paint("Alerts", ansi::BOLD, color_) << "\n";
    for (const auto& alert : alerts) {
        auto code = alert.kind == monitor::AlertKind::Offline ? ansi::RED : ansi::YELLOW;
        out << "  " << paint("!", code, color_) << " " << alert.message << "\n";
    }
    return out.str();
}

std::string StatusRenderer::discovery_line(
    bool active,
    const std::optional<device::Timestamp>& last_discovery,
    device::Timestamp now
) const {
    if (active) {
        return paint("Discovery: running...", ansi::CYAN, color_);
    }
    if (last_discovery) {
        return paint(std::format("Discovery: last completed {}", format_age(*last_discovery, now)), ansi::DIM, color_);
    }
    return paint("Discovery: not run yet", ansi::DIM, color_);
}

std::string StatusRenderer::discovery_report(const discovery::DiscoveryResult& result) const {
    std::ostringstream out;

    if (result.devices.empty()) {
        out << paint("No devices found", ansi::YELLOW, color_) << "\n";
    } else {
        out << basic_table(result.plain_devices(), std::chrono::system_clock::now());
    }

    out << "\n";
    out << std::format("Found {} device(s) on {} in {:.1f}s",
                       result.devices.size(), result.network_scanned, result.duration_seconds) << "\n";
    out << std::format("  mDNS: {}{}  cache: {}  scan: {}",
                       result.mdns_count,
                       result.mdns_enabled ? "" : " (disabled)",
                       result.cache_probe_count,
                       result.scan_count) << "\n";
    out << std::format("  scanned {} address(es), {} responsive",
                       result.scan_info.addresses_scanned,
                       result.scan_info.responsive_addresses) << "\n";
    return out.str();
}

std::string StatusRenderer::tick(const monitor::TickEvent& event) const {
    std::ostringstream out;

    out << paint(std::format("axectl monitor  {}", event.devices.size() == 1
                                 ? std::string("1 device")
                                 : std::format("{} devices", event.devices.size())),
                 ansi::BOLD, color_)
        << "\n\n";

    if (event.devices.empty()) {
        out << paint("No devices to monitor", ansi::YELLOW, color_) << "\n";
    } else if (event.stats_collected) {
        out << device_table(event.devices);
    } else {
        out << basic_table(event.devices, event.timestamp);
    }

    out << "\n" << summary(event.summary);

    auto alert_text = alerts(event.recent_alerts);
    if (!alert_text.empty()) {
        out << "\n" << alert_text;
        out << paint(std::format("  ({} alert(s) this session)", event.alert_count), ansi::DIM, color_) << "\n";
    }

    out << "\n" << discovery_line(event.discovery_active, event.last_discovery, event.timestamp) << "\n";
    return out.str();
}

std::string StatusRenderer::control_report(
    const std::vector<control::ControlOutcome>& outcomes,
    const control::ControlAction& action
) const {
    std::ostringstream out;
    std::size_t succeeded = 0;

    for (const auto& outcome : outcomes) {
        if (outcome.success) {
            ++succeeded;
            out << paint("ok  ", ansi::GREEN, color_);
        } else {
            out << paint("FAIL", ansi::RED, color_);
        }
        out << " " << outcome.message << "\n";
    }

    out << std::format("{}: {}/{} succeeded", action.describe(), succeeded, outcomes.size()) << "\n";
    return out.str();
}

std::string StatusRenderer::stats_report(const monitor::StatsSnapshot& snapshot) const {
    std::ostringstream out;

    if (snapshot.devices.empty()) {
        out << paint("Failed to collect statistics from any device", ansi::RED, color_) << "\n";
    } else {
        out << device_table(snapshot.devices);
    }

    for (const auto& device : snapshot.failed) {
        out << paint("FAIL", ansi::RED, color_) << " " << device.name << " (" << device.ip_address << "): no response\n";
    }

    if (snapshot.devices.size() > 1) {
        out << "\n" << summary(snapshot.summary);
    }
    return out.str();
}

std::string render_plain(const monitor::TickEvent& event) {
    return StatusRenderer(false).tick(event);
}

} // namespace axectl::output
