/**
 * @file device_client.cpp
 * @brief Общие функции клиента устройств
 */

#include "device_client.hpp"

namespace axectl::device {

Device make_device(std::string_view address, const DeviceIdentity& identity, Timestamp now) {
    Device device;
    device.name = identity.info.hostname;
    device.ip_address = std::string(address);
    device.device_type = identity.type;
    if (!identity.info.mac_address.empty()) {
        device.serial_number = identity.info.mac_address;
    }
    device.status = DeviceStatus::Online;
    device.discovered_at = now;
    device.last_seen = now;
    return device;
}

} // namespace axectl::device
