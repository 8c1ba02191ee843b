/**
 * @file prober.cpp
 * @brief Реализация пробы адреса
 */

#include "prober.hpp"
#include "../log/logger.hpp"

namespace axectl::discovery {

ProbeResult Prober::probe(std::string_view address, std::chrono::milliseconds timeout) const {
    ProbeResult result;
    result.address = std::string(address);
    result.health = client_.probe(address, timeout);

    if (!result.health.is_healthy()) {
        return result;
    }

    auto identity = client_.fetch_identity(address, timeout);
    if (!identity) {
        log::debug("{} отвечает, но не опознан: {}", address, identity.error().message);
        result.state = ProbeResult::State::Unclassified;
        result.error = identity.error();
        return result;
    }

    result.state = ProbeResult::State::Identified;
    result.device = device::make_device(address, *identity, std::chrono::system_clock::now());
    return result;
}

} // namespace axectl::discovery
