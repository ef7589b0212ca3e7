#include "protocol.hpp"

#include <userver/utils/trivial_map.hpp>

namespace socksrelay::socks5 {

constexpr userver::utils::TrivialBiMap kFailStatusNames = [](auto selector) {
    return selector()
        .Case(FailStatus::kGeneralFailure, "general SOCKS server failure")
        .Case(FailStatus::kNotAllowed, "connection not allowed by ruleset")
        .Case(FailStatus::kNetworkUnreachable, "network unreachable")
        .Case(FailStatus::kHostUnreachable, "host unreachable")
        .Case(FailStatus::kConnectionRefused, "connection refused")
        .Case(FailStatus::kTtlExpired, "TTL expired")
        .Case(FailStatus::kCommandNotSupported, "command not supported")
        .Case(FailStatus::kAddressTypeNotSupported, "address type not supported");
};

uint8_t ToWire(FailStatus status) { return static_cast<uint8_t>(status); }

std::optional<FailStatus> FailStatusFromWire(uint8_t value) {
    switch (value) {
        case 0x01:
            return FailStatus::kGeneralFailure;
        case 0x02:
            return FailStatus::kNotAllowed;
        case 0x03:
            return FailStatus::kNetworkUnreachable;
        case 0x04:
            return FailStatus::kHostUnreachable;
        case 0x05:
            return FailStatus::kConnectionRefused;
        case 0x06:
            return FailStatus::kTtlExpired;
        case 0x07:
            return FailStatus::kCommandNotSupported;
        case 0x08:
            return FailStatus::kAddressTypeNotSupported;
        default:
            return std::nullopt;
    }
}

std::string_view ToString(FailStatus status) { return kFailStatusNames.TryFind(status).value_or("unknown"); }

FailStatus ToFailStatus(const std::error_code& error) {
    if (error == std::errc::connection_refused) {
        return FailStatus::kConnectionRefused;
    }
    if (error == std::errc::network_unreachable || error == std::errc::network_down) {
        return FailStatus::kNetworkUnreachable;
    }
    if (error == std::errc::host_unreachable || error == std::errc::timed_out) {
        return FailStatus::kHostUnreachable;
    }
    if (error == std::errc::permission_denied || error == std::errc::operation_not_permitted) {
        return FailStatus::kNotAllowed;
    }
    if (error == std::errc::address_family_not_supported) {
        return FailStatus::kAddressTypeNotSupported;
    }
    return FailStatus::kGeneralFailure;
}

}  // namespace socksrelay::socks5
