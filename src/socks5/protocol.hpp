#pragma once

#include <userver/engine/deadline.hpp>
#include <userver/utils/span.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

// SOCKS protocol version 5, RFC 1928.

namespace socksrelay::socks5 {

inline constexpr uint8_t kSocksVersion = 0x05;

// methods
inline constexpr uint8_t kNoAuthenticationRequired = 0x00;

// address type
inline constexpr uint8_t kAtypIpV4 = 0x01;
inline constexpr uint8_t kAtypDomainName = 0x03;
inline constexpr uint8_t kAtypIpV6 = 0x04;

// commands
inline constexpr uint8_t kCmdConnect = 0x01;
inline constexpr uint8_t kCmdBind = 0x02;
inline constexpr uint8_t kCmdUdpAssociate = 0x03;

// reply field
inline constexpr uint8_t kRepSucceeded = 0x00;

enum class FailStatus : uint8_t {
    kGeneralFailure = 0x01,
    kNotAllowed = 0x02,
    kNetworkUnreachable = 0x03,
    kHostUnreachable = 0x04,
    kConnectionRefused = 0x05,
    kTtlExpired = 0x06,
    kCommandNotSupported = 0x07,
    kAddressTypeNotSupported = 0x08,
};

uint8_t ToWire(FailStatus status);
std::optional<FailStatus> FailStatusFromWire(uint8_t value);
std::string_view ToString(FailStatus status);

FailStatus ToFailStatus(const std::error_code& error);

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <typename Stream>
void ReadExact(
    Stream& stream,
    userver::utils::span<uint8_t> data,
    userver::engine::Deadline deadline,
    std::string_view what
) {
    const auto bytes_received = stream.ReadAll(data, deadline);
    if (bytes_received != data.size()) {
        throw ProtocolError(
            "Unexpected end of stream while reading " + std::string(what) + ": got " +
            std::to_string(bytes_received) + " of " + std::to_string(data.size()) + " bytes"
        );
    }
}

}  // namespace socksrelay::socks5
