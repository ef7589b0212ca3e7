#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace socksrelay::net {

using IPv4Octets = std::array<uint8_t, 4>;
using IPv6Octets = std::array<uint8_t, 16>;

std::string FormatIPv4(const IPv4Octets& ipv4);
std::string FormatIPv6(const IPv6Octets& ipv6);

std::optional<IPv4Octets> ParseIPv4(const std::string& address);
std::optional<IPv6Octets> ParseIPv6(const std::string& address);

}  // namespace socksrelay::net
