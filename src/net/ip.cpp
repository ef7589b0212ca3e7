#include "ip.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstring>
#include <stdexcept>

namespace socksrelay::net {

std::string FormatIPv4(const IPv4Octets& ipv4) {
    char buffer[INET_ADDRSTRLEN];
    in_addr addr{};
    std::memcpy(&addr.s_addr, ipv4.data(), ipv4.size());

    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) {
        throw std::runtime_error("Failed to format IPv4 address");
    }

    return std::string(buffer);
}

std::string FormatIPv6(const IPv6Octets& ipv6) {
    char buffer[INET6_ADDRSTRLEN];
    in6_addr addr{};
    std::memcpy(addr.s6_addr, ipv6.data(), ipv6.size());

    if (inet_ntop(AF_INET6, &addr, buffer, sizeof(buffer)) == nullptr) {
        throw std::runtime_error("Failed to format IPv6 address");
    }

    return std::string(buffer);
}

std::optional<IPv4Octets> ParseIPv4(const std::string& address) {
    in_addr addr{};
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
        return std::nullopt;
    }

    IPv4Octets octets;
    std::memcpy(octets.data(), &addr.s_addr, octets.size());
    return octets;
}

std::optional<IPv6Octets> ParseIPv6(const std::string& address) {
    in6_addr addr{};
    if (inet_pton(AF_INET6, address.c_str(), &addr) != 1) {
        return std::nullopt;
    }

    IPv6Octets octets;
    std::memcpy(octets.data(), addr.s6_addr, octets.size());
    return octets;
}

}  // namespace socksrelay::net
