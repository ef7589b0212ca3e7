#include "sockaddr.hpp"

#include <arpa/inet.h>
#include <netdb.h>

#include <cstring>
#include <memory>

namespace socksrelay::net {

Sockaddr CreateSockAddrIpV4(const IPv4Octets& address, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    std::memcpy(&addr.sin_addr.s_addr, address.data(), address.size());

    return Sockaddr(reinterpret_cast<const void*>(&addr));
}

Sockaddr CreateSockAddrIpV6(const IPv6Octets& address, uint16_t port) {
    sockaddr_in6 addr{};
    addr.sin6_family = AF_INET6;
    addr.sin6_port = htons(port);
    std::memcpy(addr.sin6_addr.s6_addr, address.data(), address.size());

    return Sockaddr(reinterpret_cast<const void*>(&addr));
}

Sockaddr CreateSockAddrIp(const std::string& address, uint16_t port) {
    if (const auto ipv4 = ParseIPv4(address)) {
        return CreateSockAddrIpV4(*ipv4, port);
    }
    if (const auto ipv6 = ParseIPv6(address)) {
        return CreateSockAddrIpV6(*ipv6, port);
    }

    throw std::invalid_argument("Not an IP address: " + address);
}

std::vector<Sockaddr> ResolveDomain(const std::string& domain, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    const auto service = std::to_string(port);
    addrinfo* result = nullptr;
    const int status = getaddrinfo(domain.c_str(), service.c_str(), &hints, &result);
    if (status != 0 || result == nullptr) {
        throw ResolveError("Failed to resolve domain name '" + domain + "': " + gai_strerror(status));
    }

    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> result_guard(result, freeaddrinfo);

    std::vector<Sockaddr> addresses;
    for (const addrinfo* entry = result; entry != nullptr; entry = entry->ai_next) {
        if (entry->ai_family == AF_INET || entry->ai_family == AF_INET6) {
            addresses.emplace_back(reinterpret_cast<const void*>(entry->ai_addr));
        }
    }

    if (addresses.empty()) {
        throw ResolveError("Unsupported address family for domain: " + domain);
    }

    return addresses;
}

}  // namespace socksrelay::net
