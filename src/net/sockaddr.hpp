#pragma once

#include "net/ip.hpp"

#include <userver/engine/io/sockaddr.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace socksrelay::net {

using Sockaddr = userver::engine::io::Sockaddr;

class ResolveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

Sockaddr CreateSockAddrIpV4(const IPv4Octets& address, uint16_t port);
Sockaddr CreateSockAddrIpV6(const IPv6Octets& address, uint16_t port);

// Accepts an IPv4 or IPv6 literal, throws std::invalid_argument otherwise.
Sockaddr CreateSockAddrIp(const std::string& address, uint16_t port);

// Blocking getaddrinfo() lookup. Results keep the resolver order.
std::vector<Sockaddr> ResolveDomain(const std::string& domain, uint16_t port);

}  // namespace socksrelay::net
