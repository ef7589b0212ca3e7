#include "address.hpp"

#include <userver/utils/overloaded.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstring>
#include <stdexcept>

namespace socksrelay::socks5 {

bool operator==(const IpV4Address& lhs, const IpV4Address& rhs) { return lhs.octets == rhs.octets; }

bool operator==(const IpV6Address& lhs, const IpV6Address& rhs) { return lhs.octets == rhs.octets; }

bool operator==(const DomainName& lhs, const DomainName& rhs) { return lhs.name == rhs.name; }

bool IsIpV6(const Address& address) { return std::holds_alternative<IpV6Address>(address); }

Address DefaultAddress(bool is_ipv6) {
    if (is_ipv6) {
        return IpV6Address{};
    }
    return IpV4Address{};
}

void SerializeAddress(const Address& address, std::vector<uint8_t>& buffer) {
    std::visit(
        userver::utils::Overloaded{
            [&buffer](const IpV4Address& ipv4) {
                buffer.push_back(kAtypIpV4);
                buffer.insert(buffer.end(), ipv4.octets.begin(), ipv4.octets.end());
            },
            [&buffer](const IpV6Address& ipv6) {
                buffer.push_back(kAtypIpV6);
                buffer.insert(buffer.end(), ipv6.octets.begin(), ipv6.octets.end());
            },
            [&buffer](const DomainName& domain) {
                if (domain.name.size() > kMaxDomainNameLength) {
                    throw std::invalid_argument(
                        "Domain name is too long for SOCKS5: " + std::to_string(domain.name.size()) + " bytes"
                    );
                }
                buffer.push_back(kAtypDomainName);
                buffer.push_back(static_cast<uint8_t>(domain.name.size()));
                buffer.insert(buffer.end(), domain.name.begin(), domain.name.end());
            },
        },
        address
    );
}

std::string ToString(const Address& address) {
    return std::visit(
        userver::utils::Overloaded{
            [](const IpV4Address& ipv4) { return net::FormatIPv4(ipv4.octets); },
            [](const IpV6Address& ipv6) { return "[" + net::FormatIPv6(ipv6.octets) + "]"; },
            [](const DomainName& domain) { return domain.name; },
        },
        address
    );
}

Address FromSockaddr(const userver::engine::io::Sockaddr& sockaddr) {
    switch (sockaddr.Domain()) {
        case userver::engine::io::AddrDomain::kInet: {
            const auto* addr = reinterpret_cast<const sockaddr_in*>(sockaddr.Data());
            IpV4Address ipv4;
            std::memcpy(ipv4.octets.data(), &addr->sin_addr.s_addr, ipv4.octets.size());
            return ipv4;
        }
        case userver::engine::io::AddrDomain::kInet6: {
            const auto* addr = reinterpret_cast<const sockaddr_in6*>(sockaddr.Data());
            IpV6Address ipv6;
            std::memcpy(ipv6.octets.data(), addr->sin6_addr.s6_addr, ipv6.octets.size());
            return ipv6;
        }
        default: {
            throw std::invalid_argument("Unsupported socket address family: " + sockaddr.PrimaryAddressString());
        }
    }
}

}  // namespace socksrelay::socks5
