#pragma once

#include "net/ip.hpp"
#include "socks5/protocol.hpp"

#include <userver/engine/deadline.hpp>
#include <userver/engine/io/sockaddr.hpp>
#include <userver/utils/text.hpp>

#include <string>
#include <variant>
#include <vector>

namespace socksrelay::socks5 {

struct IpV4Address {
    net::IPv4Octets octets{};
};

struct IpV6Address {
    net::IPv6Octets octets{};
};

struct DomainName {
    std::string name;
};

bool operator==(const IpV4Address& lhs, const IpV4Address& rhs);
bool operator==(const IpV6Address& lhs, const IpV6Address& rhs);
bool operator==(const DomainName& lhs, const DomainName& rhs);

using Address = std::variant<IpV4Address, IpV6Address, DomainName>;

inline constexpr std::size_t kMaxDomainNameLength = 255;

bool IsIpV6(const Address& address);

// 0.0.0.0 or ::
Address DefaultAddress(bool is_ipv6);

// Throws std::invalid_argument for a domain name longer than 255 bytes
void SerializeAddress(const Address& address, std::vector<uint8_t>& buffer);

std::string ToString(const Address& address);

Address FromSockaddr(const userver::engine::io::Sockaddr& sockaddr);

template <typename Stream>
Address ParseAddress(Stream& stream, userver::engine::Deadline deadline) {
    uint8_t address_type = 0;
    ReadExact(stream, {&address_type, 1}, deadline, "address type");

    switch (address_type) {
        case kAtypIpV4: {
            IpV4Address address;
            ReadExact(stream, address.octets, deadline, "IPv4 address");
            return address;
        }
        case kAtypDomainName: {
            uint8_t domain_length = 0;
            ReadExact(stream, {&domain_length, 1}, deadline, "domain length");
            DomainName domain;
            domain.name.resize(domain_length, '\0');
            ReadExact(
                stream, {reinterpret_cast<uint8_t*>(domain.name.data()), domain.name.size()}, deadline, "domain name"
            );
            if (!userver::utils::text::IsUtf8(domain.name)) {
                throw ProtocolError("Domain name is not valid UTF-8");
            }
            return domain;
        }
        case kAtypIpV6: {
            IpV6Address address;
            ReadExact(stream, address.octets, deadline, "IPv6 address");
            return address;
        }
        default: {
            throw ProtocolError("Unsupported address type: " + std::to_string(address_type));
        }
    }
}

}  // namespace socksrelay::socks5
