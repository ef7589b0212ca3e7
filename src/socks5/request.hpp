#pragma once

#include "socks5/address.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace socksrelay::socks5 {

struct ConnectRequest {
    Address address;
    uint16_t port{0};
};

struct BindRequest {
    Address address;
    uint16_t port{0};
};

struct UdpAssociateRequest {
    Address address;
    uint16_t port{0};
};

using Request = std::variant<ConnectRequest, BindRequest, UdpAssociateRequest>;

// Throws ProtocolError for an unknown command
Request MakeRequest(uint8_t command, Address address, uint16_t port);

std::string ToString(const Request& request);

}  // namespace socksrelay::socks5
