#pragma once

#include "net/relay.hpp"
#include "net/socket.hpp"
#include "socks5/connector.hpp"

#include <chrono>
#include <cstddef>

namespace socksrelay::socks5 {

struct ConnectionConfig {
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds{10}};
    std::size_t relay_buffer_size{4096};
};

// Throws if the connection failed before relaying started
net::RelayStats HandleConnection(net::TcpSocket client, const Connector& connector, const ConnectionConfig& config);

}  // namespace socksrelay::socks5
