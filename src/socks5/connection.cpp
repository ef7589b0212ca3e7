#include "connection.hpp"
#include "socks5/acceptor.hpp"

#include <userver/logging/log.hpp>

#include <optional>

namespace socksrelay::socks5 {

net::RelayStats HandleConnection(net::TcpSocket client, const Connector& connector, const ConnectionConfig& config) {
    const auto deadline = userver::engine::Deadline::FromDuration(config.handshake_timeout);

    // Step 1: SOCKS5 handshake and request
    auto [request, acceptor] = Accept(std::move(client), deadline);
    LOG_INFO() << "Proxying " << ToString(request);

    // Step 2: Establish a connection to the target server
    std::optional<net::TcpSocket> upstream;
    try {
        upstream.emplace(connector.Connect(request));
    } catch (const ConnectError& ex) {
        const auto status = ex.Status();
        LOG_DEBUG() << "Replying '" << ToString(status) << "' to " << ToString(request);
        std::move(acceptor).ReplyFailure(status, deadline);
        throw;
    }

    // Step 3: Report the bound address and take the stream back
    const auto& bound = upstream->GetSockname();
    auto stream = std::move(acceptor).ReplySuccess(FromSockaddr(bound), static_cast<uint16_t>(bound.Port()), deadline);
    LOG_DEBUG() << "Sent SOCKS5 success response for " << ToString(request) << ", bound to " << bound;

    // Step 4: Proxying data
    auto stats = net::Relay(stream, *upstream, config.relay_buffer_size);
    LOG_DEBUG() << "Disconnecting from " << ToString(request) << ", uploaded " << stats.uploaded
                << " bytes, downloaded " << stats.downloaded << " bytes";
    return stats;
}

}  // namespace socksrelay::socks5
