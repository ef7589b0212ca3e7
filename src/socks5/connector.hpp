#pragma once

#include "net/sockaddr.hpp"
#include "net/socket.hpp"
#include "socks5/protocol.hpp"
#include "socks5/request.hpp"

#include <userver/engine/task/task_processor_fwd.hpp>

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace socksrelay::socks5 {

// Upstream connection attempt that failed, with the reply code for the client
class ConnectError : public std::runtime_error {
public:
    ConnectError(std::error_code code, const std::string& message);
    ConnectError(FailStatus status, const std::string& message);

    FailStatus Status() const noexcept { return status_; }

private:
    FailStatus status_;
};

class Connector final {
public:
    using ResolveFunction = std::function<std::vector<net::Sockaddr>(const std::string&, uint16_t)>;

    Connector(
        userver::engine::TaskProcessor& resolver_task_processor,
        std::chrono::milliseconds connect_timeout,
        ResolveFunction resolve = &net::ResolveDomain
    );

    net::TcpSocket Connect(const Request& request) const;

private:
    net::TcpSocket ConnectTo(const Address& address, uint16_t port) const;
    std::vector<net::Sockaddr> Resolve(const Address& address, uint16_t port, userver::engine::Deadline deadline) const;

    userver::engine::TaskProcessor& resolver_task_processor_;
    const std::chrono::milliseconds connect_timeout_;
    const ResolveFunction resolve_;
};

}  // namespace socksrelay::socks5
