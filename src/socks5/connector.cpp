#include "connector.hpp"
#include "net/sockaddr.hpp"

#include <userver/engine/async.hpp>
#include <userver/engine/exception.hpp>
#include <userver/engine/io/exception.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/overloaded.hpp>

namespace socksrelay::socks5 {

ConnectError::ConnectError(std::error_code code, const std::string& message)
    : std::runtime_error(message + ": " + code.message()), status_{ToFailStatus(code)} {}

ConnectError::ConnectError(FailStatus status, const std::string& message)
    : std::runtime_error(message), status_{status} {}

Connector::Connector(
    userver::engine::TaskProcessor& resolver_task_processor,
    std::chrono::milliseconds connect_timeout,
    ResolveFunction resolve
)
    : resolver_task_processor_{resolver_task_processor},
      connect_timeout_{connect_timeout},
      resolve_{std::move(resolve)} {}

net::TcpSocket Connector::Connect(const Request& request) const {
    const auto unsupported = [](const char* command) -> net::TcpSocket {
        throw ConnectError(FailStatus::kCommandNotSupported, std::string(command) + " command is not supported");
    };

    return std::visit(
        userver::utils::Overloaded{
            [this](const ConnectRequest& connect) { return ConnectTo(connect.address, connect.port); },
            [&unsupported](const BindRequest&) { return unsupported("Bind"); },
            [&unsupported](const UdpAssociateRequest&) { return unsupported("UdpAssociate"); },
        },
        request
    );
}

std::vector<net::Sockaddr> Connector::Resolve(
    const Address& address,
    uint16_t port,
    userver::engine::Deadline deadline
) const {
    return std::visit(
        userver::utils::Overloaded{
            [port](const IpV4Address& ipv4) {
                return std::vector<net::Sockaddr>{net::CreateSockAddrIpV4(ipv4.octets, port)};
            },
            [port](const IpV6Address& ipv6) {
                return std::vector<net::Sockaddr>{net::CreateSockAddrIpV6(ipv6.octets, port)};
            },
            [this, port, deadline](const DomainName& domain) {
                auto task = userver::engine::AsyncNoSpan(
                    resolver_task_processor_,
                    [resolve = resolve_, name = domain.name, port] { return resolve(name, port); }
                );
                // getaddrinfo() can not be interrupted, an abandoned lookup finishes in background
                try {
                    task.WaitUntil(deadline);
                } catch (const userver::engine::WaitInterruptedException&) {
                    std::move(task).Detach();
                    throw;
                }
                if (!task.IsFinished()) {
                    std::move(task).Detach();
                    throw ConnectError(
                        std::make_error_code(std::errc::timed_out), "Timed out resolving '" + domain.name + "'"
                    );
                }

                try {
                    return task.Get();
                } catch (const net::ResolveError& ex) {
                    throw ConnectError(std::make_error_code(std::errc::host_unreachable), ex.what());
                }
            },
        },
        address
    );
}

net::TcpSocket Connector::ConnectTo(const Address& address, uint16_t port) const {
    const auto deadline = userver::engine::Deadline::FromDuration(connect_timeout_);
    const auto target = ToString(address) + ":" + std::to_string(port);

    std::error_code error = std::make_error_code(std::errc::host_unreachable);
    for (const auto& sockaddr : Resolve(address, port, deadline)) {
        try {
            net::TcpSocket::BaseSocket target_socket(sockaddr.Domain(), userver::engine::io::SocketType::kStream);
            target_socket.Connect(sockaddr, deadline);
            LOG_INFO() << "Connected to target server: " << sockaddr;
            return net::TcpSocket(std::move(target_socket));
        } catch (const userver::engine::io::IoSystemError& ex) {
            LOG_DEBUG() << "Failed to connect to " << sockaddr << ": " << ex.what();
            // ECONNREFUSED from an earlier address wins over later socket errors
            if (error != std::errc::connection_refused) {
                error = ex.Code();
            }
        } catch (const userver::engine::io::IoTimeout&) {
            LOG_DEBUG() << "Timed out connecting to " << sockaddr;
            error = std::make_error_code(std::errc::timed_out);
            break;
        }
    }

    throw ConnectError(error, "Failed to connect to " + target);
}

}  // namespace socksrelay::socks5
