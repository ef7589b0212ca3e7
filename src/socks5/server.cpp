#include "server.hpp"
#include "net/sockaddr.hpp"

#include <userver/engine/async.hpp>
#include <userver/engine/io/exception.hpp>
#include <userver/engine/task/cancel.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/assert.hpp>

#include <sys/socket.h>

namespace socksrelay::socks5 {

Server::Server(ServerConfig config, userver::engine::TaskProcessor& resolver_task_processor)
    : config_{std::move(config)}, connector_{resolver_task_processor, config_.connect_timeout} {}

Server::~Server() { Stop(); }

void Server::Listen() {
    UINVARIANT(!server_socket_.IsValid(), "Server is already listening");

    const auto sockaddr = net::CreateSockAddrIp(config_.listen_address, config_.port);
    userver::engine::io::Socket server_socket(sockaddr.Domain(), userver::engine::io::SocketType::kStream);
    server_socket.SetOption(SOL_SOCKET, SO_REUSEADDR, 1);

    LOG_DEBUG() << "Binding server socket to " << sockaddr;
    server_socket.Bind(sockaddr);
    server_socket.Listen();

    listen_address_ = server_socket.Getsockname();
    server_socket_ = std::move(server_socket);
    LOG_INFO() << "SOCKS5 server is listening on " << listen_address_;
}

void Server::Start() {
    UINVARIANT(server_socket_.IsValid(), "Listen() must be called before Start()");

    accept_task_ = userver::engine::AsyncNoSpan([this, server_socket = std::move(server_socket_)]() mutable {
        AcceptLoop(std::move(server_socket));
    });
}

void Server::Stop() noexcept {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    if (accept_task_.IsValid()) {
        LOG_INFO() << "Stopping SOCKS5 server, active connections: " << bg_storage_.ActiveTasksApprox();
        accept_task_.SyncCancel();
        accept_task_ = {};
    }

    bg_storage_.CancelAndWait();
    LOG_INFO() << "SOCKS5 server stopped";
}

const userver::engine::io::Sockaddr& Server::GetListenAddress() const { return listen_address_; }

std::int64_t Server::GetActiveConnections() const noexcept { return bg_storage_.ActiveTasksApprox(); }

void Server::AcceptLoop(userver::engine::io::Socket server_socket) {
    while (!userver::engine::current_task::ShouldCancel()) {
        userver::engine::io::Socket client_socket;
        try {
            client_socket = server_socket.Accept({});
        } catch (const userver::engine::io::IoCancelled&) {
            break;
        } catch (const std::exception& ex) {
            LOG_ERROR() << "Error accepting client: " << ex.what();
            continue;
        }

        bg_storage_.AsyncDetach("socks5-connection", [this, client_socket = std::move(client_socket)]() mutable {
            HandleClient(std::move(client_socket));
        });
    }

    LOG_DEBUG() << "Accept loop finished on " << listen_address_;
}

void Server::HandleClient(userver::engine::io::Socket client_socket) {
    std::string peer = "unknown peer";
    try {
        net::TcpSocket client(std::move(client_socket));
        peer = client.GetPeername().PrimaryAddressString();
        LOG_DEBUG() << "Accepted connection from " << peer;

        const auto stats = HandleConnection(std::move(client), connector_, config_.connection);
        if (stats.error) {
            LOG_WARNING() << "Relay for " << peer << " ended with error: " << *stats.error;
        }
        LOG_DEBUG() << "Disconnected: " << peer;
    } catch (const std::exception& ex) {
        if (userver::engine::current_task::ShouldCancel()) {
            LOG_INFO() << "Connection from " << peer << " cancelled: " << ex.what();
        } else {
            LOG_ERROR() << "Error handling connection from " << peer << ": " << ex.what();
        }
    }
}

}  // namespace socksrelay::socks5
