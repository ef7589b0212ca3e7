#pragma once

#include "socks5/connection.hpp"
#include "socks5/connector.hpp"

#include <userver/concurrent/background_task_storage.hpp>
#include <userver/engine/io/socket.hpp>
#include <userver/engine/task/task_with_result.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace socksrelay::socks5 {

struct ServerConfig {
    std::string listen_address{"::"};
    uint16_t port{6000};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds{10}};
    ConnectionConfig connection;
};

class Server final {
public:
    Server(ServerConfig config, userver::engine::TaskProcessor& resolver_task_processor);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    void Listen();
    void Start();

    // Closes the listening socket first, then cancels and awaits every connection
    void Stop() noexcept;

    const userver::engine::io::Sockaddr& GetListenAddress() const;

    std::int64_t GetActiveConnections() const noexcept;

private:
    void AcceptLoop(userver::engine::io::Socket server_socket);
    void HandleClient(userver::engine::io::Socket client_socket);

    const ServerConfig config_;
    const Connector connector_;

    userver::engine::io::Socket server_socket_;
    userver::engine::io::Sockaddr listen_address_;

    userver::concurrent::BackgroundTaskStorage bg_storage_;
    userver::engine::TaskWithResult<void> accept_task_;
    bool stopped_{false};
};

}  // namespace socksrelay::socks5
