#pragma once

#include <userver/engine/io/socket.hpp>
#include <userver/logging/log_extra.hpp>
#include <userver/utils/span.hpp>

namespace socksrelay::net {

class TcpSocket final {
public:
    using BaseSocket = userver::engine::io::Socket;
    using Deadline = userver::engine::Deadline;
    using Sockaddr = userver::engine::io::Sockaddr;

    template <typename T>
    using Span = userver::utils::span<T>;

    explicit TcpSocket(BaseSocket socket);

    TcpSocket(TcpSocket&&) = default;
    TcpSocket& operator=(TcpSocket&&) = default;

    // Returns 0 when the peer has closed the stream.
    size_t ReadSome(Span<uint8_t> data, Deadline deadline);
    // May return less than data.size() if the peer closes the stream early.
    size_t ReadAll(Span<uint8_t> data, Deadline deadline);
    size_t SendAll(Span<const uint8_t> data, Deadline deadline);

    const Sockaddr& GetSockname();
    const Sockaddr& GetPeername();

private:
    BaseSocket socket_;
    userver::logging::LogExtra log_extra_;
};

}  // namespace socksrelay::net
