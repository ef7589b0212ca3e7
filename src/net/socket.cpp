#include "socket.hpp"

#include <userver/logging/log.hpp>
#include <userver/utils/assert.hpp>

namespace socksrelay::net {

TcpSocket::TcpSocket(BaseSocket socket) : socket_{std::move(socket)} {
    UASSERT(socket_.IsValid());
    log_extra_.Extend("fd", socket_.Fd());
    log_extra_.Extend("sockname", socket_.Getsockname().PrimaryAddressString());
    log_extra_.Extend("peername", socket_.Getpeername().PrimaryAddressString());
    log_extra_.Extend("port", socket_.Getsockname().Port());
}

size_t TcpSocket::ReadSome(Span<uint8_t> data, Deadline deadline) {
    const auto bytes_received = socket_.RecvSome(data.data(), data.size(), deadline);
    LOG_DEBUG() << log_extra_ << "Received bytes count: " << bytes_received;
    return bytes_received;
}

size_t TcpSocket::ReadAll(Span<uint8_t> data, Deadline deadline) {
    const auto bytes_received = socket_.RecvAll(data.data(), data.size(), deadline);
    LOG_DEBUG() << log_extra_ << "Received bytes count: " << bytes_received;
    return bytes_received;
}

size_t TcpSocket::SendAll(Span<const uint8_t> data, Deadline deadline) {
    const auto bytes_sent = socket_.SendAll(data.data(), data.size(), deadline);
    LOG_DEBUG() << log_extra_ << "Sent bytes count: " << bytes_sent;
    return bytes_sent;
}

const TcpSocket::Sockaddr& TcpSocket::GetSockname() { return socket_.Getsockname(); }

const TcpSocket::Sockaddr& TcpSocket::GetPeername() { return socket_.Getpeername(); }

}  // namespace socksrelay::net
