#pragma once

#include "socks5/address.hpp"
#include "socks5/protocol.hpp"
#include "socks5/request.hpp"

#include <userver/engine/deadline.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/assert.hpp>
#include <userver/utils/encoding/hex.hpp>

#include <algorithm>
#include <array>
#include <exception>
#include <utility>
#include <vector>

namespace socksrelay::socks5 {

template <typename Stream>
class Acceptor;

template <typename Stream>
struct AcceptResult;

// Throws ProtocolError on malformed input, nothing is replied in that case
template <typename Stream>
AcceptResult<Stream> Accept(Stream stream, userver::engine::Deadline deadline);

template <typename Stream>
class Acceptor final {
public:
    Acceptor(Acceptor&&) = default;
    Acceptor& operator=(Acceptor&&) = default;

    [[nodiscard]] Stream ReplySuccess(
        const Address& bound_address,
        uint16_t bound_port,
        userver::engine::Deadline deadline
    ) &&;

    // A failed write is only logged
    void ReplyFailure(FailStatus status, userver::engine::Deadline deadline) && noexcept;

    bool IsIpV6() const { return is_ipv6_; }

private:
    friend AcceptResult<Stream> Accept<Stream>(Stream stream, userver::engine::Deadline deadline);

    Acceptor(Stream stream, bool is_ipv6) : stream_{std::move(stream)}, is_ipv6_{is_ipv6} {}

    void Reply(uint8_t status, const Address& address, uint16_t port, userver::engine::Deadline deadline);

    Stream stream_;
    bool is_ipv6_;
    bool replied_{false};
};

template <typename Stream>
struct AcceptResult {
    Request request;
    Acceptor<Stream> acceptor;
};

template <typename Stream>
AcceptResult<Stream> Accept(Stream stream, userver::engine::Deadline deadline) {
    using userver::utils::encoding::ToHex;

    std::array<uint8_t, 2> header;
    ReadExact(stream, header, deadline, "handshake header");
    LOG_DEBUG() << "Received handshake header: " << ToHex(header.data(), header.size());

    const uint8_t socks_version = header[0];
    if (socks_version != kSocksVersion) {
        throw ProtocolError("Unsupported SOCKS version in handshake header: " + std::to_string(socks_version));
    }

    const uint8_t method_count = header[1];
    std::vector<uint8_t> methods(method_count);
    ReadExact(stream, methods, deadline, "authentication methods");
    LOG_DEBUG() << "Received methods: " << ToHex(methods.data(), methods.size());

    if (std::find(methods.begin(), methods.end(), kNoAuthenticationRequired) == methods.end()) {
        throw ProtocolError("Only '0x00 NO AUTHENTICATION REQUIRED' method is supported");
    }

    const std::array<uint8_t, 2> response = {kSocksVersion, kNoAuthenticationRequired};
    stream.SendAll(response, deadline);

    std::array<uint8_t, 3> request_header;
    ReadExact(stream, request_header, deadline, "request header");
    LOG_DEBUG() << "Received request header: " << ToHex(request_header.data(), request_header.size());

    if (request_header[0] != kSocksVersion) {
        throw ProtocolError("Unsupported SOCKS version in request header: " + std::to_string(request_header[0]));
    }

    const uint8_t command = request_header[1];
    auto address = ParseAddress(stream, deadline);

    std::array<uint8_t, 2> port_bytes;
    ReadExact(stream, port_bytes, deadline, "port");
    const auto port = static_cast<uint16_t>((port_bytes[0] << 8) | port_bytes[1]);

    const bool is_ipv6 = IsIpV6(address);
    auto request = MakeRequest(command, std::move(address), port);

    return AcceptResult<Stream>{std::move(request), Acceptor<Stream>(std::move(stream), is_ipv6)};
}

template <typename Stream>
Stream Acceptor<Stream>::ReplySuccess(
    const Address& bound_address,
    uint16_t bound_port,
    userver::engine::Deadline deadline
) && {
    Reply(kRepSucceeded, bound_address, bound_port, deadline);
    return std::move(stream_);
}

template <typename Stream>
void Acceptor<Stream>::ReplyFailure(FailStatus status, userver::engine::Deadline deadline) && noexcept {
    try {
        Reply(ToWire(status), DefaultAddress(is_ipv6_), 0, deadline);
    } catch (const std::exception& ex) {
        LOG_WARNING() << "Failed to send SOCKS5 failure reply (" << ToString(status) << "): " << ex.what();
    }
}

template <typename Stream>
void Acceptor<Stream>::Reply(
    uint8_t status,
    const Address& address,
    uint16_t port,
    userver::engine::Deadline deadline
) {
    UINVARIANT(!replied_, "SOCKS5 reply has already been sent");
    replied_ = true;

    std::vector<uint8_t> response = {kSocksVersion, status, 0x00};
    response.reserve(22);
    SerializeAddress(address, response);
    response.push_back(static_cast<uint8_t>(port >> 8));
    response.push_back(static_cast<uint8_t>(port & 0xFF));

    // The whole reply goes out in one write.
    stream_.SendAll(response, deadline);
}

}  // namespace socksrelay::socks5
