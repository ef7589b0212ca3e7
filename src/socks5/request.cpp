#include "request.hpp"

#include <userver/utils/overloaded.hpp>

namespace socksrelay::socks5 {

Request MakeRequest(uint8_t command, Address address, uint16_t port) {
    switch (command) {
        case kCmdConnect:
            return ConnectRequest{std::move(address), port};
        case kCmdBind:
            return BindRequest{std::move(address), port};
        case kCmdUdpAssociate:
            return UdpAssociateRequest{std::move(address), port};
        default:
            throw ProtocolError("Unsupported command: " + std::to_string(command));
    }
}

std::string ToString(const Request& request) {
    const auto target = [](const auto& typed) { return ToString(typed.address) + ":" + std::to_string(typed.port); };

    return std::visit(
        userver::utils::Overloaded{
            [&target](const ConnectRequest& connect) { return "Connect(" + target(connect) + ")"; },
            [&target](const BindRequest& bind) { return "Bind(" + target(bind) + ")"; },
            [&target](const UdpAssociateRequest& udp) { return "UdpAssociate(" + target(udp) + ")"; },
        },
        request
    );
}

}  // namespace socksrelay::socks5
