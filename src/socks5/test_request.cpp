#include "socks5/request.hpp"

#include <userver/utest/utest.hpp>

using namespace socksrelay::socks5;

TEST(Request, MakeFromCommandByte) {
    const auto connect = MakeRequest(kCmdConnect, DomainName{"example.com"}, 443);
    ASSERT_TRUE(std::holds_alternative<ConnectRequest>(connect));
    EXPECT_EQ(std::get<ConnectRequest>(connect).port, 443);
    EXPECT_TRUE((std::get<ConnectRequest>(connect).address == Address{DomainName{"example.com"}}));

    EXPECT_TRUE(std::holds_alternative<BindRequest>(MakeRequest(kCmdBind, IpV4Address{}, 0)));
    EXPECT_TRUE(std::holds_alternative<UdpAssociateRequest>(MakeRequest(kCmdUdpAssociate, IpV6Address{}, 53)));
}

TEST(Request, UnknownCommand) {
    EXPECT_THROW(MakeRequest(0x04, IpV4Address{}, 80), ProtocolError);
    EXPECT_THROW(MakeRequest(0x00, IpV4Address{}, 80), ProtocolError);
}

TEST(Request, Formatting) {
    EXPECT_EQ(ToString(Request{ConnectRequest{IpV4Address{{10, 0, 0, 1}}, 8080}}), "Connect(10.0.0.1:8080)");
    EXPECT_EQ(ToString(Request{BindRequest{DomainName{"example.com"}, 21}}), "Bind(example.com:21)");
    EXPECT_EQ(ToString(Request{UdpAssociateRequest{IpV6Address{}, 53}}), "UdpAssociate([::]:53)");
}
