#include "socks5/connector.hpp"
#include "net/sockaddr.hpp"

#include <userver/engine/async.hpp>
#include <userver/engine/io/socket.hpp>
#include <userver/engine/sleep.hpp>
#include <userver/engine/task/current_task.hpp>
#include <userver/utest/utest.hpp>

#include <thread>

using namespace std::chrono_literals;
using namespace socksrelay::socks5;

namespace {

userver::engine::io::Socket MakeListeningSocket() {
    const auto sockaddr = socksrelay::net::CreateSockAddrIp("127.0.0.1", 0);
    userver::engine::io::Socket socket(sockaddr.Domain(), userver::engine::io::SocketType::kStream);
    socket.Bind(sockaddr);
    socket.Listen();
    return socket;
}

Connector MakeConnector() { return Connector(userver::engine::current_task::GetTaskProcessor(), 5s); }

FailStatus ConnectFailure(const Connector& connector, const Request& request) {
    try {
        [[maybe_unused]] auto socket = connector.Connect(request);
    } catch (const ConnectError& ex) {
        return ex.Status();
    }
    ADD_FAILURE() << "Connect to " << ToString(request) << " unexpectedly succeeded";
    return FailStatus::kGeneralFailure;
}

}  // namespace

UTEST_MT(Connector, ConnectsToListeningSocket, 2) {
    auto listener = MakeListeningSocket();
    const auto port = static_cast<uint16_t>(listener.Getsockname().Port());
    const auto connector = MakeConnector();

    auto upstream = connector.Connect(ConnectRequest{IpV4Address{{127, 0, 0, 1}}, port});
    const auto bound = FromSockaddr(upstream.GetSockname());
    EXPECT_TRUE((bound == Address{IpV4Address{{127, 0, 0, 1}}}));
    EXPECT_NE(upstream.GetSockname().Port(), 0);
}

UTEST_MT(Connector, ConnectsByDomainName, 2) {
    auto listener = MakeListeningSocket();
    const auto port = static_cast<uint16_t>(listener.Getsockname().Port());
    const auto connector = MakeConnector();

    auto upstream = connector.Connect(ConnectRequest{DomainName{"localhost"}, port});
    EXPECT_EQ(upstream.GetPeername().Port(), port);
}

UTEST_MT(Connector, ConnectionRefused, 2) {
    uint16_t port = 0;
    {
        auto listener = MakeListeningSocket();
        port = static_cast<uint16_t>(listener.Getsockname().Port());
    }
    const auto connector = MakeConnector();

    EXPECT_EQ(ConnectFailure(connector, ConnectRequest{IpV4Address{{127, 0, 0, 1}}, port}), FailStatus::kConnectionRefused);
}

UTEST_MT(Connector, UnresolvableDomain, 2) {
    const auto connector = MakeConnector();
    EXPECT_EQ(ConnectFailure(connector, ConnectRequest{DomainName{"name.invalid"}, 80}), FailStatus::kHostUnreachable);
}

UTEST_MT(Connector, OnlyConnectIsSupported, 2) {
    const auto connector = MakeConnector();
    EXPECT_EQ(ConnectFailure(connector, BindRequest{IpV4Address{}, 80}), FailStatus::kCommandNotSupported);
    EXPECT_EQ(ConnectFailure(connector, UdpAssociateRequest{IpV6Address{}, 53}), FailStatus::kCommandNotSupported);
}

UTEST_MT(Connector, CancellationInterruptsNameResolution, 2) {
    const Connector connector(
        userver::engine::current_task::GetTaskProcessor(),
        5s,
        [](const std::string&, uint16_t) -> std::vector<socksrelay::net::Sockaddr> {
            // occupies the thread like a stalled getaddrinfo()
            std::this_thread::sleep_for(1s);
            throw socksrelay::net::ResolveError("resolver stalled");
        }
    );

    auto task = userver::engine::AsyncNoSpan([&connector] {
        [[maybe_unused]] auto upstream = connector.Connect(ConnectRequest{DomainName{"stalled.example"}, 80});
    });
    userver::engine::SleepFor(50ms);
    ASSERT_FALSE(task.IsFinished());

    task.RequestCancel();
    task.WaitFor(300ms);
    EXPECT_TRUE(task.IsFinished());
}

UTEST_MT(Connector, NameResolutionTimeout, 2) {
    const Connector connector(
        userver::engine::current_task::GetTaskProcessor(),
        100ms,
        [](const std::string&, uint16_t) -> std::vector<socksrelay::net::Sockaddr> {
            std::this_thread::sleep_for(500ms);
            throw socksrelay::net::ResolveError("resolver stalled");
        }
    );

    EXPECT_EQ(ConnectFailure(connector, ConnectRequest{DomainName{"stalled.example"}, 80}), FailStatus::kHostUnreachable);
}
