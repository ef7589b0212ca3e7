#include "net/relay.hpp"
#include "testing/memory_stream.hpp"

#include <userver/engine/async.hpp>
#include <userver/engine/sleep.hpp>
#include <userver/utest/utest.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using socksrelay::net::Relay;
using socksrelay::net::RelayStats;
using socksrelay::tests::MemoryStream;

namespace {

std::vector<uint8_t> Bytes(const std::string& text) { return {text.begin(), text.end()}; }

}  // namespace

UTEST(Relay, ClientEndOfStreamEndsRelay) {
    MemoryStream client(Bytes("hello upstream"));
    MemoryStream upstream;
    upstream.HoldOpen();

    const auto stats = Relay(client, upstream, 4);

    EXPECT_EQ(upstream.Written(), Bytes("hello upstream"));
    EXPECT_EQ(stats.uploaded, 14u);
    EXPECT_EQ(stats.downloaded, 0u);
    EXPECT_FALSE(stats.error.has_value());
}

UTEST(Relay, UpstreamEndOfStreamEndsRelay) {
    MemoryStream client;
    client.HoldOpen();
    MemoryStream upstream(Bytes("response"));

    const auto stats = Relay(client, upstream, 4096);

    EXPECT_EQ(client.Written(), Bytes("response"));
    EXPECT_EQ(stats.uploaded, 0u);
    EXPECT_EQ(stats.downloaded, 8u);
    EXPECT_FALSE(stats.error.has_value());
}

UTEST(Relay, WriteErrorEndsRelay) {
    MemoryStream client(Bytes("data"));
    client.HoldOpen();
    MemoryStream upstream;
    upstream.HoldOpen().FailWrites();

    const auto stats = Relay(client, upstream, 4096);

    EXPECT_EQ(stats.uploaded, 0u);
    ASSERT_TRUE(stats.error.has_value());
    EXPECT_EQ(*stats.error, "write failed");
}

UTEST(Relay, CancellationEndsRelay) {
    MemoryStream client;
    client.HoldOpen();
    MemoryStream upstream;
    upstream.HoldOpen();

    std::optional<RelayStats> stats;
    auto task = userver::engine::AsyncNoSpan([&] { stats = Relay(client, upstream, 4096); });
    userver::engine::SleepFor(std::chrono::milliseconds{10});
    task.RequestCancel();
    task.Wait();

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->uploaded, 0u);
    EXPECT_EQ(stats->downloaded, 0u);
    ASSERT_TRUE(stats->error.has_value());
    EXPECT_EQ(*stats->error, "relay cancelled");
}
