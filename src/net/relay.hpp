#pragma once

#include <userver/engine/async.hpp>
#include <userver/engine/deadline.hpp>
#include <userver/engine/wait_any.hpp>
#include <userver/logging/log.hpp>

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace socksrelay::net {

struct RelayStats {
    uint64_t uploaded{0};
    uint64_t downloaded{0};
    // Set when the relay was ended by an I/O error or by cancellation.
    std::optional<std::string> error;
};

namespace impl {

template <typename From, typename To>
void Pump(From& from, To& to, std::size_t buffer_size, uint64_t& transferred, std::string_view direction) {
    std::vector<uint8_t> buffer(buffer_size);
    while (true) {
        const auto bytes_received = from.ReadSome(buffer, {});
        if (bytes_received == 0) {
            LOG_DEBUG() << "End of stream reached while relaying " << direction;
            return;
        }

        to.SendAll({buffer.data(), bytes_received}, {});
        transferred += bytes_received;
    }
}

}  // namespace impl

// The direction that finishes first cancels the other one
template <typename Client, typename Upstream>
RelayStats Relay(Client& client, Upstream& upstream, std::size_t buffer_size) {
    RelayStats stats;

    auto upload = userver::engine::AsyncNoSpan([&client, &upstream, &stats, buffer_size] {
        impl::Pump(client, upstream, buffer_size, stats.uploaded, "client -> upstream");
    });
    auto download = userver::engine::AsyncNoSpan([&client, &upstream, &stats, buffer_size] {
        impl::Pump(upstream, client, buffer_size, stats.downloaded, "upstream -> client");
    });

    const auto finished = userver::engine::WaitAny(upload, download);
    if (!finished) {
        upload.SyncCancel();
        download.SyncCancel();
        stats.error = "relay cancelled";
        return stats;
    }

    auto& done = (*finished == 0) ? upload : download;
    auto& other = (*finished == 0) ? download : upload;
    other.SyncCancel();

    try {
        done.Get();
    } catch (const std::exception& ex) {
        stats.error = ex.what();
    }

    return stats;
}

}  // namespace socksrelay::net
