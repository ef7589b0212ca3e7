#pragma once

#include <userver/engine/deadline.hpp>
#include <userver/engine/sleep.hpp>
#include <userver/utils/span.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

namespace socksrelay::tests {

// Copies share the same buffers
class MemoryStream {
public:
    using Deadline = userver::engine::Deadline;

    template <typename T>
    using Span = userver::utils::span<T>;

    explicit MemoryStream(std::vector<uint8_t> input = {}) : state_{std::make_shared<State>()} {
        state_->input = std::move(input);
    }

    // Reads block until cancelled instead of reporting end of stream
    MemoryStream& HoldOpen() {
        state_->hold_open = true;
        return *this;
    }

    MemoryStream& FailWrites() {
        state_->fail_writes = true;
        return *this;
    }

    size_t ReadSome(Span<uint8_t> data, Deadline) {
        const auto available = state_->input.size() - state_->read_offset;
        if (available == 0 && state_->hold_open) {
            userver::engine::InterruptibleSleepFor(std::chrono::hours{1});
            throw std::runtime_error("read interrupted");
        }

        const auto count = std::min(available, data.size());
        std::copy_n(state_->input.begin() + state_->read_offset, count, data.begin());
        state_->read_offset += count;
        return count;
    }

    size_t ReadAll(Span<uint8_t> data, Deadline deadline) {
        size_t total = 0;
        while (total < data.size()) {
            const auto count = ReadSome({data.data() + total, data.size() - total}, deadline);
            if (count == 0) {
                break;
            }
            total += count;
        }
        return total;
    }

    size_t SendAll(Span<const uint8_t> data, Deadline) {
        if (state_->fail_writes) {
            throw std::runtime_error("write failed");
        }
        state_->output.insert(state_->output.end(), data.begin(), data.end());
        return data.size();
    }

    const std::vector<uint8_t>& Written() const { return state_->output; }

    size_t Remaining() const { return state_->input.size() - state_->read_offset; }

private:
    struct State {
        std::vector<uint8_t> input;
        size_t read_offset{0};
        std::vector<uint8_t> output;
        bool hold_open{false};
        bool fail_writes{false};
    };

    std::shared_ptr<State> state_;
};

}  // namespace socksrelay::tests
