// SPDX-License-Identifier: MIT

// src/stream_config.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <expected>

#include <fmt/format.h>

#include "lib/stream/bounded_buffer.hpp"
#include "lib/stream/error.hpp"

namespace query_pipe {

/// Flow-control settings for one stream.
struct StreamConfig {
    /// Longest gate_timeout Validate() accepts.
    static constexpr std::chrono::milliseconds kMaxGateTimeout = std::chrono::hours{24};

    std::size_t buffer_size = 1024;                     ///< Max undelivered items held
    OverflowPolicy overflow = OverflowPolicy::DropHead; ///< Rule when the buffer is full
    std::chrono::milliseconds gate_timeout{3000};       ///< Max wait for a permit or a token

    /// Preset for live queries: large buffer, oldest changes dropped first.
    static StreamConfig LiveDefaults() {
        return StreamConfig{
            .buffer_size = 10000,
            .overflow = OverflowPolicy::DropHead,
            .gate_timeout = std::chrono::milliseconds{3000},
        };
    }

    /// Preset for one-shot fetches: the gate bounds the producer, so the
    /// buffer only ever holds a handful of rows; overflowing it is a bug.
    static StreamConfig FetchDefaults() {
        return StreamConfig{
            .buffer_size = 16,
            .overflow = OverflowPolicy::Fail,
            .gate_timeout = std::chrono::milliseconds{30000},
        };
    }

    /// Check the settings before a stream is built from them.
    std::expected<void, Error> Validate() const {
        if (buffer_size == 0) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                                         "buffer_size must be positive"});
        }
        if (gate_timeout.count() <= 0) {
            return std::unexpected(Error{
                ErrorCode::InvalidConfig,
                fmt::format("gate_timeout must be positive, got {}ms", gate_timeout.count())});
        }
        if (gate_timeout > kMaxGateTimeout) {
            return std::unexpected(Error{
                ErrorCode::InvalidConfig,
                fmt::format("gate_timeout must not exceed {}ms, got {}ms",
                            kMaxGateTimeout.count(), gate_timeout.count())});
        }
        return {};
    }
};

}  // namespace query_pipe
