// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

#include <fmt/format.h>

namespace query_pipe {

/// Error codes for all stream and query operations.
enum class ErrorCode {
    // Producer
    QueryFailed,       ///< Query engine rejected or failed the query
    ConnectionLost,    ///< Connection to the query engine dropped mid-stream
    SubscribeFailed,   ///< Live subscription could not be registered

    // Flow control
    BufferOverflow,    ///< Buffer full under the Fail overflow policy
    GateTimeout,       ///< Waited too long for a permit or a subscription token

    // Usage
    InvalidDemand,     ///< Request(n) called with n <= 0
    InvalidState,      ///< Method called in wrong stream state
    InvalidConfig,     ///< StreamConfig failed validation
};

/// Error payload delivered to OnError callbacks.
struct Error {
    ErrorCode code;        ///< Classified error code
    std::string message;   ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "producer", "flow").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::QueryFailed:
        case ErrorCode::ConnectionLost:
        case ErrorCode::SubscribeFailed:
            return "producer";
        case ErrorCode::BufferOverflow:
        case ErrorCode::GateTimeout:
            return "flow";
        case ErrorCode::InvalidDemand:
        case ErrorCode::InvalidState:
        case ErrorCode::InvalidConfig:
            return "usage";
    }
    return "unknown";
}

/// Return the enumerator name of an error code.
constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::QueryFailed: return "QueryFailed";
        case ErrorCode::ConnectionLost: return "ConnectionLost";
        case ErrorCode::SubscribeFailed: return "SubscribeFailed";
        case ErrorCode::BufferOverflow: return "BufferOverflow";
        case ErrorCode::GateTimeout: return "GateTimeout";
        case ErrorCode::InvalidDemand: return "InvalidDemand";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

/// True for errors raised inside the stream rather than reported by the producer.
constexpr bool is_local_error(ErrorCode code) {
    return error_category(code) == "flow";
}

}  // namespace query_pipe

/// Formats as "<category>/<code>: <message>".
template <>
struct fmt::formatter<query_pipe::Error> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const query_pipe::Error& e, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}/{}: {}",
                              query_pipe::error_category(e.code),
                              query_pipe::error_code_name(e.code), e.message);
    }
};
