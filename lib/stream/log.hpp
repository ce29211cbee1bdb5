// SPDX-License-Identifier: MIT

// lib/stream/log.hpp
#pragma once

#include <memory>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace query_pipe {

inline constexpr const char* kLoggerName = "query_pipe";

/// Shared logger for all query-pipe components.
///
/// Created on first use with a stderr color sink at Info level. Callers that
/// install their own sinks can register a logger named "query_pipe" with
/// spdlog before the first call.
inline std::shared_ptr<spdlog::logger> Log() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(kLoggerName)) return existing;
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::info);
        return created;
    }();
    return logger;
}

/// Set the query-pipe log level by name ("trace", "debug", "info", "warn",
/// "error", "off"). Unknown names fall back to "info".
inline void SetLogLevel(std::string_view level) {
    using spdlog::level::level_enum;
    if (level == "trace")      Log()->set_level(level_enum::trace);
    else if (level == "debug") Log()->set_level(level_enum::debug);
    else if (level == "warn")  Log()->set_level(level_enum::warn);
    else if (level == "error") Log()->set_level(level_enum::err);
    else if (level == "off")   Log()->set_level(level_enum::off);
    else                       Log()->set_level(level_enum::info);
}

}  // namespace query_pipe
