// SPDX-License-Identifier: MIT

// src/live_query.hpp
#pragma once

#include <expected>
#include <memory>
#include <string>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/connection.hpp"
#include "src/record.hpp"
#include "src/stream_config.hpp"
#include "src/stream_source.hpp"

namespace query_pipe {

// LiveQuery - subscribes to a live query and exposes its change events as a
// demand-driven StreamSource<LiveEvent>.
//
// The producer is the engine's notification thread and is never blocked:
// events beyond consumer demand go to the stream buffer under the configured
// overflow policy. A live stream never completes on its own; it ends with
// Cancel() (after the unsubscribe) or with an error.
//
// Unsubscribe is issued from the event loop thread on a forked connection.
// If the caller's connection is gone by then, the unsubscribe is skipped.
class LiveQuery {
public:
    explicit LiveQuery(std::string query,
                       StreamConfig config = StreamConfig::LiveDefaults())
        : query_(std::move(query)), config_(config) {}

    // Register the subscription and return the stream. Fails synchronously
    // only for an invalid config; subscribe errors arrive through OnError.
    std::expected<std::shared_ptr<StreamSource<LiveEvent>>, Error> Execute(
        IEventLoop& loop, const std::shared_ptr<IConnection>& connection) const;

private:
    std::string query_;
    StreamConfig config_;
};

}  // namespace query_pipe
