// SPDX-License-Identifier: MIT

// src/fetch_query.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <expected>
#include <memory>
#include <string_view>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/log.hpp"
#include "src/connection.hpp"
#include "src/record.hpp"
#include "src/result_gate.hpp"
#include "src/stream_config.hpp"
#include "src/stream_source.hpp"

namespace query_pipe {

/// How a one-shot fetch keeps a fast producer in check.
enum class FetchMode {
    Backpressured,  ///< Producer thread blocks in a ResultGate until rows are accepted
    Buffered        ///< Producer never blocks; the buffer overflow policy applies
};

inline std::string_view FetchModeToString(FetchMode mode) {
    switch (mode) {
        case FetchMode::Backpressured: return "backpressured";
        case FetchMode::Buffered: return "buffered";
    }
    return "";
}

/// @internal Local handle for a fetch; fetches have no engine-side token.
inline Token NextFetchToken() {
    static std::atomic<Token> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

/// One-shot bounded query exposed as a demand-driven StreamSource<T>.
///
/// Rows are converted with the RecordLoader on the producer thread. The
/// stream completes after the last row has been delivered; cancelling stops
/// the producer at its next row.
///
/// @code
/// FetchQuery<Order> query({.text = "SELECT FROM Orders", .limit = 500}, LoadOrder);
/// auto source = query.Execute(loop, conn).value();
/// source->OnNext([&](Order&& o) { ... });
/// source->Request(64);
/// @endcode
template<typename T = Record>
class FetchQuery {
public:
    FetchQuery(QueryRequest request, RecordLoader<T> loader,
               StreamConfig config = StreamConfig::FetchDefaults(),
               FetchMode mode = FetchMode::Backpressured)
        : request_(std::move(request)),
          loader_(std::move(loader)),
          config_(config),
          mode_(mode) {}

    /// Fetch raw records.
    explicit FetchQuery(QueryRequest request,
                        StreamConfig config = StreamConfig::FetchDefaults(),
                        FetchMode mode = FetchMode::Backpressured)
        requires std::same_as<T, Record>
        : FetchQuery(std::move(request), [](const Record& r) { return r; }, config, mode) {}

    /// Start the fetch and return the stream. Fails synchronously only for
    /// an invalid config; query errors arrive through OnError.
    std::expected<std::shared_ptr<StreamSource<T>>, Error> Execute(
        IEventLoop& loop, const std::shared_ptr<IConnection>& connection) const {
        if (auto valid = config_.Validate(); !valid) {
            return std::unexpected(valid.error());
        }

        // Nothing to unsubscribe: stopping the producer is the gate's job
        auto source = StreamSource<T>::Create(loop, config_, nullptr);
        std::shared_ptr<IResultListener> listener;

        if (mode_ == FetchMode::Backpressured) {
            auto gate = std::make_shared<ResultGate<T>>(source, loader_, config_.gate_timeout);
            std::weak_ptr<ResultGate<T>> weak_gate = gate;
            source->SetAcceptedHook([weak_gate]() {
                if (auto g = weak_gate.lock()) g->Release();
            });
            source->SetTerminatedHook([weak_gate]() {
                if (auto g = weak_gate.lock()) g->Finish();
            });
            listener = std::move(gate);
        } else {
            listener = std::make_shared<BufferingListener<T>>(source, loader_);
        }

        // Bound before any row is queued, so rows are never held back
        source->PushToken(NextFetchToken());

        Log()->info("fetch submitted ({}, limit {}): {}", FetchModeToString(mode_),
                    request_.limit, request_.text);
        connection->ActivateOnCurrentThread();
        connection->Fetch(request_, std::move(listener));
        return source;
    }

private:
    QueryRequest request_;
    RecordLoader<T> loader_;
    StreamConfig config_;
    FetchMode mode_;
};

}  // namespace query_pipe
