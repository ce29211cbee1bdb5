// SPDX-License-Identifier: MIT

// src/connection.hpp
#pragma once

#include <expected>
#include <memory>
#include <string_view>

#include "lib/stream/error.hpp"
#include "src/record.hpp"

namespace query_pipe {

// Receives the rows of a one-shot fetch on the producer's thread.
class IResultListener {
public:
    virtual ~IResultListener() = default;

    // One row. Return false to ask the producer to stop fetching.
    virtual bool OnResult(Record record) = 0;

    // The fetch finished successfully.
    virtual void OnEnd() = 0;

    // The fetch failed; no further callbacks follow.
    virtual void OnError(const Error& e) = 0;
};

// Receives the events of a live subscription on the producer's thread.
class ILiveListener {
public:
    virtual ~ILiveListener() = default;

    // A change matching the live query.
    virtual void OnLiveEvent(LiveEvent event) = 0;

    // The producer registered the subscription. Called at most once, before
    // or after the first events.
    virtual void OnToken(Token token) = 0;

    // The subscription failed; no further callbacks follow.
    virtual void OnError(const Error& e) = 0;
};

// Connection to the query engine.
//
// A connection is bound to one thread at a time. A thread must call
// ActivateOnCurrentThread() before issuing commands; a thread that needs its
// own handle (e.g. the event loop issuing an unsubscribe) uses Fork().
// Listeners are held by the engine until the fetch resolves or the
// subscription is unsubscribed.
class IConnection {
public:
    virtual ~IConnection() = default;

    // Bind this connection to the calling thread.
    virtual void ActivateOnCurrentThread() = 0;

    // Open another handle on the same database for use on a different thread.
    virtual std::shared_ptr<IConnection> Fork() = 0;

    // Register a live query. Events and the token arrive asynchronously.
    virtual std::expected<void, Error> Subscribe(
        std::string_view query, std::shared_ptr<ILiveListener> listener) = 0;

    // Best-effort stop of a live subscription.
    virtual std::expected<void, Error> Unsubscribe(Token token) = 0;

    // Start a one-shot query on the engine's own thread. Resolves through
    // listener->OnEnd() or listener->OnError().
    virtual void Fetch(const QueryRequest& request,
                       std::shared_ptr<IResultListener> listener) = 0;
};

}  // namespace query_pipe
