// SPDX-License-Identifier: MIT

// src/live_query.cpp
#include "src/live_query.hpp"

#include <utility>

#include "lib/stream/log.hpp"

namespace query_pipe {

namespace {

// Bridges engine callbacks into the stream's mailbox.
class LiveListener : public ILiveListener {
public:
    explicit LiveListener(std::shared_ptr<StreamSource<LiveEvent>> source)
        : source_(std::move(source)) {}

    void OnLiveEvent(LiveEvent event) override {
        std::optional<Token> tag = event.token;
        Log()->trace("live event {} on {}", LiveOperationToString(event.operation),
                     event.record.rid);
        source_->PushItem(std::move(event), tag);
    }

    void OnToken(Token token) override {
        source_->PushToken(token);
    }

    void OnError(const Error& e) override {
        source_->PushError(e);
    }

private:
    std::shared_ptr<StreamSource<LiveEvent>> source_;
};

}  // namespace

std::expected<std::shared_ptr<StreamSource<LiveEvent>>, Error> LiveQuery::Execute(
    IEventLoop& loop, const std::shared_ptr<IConnection>& connection) const {
    if (auto valid = config_.Validate(); !valid) {
        return std::unexpected(valid.error());
    }

    std::weak_ptr<IConnection> weak_connection = connection;
    auto unsubscribe = [weak_connection, query = query_](Token token) {
        auto origin = weak_connection.lock();
        if (!origin) {
            Log()->warn("connection closed, cannot unsubscribe token {}", token);
            return;
        }
        // The caller's connection is bound to its own thread
        auto handle = origin->Fork();
        handle->ActivateOnCurrentThread();
        if (auto r = handle->Unsubscribe(token); !r) {
            Log()->warn("unsubscribe of token {} failed: {}", token, r.error());
            return;
        }
        Log()->info("unsubscribed token {} ({})", token, query);
    };

    auto source = StreamSource<LiveEvent>::Create(loop, config_, std::move(unsubscribe));
    auto listener = std::make_shared<LiveListener>(source);

    source->ExpectTokenWithin(config_.gate_timeout);

    connection->ActivateOnCurrentThread();
    if (auto r = connection->Subscribe(query_, listener); !r) {
        Log()->warn("live subscribe failed: {}", r.error());
        source->PushError(r.error());
    } else {
        Log()->info("live query submitted: {}", query_);
    }

    return source;
}

}  // namespace query_pipe
