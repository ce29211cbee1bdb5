// SPDX-License-Identifier: MIT

// src/stream_source.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/log.hpp"
#include "lib/stream/sink.hpp"
#include "src/stream_config.hpp"
#include "src/subscription_machine.hpp"

namespace query_pipe {

/// Consumer-facing, demand-driven stream of T.
///
/// Consumer contract: Request(n) with n > 0, Cancel() at any time, and
/// OnNext* followed by at most one OnComplete or OnError.
///
/// Producer contract: PushToken / PushItem / PushEnd / PushError from any
/// thread.
///
/// Every call is marshalled onto the event loop with Defer() and applied to
/// the SubscriptionMachine there, one event at a time in arrival order.
/// Consumer callbacks therefore run on the loop thread; a callback that
/// calls Request() or Cancel() is never re-entered.
///
/// Lifecycle: single-use. Register callbacks before the first Request().
///
/// @code
/// auto source = LiveQuery("LIVE SELECT FROM Orders").Execute(loop, conn).value();
/// source->OnNext([&](LiveEvent&& e) { handle(e); source->Request(1); });
/// source->OnError([](const Error& e) { /* ... */ });
/// source->Request(1);
/// loop.Run();
/// @endcode
template<typename T>
class StreamSource : public std::enable_shared_from_this<StreamSource<T>> {
    struct PrivateTag {};

public:
    using Unsubscribe = std::function<void(Token)>;

    /// Create a stream. @p config must have passed StreamConfig::Validate().
    /// @param loop         Event loop that serializes all events
    /// @param config       Buffer capacity, overflow policy, gate timeout
    /// @param unsubscribe  Invoked on the loop thread, at most once, with the
    ///                     token of a subscription that must be released
    static std::shared_ptr<StreamSource> Create(IEventLoop& loop, StreamConfig config,
                                                Unsubscribe unsubscribe) {
        return std::make_shared<StreamSource>(PrivateTag{}, loop, config,
                                              std::move(unsubscribe));
    }

    /// @internal
    StreamSource(PrivateTag, IEventLoop& loop, StreamConfig config, Unsubscribe unsubscribe)
        : loop_(loop),
          config_(config),
          downstream_(*this),
          machine_(config.buffer_size, config.overflow, downstream_, std::move(unsubscribe)) {}

    StreamSource(const StreamSource&) = delete;
    StreamSource& operator=(const StreamSource&) = delete;

    // Consumer side

    /// Set callback for each delivered item.
    template <typename H>
        requires std::invocable<H, T&&>
    void OnNext(H&& h) {
        sink_.SetOnNext(std::forward<H>(h));
    }

    /// Set callback for the terminal error.
    template <typename H>
    void OnError(H&& h) {
        sink_.SetOnError(std::forward<H>(h));
    }

    /// Set callback for normal completion (also fired after a cancel).
    template <typename H>
    void OnComplete(H&& h) {
        sink_.SetOnComplete(std::forward<H>(h));
    }

    /// Ask for @p n more items. Thread-safe.
    /// @return InvalidDemand for n <= 0; the stream itself is unaffected.
    std::expected<void, Error> Request(int64_t n) {
        if (n <= 0) {
            return std::unexpected(Error{
                ErrorCode::InvalidDemand,
                fmt::format("request count must be positive, got {}", n)});
        }
        Post([n](StreamSource& self) {
            self.machine_.OnRequest(static_cast<uint64_t>(n));
        });
        return {};
    }

    /// Stop the stream. Thread-safe and idempotent. No item is delivered
    /// once this returns; completion follows after the unsubscribe, or once
    /// the producer fails or the token wait expires if no token was known.
    void Cancel() {
        if (cancel_requested_.exchange(true, std::memory_order_acq_rel)) return;
        sink_.MuteItems();
        Post([](StreamSource& self) { self.machine_.OnCancel(); });
    }

    // Producer side

    void PushToken(Token token) {
        Post([token](StreamSource& self) { self.machine_.OnToken(token); });
    }

    void PushItem(T item, std::optional<Token> tag = std::nullopt) {
        Post([item = std::move(item), tag](StreamSource& self) mutable {
            self.machine_.OnItem(std::move(item), tag);
        });
    }

    void PushEnd() {
        Post([](StreamSource& self) { self.machine_.OnEnd(); });
    }

    void PushError(Error e) {
        Post([e = std::move(e)](StreamSource& self) { self.machine_.OnError(e); });
    }

    /// Fail the stream with GateTimeout unless a token arrives within
    /// @p timeout. A stream cancelled before its token completes instead.
    /// Thread-safe.
    void ExpectTokenWithin(std::chrono::milliseconds timeout) {
        std::weak_ptr<StreamSource> weak_self = this->shared_from_this();
        loop_.Schedule(timeout, [weak_self, timeout]() {
            if (auto self = weak_self.lock()) {
                self->machine_.OnTokenTimeout(Error{
                    ErrorCode::GateTimeout,
                    fmt::format("no subscription token within {}ms", timeout.count())});
            }
        });
    }

    // Wiring hooks, set by the query runner before the producer starts

    /// Called on the loop thread after each item the consumer accepted.
    void SetAcceptedHook(std::function<void()> fn) { accepted_hook_ = std::move(fn); }

    /// Called on the loop thread once, when the stream reaches a terminal state.
    void SetTerminatedHook(std::function<void()> fn) { terminated_hook_ = std::move(fn); }

    // Introspection (for testing/debugging). Loop thread only, except the
    // two atomic flags.

    SubscriptionPhase GetPhase() const {
        RequireLoopThread(__func__);
        return machine_.phase();
    }

    std::optional<Token> GetToken() const {
        RequireLoopThread(__func__);
        return machine_.token();
    }

    uint64_t GetDemand() const {
        RequireLoopThread(__func__);
        return machine_.demand();
    }

    std::size_t GetBuffered() const {
        RequireLoopThread(__func__);
        return machine_.buffered();
    }

    std::vector<T> GetBufferedItems() const
        requires std::is_copy_constructible_v<T>
    {
        RequireLoopThread(__func__);
        return machine_.BufferedItems();
    }

    const StreamConfig& config() const { return config_; }

    /// True once Cancel() has been called. Thread-safe.
    bool IsCancelRequested() const {
        return cancel_requested_.load(std::memory_order_acquire);
    }

    /// True once a terminal signal has been delivered. Thread-safe.
    bool IsTerminated() const {
        return terminated_.load(std::memory_order_acquire);
    }

private:
    // Adapts machine output to the consumer sink and the wiring hooks.
    class Downstream {
    public:
        explicit Downstream(StreamSource& source) : source_(source) {}

        void OnNext(T&& item) {
            source_.sink_.OnNext(std::move(item));
            if (source_.accepted_hook_) source_.accepted_hook_();
        }

        void OnError(const Error& e) {
            Log()->debug("stream failed: {}", e);
            source_.MarkTerminated();
            source_.sink_.OnError(e);
        }

        void OnComplete() {
            Log()->debug("stream completed");
            source_.MarkTerminated();
            source_.sink_.OnComplete();
        }

    private:
        StreamSource& source_;
    };

    using Machine = SubscriptionMachine<T, Downstream>;

    template <typename F>
    void Post(F&& fn) {
        // Capture weak_ptr: a queued event must not keep a dropped stream alive
        std::weak_ptr<StreamSource> weak_self = this->shared_from_this();
        loop_.Defer([weak_self, fn = std::forward<F>(fn)]() mutable {
            if (auto self = weak_self.lock()) {
                fn(*self);
            }
        });
    }

    void RequireLoopThread(const char* func) const {
        if (loop_.IsInEventLoopThread()) return;
        std::fprintf(stderr, "StreamSource::%s called off event loop thread\n", func);
        std::terminate();
    }

    void MarkTerminated() {
        if (terminated_.exchange(true, std::memory_order_acq_rel)) return;
        if (terminated_hook_) terminated_hook_();
    }

    IEventLoop& loop_;
    StreamConfig config_;
    CallbackSink<T> sink_;
    std::function<void()> accepted_hook_;
    std::function<void()> terminated_hook_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> terminated_{false};
    Downstream downstream_;
    Machine machine_;
};

}  // namespace query_pipe
