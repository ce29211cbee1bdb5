// SPDX-License-Identifier: MIT

// lib/stream/sink.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <functional>
#include <utility>

#include "lib/stream/error.hpp"

namespace query_pipe {

/// Concept for the minimal sink lifecycle: error and completion.
template<typename S>
concept TerminalSink = requires(S& s, const Error& e) {
    { s.OnError(e) } -> std::same_as<void>;
    { s.OnComplete() } -> std::same_as<void>;
};

/// Concept for a sink that receives items of type T one at a time.
///
/// Refines TerminalSink with OnNext. A conforming sink sees OnNext zero or
/// more times followed by at most one of OnComplete / OnError.
template<typename S, typename T>
concept ItemSink = TerminalSink<S> && requires(S& s, T&& item) {
    { s.OnNext(std::move(item)) } -> std::same_as<void>;
};

/// Concrete item sink that dispatches through user-provided callbacks.
///
/// Callbacks are installed with the setters before the stream starts.
/// OnNext is guarded by an atomic mute flag: once MuteItems() is called,
/// items are silently dropped while terminal signals keep flowing, so a
/// consumer that cancels still sees its completion.
template<typename T>
class CallbackSink {
public:
    void SetOnNext(std::function<void(T&&)> fn) { on_next_ = std::move(fn); }
    void SetOnError(std::function<void(const Error&)> fn) { on_error_ = std::move(fn); }
    void SetOnComplete(std::function<void()> fn) { on_complete_ = std::move(fn); }

    /// Deliver one item to the downstream consumer.
    void OnNext(T&& item) {
        if (items_muted_.load(std::memory_order_acquire)) return;
        if (on_next_) on_next_(std::move(item));
    }

    /// Report an error to the downstream consumer.
    void OnError(const Error& e) {
        if (on_error_) on_error_(e);
    }

    /// Signal normal stream completion.
    void OnComplete() {
        if (on_complete_) on_complete_();
    }

    /// Stop item delivery only. Thread-safe.
    void MuteItems() { items_muted_.store(true, std::memory_order_release); }

private:
    std::function<void(T&&)> on_next_;
    std::function<void(const Error&)> on_error_;
    std::function<void()> on_complete_;
    std::atomic<bool> items_muted_{false};
};

static_assert(ItemSink<CallbackSink<int>, int>, "CallbackSink must satisfy ItemSink");

}  // namespace query_pipe
