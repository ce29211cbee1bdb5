// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <chrono>
#include <functional>

namespace query_pipe {

/// Event loop interface used to serialize stream events.
///
/// Every subscription state transition runs as a deferred callback on the
/// loop thread, so a stream never processes two events concurrently.
/// Implement this to integrate query-pipe with an existing event loop
/// (libuv, asio, etc.). EpollEventLoop is the built-in implementation.
///
/// All callbacks are invoked on the event loop thread.
class IEventLoop {
public:
    using TimerCallback = std::function<void()>;

    virtual ~IEventLoop() = default;

    /// Schedule a callback for the next event loop iteration.
    /// Callable from any thread; callbacks run in submission order.
    virtual void Defer(std::function<void()> fn) = 0;

    /// Schedule a callback after a delay.
    /// @param delay  Minimum time before callback fires
    /// @param fn     Callback to invoke
    virtual void Schedule(std::chrono::milliseconds delay, TimerCallback fn) = 0;

    /// Return true if the caller is on the event loop thread.
    virtual bool IsInEventLoopThread() const = 0;
};

}  // namespace query_pipe
