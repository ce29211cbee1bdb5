// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace query_pipe {

/// Epoll-based event loop for deferred callbacks and timer scheduling.
///
/// Deferred callbacks form the mailbox that serializes stream events:
/// producers on any thread Defer() work, and the loop thread drains it in
/// FIFO order. Timers are timerfds registered with the same epoll set.
///
/// Thread safety: the loop itself runs on a single thread.  Defer(),
/// Schedule(), Stop() and Wake() may be called from any thread.
class EpollEventLoop : public IEventLoop {
public:
    /// Create an epoll instance and an internal eventfd for cross-thread wakeups.
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    /// Queue a callback to run on the event-loop thread.
    void Defer(std::function<void()> fn) override;

    /// Schedule a one-shot callback after @p delay.
    void Schedule(std::chrono::milliseconds delay, TimerCallback fn) override;

    /// @return True if the calling thread is the event-loop thread.
    bool IsInEventLoopThread() const override;

    /// Poll for events with the given timeout (milliseconds).  -1 blocks.
    void Poll(int timeout_ms);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the loop to exit after the current poll completes.
    void Stop();

    /// Wake the event loop from another thread (e.g. after Defer()).
    void Wake();

    /// @return Number of callbacks waiting for the next iteration.
    std::size_t PendingCount() const;

private:
    void ProcessDeferredCallbacks();
    void HandleTimerExpired(int timer_fd);

    enum class State { Idle, Running, Stopped };

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::thread::id> loop_thread_id_{};

    mutable std::mutex deferred_mutex_;
    std::vector<std::function<void()>> deferred_callbacks_;

    // Armed timers keyed by timerfd (protected by deferred_mutex_)
    std::unordered_map<int, TimerCallback> timers_;

    static constexpr int kMaxEvents = 64;
};

}  // namespace query_pipe
