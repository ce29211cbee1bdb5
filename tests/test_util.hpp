// SPDX-License-Identifier: MIT

// tests/test_util.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace query_pipe::test {

// Poll the loop until pred() holds or the timeout expires. pred() runs on
// the loop thread, after at least one poll.
inline bool RunUntil(EpollEventLoop& loop, const std::function<bool()>& pred,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds{2000}) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        loop.Poll(5);
        if (pred()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
    }
}

// Single-threaded IEventLoop driven by hand. Deferred callbacks queue up
// until RunPending(); timers fire only on FireTimers().
class ManualLoop : public IEventLoop {
public:
    void Defer(std::function<void()> fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(fn));
    }

    void Schedule(std::chrono::milliseconds delay, TimerCallback fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_.push_back(delay);
        timers_.push_back(std::move(fn));
    }

    bool IsInEventLoopThread() const override { return true; }

    // Run queued callbacks, including any they queue. Returns how many ran.
    std::size_t RunPending() {
        std::size_t ran = 0;
        while (true) {
            std::function<void()> fn;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (queue_.empty()) break;
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            fn();
            ++ran;
        }
        return ran;
    }

    // Fire every scheduled timer, then drain the queue.
    std::size_t FireTimers() {
        std::vector<TimerCallback> due;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            due.swap(timers_);
        }
        for (auto& fn : due) fn();
        RunPending();
        return due.size();
    }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::vector<std::chrono::milliseconds> scheduled_delays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::function<void()>> queue_;
    std::vector<TimerCallback> timers_;
    std::vector<std::chrono::milliseconds> delays_;
};

// Sink that records everything it is given.
template<typename T>
struct RecordingSink {
    std::vector<T> items;
    std::vector<Error> errors;
    int completions = 0;

    void OnNext(T&& item) { items.push_back(std::move(item)); }
    void OnError(const Error& e) { errors.push_back(e); }
    void OnComplete() { ++completions; }

    std::size_t terminal_count() const { return errors.size() + completions; }
};

}  // namespace query_pipe::test
