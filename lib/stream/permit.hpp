// SPDX-License-Identifier: MIT

// lib/stream/permit.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace query_pipe {

/// Outcome of a blocking Permit::Acquire().
enum class AcquireResult {
    Acquired,   ///< A permit was taken
    TimedOut,   ///< The wait exceeded the timeout
    Closed      ///< Close() was called before a permit became available
};

/// Counting permit used to pace a blocking producer thread.
///
/// Release() adds a permit and may be called more often than needed;
/// unused permits accumulate. Close() wakes every waiter without a matching
/// Release() and makes all later Acquire() calls return Closed immediately.
///
/// Thread safety: all methods may be called from any thread.
class Permit {
public:
    explicit Permit(uint64_t initial = 0) : available_(initial) {}

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    /// Add one permit and wake one waiter. No-op after Close().
    void Release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            ++available_;
        }
        cv_.notify_one();
    }

    /// Timeouts at or above this wait without a deadline.
    static constexpr std::chrono::milliseconds kUnboundedWait = std::chrono::hours{24 * 365};

    /// Block until a permit is available, the permit is closed, or the
    /// timeout expires.
    AcquireResult Acquire(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this] { return closed_ || available_ > 0; };
        // wait_for converts to the clock's duration, which overflows near max()
        if (timeout >= kUnboundedWait) {
            cv_.wait(lock, ready);
        } else if (!cv_.wait_for(lock, timeout, ready)) {
            return AcquireResult::TimedOut;
        }
        if (closed_) return AcquireResult::Closed;
        --available_;
        return AcquireResult::Acquired;
    }

    /// Wake all waiters and refuse further permits. Idempotent.
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
            available_ = 0;
        }
        cv_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    uint64_t Available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t available_;
    bool closed_ = false;
};

}  // namespace query_pipe
