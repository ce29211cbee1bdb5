// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.cpp
#include "lib/stream/epoll_event_loop.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace query_pipe {

namespace {

[[noreturn]] void ThrowErrno(const char* what) {
    throw std::runtime_error(std::string(what) + " failed: " + std::strerror(errno));
}

}  // namespace

EpollEventLoop::EpollEventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        ThrowErrno("epoll_create1");
    }

    // eventfd for cross-thread wakeup
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        close(epoll_fd_);
        ThrowErrno("eventfd");
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        close(wake_fd_);
        close(epoll_fd_);
        ThrowErrno("epoll_ctl ADD wake_fd");
    }
}

EpollEventLoop::~EpollEventLoop() {
    for (auto& [fd, callback] : timers_) {
        close(fd);
    }
    timers_.clear();

    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        deferred_callbacks_.push_back(std::move(fn));
    }

    if (!IsInEventLoopThread()) {
        Wake();
    }
}

void EpollEventLoop::Schedule(std::chrono::milliseconds delay, TimerCallback fn) {
    int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        ThrowErrno("timerfd_create");
    }

    // A zero it_value disarms a timerfd, so round up to 1ns
    itimerspec ts{};
    ts.it_value.tv_sec = delay.count() / 1000;
    ts.it_value.tv_nsec = (delay.count() % 1000) * 1000000;
    if (ts.it_value.tv_sec == 0 && ts.it_value.tv_nsec == 0) {
        ts.it_value.tv_nsec = 1;
    }

    if (timerfd_settime(tfd, 0, &ts, nullptr) < 0) {
        close(tfd);
        ThrowErrno("timerfd_settime");
    }

    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        timers_.emplace(tfd, std::move(fn));
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = tfd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, tfd, &ev) < 0) {
        {
            std::lock_guard<std::mutex> lock(deferred_mutex_);
            timers_.erase(tfd);
        }
        close(tfd);
        ThrowErrno("epoll_ctl ADD timerfd");
    }
}

void EpollEventLoop::HandleTimerExpired(int timer_fd) {
    uint64_t expirations = 0;
    [[maybe_unused]] ssize_t n = read(timer_fd, &expirations, sizeof(expirations));

    TimerCallback callback;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        auto it = timers_.find(timer_fd);
        if (it == timers_.end()) return;
        callback = std::move(it->second);
        timers_.erase(it);
    }
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, timer_fd, nullptr);
    close(timer_fd);

    // Run outside the lock; the callback may Schedule() again
    if (callback) {
        callback();
    }
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
}

std::size_t EpollEventLoop::PendingCount() const {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    return deferred_callbacks_.size();
}

void EpollEventLoop::Poll(int timeout_ms) {
    loop_thread_id_.store(std::this_thread::get_id());

    ProcessDeferredCallbacks();

    // Deferred work queued by the callbacks above must not wait for epoll
    if (PendingCount() > 0) {
        timeout_ms = 0;
    }

    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);

    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        ThrowErrno("epoll_wait");
    }

    for (int i = 0; i < nfds; ++i) {
        int fd = events[i].data.fd;
        if (fd == wake_fd_) {
            uint64_t val;
            [[maybe_unused]] ssize_t n = read(wake_fd_, &val, sizeof(val));
        } else {
            HandleTimerExpired(fd);
        }
    }

    ProcessDeferredCallbacks();
}

void EpollEventLoop::Run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;  // Already running or stopped
    }
    while (state_.load() == State::Running) {
        Poll(100);  // 100ms timeout to check state_ periodically
    }
}

void EpollEventLoop::Stop() {
    state_.store(State::Stopped);
    Wake();  // Interrupt epoll_wait so Run() exits immediately
}

void EpollEventLoop::Wake() {
    uint64_t val = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &val, sizeof(val));
}

void EpollEventLoop::ProcessDeferredCallbacks() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        callbacks.swap(deferred_callbacks_);
    }

    for (auto& cb : callbacks) {
        if (cb) {
            cb();
        }
    }
}

}  // namespace query_pipe
