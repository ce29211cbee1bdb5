// SPDX-License-Identifier: MIT

// src/result_gate.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "lib/stream/log.hpp"
#include "lib/stream/permit.hpp"
#include "src/connection.hpp"
#include "src/record.hpp"
#include "src/stream_source.hpp"

namespace query_pipe {

// ResultGate - demand-gating listener for one-shot fetches.
//
// The producer calls OnResult() synchronously on its own thread. Each row is
// forwarded to the StreamSource and the producer thread then blocks until
// the consumer has accepted a row (Release()), so the producer can never run
// more than one row ahead of the consumer.
//
// Thread safety:
// - OnResult/OnEnd/OnError are called from the producer thread.
// - Release() and Finish() may be called from any thread. Finish() wakes a
//   blocked producer without a matching Release() and is idempotent.
//
// Must not be used with a producer that calls back on the event loop thread:
// the loop is what delivers the releases.
template<typename T>
class ResultGate : public IResultListener {
public:
    ResultGate(std::shared_ptr<StreamSource<T>> source, RecordLoader<T> loader,
               std::chrono::milliseconds timeout)
        : source_(std::move(source)),
          loader_(std::move(loader)),
          timeout_(timeout) {}

    bool OnResult(Record record) override {
        if (IsFinished()) return false;

        source_->PushItem(loader_(record));

        switch (permit_.Acquire(timeout_)) {
            case AcquireResult::Acquired:
                return !IsFinished();
            case AcquireResult::Closed:
                return false;
            case AcquireResult::TimedOut:
                break;
        }

        Log()->warn("producer blocked for more than {}ms waiting for demand",
                    timeout_.count());
        source_->PushError(Error{
            ErrorCode::GateTimeout,
            fmt::format("consumer did not accept a row within {}ms", timeout_.count())});
        Finish();
        return false;
    }

    void OnEnd() override {
        if (ended_.exchange(true, std::memory_order_acq_rel)) return;
        source_->PushEnd();
    }

    void OnError(const Error& e) override {
        if (ended_.exchange(true, std::memory_order_acq_rel)) return;
        source_->PushError(e);
        Finish();
    }

    // One permit per accepted row. Extra releases accumulate.
    void Release() { permit_.Release(); }

    // Unblock the producer and stop granting permits.
    void Finish() {
        if (finished_.exchange(true, std::memory_order_acq_rel)) return;
        Log()->debug("result gate finished");
        permit_.Close();
    }

    bool IsFinished() const { return finished_.load(std::memory_order_acquire); }

private:
    std::shared_ptr<StreamSource<T>> source_;
    RecordLoader<T> loader_;
    std::chrono::milliseconds timeout_;
    Permit permit_;
    std::atomic<bool> finished_{false};
    std::atomic<bool> ended_{false};
};

// BufferingListener - forwards rows without blocking the producer.
//
// Used when the fetch runs in buffered mode: the StreamSource buffer and its
// overflow policy absorb a fast producer instead of the gate.
template<typename T>
class BufferingListener : public IResultListener {
public:
    BufferingListener(std::shared_ptr<StreamSource<T>> source, RecordLoader<T> loader)
        : source_(std::move(source)), loader_(std::move(loader)) {}

    bool OnResult(Record record) override {
        if (source_->IsCancelRequested() || source_->IsTerminated()) return false;
        source_->PushItem(loader_(record));
        return true;
    }

    void OnEnd() override {
        if (ended_.exchange(true, std::memory_order_acq_rel)) return;
        source_->PushEnd();
    }

    void OnError(const Error& e) override {
        if (ended_.exchange(true, std::memory_order_acq_rel)) return;
        source_->PushError(e);
    }

private:
    std::shared_ptr<StreamSource<T>> source_;
    RecordLoader<T> loader_;
    std::atomic<bool> ended_{false};
};

}  // namespace query_pipe
