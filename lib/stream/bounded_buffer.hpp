// SPDX-License-Identifier: MIT

// lib/stream/bounded_buffer.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string_view>
#include <utility>

namespace query_pipe {

// Rule applied when an item arrives, cannot be emitted, and the buffer is full.
enum class OverflowPolicy {
    DropHead,    // Discard the oldest buffered item, append the new one
    DropTail,    // Replace the newest buffered item with the new one
    DropBuffer,  // Discard the whole buffer, keep only the new one
    DropNew,     // Discard the incoming item
    Fail         // Terminate the stream with a BufferOverflow error
};

inline std::optional<OverflowPolicy> OverflowPolicyFromString(std::string_view s) {
    if (s == "drop_head") return OverflowPolicy::DropHead;
    if (s == "drop_tail") return OverflowPolicy::DropTail;
    if (s == "drop_buffer") return OverflowPolicy::DropBuffer;
    if (s == "drop_new") return OverflowPolicy::DropNew;
    if (s == "fail") return OverflowPolicy::Fail;
    return std::nullopt;
}

inline std::string_view OverflowPolicyToString(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::DropHead: return "drop_head";
        case OverflowPolicy::DropTail: return "drop_tail";
        case OverflowPolicy::DropBuffer: return "drop_buffer";
        case OverflowPolicy::DropNew: return "drop_new";
        case OverflowPolicy::Fail: return "fail";
    }
    return "";
}

// Result of BoundedBuffer::Offer().
struct OfferResult {
    bool overflowed = false;   // Buffer was full when the item arrived
    std::size_t dropped = 0;   // Items discarded (including the offered one)
    bool failed = false;       // Fail policy tripped; buffer has been cleared
};

// FIFO buffer with a fixed capacity and an overflow policy.
//
// size() never exceeds capacity() after Offer() returns. Not thread-safe:
// owned by a single subscription and touched only from the event loop.
template<typename T>
class BoundedBuffer {
public:
    BoundedBuffer(std::size_t capacity, OverflowPolicy policy)
        : capacity_(capacity), policy_(policy) {}

    // Append an item, applying the overflow policy when full.
    OfferResult Offer(T item) {
        if (items_.size() < capacity_) {
            items_.push_back(std::move(item));
            return {};
        }

        OfferResult result{.overflowed = true};
        switch (policy_) {
            case OverflowPolicy::DropHead:
                if (!items_.empty()) items_.pop_front();
                items_.push_back(std::move(item));
                result.dropped = 1;
                break;
            case OverflowPolicy::DropTail:
                if (!items_.empty()) items_.pop_back();
                items_.push_back(std::move(item));
                result.dropped = 1;
                break;
            case OverflowPolicy::DropBuffer:
                result.dropped = items_.size();
                items_.clear();
                items_.push_back(std::move(item));
                break;
            case OverflowPolicy::DropNew:
                result.dropped = 1;
                break;
            case OverflowPolicy::Fail:
                result.dropped = items_.size() + 1;
                result.failed = true;
                items_.clear();
                break;
        }
        return result;
    }

    // Remove and return the oldest item. Buffer must not be empty.
    T Pop() {
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    bool empty() const { return items_.empty(); }
    std::size_t size() const { return items_.size(); }
    std::size_t capacity() const { return capacity_; }
    OverflowPolicy policy() const { return policy_; }

    auto begin() const { return items_.begin(); }
    auto end() const { return items_.end(); }

private:
    std::deque<T> items_;
    std::size_t capacity_;
    OverflowPolicy policy_;
};

}  // namespace query_pipe
