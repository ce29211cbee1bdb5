// SPDX-License-Identifier: MIT

// src/subscription_machine.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/bounded_buffer.hpp"
#include "lib/stream/demand.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/log.hpp"
#include "lib/stream/sink.hpp"
#include "src/record.hpp"

namespace query_pipe {

/// Observable lifecycle phase of a SubscriptionMachine.
enum class SubscriptionPhase {
    AwaitingToken,  ///< Subscribed, token not yet known; nothing is emitted
    Active,         ///< Token known; items flow against demand
    Cancelled,      ///< Cancelled before the token arrived; waiting to unsubscribe
    Completed,      ///< Terminal: completed normally (or after cancel)
    Failed          ///< Terminal: error delivered
};

inline std::string_view SubscriptionPhaseToString(SubscriptionPhase phase) {
    switch (phase) {
        case SubscriptionPhase::AwaitingToken: return "awaiting_token";
        case SubscriptionPhase::Active: return "active";
        case SubscriptionPhase::Cancelled: return "cancelled";
        case SubscriptionPhase::Completed: return "completed";
        case SubscriptionPhase::Failed: return "failed";
    }
    return "";
}

/// Flow-control state machine for one subscription.
///
/// Owns the buffer of undelivered items, the consumer demand and the token.
/// Each state carries only the data valid in it, so "active without a token"
/// cannot be represented:
///
///   AwaitingToken{buffer} --token--> Active{buffer, token}
///        |                               |
///        +--cancel--> Cancelled{} --token--> Completed (after unsubscribe)
///        |                 |
///        |                 +--error/end/token timeout--> Completed
///        |                               |
///        +---------- error/end ----------+--> Completed | Failed
///
/// Invariants:
/// - No item reaches the sink before the token is known.
/// - The buffer never exceeds its capacity once an event has been processed.
/// - Each emission consumes exactly one unit of demand.
/// - unsubscribe is invoked at most once, and only with a known token.
/// - The sink sees at most one terminal signal.
///
/// Thread safety: none. Every event must be delivered from one logical
/// context (StreamSource funnels them through the event loop).
template<typename T, typename Sink>
    requires ItemSink<Sink, T>
class SubscriptionMachine {
public:
    using Unsubscribe = std::function<void(Token)>;

    SubscriptionMachine(std::size_t capacity, OverflowPolicy policy,
                        Sink& sink, Unsubscribe unsubscribe)
        : state_(AwaitingToken{BoundedBuffer<T>(capacity, policy)}),
          sink_(sink),
          unsubscribe_(std::move(unsubscribe)) {}

    SubscriptionMachine(const SubscriptionMachine&) = delete;
    SubscriptionMachine& operator=(const SubscriptionMachine&) = delete;

    void OnToken(Token token) {
        if (auto* s = std::get_if<AwaitingToken>(&state_)) {
            Log()->debug("subscription token {} received, {} item(s) buffered",
                         token, s->buffer.size());
            state_ = Active{std::move(s->buffer), token};
        } else if (auto* s = std::get_if<Active>(&state_)) {
            if (s->token != token) {
                Log()->warn("ignoring token {}, subscription already bound to {}",
                            token, s->token);
            }
        } else if (std::holds_alternative<Cancelled>(state_)) {
            Log()->debug("token {} arrived after cancel, unsubscribing", token);
            DoUnsubscribe(token);
            Complete();
        } else {
            ReleaseLateToken(token);
        }
    }

    /// An item from the producer, optionally tagged with the token.
    void OnItem(T item, std::optional<Token> tag = std::nullopt) {
        if (auto* s = std::get_if<AwaitingToken>(&state_)) {
            if (tag) {
                state_ = Active{std::move(s->buffer), *tag};
                Store(std::get<Active>(state_).buffer, std::move(item), tag);
            } else {
                Store(s->buffer, std::move(item), std::nullopt);
            }
        } else if (auto* s = std::get_if<Active>(&state_)) {
            Drain(*s);
            if (demand_.TryTake()) {
                Emit(std::move(item));
            } else if (!Store(s->buffer, std::move(item), s->token)) {
                return;
            }
            MaybeFinish();
        } else if (std::holds_alternative<Cancelled>(state_)) {
            if (tag) {
                Log()->debug("item tagged with token {} arrived after cancel, unsubscribing",
                             *tag);
                DoUnsubscribe(*tag);
                Complete();
            } else {
                Log()->trace("dropping untagged item after cancel");
            }
        } else if (tag) {
            ReleaseLateToken(*tag);
        }
    }

    /// Consumer demand. Callers reject n == 0 before it gets here.
    void OnRequest(uint64_t n) {
        if (std::holds_alternative<AwaitingToken>(state_)) {
            demand_.Add(n);
        } else if (auto* s = std::get_if<Active>(&state_)) {
            demand_.Add(n);
            Drain(*s);
            MaybeFinish();
        }
    }

    void OnCancel() {
        if (std::holds_alternative<AwaitingToken>(state_)) {
            Log()->debug("cancelled before token, unsubscribe deferred");
            state_ = Cancelled{};
        } else if (auto* s = std::get_if<Active>(&state_)) {
            Token token = s->token;
            DoUnsubscribe(token);
            Complete();
        }
    }

    void OnError(const Error& e) {
        if (std::holds_alternative<AwaitingToken>(state_)) {
            Fail(e, std::nullopt);
        } else if (auto* s = std::get_if<Active>(&state_)) {
            // The producer already tore down its side for errors it reports
            std::optional<Token> token;
            if (is_local_error(e.code)) token = s->token;
            Fail(e, token);
        } else if (std::holds_alternative<Cancelled>(state_)) {
            // No token will follow a producer error; the consumer asked to stop anyway
            Log()->debug("error after cancel, completing: {}", e);
            Complete(is_local_error(e.code));
        }
    }

    /// The token did not arrive in time. Fails a waiting subscription with
    /// @p e; completes a cancelled one. Either way a token that still shows
    /// up later is unsubscribed once.
    void OnTokenTimeout(const Error& e) {
        if (std::holds_alternative<AwaitingToken>(state_)) {
            Log()->warn("{}", e);
            Fail(e, std::nullopt);
        } else if (std::holds_alternative<Cancelled>(state_)) {
            Log()->debug("no token after cancel, completing: {}", e);
            Complete(true);
        }
    }

    /// End of a bounded fetch. Completion waits for the buffer to drain.
    void OnEnd() {
        if (auto* s = std::get_if<AwaitingToken>(&state_)) {
            if (!s->buffer.empty()) {
                Log()->warn("stream ended before token, discarding {} buffered item(s)",
                            s->buffer.size());
            }
            Complete();
        } else if (auto* s = std::get_if<Active>(&state_)) {
            s->end_pending = true;
            MaybeFinish();
        } else if (std::holds_alternative<Cancelled>(state_)) {
            Complete();
        }
    }

    SubscriptionPhase phase() const {
        return static_cast<SubscriptionPhase>(state_.index());
    }

    bool IsTerminal() const {
        return std::holds_alternative<Completed>(state_) ||
               std::holds_alternative<Failed>(state_);
    }

    std::optional<Token> token() const {
        if (auto* s = std::get_if<Active>(&state_)) return s->token;
        return std::nullopt;
    }

    uint64_t demand() const { return demand_.value(); }

    std::size_t buffered() const {
        if (auto* s = std::get_if<AwaitingToken>(&state_)) return s->buffer.size();
        if (auto* s = std::get_if<Active>(&state_)) return s->buffer.size();
        return 0;
    }

    /// Copy of the buffered items, oldest first.
    std::vector<T> BufferedItems() const
        requires std::is_copy_constructible_v<T>
    {
        const BoundedBuffer<T>* buffer = nullptr;
        if (auto* s = std::get_if<AwaitingToken>(&state_)) buffer = &s->buffer;
        if (auto* s = std::get_if<Active>(&state_)) buffer = &s->buffer;
        if (!buffer) return {};
        return std::vector<T>(buffer->begin(), buffer->end());
    }

    /// The delivered error, if the machine failed.
    const Error* error() const {
        if (auto* s = std::get_if<Failed>(&state_)) return &s->error;
        return nullptr;
    }

private:
    struct AwaitingToken {
        BoundedBuffer<T> buffer;
    };
    struct Active {
        BoundedBuffer<T> buffer;
        Token token;
        bool end_pending = false;
    };
    struct Cancelled {};
    struct Completed {
        bool unsubscribe_late_token = false;
    };
    struct Failed {
        Error error;
        bool unsubscribe_late_token = false;
    };

    // Alternative order matches SubscriptionPhase
    using State = std::variant<AwaitingToken, Active, Cancelled, Completed, Failed>;

    void Emit(T&& item) {
        sink_.OnNext(std::move(item));
    }

    void Drain(Active& s) {
        while (!s.buffer.empty() && demand_.TryTake()) {
            Emit(s.buffer.Pop());
        }
    }

    // Buffers under the overflow policy. Returns false if the machine failed.
    bool Store(BoundedBuffer<T>& buffer, T&& item, std::optional<Token> token) {
        OfferResult result = buffer.Offer(std::move(item));
        if (result.failed) {
            Log()->warn("buffer of size {} overflowed, failing stream", buffer.capacity());
            Fail(Error{ErrorCode::BufferOverflow,
                       fmt::format("Buffer of size {} has overflown", buffer.capacity())},
                 token);
            return false;
        }
        if (result.overflowed) {
            Log()->debug("buffer full ({}), {} dropped {} item(s)", buffer.capacity(),
                         OverflowPolicyToString(buffer.policy()), result.dropped);
        }
        return true;
    }

    void MaybeFinish() {
        auto* s = std::get_if<Active>(&state_);
        if (s && s->end_pending && s->buffer.empty()) {
            Complete();
        }
    }

    void DoUnsubscribe(Token token) {
        if (unsubscribe_) unsubscribe_(token);
    }

    // Terminated while the token was outstanding on our side (e.g. token
    // timeout): the producer may still register the subscription, so
    // release it once.
    void ReleaseLateToken(Token token) {
        bool* pending = nullptr;
        if (auto* s = std::get_if<Failed>(&state_)) pending = &s->unsubscribe_late_token;
        if (auto* s = std::get_if<Completed>(&state_)) pending = &s->unsubscribe_late_token;
        if (!pending || !*pending) return;
        *pending = false;
        Log()->debug("late token {} for terminated subscription, unsubscribing", token);
        DoUnsubscribe(token);
    }

    void Complete(bool unsubscribe_late_token = false) {
        state_ = Completed{unsubscribe_late_token};
        sink_.OnComplete();
    }

    void Fail(const Error& e, std::optional<Token> unsubscribe_token) {
        Error error = e;  // e may refer into state_
        // A token may still show up for a subscription we gave up on locally
        bool late_token = std::holds_alternative<AwaitingToken>(state_) &&
                          is_local_error(error.code);
        if (unsubscribe_token) DoUnsubscribe(*unsubscribe_token);
        state_ = Failed{error, late_token};
        sink_.OnError(error);
    }

    State state_;
    Demand demand_;
    Sink& sink_;
    Unsubscribe unsubscribe_;
};

}  // namespace query_pipe
