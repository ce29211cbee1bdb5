// SPDX-License-Identifier: MIT

// src/record.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace query_pipe {

// Producer-assigned handle of a live subscription, needed to unsubscribe.
using Token = int64_t;

// A row produced by the query engine. Immutable once produced.
//
// Field values stay in the engine's textual form; typed decoding is the job
// of a RecordLoader supplied by the caller.
struct Record {
    std::string rid;         // Engine record id, e.g. "#12:4"
    std::string class_name;  // Table/class the record belongs to
    int32_t version = 0;     // Record version at the time it was produced
    std::map<std::string, std::string, std::less<>> fields;

    // Return the value of a field, or nullopt if absent.
    std::optional<std::string_view> Field(std::string_view name) const {
        auto it = fields.find(name);
        if (it == fields.end()) return std::nullopt;
        return std::string_view(it->second);
    }

    bool operator==(const Record&) const = default;
};

// Kind of change reported by a live query.
enum class LiveOperation {
    Created,
    Updated,
    Deleted
};

inline std::optional<LiveOperation> LiveOperationFromString(std::string_view s) {
    if (s == "created") return LiveOperation::Created;
    if (s == "updated") return LiveOperation::Updated;
    if (s == "deleted") return LiveOperation::Deleted;
    return std::nullopt;
}

inline std::string_view LiveOperationToString(LiveOperation op) {
    switch (op) {
        case LiveOperation::Created: return "created";
        case LiveOperation::Updated: return "updated";
        case LiveOperation::Deleted: return "deleted";
    }
    return "";
}

// A change event delivered by a live subscription.
//
// Engines that know the subscription token when they dispatch the event set
// `token`; others leave it empty and report the token through
// ILiveListener::OnToken().
struct LiveEvent {
    LiveOperation operation = LiveOperation::Created;
    Record record;
    std::optional<Token> token;

    bool operator==(const LiveEvent&) const = default;
};

// Converts an engine record into the consumer's item type.
template<typename T>
using RecordLoader = std::function<T(const Record&)>;

// Parameters of a one-shot query.
struct QueryRequest {
    std::string text;                    // Query text, passed through verbatim
    int64_t limit = -1;                  // Max rows, -1 for no limit
    std::string fetch_plan;              // Engine-specific fetch plan, may be empty
    std::vector<std::string> arguments;  // Positional query parameters
};

}  // namespace query_pipe
