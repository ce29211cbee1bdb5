// SPDX-License-Identifier: MIT

// lib/stream/demand.hpp
#pragma once

#include <cstdint>
#include <limits>

namespace query_pipe {

// Outstanding consumer demand: items requested but not yet delivered.
//
// Additions saturate at UINT64_MAX instead of wrapping; a saturated
// counter is treated as unbounded and is never decremented.
class Demand {
public:
    static constexpr uint64_t kUnbounded = std::numeric_limits<uint64_t>::max();

    void Add(uint64_t n) {
        if (n > kUnbounded - value_) {
            value_ = kUnbounded;
        } else {
            value_ += n;
        }
    }

    // Consume one unit. Returns false if there is no demand.
    bool TryTake() {
        if (value_ == 0) return false;
        if (value_ != kUnbounded) --value_;
        return true;
    }

    bool HasDemand() const { return value_ > 0; }
    bool IsUnbounded() const { return value_ == kUnbounded; }
    uint64_t value() const { return value_; }

private:
    uint64_t value_ = 0;
};

}  // namespace query_pipe
