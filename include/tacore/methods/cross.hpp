#pragma once
// ============================================================================
// TACORE - Cross
// ============================================================================
// Detects one series crossing another
// +1 = crossed above, -1 = crossed below, 0 = no cross
// ============================================================================

#include "tacore/core/types.hpp"

namespace tacore::methods {

class Cross {
public:
    Cross() = default;

    /// Compare the sign of (a - b) with the previous pair's
    /// The first call has no previous pair and never reports a cross
    Signal next(ValueType a, ValueType b) noexcept {
        const ValueType diff = a - b;

        Signal signal = Signal::none();
        if (has_previous_) {
            if (diff > 0.0 && prev_diff_ <= 0.0) {
                signal = Signal::buy();
            } else if (diff < 0.0 && prev_diff_ >= 0.0) {
                signal = Signal::sell();
            }
        }

        prev_diff_ = diff;
        has_previous_ = true;
        return signal;
    }

private:
    ValueType prev_diff_ = 0.0;
    bool has_previous_ = false;
};

}  // namespace tacore::methods
