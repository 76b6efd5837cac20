#pragma once
// ============================================================================
// TACORE - Rate of Change
// ============================================================================
// Change of a series against its value `period` steps back
// ============================================================================

#include "tacore/core/types.hpp"
#include "tacore/core/window.hpp"

#include <cstdint>
#include <stdexcept>

namespace tacore::methods {

enum class ChangeKind : uint8_t {
    Relative = 0,  // (x - x_old) / x_old, 0 when x_old == 0
    Absolute = 1   // x - x_old
};

class RateOfChange {
public:
    /// The first `period` outputs are measured against `seed`
    RateOfChange(PeriodType period, ValueType seed, ChangeKind kind = ChangeKind::Relative)
        : window_(check_period(period), seed), kind_(kind) {}

    ValueType next(ValueType value) {
        const ValueType old = window_.push(value);

        if (kind_ == ChangeKind::Absolute) {
            return value - old;
        }
        if (old == 0.0) return 0.0;
        return (value - old) / old;
    }

    [[nodiscard]] PeriodType period() const noexcept {
        return static_cast<PeriodType>(window_.capacity());
    }

    [[nodiscard]] ChangeKind kind() const noexcept { return kind_; }

private:
    static PeriodType check_period(PeriodType period) {
        if (period == 0) {
            throw std::invalid_argument("RateOfChange period must be positive");
        }
        return period;
    }

    // Holds the last `period` inputs; push hands back the one `period` steps ago
    Window<ValueType> window_;
    ChangeKind kind_;
};

}  // namespace tacore::methods
