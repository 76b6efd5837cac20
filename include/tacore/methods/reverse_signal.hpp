#pragma once
// ============================================================================
// TACORE - Reverse Signal (Pivot Detector)
// ============================================================================
// Reports a local extremum `right` observations after it happened
// Maximum -> -1 (sell), Minimum -> +1 (buy)
// ============================================================================

#include "tacore/core/types.hpp"
#include "tacore/core/window.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tacore::methods {

class ReverseSignal {
public:
    /// Window of left + 1 + right values prefilled with `seed`
    ReverseSignal(PeriodType left, PeriodType right, ValueType seed)
        : left_(check_span(left, "left")),
          right_(check_span(right, "right")),
          window_(left_ + right_ + 1, seed),
          max_age_(0),
          min_age_(0) {}

    /// The center (age `right`) is a maximum when it is >= every older value
    /// and > every newer one; a minimum mirrors that
    Signal next(ValueType value) {
        window_.push(value);
        ++max_age_;
        ++min_age_;

        // The newest occurrence of each extreme is tracked; the window is only
        // rescanned when that occurrence drops out
        if (max_age_ >= window_.capacity()) {
            max_age_ = rescan_max();
        } else if (value >= window_[max_age_]) {
            max_age_ = 0;
        }

        if (min_age_ >= window_.capacity()) {
            min_age_ = rescan_min();
        } else if (value <= window_[min_age_]) {
            min_age_ = 0;
        }

        if (max_age_ == right_) return Signal::sell();
        if (min_age_ == right_) return Signal::buy();
        return Signal::none();
    }

    [[nodiscard]] PeriodType left() const noexcept { return left_; }
    [[nodiscard]] PeriodType right() const noexcept { return right_; }

private:
    static PeriodType check_span(PeriodType span, const char* side) {
        if (span == 0) {
            throw std::invalid_argument(std::string("ReverseSignal ") + side +
                                        " span must be positive");
        }
        return span;
    }

    /// Age of the newest maximum
    [[nodiscard]] size_t rescan_max() const {
        size_t best = 0;
        for (size_t age = 1; age < window_.capacity(); ++age) {
            if (window_[age] > window_[best]) best = age;
        }
        return best;
    }

    /// Age of the newest minimum
    [[nodiscard]] size_t rescan_min() const {
        size_t best = 0;
        for (size_t age = 1; age < window_.capacity(); ++age) {
            if (window_[age] < window_[best]) best = age;
        }
        return best;
    }

    PeriodType left_;
    PeriodType right_;
    Window<ValueType> window_;
    size_t max_age_;
    size_t min_age_;
};

}  // namespace tacore::methods
