#pragma once
// ============================================================================
// TACORE - Window-Based Moving Averages
// ============================================================================
// SMA, WMA and their compositions (TMA, HMA)
// ============================================================================

#include "tacore/core/method.hpp"
#include "tacore/core/window.hpp"

#include <algorithm>
#include <cmath>

namespace tacore::methods {

/// Simple Moving Average, O(1) running sum
class SMA : public MethodBase<SMA> {
public:
    SMA(PeriodType period, ValueType seed)
        : period_(check_period(period, "SMA")),
          window_(period_, seed),
          sum_(seed * static_cast<ValueType>(period_)) {}

    ValueType next_impl(ValueType value) {
        sum_ += value - window_.push(value);
        return sum_ / static_cast<ValueType>(period_);
    }

    [[nodiscard]] PeriodType period_impl() const { return period_; }

private:
    PeriodType period_;
    Window<ValueType> window_;
    ValueType sum_;
};

/// Weighted Moving Average
/// Weights 1..period, the newest value weighted `period`
class WMA : public MethodBase<WMA> {
public:
    WMA(PeriodType period, ValueType seed)
        : period_(check_period(period, "WMA")),
          window_(period_, seed),
          denominator_(static_cast<ValueType>(period_) * (period_ + 1) / 2.0) {}

    // Direct weighted sum, oldest first, so the result does not drift
    ValueType next_impl(ValueType value) {
        window_.push(value);
        ValueType sum = 0.0;
        for (PeriodType age = period_; age-- > 0;) {
            sum += window_[age] * static_cast<ValueType>(period_ - age);
        }
        return sum / denominator_;
    }

    [[nodiscard]] PeriodType period_impl() const { return period_; }

private:
    PeriodType period_;
    Window<ValueType> window_;
    ValueType denominator_;
};

/// Triangular Moving Average (SMA of SMA)
class TMA : public MethodBase<TMA> {
public:
    TMA(PeriodType period, ValueType seed)
        : sma1_(period, seed), sma2_(period, seed) {}

    ValueType next_impl(ValueType value) { return sma2_.next(sma1_.next(value)); }

    [[nodiscard]] PeriodType period_impl() const { return sma1_.period(); }

private:
    SMA sma1_;
    SMA sma2_;
};

/// Hull Moving Average
/// WMA(sqrt(n)) of 2*WMA(n/2) - WMA(n)
class HMA : public MethodBase<HMA> {
public:
    HMA(PeriodType period, ValueType seed)
        : period_(check_period(period, "HMA")),
          half_(std::max<PeriodType>(period_ / 2, 1), seed),
          full_(period_, seed),
          root_(std::max<PeriodType>(
                    static_cast<PeriodType>(std::sqrt(static_cast<ValueType>(period_))), 1),
                seed) {}

    ValueType next_impl(ValueType value) {
        const ValueType diff = 2.0 * half_.next(value) - full_.next(value);
        return root_.next(diff);
    }

    [[nodiscard]] PeriodType period_impl() const { return period_; }

private:
    PeriodType period_;
    WMA half_;
    WMA full_;
    WMA root_;
};

}  // namespace tacore::methods
