#pragma once
// ============================================================================
// TACORE - Exponential Smoothing Family
// ============================================================================
// EMA (alpha = 2 / (period + 1)) and Wilder's RMA (alpha = 1 / period)
// plus the EMA compositions DMA, DEMA and TEMA
// ============================================================================

#include "tacore/core/method.hpp"

namespace tacore::methods {

namespace detail {

/// previous * (1 - alpha) + input * alpha, written so a constant input equal
/// to the state is an exact fixed point
[[nodiscard]] constexpr ValueType smooth(ValueType previous, ValueType input,
                                         ValueType alpha) noexcept {
    return previous + (input - previous) * alpha;
}

}  // namespace detail

/// Exponential Moving Average
class EMA : public MethodBase<EMA> {
public:
    EMA(PeriodType period, ValueType seed)
        : period_(check_period(period, "EMA")),
          alpha_(2.0 / (static_cast<ValueType>(period_) + 1.0)),
          value_(seed) {}

    ValueType next_impl(ValueType value) {
        value_ = detail::smooth(value_, value, alpha_);
        return value_;
    }

    [[nodiscard]] PeriodType period_impl() const { return period_; }
    [[nodiscard]] ValueType alpha() const { return alpha_; }

private:
    PeriodType period_;
    ValueType alpha_;
    ValueType value_;
};

/// Running Moving Average (Wilder's smoothing)
class RMA : public MethodBase<RMA> {
public:
    RMA(PeriodType period, ValueType seed)
        : period_(check_period(period, "RMA")),
          alpha_(1.0 / static_cast<ValueType>(period_)),
          value_(seed) {}

    ValueType next_impl(ValueType value) {
        value_ = detail::smooth(value_, value, alpha_);
        return value_;
    }

    [[nodiscard]] PeriodType period_impl() const { return period_; }
    [[nodiscard]] ValueType alpha() const { return alpha_; }

private:
    PeriodType period_;
    ValueType alpha_;
    ValueType value_;
};

/// Double Moving Average (EMA of EMA)
class DMA : public MethodBase<DMA> {
public:
    DMA(PeriodType period, ValueType seed) : ema1_(period, seed), ema2_(period, seed) {}

    ValueType next_impl(ValueType value) { return ema2_.next(ema1_.next(value)); }

    [[nodiscard]] PeriodType period_impl() const { return ema1_.period(); }

private:
    EMA ema1_;
    EMA ema2_;
};

/// Double Exponential Moving Average
class DEMA : public MethodBase<DEMA> {
public:
    DEMA(PeriodType period, ValueType seed) : ema1_(period, seed), ema2_(period, seed) {}

    ValueType next_impl(ValueType value) {
        const ValueType e1 = ema1_.next(value);
        const ValueType e2 = ema2_.next(e1);
        return 2.0 * e1 - e2;
    }

    [[nodiscard]] PeriodType period_impl() const { return ema1_.period(); }

private:
    EMA ema1_;
    EMA ema2_;
};

/// Triple Exponential Moving Average
class TEMA : public MethodBase<TEMA> {
public:
    TEMA(PeriodType period, ValueType seed)
        : ema1_(period, seed), ema2_(period, seed), ema3_(period, seed) {}

    ValueType next_impl(ValueType value) {
        const ValueType e1 = ema1_.next(value);
        const ValueType e2 = ema2_.next(e1);
        const ValueType e3 = ema3_.next(e2);
        return 3.0 * (e1 - e2) + e3;
    }

    [[nodiscard]] PeriodType period_impl() const { return ema1_.period(); }

private:
    EMA ema1_;
    EMA ema2_;
    EMA ema3_;
};

}  // namespace tacore::methods
