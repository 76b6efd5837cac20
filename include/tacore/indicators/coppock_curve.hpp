#pragma once
// ============================================================================
// TACORE - Coppock Curve
// ============================================================================
// Smoothed sum of two rates of change
//
// 2 values: Coppock curve, its signal line
// 3 signals: curve crossing zero, curve pivots, curve crossing its signal line
// ============================================================================

#include "tacore/core/indicator.hpp"
#include "tacore/methods/cross.hpp"
#include "tacore/methods/rate_of_change.hpp"
#include "tacore/methods/regular_method.hpp"
#include "tacore/methods/reverse_signal.hpp"

#include <array>
#include <string_view>

namespace tacore::indicators {

class CoppockCurveInstance;

struct CoppockCurve {
    static constexpr std::string_view NAME = "coppock";

    PeriodType period1 = 10;
    PeriodType period2 = 14;
    PeriodType period3 = 11;
    PeriodType s2_left = 4;
    PeriodType s2_right = 2;
    PeriodType s3_period = 5;
    Source source = Source::Close;
    RegularMethods method1 = RegularMethods::WMA;
    RegularMethods method2 = RegularMethods::EMA;

    [[nodiscard]] bool validate() const noexcept {
        return period1 >= 1 && period2 >= 1 && period3 >= 1 && s2_left >= 1 && s2_right >= 1 &&
               s3_period >= 1;
    }

    SetStatus set(std::string_view name, std::string_view value) {
        if (name == "period1") return assign_field(period1, NAME, name, value);
        if (name == "period2") return assign_field(period2, NAME, name, value);
        if (name == "period3") return assign_field(period3, NAME, name, value);
        if (name == "s2_left") return assign_field(s2_left, NAME, name, value);
        if (name == "s2_right") return assign_field(s2_right, NAME, name, value);
        if (name == "s3_period") return assign_field(s3_period, NAME, name, value);
        if (name == "source") return assign_field(source, NAME, name, value);
        if (name == "method1") return assign_field(method1, NAME, name, value);
        if (name == "method2") return assign_field(method2, NAME, name, value);
        return unknown_field(NAME, name, value);
    }

    [[nodiscard]] ResultSize size() const noexcept { return {2, 3}; }

    template <OHLC T>
    [[nodiscard]] CoppockCurveInstance init(const T& bar) const;
};

class CoppockCurveInstance {
public:
    CoppockCurveInstance(const CoppockCurve& cfg, ValueType src)
        : cfg_(cfg),
          roc1_(cfg.period2, src),
          roc2_(cfg.period3, src),
          ma1_(method(cfg.method1, cfg.period1, 0.0)),
          ma2_(method(cfg.method2, cfg.s3_period, 0.0)),
          pivot_(cfg.s2_left, cfg.s2_right, 0.0) {}

    [[nodiscard]] const CoppockCurve& config() const noexcept { return cfg_; }

    template <OHLC T>
    IndicatorResult next(const T& bar) {
        const ValueType src = source(bar, cfg_.source);
        const ValueType roc1 = roc1_.next(src);
        const ValueType roc2 = roc2_.next(src);
        const ValueType value1 = ma1_.next(roc1 + roc2);
        const ValueType value2 = ma2_.next(value1);

        const Signal signal1 = cross_over1_.next(value1, 0.0);
        const Signal signal2 = pivot_.next(value1);
        const Signal signal3 = cross_over2_.next(value1, value2);

        return IndicatorResult(std::array<ValueType, 2>{value1, value2},
                               std::array<Signal, 3>{signal1, signal2, signal3});
    }

private:
    CoppockCurve cfg_;

    methods::RateOfChange roc1_;
    methods::RateOfChange roc2_;
    RegularMethod ma1_;
    RegularMethod ma2_;
    methods::Cross cross_over1_;
    methods::ReverseSignal pivot_;
    methods::Cross cross_over2_;
};

template <OHLC T>
CoppockCurveInstance CoppockCurve::init(const T& bar) const {
    ensure_valid(*this);
    return CoppockCurveInstance(*this, tacore::source(bar, source));
}

static_assert(IndicatorInitializer<CoppockCurve, Candle>);

}  // namespace tacore::indicators
