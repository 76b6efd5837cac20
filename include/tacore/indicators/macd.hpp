#pragma once
// ============================================================================
// TACORE - MACD (Moving Average Convergence Divergence)
// ============================================================================
// Trend-following momentum indicator
// Standard settings: 12/26/9 EMAs
//
// 3 values: MACD line, signal line, histogram
// 2 signals: MACD crossing the signal line, MACD crossing zero
// ============================================================================

#include "tacore/core/indicator.hpp"
#include "tacore/methods/cross.hpp"
#include "tacore/methods/regular_method.hpp"

#include <array>
#include <string_view>

namespace tacore::indicators {

class MACDInstance;

struct MACD {
    static constexpr std::string_view NAME = "macd";

    PeriodType period1 = 12;  // fast
    PeriodType period2 = 26;  // slow
    PeriodType period3 = 9;   // signal line
    RegularMethods method1 = RegularMethods::EMA;
    RegularMethods method2 = RegularMethods::EMA;
    Source source = Source::Close;

    /// Fast period must be less than slow period
    [[nodiscard]] bool validate() const noexcept {
        return period1 >= 1 && period2 >= 1 && period3 >= 1 && period1 < period2;
    }

    SetStatus set(std::string_view name, std::string_view value) {
        if (name == "period1") return assign_field(period1, NAME, name, value);
        if (name == "period2") return assign_field(period2, NAME, name, value);
        if (name == "period3") return assign_field(period3, NAME, name, value);
        if (name == "method1") return assign_field(method1, NAME, name, value);
        if (name == "method2") return assign_field(method2, NAME, name, value);
        if (name == "source") return assign_field(source, NAME, name, value);
        return unknown_field(NAME, name, value);
    }

    [[nodiscard]] ResultSize size() const noexcept { return {3, 2}; }

    template <OHLC T>
    [[nodiscard]] MACDInstance init(const T& bar) const;
};

class MACDInstance {
public:
    MACDInstance(const MACD& cfg, ValueType src)
        : cfg_(cfg),
          fast_ma_(method(cfg.method1, cfg.period1, src)),
          slow_ma_(method(cfg.method1, cfg.period2, src)),
          signal_ma_(method(cfg.method2, cfg.period3, 0.0)) {}

    [[nodiscard]] const MACD& config() const noexcept { return cfg_; }

    template <OHLC T>
    IndicatorResult next(const T& bar) {
        const ValueType src = source(bar, cfg_.source);

        const ValueType macd_line = fast_ma_.next(src) - slow_ma_.next(src);
        const ValueType signal_line = signal_ma_.next(macd_line);
        const ValueType histogram = macd_line - signal_line;

        const Signal signal1 = signal_cross_.next(macd_line, signal_line);
        const Signal signal2 = zero_cross_.next(macd_line, 0.0);

        return IndicatorResult(std::array<ValueType, 3>{macd_line, signal_line, histogram},
                               std::array<Signal, 2>{signal1, signal2});
    }

private:
    MACD cfg_;

    RegularMethod fast_ma_;
    RegularMethod slow_ma_;
    RegularMethod signal_ma_;
    methods::Cross signal_cross_;
    methods::Cross zero_cross_;
};

template <OHLC T>
MACDInstance MACD::init(const T& bar) const {
    ensure_valid(*this);
    return MACDInstance(*this, tacore::source(bar, source));
}

static_assert(IndicatorInitializer<MACD, Candle>);

}  // namespace tacore::indicators
