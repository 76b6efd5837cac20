#pragma once
// ============================================================================
// TACORE - RSI (Relative Strength Index)
// ============================================================================
// Momentum oscillator measuring speed and magnitude of price changes
// Range: 0-1, oversold below `zone`, overbought above `1 - zone`
//
// 1 value: RSI
// 2 signals:
//   * zone pressure, positive when oversold, negative when overbought
//   * +1 leaving the oversold zone, -1 leaving the overbought zone
// ============================================================================

#include "tacore/core/indicator.hpp"
#include "tacore/methods/cross.hpp"
#include "tacore/methods/regular_method.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace tacore::indicators {

class RSIInstance;

struct RSI {
    static constexpr std::string_view NAME = "rsi";

    PeriodType period = 14;
    RegularMethods method = RegularMethods::RMA;  // Wilder's smoothing
    ValueType zone = 0.3;
    Source source = Source::Close;

    [[nodiscard]] bool validate() const noexcept {
        return period >= 1 && zone > 0.0 && zone < 0.5;
    }

    SetStatus set(std::string_view name, std::string_view value) {
        if (name == "period") return assign_field(period, NAME, name, value);
        if (name == "method") return assign_field(method, NAME, name, value);
        if (name == "zone") return assign_field(zone, NAME, name, value);
        if (name == "source") return assign_field(source, NAME, name, value);
        return unknown_field(NAME, name, value);
    }

    [[nodiscard]] ResultSize size() const noexcept { return {1, 2}; }

    template <OHLC T>
    [[nodiscard]] RSIInstance init(const T& bar) const;
};

class RSIInstance {
public:
    RSIInstance(const RSI& cfg, ValueType src)
        : cfg_(cfg),
          prev_value_(src),
          avg_gain_(tacore::method(cfg.method, cfg.period, 0.0)),
          avg_loss_(tacore::method(cfg.method, cfg.period, 0.0)) {}

    [[nodiscard]] const RSI& config() const noexcept { return cfg_; }

    template <OHLC T>
    IndicatorResult next(const T& bar) {
        const ValueType src = source(bar, cfg_.source);
        const ValueType change = src - prev_value_;
        prev_value_ = src;

        const ValueType gain = avg_gain_.next(std::max(change, 0.0));
        const ValueType loss = avg_loss_.next(std::max(-change, 0.0));

        // Neutral while there has been no movement at all
        const ValueType total = gain + loss;
        const ValueType rsi = total == 0.0 ? 0.5 : gain / total;

        const ValueType upper = 1.0 - cfg_.zone;
        Signal pressure = Signal::none();
        if (rsi < cfg_.zone) {
            pressure = Signal{(cfg_.zone - rsi) / cfg_.zone};
        } else if (rsi > upper) {
            pressure = Signal{-(rsi - upper) / cfg_.zone};
        }

        const Signal leave_oversold = lower_cross_.next(rsi, cfg_.zone);
        const Signal leave_overbought = upper_cross_.next(rsi, upper);
        Signal reversal = Signal::none();
        if (leave_oversold.is_buy()) {
            reversal = Signal::buy();
        } else if (leave_overbought.is_sell()) {
            reversal = Signal::sell();
        }

        return IndicatorResult(std::array<ValueType, 1>{rsi},
                               std::array<Signal, 2>{pressure, reversal});
    }

private:
    RSI cfg_;

    ValueType prev_value_;
    RegularMethod avg_gain_;
    RegularMethod avg_loss_;
    methods::Cross lower_cross_;
    methods::Cross upper_cross_;
};

template <OHLC T>
RSIInstance RSI::init(const T& bar) const {
    ensure_valid(*this);
    return RSIInstance(*this, tacore::source(bar, source));
}

static_assert(IndicatorInitializer<RSI, Candle>);

}  // namespace tacore::indicators
