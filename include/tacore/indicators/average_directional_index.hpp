#pragma once
// ============================================================================
// TACORE - Average Directional Index
// ============================================================================
// Trend strength from smoothed directional movement
//
// 3 values: ADX, +DI, -DI
// 2 signals:
//   * +1/-1 when ADX is above `zone`, by the sign of +DI - -DI; otherwise 0
//   * +DI - -DI
// ============================================================================

#include "tacore/core/indicator.hpp"
#include "tacore/core/window.hpp"
#include "tacore/methods/regular_method.hpp"

#include <array>
#include <cmath>
#include <string_view>
#include <utility>

namespace tacore::indicators {

template <OHLC T>
class AverageDirectionalIndexInstance;

struct AverageDirectionalIndex {
    static constexpr std::string_view NAME = "adx";

    RegularMethods method1 = RegularMethods::RMA;
    PeriodType di_length = 14;

    RegularMethods method2 = RegularMethods::RMA;
    PeriodType adx_smoothing = 14;

    PeriodType period1 = 1;
    ValueType zone = 0.2;

    [[nodiscard]] bool validate() const noexcept {
        return di_length >= 1 && adx_smoothing >= 1 && zone >= 0.0 && zone <= 1.0 &&
               period1 >= 1 && period1 < di_length && period1 < adx_smoothing;
    }

    SetStatus set(std::string_view name, std::string_view value) {
        if (name == "method1") return assign_field(method1, NAME, name, value);
        if (name == "di_length") return assign_field(di_length, NAME, name, value);
        if (name == "method2") return assign_field(method2, NAME, name, value);
        if (name == "adx_smoothing") return assign_field(adx_smoothing, NAME, name, value);
        if (name == "period1") return assign_field(period1, NAME, name, value);
        if (name == "zone") return assign_field(zone, NAME, name, value);
        return unknown_field(NAME, name, value);
    }

    [[nodiscard]] ResultSize size() const noexcept { return {3, 2}; }

    /// Throws std::invalid_argument when validate() fails
    template <OHLC T>
    [[nodiscard]] AverageDirectionalIndexInstance<T> init(const T& bar) const {
        ensure_valid(*this);
        return AverageDirectionalIndexInstance<T>(*this, bar);
    }
};

template <OHLC T>
class AverageDirectionalIndexInstance {
public:
    AverageDirectionalIndexInstance(const AverageDirectionalIndex& cfg, const T& bar)
        : cfg_(cfg),
          window_(cfg.period1, bar),
          tr_ma_(method(cfg.method1, cfg.di_length, tr(bar, bar))),
          plus_di_(method(cfg.method1, cfg.di_length, 0.0)),
          minus_di_(method(cfg.method1, cfg.di_length, 0.0)),
          ma2_(method(cfg.method2, cfg.adx_smoothing, 0.0)) {}

    [[nodiscard]] const AverageDirectionalIndex& config() const noexcept { return cfg_; }

    IndicatorResult next(const T& bar) {
        const auto [plus, minus] = directional_movement(bar);
        const ValueType adx = average_dx(plus, minus);

        const ValueType direction = static_cast<ValueType>((plus > minus) - (plus < minus));
        const Signal signal1 = adx > cfg_.zone ? Signal{direction} : Signal::none();
        const Signal signal2{plus - minus};

        return IndicatorResult(std::array<ValueType, 3>{adx, plus, minus},
                               std::array<Signal, 2>{signal1, signal2});
    }

private:
    /// (+DI, -DI); both 0 while the smoothed true range is 0
    std::pair<ValueType, ValueType> directional_movement(const T& bar) {
        const T prev = window_.push(bar);
        const ValueType true_range = tr_ma_.next(tr(bar, prev));

        const ValueType du = bar.high() - prev.high();
        const ValueType dd = prev.low() - bar.low();

        const ValueType plus_dm = (du > dd && du > 0.0) ? du : 0.0;
        const ValueType minus_dm = (dd > du && dd > 0.0) ? dd : 0.0;

        const ValueType plus_di = plus_di_.next(plus_dm);
        const ValueType minus_di = minus_di_.next(minus_dm);

        if (true_range == 0.0) return {0.0, 0.0};
        return {plus_di / true_range, minus_di / true_range};
    }

    ValueType average_dx(ValueType plus, ValueType minus) {
        const ValueType sum = plus + minus;
        if (sum == 0.0) return ma2_.next(0.0);
        return ma2_.next(std::abs(plus - minus) / sum);
    }

    AverageDirectionalIndex cfg_;

    Window<T> window_;
    RegularMethod tr_ma_;
    RegularMethod plus_di_;
    RegularMethod minus_di_;
    RegularMethod ma2_;
};

static_assert(IndicatorInitializer<AverageDirectionalIndex, Candle>);

}  // namespace tacore::indicators
