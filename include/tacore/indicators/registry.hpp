#pragma once
// ============================================================================
// TACORE - Indicator Registry
// ============================================================================
// Closed set of indicators addressable by name
// ============================================================================

#include "tacore/core/field.hpp"
#include "tacore/core/indicator_dyn.hpp"
#include "tacore/indicators/average_directional_index.hpp"
#include "tacore/indicators/coppock_curve.hpp"
#include "tacore/indicators/macd.hpp"
#include "tacore/indicators/rsi.hpp"

#include <array>
#include <memory>
#include <string_view>

namespace tacore::indicators {

inline constexpr std::array<std::string_view, 4> INDICATOR_NAMES = {
    AverageDirectionalIndex::NAME,
    CoppockCurve::NAME,
    MACD::NAME,
    RSI::NAME,
};

/// Default configuration for `name` (case-insensitive), nullptr if unknown
template <OHLC T = Candle>
[[nodiscard]] std::unique_ptr<IndicatorConfigDyn<T>> make_indicator(std::string_view name) {
    if (iequals(name, AverageDirectionalIndex::NAME)) {
        return std::make_unique<DynConfig<AverageDirectionalIndex, T>>();
    }
    if (iequals(name, CoppockCurve::NAME)) {
        return std::make_unique<DynConfig<CoppockCurve, T>>();
    }
    if (iequals(name, MACD::NAME)) {
        return std::make_unique<DynConfig<MACD, T>>();
    }
    if (iequals(name, RSI::NAME)) {
        return std::make_unique<DynConfig<RSI, T>>();
    }
    return nullptr;
}

}  // namespace tacore::indicators
