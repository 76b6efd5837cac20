#pragma once
// ============================================================================
// TACORE - Regular Method
// ============================================================================
// Closed set of smoothing strategies chosen at configuration time
// Dispatch is an exhaustive std::visit, no text on the per-bar path
// ============================================================================

#include "tacore/core/field.hpp"
#include "tacore/core/method.hpp"
#include "tacore/methods/exponential.hpp"
#include "tacore/methods/moving_average.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <variant>

namespace tacore {

enum class RegularMethods : uint8_t {
    SMA = 0,
    WMA = 1,
    HMA = 2,
    RMA = 3,
    EMA = 4,
    DMA = 5,
    DEMA = 6,
    TEMA = 7,
    TMA = 8
};

/// Case-insensitive parse ("ema", "RMA", ...)
[[nodiscard]] std::optional<RegularMethods> parse_method(std::string_view text) noexcept;

[[nodiscard]] std::string_view to_string(RegularMethods kind) noexcept;

template <>
struct FieldParser<RegularMethods> {
    [[nodiscard]] static std::optional<RegularMethods> parse(std::string_view text) noexcept {
        return parse_method(text);
    }
};

/// Any member of the RegularMethods family
class RegularMethod : public MethodBase<RegularMethod> {
public:
    using Variant = std::variant<methods::SMA, methods::WMA, methods::HMA, methods::RMA,
                                 methods::EMA, methods::DMA, methods::DEMA, methods::TEMA,
                                 methods::TMA>;

    RegularMethod(RegularMethods kind, PeriodType period, ValueType seed)
        : kind_(kind), method_(make(kind, period, seed)) {}

    ValueType next_impl(ValueType value) {
        return std::visit([value](auto& m) { return m.next(value); }, method_);
    }

    [[nodiscard]] PeriodType period_impl() const {
        return std::visit([](const auto& m) { return m.period(); }, method_);
    }

    [[nodiscard]] RegularMethods kind() const noexcept { return kind_; }

private:
    static Variant make(RegularMethods kind, PeriodType period, ValueType seed) {
        switch (kind) {
            case RegularMethods::SMA:
                return methods::SMA(period, seed);
            case RegularMethods::WMA:
                return methods::WMA(period, seed);
            case RegularMethods::HMA:
                return methods::HMA(period, seed);
            case RegularMethods::RMA:
                return methods::RMA(period, seed);
            case RegularMethods::EMA:
                return methods::EMA(period, seed);
            case RegularMethods::DMA:
                return methods::DMA(period, seed);
            case RegularMethods::DEMA:
                return methods::DEMA(period, seed);
            case RegularMethods::TEMA:
                return methods::TEMA(period, seed);
            case RegularMethods::TMA:
                return methods::TMA(period, seed);
        }
        throw std::invalid_argument("Unsupported smoothing method");
    }

    RegularMethods kind_;
    Variant method_;
};

/// Factory keyed by (strategy, period, seed)
[[nodiscard]] inline RegularMethod method(RegularMethods kind, PeriodType period,
                                          ValueType seed) {
    return RegularMethod(kind, period, seed);
}

static_assert(Method<RegularMethod>);
static_assert(Method<methods::SMA> && Method<methods::WMA> && Method<methods::EMA>);

}  // namespace tacore
