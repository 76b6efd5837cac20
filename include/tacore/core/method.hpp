#pragma once
// ============================================================================
// TACORE - Method Base Class
// ============================================================================
// CRTP pattern for the incremental smoothing family
// Every method consumes one scalar and produces one scalar per call
// ============================================================================

#include "tacore/core/types.hpp"

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tacore {

// ============================================================================
// Method Concept
// ============================================================================

template <typename M>
concept Method = requires(M method, const M cmethod, ValueType value) {
    { method.next(value) } -> std::same_as<ValueType>;
    { cmethod.period() } -> std::convertible_to<PeriodType>;
};

// ============================================================================
// CRTP Base Class
// ============================================================================

template <typename Derived>
class MethodBase {
public:
    /// Feed the next input and return the smoothed output
    ValueType next(ValueType value) {
        return static_cast<Derived*>(this)->next_impl(value);
    }

    /// Declared smoothing period
    [[nodiscard]] PeriodType period() const {
        return static_cast<const Derived*>(this)->period_impl();
    }

protected:
    MethodBase() = default;
    ~MethodBase() = default;

    /// Throws std::invalid_argument for a zero period
    static PeriodType check_period(PeriodType period, std::string_view name) {
        if (period == 0) {
            throw std::invalid_argument(std::string(name) + " period must be positive");
        }
        return period;
    }
};

}  // namespace tacore
