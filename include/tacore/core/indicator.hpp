#pragma once
// ============================================================================
// TACORE - Indicator Protocol
// ============================================================================
// Configuration: parameters, validation, field mutation and result arity
// Instance: per-stream state bound to a configuration and a first bar
// ============================================================================

#include "tacore/core/field.hpp"
#include "tacore/core/types.hpp"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tacore {

// ============================================================================
// Result
// ============================================================================

/// Number of values and signals an indicator emits per bar
struct ResultSize {
    uint8_t values = 0;
    uint8_t signals = 0;

    constexpr bool operator==(const ResultSize&) const noexcept = default;
};

/// Values and signals emitted for one bar
class IndicatorResult {
public:
    static constexpr size_t MAX_VALUES = 4;
    static constexpr size_t MAX_SIGNALS = 4;

    IndicatorResult() = default;

    template <size_t NV, size_t NS>
    IndicatorResult(const std::array<ValueType, NV>& values,
                    const std::array<Signal, NS>& signals) noexcept
        : values_length_(static_cast<uint8_t>(NV)), signals_length_(static_cast<uint8_t>(NS)) {
        static_assert(NV <= MAX_VALUES, "Too many values for IndicatorResult");
        static_assert(NS <= MAX_SIGNALS, "Too many signals for IndicatorResult");
        for (size_t i = 0; i < NV; ++i) values_[i] = values[i];
        for (size_t i = 0; i < NS; ++i) signals_[i] = signals[i];
    }

    [[nodiscard]] std::span<const ValueType> values() const noexcept {
        return {values_.data(), values_length_};
    }

    [[nodiscard]] std::span<const Signal> signals() const noexcept {
        return {signals_.data(), signals_length_};
    }

    /// Positional access; out of range yields 0 / Signal::none()
    [[nodiscard]] ValueType value(size_t i) const noexcept {
        return i < values_length_ ? values_[i] : 0.0;
    }

    [[nodiscard]] Signal signal(size_t i) const noexcept {
        return i < signals_length_ ? signals_[i] : Signal::none();
    }

    [[nodiscard]] ResultSize size() const noexcept {
        return {values_length_, signals_length_};
    }

private:
    std::array<ValueType, MAX_VALUES> values_{};
    std::array<Signal, MAX_SIGNALS> signals_{};
    uint8_t values_length_ = 0;
    uint8_t signals_length_ = 0;
};

// ============================================================================
// Protocol Concepts
// ============================================================================

template <typename C>
concept IndicatorConfig = std::copyable<C> &&
    requires(C cfg, const C ccfg, std::string_view name, std::string_view value) {
        { C::NAME } -> std::convertible_to<std::string_view>;
        { ccfg.validate() } -> std::same_as<bool>;
        { cfg.set(name, value) } -> std::same_as<SetStatus>;
        { ccfg.size() } -> std::same_as<ResultSize>;
    };

template <typename I, typename T>
concept IndicatorInstance = OHLC<T> && requires(I instance, const I cinstance, const T& bar) {
    { instance.next(bar) } -> std::same_as<IndicatorResult>;
    cinstance.config();
} && IndicatorConfig<std::remove_cvref_t<decltype(std::declval<const I&>().config())>>;

/// A configuration that can be bound to a first bar of type T
template <typename C, typename T>
concept IndicatorInitializer = IndicatorConfig<C> && OHLC<T> && requires(const C cfg, const T& bar) {
    { cfg.init(bar) } -> IndicatorInstance<T>;
};

/// Refuse to bind an invalid configuration
template <IndicatorConfig C>
void ensure_valid(const C& cfg) {
    if (!cfg.validate()) {
        throw std::invalid_argument("Invalid `" + std::string(C::NAME) + "` configuration");
    }
}

}  // namespace tacore
