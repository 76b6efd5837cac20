#pragma once
// ============================================================================
// TACORE - Core Types
// ============================================================================
// Scalar aliases, price sources, signals and the OHLC bar contract
// ============================================================================

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tacore {

// ============================================================================
// Scalar Types
// ============================================================================

using ValueType = double;
using PeriodType = std::uint32_t;

// ============================================================================
// Price Source
// ============================================================================

/// Scalar series derived from a bar
enum class Source : uint8_t {
    Open = 0,
    High = 1,
    Low = 2,
    Close = 3,
    HL2 = 4,    // (high + low) / 2
    HLC3 = 5,   // typical price
    OHLC4 = 6
};

/// Case-insensitive parse ("close", "HL2", ...)
[[nodiscard]] std::optional<Source> parse_source(std::string_view text) noexcept;

[[nodiscard]] std::string_view to_string(Source source) noexcept;

// ============================================================================
// OHLC Contract
// ============================================================================

template <typename T>
concept OHLC = std::copyable<T> && requires(const T bar) {
    { bar.open() } -> std::convertible_to<ValueType>;
    { bar.high() } -> std::convertible_to<ValueType>;
    { bar.low() } -> std::convertible_to<ValueType>;
    { bar.close() } -> std::convertible_to<ValueType>;
};

/// True range relative to the previous bar
template <OHLC T>
[[nodiscard]] ValueType tr(const T& bar, const T& prev) noexcept {
    const ValueType prev_close = prev.close();
    return std::max({bar.high() - bar.low(),
                     std::abs(bar.high() - prev_close),
                     std::abs(bar.low() - prev_close)});
}

template <OHLC T>
[[nodiscard]] ValueType source(const T& bar, Source src) noexcept {
    switch (src) {
        case Source::Open:
            return bar.open();
        case Source::High:
            return bar.high();
        case Source::Low:
            return bar.low();
        case Source::Close:
            return bar.close();
        case Source::HL2:
            return (bar.high() + bar.low()) / 2.0;
        case Source::HLC3:
            return (bar.high() + bar.low() + bar.close()) / 3.0;
        case Source::OHLC4:
            return (bar.open() + bar.high() + bar.low() + bar.close()) / 4.0;
    }
    return bar.close();
}

// ============================================================================
// Candle
// ============================================================================

/// Default bar type
class Candle {
public:
    constexpr Candle() noexcept = default;
    constexpr Candle(ValueType open, ValueType high, ValueType low, ValueType close,
                     ValueType volume = 0.0) noexcept
        : open_(open), high_(high), low_(low), close_(close), volume_(volume) {}

    [[nodiscard]] constexpr ValueType open() const noexcept { return open_; }
    [[nodiscard]] constexpr ValueType high() const noexcept { return high_; }
    [[nodiscard]] constexpr ValueType low() const noexcept { return low_; }
    [[nodiscard]] constexpr ValueType close() const noexcept { return close_; }
    [[nodiscard]] constexpr ValueType volume() const noexcept { return volume_; }

    [[nodiscard]] ValueType tr(const Candle& prev) const noexcept {
        return tacore::tr(*this, prev);
    }

    [[nodiscard]] ValueType source(Source src) const noexcept {
        return tacore::source(*this, src);
    }

    constexpr bool operator==(const Candle&) const noexcept = default;

private:
    ValueType open_ = 0.0;
    ValueType high_ = 0.0;
    ValueType low_ = 0.0;
    ValueType close_ = 0.0;
    ValueType volume_ = 0.0;
};

static_assert(OHLC<Candle>);

// ============================================================================
// Signal
// ============================================================================

/// Trading signal (-1.0 to +1.0)
/// Positive = buy, Negative = sell, zero = no signal
class Signal {
public:
    constexpr Signal() noexcept : value_(0.0) {}
    constexpr explicit Signal(ValueType value) noexcept
        : value_(value != value ? 0.0 : std::clamp(value, -1.0, 1.0)) {}

    [[nodiscard]] static constexpr Signal buy() noexcept { return Signal{1.0}; }
    [[nodiscard]] static constexpr Signal sell() noexcept { return Signal{-1.0}; }
    [[nodiscard]] static constexpr Signal none() noexcept { return Signal{}; }

    /// -1, 0 or +1 from the sign of a value
    [[nodiscard]] static constexpr Signal from_sign(ValueType value) noexcept {
        return Signal{static_cast<ValueType>((value > 0.0) - (value < 0.0))};
    }

    [[nodiscard]] constexpr ValueType value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool is_buy() const noexcept { return value_ > 0.0; }
    [[nodiscard]] constexpr bool is_sell() const noexcept { return value_ < 0.0; }
    [[nodiscard]] constexpr bool is_none() const noexcept { return value_ == 0.0; }

    constexpr bool operator==(const Signal&) const noexcept = default;

private:
    ValueType value_;
};

}  // namespace tacore
