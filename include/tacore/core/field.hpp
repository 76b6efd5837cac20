#pragma once
// ============================================================================
// TACORE - Configuration Fields
// ============================================================================
// String-keyed, string-valued field mutation used by configuration loaders
// Failures are reported, logged and leave the field untouched
// ============================================================================

#include "tacore/core/types.hpp"
#include "tacore/utils/logger.hpp"

#include <charconv>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace tacore {

/// Outcome of IndicatorConfig::set
enum class SetStatus : uint8_t {
    Ok = 0,
    UnknownField = 1,
    InvalidValue = 2
};

[[nodiscard]] std::string_view to_string(SetStatus status) noexcept;

/// ASCII case-insensitive comparison
[[nodiscard]] constexpr bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

// ============================================================================
// Field Parsers
// ============================================================================
// Specialized per field type; parse() consumes the whole string or fails

template <typename T>
struct FieldParser;

template <std::integral T>
struct FieldParser<T> {
    [[nodiscard]] static std::optional<T> parse(std::string_view text) noexcept {
        T value{};
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
            return std::nullopt;
        }
        return value;
    }
};

template <std::floating_point T>
struct FieldParser<T> {
    [[nodiscard]] static std::optional<T> parse(std::string_view text) noexcept {
        T value{};
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
            return std::nullopt;
        }
        if (!std::isfinite(value)) return std::nullopt;
        return value;
    }
};

template <>
struct FieldParser<Source> {
    [[nodiscard]] static std::optional<Source> parse(std::string_view text) noexcept {
        return parse_source(text);
    }
};

// ============================================================================
// Field Assignment Helpers
// ============================================================================

/// Parse `value` into `field`; on failure logs a warning and keeps the field
template <typename T>
SetStatus assign_field(T& field, std::string_view owner, std::string_view name,
                       std::string_view value) {
    if (auto parsed = FieldParser<T>::parse(value)) {
        field = *parsed;
        return SetStatus::Ok;
    }
    TACORE_LOG_WARN("Invalid value `{}` for attribute `{}` of `{}`", value, name, owner);
    return SetStatus::InvalidValue;
}

inline SetStatus unknown_field(std::string_view owner, std::string_view name,
                               std::string_view value) {
    TACORE_LOG_WARN("Unknown attribute `{}` with value `{}` for `{}`", name, value, owner);
    return SetStatus::UnknownField;
}

}  // namespace tacore
