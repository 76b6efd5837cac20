// ============================================================================
// TACORE - Core Types Implementation
// ============================================================================

#include "tacore/core/types.hpp"

#include "tacore/core/field.hpp"

#include <array>
#include <utility>

namespace tacore {

namespace {

constexpr std::array<std::pair<Source, std::string_view>, 7> SOURCE_NAMES = {{
    {Source::Open, "open"},
    {Source::High, "high"},
    {Source::Low, "low"},
    {Source::Close, "close"},
    {Source::HL2, "hl2"},
    {Source::HLC3, "hlc3"},
    {Source::OHLC4, "ohlc4"},
}};

}  // namespace

std::optional<Source> parse_source(std::string_view text) noexcept {
    for (const auto& [source, name] : SOURCE_NAMES) {
        if (iequals(text, name)) {
            return source;
        }
    }
    return std::nullopt;
}

std::string_view to_string(Source source) noexcept {
    for (const auto& [candidate, name] : SOURCE_NAMES) {
        if (candidate == source) {
            return name;
        }
    }
    return "unknown";
}

}  // namespace tacore
