// ============================================================================
// TACORE - Regular Method Names
// ============================================================================

#include "tacore/methods/regular_method.hpp"

#include <array>
#include <utility>

namespace tacore {

namespace {

constexpr std::array<std::pair<RegularMethods, std::string_view>, 9> METHOD_NAMES = {{
    {RegularMethods::SMA, "sma"},
    {RegularMethods::WMA, "wma"},
    {RegularMethods::HMA, "hma"},
    {RegularMethods::RMA, "rma"},
    {RegularMethods::EMA, "ema"},
    {RegularMethods::DMA, "dma"},
    {RegularMethods::DEMA, "dema"},
    {RegularMethods::TEMA, "tema"},
    {RegularMethods::TMA, "tma"},
}};

}  // namespace

std::optional<RegularMethods> parse_method(std::string_view text) noexcept {
    for (const auto& [kind, name] : METHOD_NAMES) {
        if (iequals(text, name)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string_view to_string(RegularMethods kind) noexcept {
    for (const auto& [candidate, name] : METHOD_NAMES) {
        if (candidate == kind) {
            return name;
        }
    }
    return "unknown";
}

}  // namespace tacore
