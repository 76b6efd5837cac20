// ============================================================================
// TACORE - Configuration Fields Implementation
// ============================================================================

#include "tacore/core/field.hpp"

namespace tacore {

std::string_view to_string(SetStatus status) noexcept {
    switch (status) {
        case SetStatus::Ok:
            return "ok";
        case SetStatus::UnknownField:
            return "unknown field";
        case SetStatus::InvalidValue:
            return "invalid value";
    }
    return "unknown";
}

}  // namespace tacore
