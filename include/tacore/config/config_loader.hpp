#pragma once
// ============================================================================
// TACORE - Configuration Loader
// ============================================================================
// Reads logging settings and indicator field overrides from YAML and applies
// them through IndicatorConfigDyn::set
// ============================================================================

#include "tacore/core/field.hpp"
#include "tacore/core/indicator_dyn.hpp"
#include "tacore/core/types.hpp"
#include "tacore/utils/logger.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tacore::config {

/// File, syntax or semantic error in a configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct IndicatorEntry {
    std::string name;
    std::vector<std::pair<std::string, std::string>> fields;  // file order
};

struct AppConfig {
    utils::LogConfig logging;
    bool strict = false;  // field diagnostics become errors
    std::vector<IndicatorEntry> indicators;
};

/// A field that set() did not accept
struct FieldDiagnostic {
    std::string indicator;
    std::string field;
    std::string value;
    SetStatus status = SetStatus::Ok;
};

struct IndicatorSet {
    std::vector<std::unique_ptr<IndicatorConfigDyn<Candle>>> configs;
    std::vector<FieldDiagnostic> diagnostics;
};

/// Throws ConfigError
[[nodiscard]] AppConfig load_config(const std::string& path);

/// Throws ConfigError
[[nodiscard]] AppConfig parse_config(std::string_view yaml);

/// Resolve and populate every entry. Throws ConfigError for an unknown
/// indicator, a configuration failing validate(), or any field diagnostic when
/// `strict` is set
[[nodiscard]] IndicatorSet build_indicators(const AppConfig& config);

}  // namespace tacore::config
