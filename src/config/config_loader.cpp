// ============================================================================
// TACORE - Configuration Loader Implementation
// ============================================================================

#include "tacore/config/config_loader.hpp"

#include "tacore/indicators/registry.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <string>

namespace tacore::config {

namespace {

AppConfig from_yaml(const YAML::Node& yaml) {
    AppConfig config;

    // Logging
    if (yaml["logging"]) {
        const auto logging = yaml["logging"];
        config.logging.level = utils::level_from_string(logging["level"].as<std::string>("info"));
        config.logging.log_file = logging["file"].as<std::string>("");
        config.logging.max_file_size_mb =
            logging["max_file_size_mb"].as<size_t>(config.logging.max_file_size_mb);
        config.logging.max_files = logging["max_files"].as<size_t>(config.logging.max_files);
        if (logging["pattern"]) {
            config.logging.pattern = logging["pattern"].as<std::string>();
        }
    }

    config.strict = yaml["strict"].as<bool>(false);

    // Indicators
    if (const auto indicators = yaml["indicators"]) {
        if (!indicators.IsSequence()) {
            throw ConfigError("`indicators` must be a sequence");
        }
        for (const auto& node : indicators) {
            IndicatorEntry entry;
            entry.name = node["name"].as<std::string>("");
            if (entry.name.empty()) {
                throw ConfigError("Indicator entry without a `name`");
            }

            if (const auto fields = node["fields"]) {
                if (!fields.IsMap()) {
                    throw ConfigError(fmt::format("`fields` of `{}` must be a mapping", entry.name));
                }
                for (const auto& field : fields) {
                    if (!field.second.IsScalar()) {
                        throw ConfigError(fmt::format("Field `{}` of `{}` must be a scalar",
                                                      field.first.as<std::string>(), entry.name));
                    }
                    entry.fields.emplace_back(field.first.as<std::string>(),
                                              field.second.as<std::string>());
                }
            }
            config.indicators.push_back(std::move(entry));
        }
    }

    return config;
}

}  // namespace

AppConfig load_config(const std::string& path) {
    try {
        return from_yaml(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Config load failed for `{}`: {}", path, e.what()));
    }
}

AppConfig parse_config(std::string_view yaml) {
    try {
        return from_yaml(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Config parse failed: {}", e.what()));
    }
}

IndicatorSet build_indicators(const AppConfig& config) {
    IndicatorSet result;

    for (const auto& entry : config.indicators) {
        auto indicator = indicators::make_indicator<Candle>(entry.name);
        if (!indicator) {
            throw ConfigError(fmt::format("Unknown indicator `{}`", entry.name));
        }

        for (const auto& [field, value] : entry.fields) {
            const SetStatus status = indicator->set(field, value);
            if (status == SetStatus::Ok) continue;

            if (config.strict) {
                throw ConfigError(fmt::format("{} `{}` = `{}` for `{}`", to_string(status), field,
                                              value, entry.name));
            }
            result.diagnostics.push_back({entry.name, field, value, status});
        }

        if (!indicator->validate()) {
            throw ConfigError(fmt::format("Invalid `{}` configuration", entry.name));
        }

        TACORE_LOG_DEBUG("Configured `{}` ({} field overrides)", indicator->name(),
                         entry.fields.size());
        result.configs.push_back(std::move(indicator));
    }

    return result;
}

}  // namespace tacore::config
