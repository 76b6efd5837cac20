// ============================================================================
// TACORE - Stream Driver
// ============================================================================
// Feeds CSV bars from stdin through the configured indicators
//
//   tacore_stream [config.yaml] < bars.csv
//
// Input lines:  open,high,low,close[,volume]
// Output lines: <indicator> <values...> | <signals...>
// ============================================================================

#include "tacore/config/config_loader.hpp"
#include "tacore/core/field.hpp"
#include "tacore/core/indicator_dyn.hpp"
#include "tacore/core/types.hpp"
#include "tacore/utils/logger.hpp"

#include <fmt/format.h>

#include <array>
#include <atomic>
#include <csignal>
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int) {
        g_running = false;
    }

    /// open,high,low,close[,volume]; nullopt for headers and malformed lines
    std::optional<tacore::Candle> parse_bar(std::string_view line) {
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        std::array<tacore::ValueType, 5> fields{};
        size_t count = 0;

        while (count < fields.size()) {
            const size_t comma = line.find(',');
            const auto parsed =
                tacore::FieldParser<tacore::ValueType>::parse(line.substr(0, comma));
            if (!parsed) return std::nullopt;
            fields[count++] = *parsed;
            if (comma == std::string_view::npos) break;
            line.remove_prefix(comma + 1);
        }

        if (count < 4) return std::nullopt;
        return tacore::Candle{fields[0], fields[1], fields[2], fields[3], fields[4]};
    }

    void print_result(std::string_view name, const tacore::IndicatorResult& result) {
        std::string line(name);
        for (const auto value : result.values()) {
            line += fmt::format(" {:.6f}", value);
        }
        line += " |";
        for (const auto signal : result.signals()) {
            line += fmt::format(" {:+.3f}", signal.value());
        }
        std::cout << line << '\n';
    }
}

using namespace tacore;

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string config_path = "config/config.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    try {
        const auto config = config::load_config(config_path);
        utils::Logger::initialize(config.logging);
        TACORE_LOG_INFO("Loaded config from {}", config_path);

        auto indicator_set = config::build_indicators(config);
        for (const auto& diagnostic : indicator_set.diagnostics) {
            TACORE_LOG_WARN("Ignored `{}` = `{}` for `{}` ({})", diagnostic.field,
                            diagnostic.value, diagnostic.indicator, to_string(diagnostic.status));
        }
        if (indicator_set.configs.empty()) {
            TACORE_LOG_ERROR("No indicators configured");
            return 1;
        }

        std::vector<std::unique_ptr<IndicatorInstanceDyn<Candle>>> instances;
        size_t bars = 0;
        size_t skipped = 0;

        std::string line;
        while (g_running && std::getline(std::cin, line)) {
            const auto bar = parse_bar(line);
            if (!bar) {
                ++skipped;
                TACORE_LOG_DEBUG("Skipping line {}: `{}`", bars + skipped, line);
                continue;
            }

            // Instances are bound to the first bar
            if (instances.empty()) {
                for (const auto& cfg : indicator_set.configs) {
                    instances.push_back(cfg->init(*bar));
                }
            }

            for (const auto& instance : instances) {
                print_result(instance->config().name(), instance->next(*bar));
            }
            ++bars;
        }

        TACORE_LOG_INFO("Processed {} bars ({} lines skipped)", bars, skipped);
        utils::Logger::shutdown();
    } catch (const config::ConfigError& e) {
        TACORE_LOG_CRITICAL("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        TACORE_LOG_CRITICAL("Unhandled exception: {}", e.what());
        return 1;
    }

    return 0;
}
