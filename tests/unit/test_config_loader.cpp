// ============================================================================
// TACORE - Configuration Loader Unit Tests
// ============================================================================

#include "tacore/config/config_loader.hpp"
#include "tacore/indicators/registry.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace tacore;
using namespace tacore::config;

namespace {

constexpr const char* SAMPLE = R"(
logging:
  level: debug
  max_files: 5

indicators:
  - name: macd
    fields:
      period1: 5
      period2: 35
      method1: sma
  - name: RSI
    fields:
      zone: abc
      bogus: 1
  - name: adx
)";

}  // namespace

TEST(ConfigLoaderTest, ParsesLoggingAndEntries) {
    const auto config = parse_config(SAMPLE);

    EXPECT_EQ(config.logging.level, utils::LogLevel::Debug);
    EXPECT_EQ(config.logging.max_files, 5u);
    EXPECT_EQ(config.logging.max_file_size_mb, 10u);
    EXPECT_TRUE(config.logging.log_file.empty());
    EXPECT_FALSE(config.strict);

    ASSERT_EQ(config.indicators.size(), 3u);
    EXPECT_EQ(config.indicators[0].name, "macd");
    ASSERT_EQ(config.indicators[0].fields.size(), 3u);
    // File order is kept
    EXPECT_EQ(config.indicators[0].fields[0].first, "period1");
    EXPECT_EQ(config.indicators[0].fields[2].second, "sma");
    EXPECT_TRUE(config.indicators[2].fields.empty());
}

TEST(ConfigLoaderTest, AppliesFields) {
    const auto set = build_indicators(parse_config(SAMPLE));
    ASSERT_EQ(set.configs.size(), 3u);

    const auto& macd = dynamic_cast<const DynConfig<indicators::MACD, Candle>&>(*set.configs[0]);
    EXPECT_EQ(macd.get().period1, 5u);
    EXPECT_EQ(macd.get().period2, 35u);
    EXPECT_EQ(macd.get().method1, RegularMethods::SMA);

    const auto& rsi = dynamic_cast<const DynConfig<indicators::RSI, Candle>&>(*set.configs[1]);
    EXPECT_DOUBLE_EQ(rsi.get().zone, 0.3);

    EXPECT_EQ(set.configs[2]->name(), "adx");
}

TEST(ConfigLoaderTest, CollectsDiagnostics) {
    const auto set = build_indicators(parse_config(SAMPLE));
    ASSERT_EQ(set.diagnostics.size(), 2u);

    EXPECT_EQ(set.diagnostics[0].indicator, "RSI");
    EXPECT_EQ(set.diagnostics[0].field, "zone");
    EXPECT_EQ(set.diagnostics[0].value, "abc");
    EXPECT_EQ(set.diagnostics[0].status, SetStatus::InvalidValue);

    EXPECT_EQ(set.diagnostics[1].field, "bogus");
    EXPECT_EQ(set.diagnostics[1].status, SetStatus::UnknownField);
}

TEST(ConfigLoaderTest, StrictRejectsDiagnostics) {
    auto config = parse_config(SAMPLE);
    config.strict = true;
    EXPECT_THROW((void)build_indicators(config), ConfigError);

    const auto strict = parse_config("strict: true\nindicators:\n  - name: rsi\n    fields:\n      period: x\n");
    EXPECT_TRUE(strict.strict);
    EXPECT_THROW((void)build_indicators(strict), ConfigError);
}

TEST(ConfigLoaderTest, UnknownIndicator) {
    const auto config = parse_config("indicators:\n  - name: kama\n");
    EXPECT_THROW((void)build_indicators(config), ConfigError);
}

TEST(ConfigLoaderTest, InvalidConfiguration) {
    // Fast period not below slow period
    const auto config = parse_config("indicators:\n  - name: macd\n    fields:\n      period1: 30\n");
    EXPECT_THROW((void)build_indicators(config), ConfigError);
}

TEST(ConfigLoaderTest, MalformedDocuments) {
    EXPECT_THROW((void)parse_config("indicators: [macd"), ConfigError);
    EXPECT_THROW((void)parse_config("indicators: macd\n"), ConfigError);
    EXPECT_THROW((void)parse_config("indicators:\n  - fields: {period: 3}\n"), ConfigError);
    EXPECT_THROW((void)parse_config("indicators:\n  - name: rsi\n    fields: [1, 2]\n"), ConfigError);
    EXPECT_THROW((void)parse_config("indicators:\n  - name: rsi\n    fields:\n      period: [1, 2]\n"),
                 ConfigError);
}

TEST(ConfigLoaderTest, MissingFile) {
    EXPECT_THROW((void)load_config("/nonexistent/tacore/config.yaml"), ConfigError);
}

TEST(ConfigLoaderTest, NoIndicatorsSection) {
    const auto config = parse_config("logging:\n  level: warn\n");
    EXPECT_EQ(config.logging.level, utils::LogLevel::Warn);
    EXPECT_TRUE(config.indicators.empty());
    EXPECT_TRUE(build_indicators(config).configs.empty());
}

TEST(LogLevelTest, FromString) {
    EXPECT_EQ(utils::level_from_string("TRACE"), utils::LogLevel::Trace);
    EXPECT_EQ(utils::level_from_string("warning"), utils::LogLevel::Warn);
    EXPECT_EQ(utils::level_from_string("off"), utils::LogLevel::Off);
    EXPECT_EQ(utils::level_from_string("loud"), utils::LogLevel::Info);
}
