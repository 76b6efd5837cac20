// ============================================================================
// TACORE - Average Directional Index Unit Tests
// ============================================================================

#include "tacore/indicators/average_directional_index.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace tacore;
using namespace tacore::indicators;

namespace {

Candle bar(double close) {
    return Candle{close, close + 0.5, close - 0.5, close};
}

}  // namespace

class ADXTest : public ::testing::Test {
protected:
    AverageDirectionalIndex cfg;
};

TEST_F(ADXTest, Defaults) {
    EXPECT_EQ(cfg.method1, RegularMethods::RMA);
    EXPECT_EQ(cfg.di_length, 14u);
    EXPECT_EQ(cfg.method2, RegularMethods::RMA);
    EXPECT_EQ(cfg.adx_smoothing, 14u);
    EXPECT_EQ(cfg.period1, 1u);
    EXPECT_DOUBLE_EQ(cfg.zone, 0.2);
    EXPECT_TRUE(cfg.validate());
    EXPECT_EQ(cfg.size(), (ResultSize{3, 2}));
}

TEST_F(ADXTest, Validation) {
    cfg.di_length = 1;  // period1 must be shorter
    EXPECT_FALSE(cfg.validate());
    cfg.di_length = 14;

    cfg.adx_smoothing = 1;
    EXPECT_FALSE(cfg.validate());
    cfg.adx_smoothing = 14;

    cfg.zone = 1.5;
    EXPECT_FALSE(cfg.validate());
    cfg.zone = 1.0;
    EXPECT_TRUE(cfg.validate());

    cfg.period1 = 0;
    EXPECT_FALSE(cfg.validate());
    EXPECT_THROW((void)cfg.init(bar(100.0)), std::invalid_argument);
}

TEST_F(ADXTest, UptrendIsBullish) {
    auto adx = cfg.init(bar(100.0));

    const auto first = adx.next(bar(101.0));
    // Trend strength has not built up yet
    EXPECT_LT(first.value(0), cfg.zone);
    EXPECT_TRUE(first.signal(0).is_none());
    EXPECT_GT(first.signal(1).value(), 0.0);

    IndicatorResult result;
    for (int i = 2; i <= 40; ++i) {
        result = adx.next(bar(100.0 + i));
        ASSERT_EQ(result.size(), cfg.size());

        EXPECT_GE(result.value(0), 0.0);
        EXPECT_LE(result.value(0), 1.0);
        EXPECT_GT(result.value(1), 0.0);
        EXPECT_LE(result.value(1), 1.0);
        EXPECT_DOUBLE_EQ(result.value(2), 0.0);
        EXPECT_GT(result.signal(1).value(), 0.0);
    }

    EXPECT_GT(result.value(0), cfg.zone);
    EXPECT_EQ(result.signal(0), Signal::buy());
}

TEST_F(ADXTest, DowntrendIsBearish) {
    auto adx = cfg.init(bar(100.0));

    IndicatorResult result;
    for (int i = 1; i <= 40; ++i) {
        result = adx.next(bar(100.0 - i));
    }

    EXPECT_DOUBLE_EQ(result.value(1), 0.0);
    EXPECT_GT(result.value(2), 0.0);
    EXPECT_GT(result.value(0), cfg.zone);
    EXPECT_EQ(result.signal(0), Signal::sell());
    EXPECT_LT(result.signal(1).value(), 0.0);
}

TEST_F(ADXTest, ZeroRangeFallsBackToZero) {
    const Candle flat{100.0, 100.0, 100.0, 100.0};
    auto adx = cfg.init(flat);

    for (int i = 0; i < 20; ++i) {
        const auto result = adx.next(flat);
        EXPECT_DOUBLE_EQ(result.value(0), 0.0);
        EXPECT_DOUBLE_EQ(result.value(1), 0.0);
        EXPECT_DOUBLE_EQ(result.value(2), 0.0);
        EXPECT_TRUE(result.signal(0).is_none());
        EXPECT_TRUE(result.signal(1).is_none());
    }
}

TEST_F(ADXTest, NoDirectionalMovementInRange) {
    auto adx = cfg.init(bar(100.0));

    for (int i = 0; i < 20; ++i) {
        const auto result = adx.next(bar(100.0));
        EXPECT_DOUBLE_EQ(result.value(0), 0.0);
        EXPECT_TRUE(result.signal(0).is_none());
    }
}

TEST_F(ADXTest, LongerLookback) {
    ASSERT_EQ(cfg.set("period1", "3"), SetStatus::Ok);
    auto adx = cfg.init(bar(100.0));

    IndicatorResult result;
    for (int i = 1; i <= 40; ++i) {
        result = adx.next(bar(100.0 + i));
    }
    EXPECT_GT(result.value(1), 0.0);
    EXPECT_EQ(result.signal(0), Signal::buy());
}

TEST_F(ADXTest, SetFields) {
    EXPECT_EQ(cfg.set("method1", "ema"), SetStatus::Ok);
    EXPECT_EQ(cfg.set("di_length", "10"), SetStatus::Ok);
    EXPECT_EQ(cfg.set("zone", "0.25"), SetStatus::Ok);
    EXPECT_EQ(cfg.method1, RegularMethods::EMA);
    EXPECT_EQ(cfg.di_length, 10u);
    EXPECT_DOUBLE_EQ(cfg.zone, 0.25);

    EXPECT_EQ(cfg.set("zone", "high"), SetStatus::InvalidValue);
    EXPECT_DOUBLE_EQ(cfg.zone, 0.25);
    EXPECT_EQ(cfg.set("length", "10"), SetStatus::UnknownField);
}
