// ============================================================================
// TACORE - Reverse Signal Unit Tests
// ============================================================================

#include "tacore/methods/reverse_signal.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace tacore;

namespace {

std::vector<Signal> run(methods::ReverseSignal& pivot, const std::vector<double>& series) {
    std::vector<Signal> out;
    for (double value : series) out.push_back(pivot.next(value));
    return out;
}

}  // namespace

TEST(ReverseSignalTest, PeakReportedRightStepsLater) {
    methods::ReverseSignal pivot(2, 2, 1.0);
    const auto signals = run(pivot, {1.0, 2.0, 5.0, 2.0, 1.0});

    EXPECT_EQ(signals[4], Signal::sell());
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_FALSE(signals[i].is_sell()) << "step " << i;
    }
}

TEST(ReverseSignalTest, TroughIsBuy) {
    methods::ReverseSignal pivot(2, 2, 5.0);
    const auto signals = run(pivot, {5.0, 4.0, 1.0, 4.0, 5.0});

    EXPECT_EQ(signals[4], Signal::buy());
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_FALSE(signals[i].is_buy()) << "step " << i;
    }
}

TEST(ReverseSignalTest, PlateauReportedOnce) {
    methods::ReverseSignal pivot(1, 1, 0.0);
    const auto signals = run(pivot, {0.0, 3.0, 3.0, 0.0, 0.0, 0.0});

    int sells = 0;
    for (const auto& s : signals) sells += s.is_sell() ? 1 : 0;
    EXPECT_EQ(sells, 1);
    EXPECT_EQ(signals[3], Signal::sell());
}

TEST(ReverseSignalTest, MonotonicSeriesHasNoPeak) {
    methods::ReverseSignal pivot(3, 2, 0.0);
    for (int i = 1; i <= 30; ++i) {
        EXPECT_FALSE(pivot.next(static_cast<double>(i)).is_sell()) << "step " << i;
    }
}

TEST(ReverseSignalTest, PeakOutsideWindowForgotten) {
    methods::ReverseSignal pivot(1, 1, 0.0);
    run(pivot, {0.0, 10.0, 0.0});
    // After the 10 leaves the window a smaller local peak is found again
    const auto signals = run(pivot, {0.0, 0.0, 4.0, 1.0});
    EXPECT_EQ(signals[3], Signal::sell());
}

TEST(ReverseSignalTest, Spans) {
    methods::ReverseSignal pivot(4, 2, 0.0);
    EXPECT_EQ(pivot.left(), 4u);
    EXPECT_EQ(pivot.right(), 2u);
}

TEST(ReverseSignalTest, ZeroSpanRejected) {
    EXPECT_THROW(methods::ReverseSignal(0, 2, 0.0), std::invalid_argument);
    EXPECT_THROW(methods::ReverseSignal(2, 0, 0.0), std::invalid_argument);
}
