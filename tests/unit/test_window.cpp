// ============================================================================
// TACORE - Window Unit Tests
// ============================================================================

#include "tacore/core/window.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace tacore;

class WindowTest : public ::testing::Test {
protected:
    static constexpr PeriodType CAPACITY = 4;
    Window<int> window{CAPACITY, -1};
};

TEST_F(WindowTest, ReturnsSeedUntilFull) {
    for (int i = 0; i < static_cast<int>(CAPACITY); ++i) {
        EXPECT_EQ(window.push(i), -1);
    }
}

TEST_F(WindowTest, FIFO) {
    for (int i = 0; i < static_cast<int>(CAPACITY); ++i) {
        window.push(i);
    }
    // The (C+1)-th push hands back the first item
    EXPECT_EQ(window.push(100), 0);
    EXPECT_EQ(window.push(101), 1);
    EXPECT_EQ(window.push(102), 2);
    EXPECT_EQ(window.push(103), 3);
    EXPECT_EQ(window.push(104), 100);
}

TEST_F(WindowTest, CapacityNeverExceeded) {
    for (int i = 0; i < 50; ++i) {
        window.push(i);
        EXPECT_EQ(window.capacity(), CAPACITY);
    }
}

TEST_F(WindowTest, IndexedByAge) {
    window.push(1);
    window.push(2);
    window.push(3);

    EXPECT_EQ(window[0], 3);
    EXPECT_EQ(window[1], 2);
    EXPECT_EQ(window[2], 1);
    EXPECT_EQ(window[3], -1);
    EXPECT_EQ(window.newest(), 3);
    EXPECT_EQ(window.oldest(), -1);
}

TEST_F(WindowTest, Wrap) {
    for (int i = 0; i < 10; ++i) {
        window.push(i);
    }
    EXPECT_EQ(window.newest(), 9);
    EXPECT_EQ(window.oldest(), 6);
    EXPECT_EQ(window[3], 6);
}

TEST(WindowConstructionTest, ZeroCapacityRejected) {
    EXPECT_THROW(Window<double>(0, 0.0), std::invalid_argument);
}

TEST(WindowConstructionTest, CapacityOne) {
    Window<double> w(1, 5.0);
    EXPECT_DOUBLE_EQ(w.push(1.0), 5.0);
    EXPECT_DOUBLE_EQ(w.push(2.0), 1.0);
    EXPECT_DOUBLE_EQ(w.newest(), 2.0);
}
