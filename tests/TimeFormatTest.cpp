#include "memotrak/common/TimeFormat.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace memotrak::common {
namespace {

TEST(TimeFormatTest, FormatsWholeMinutesAndSeconds) {
    EXPECT_EQ(formatClock(0.0), "00:00");
    EXPECT_EQ(formatClock(59.9), "00:59");
    EXPECT_EQ(formatClock(61.0), "01:01");
    EXPECT_EQ(formatClock(3725.0), "62:05");
}

TEST(TimeFormatTest, InvalidInputReadsAsZero) {
    EXPECT_EQ(formatClock(-3.0), "00:00");
    EXPECT_EQ(formatClock(std::numeric_limits<double>::quiet_NaN()), "00:00");
    EXPECT_EQ(formatClock(std::numeric_limits<double>::infinity()), "00:00");
}

TEST(TimeFormatTest, HugeInputIsClampedInsteadOfOverflowing) {
    EXPECT_EQ(formatClock(1e15), "16666666666666:40");
    EXPECT_EQ(formatClock(1e19), "16666666666666:40");
    EXPECT_EQ(formatClock(std::numeric_limits<double>::max()), "16666666666666:40");
}

}  // namespace
}  // namespace memotrak::common
