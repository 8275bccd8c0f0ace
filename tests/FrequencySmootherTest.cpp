#include "FrequencySmoother.h"

#include <gtest/gtest.h>

TEST(FrequencySmoother, FirstReadingPassesThrough) {
    const FrequencySmoother smoother;
    EXPECT_DOUBLE_EQ(smoother.smooth(std::nullopt, 110.0), 110.0);
}

TEST(FrequencySmoother, SmallChangeUsesSlowAlpha) {
    const FrequencySmoother smoother;
    // |112 - 110| = 2 is below 10% of 110.
    EXPECT_DOUBLE_EQ(smoother.smooth(110.0, 112.0), 110.0 + 2.0 * 0.3);
}

TEST(FrequencySmoother, JumpUsesFastAlpha) {
    const FrequencySmoother smoother;
    EXPECT_DOUBLE_EQ(smoother.smooth(110.0, 130.0), 120.0);
    EXPECT_DOUBLE_EQ(smoother.smooth(110.0, 82.0), 96.0);
}

TEST(FrequencySmoother, JumpThresholdIsExclusive) {
    const FrequencySmoother smoother(SmoothingParams{0.25, 0.5, 0.25});
    // Exactly 25% of 100 is not a jump.
    EXPECT_DOUBLE_EQ(smoother.smooth(100.0, 125.0), 106.25);
    EXPECT_DOUBLE_EQ(smoother.smooth(100.0, 126.0), 113.0);
}

TEST(FrequencySmoother, NoPitchClearsMemory) {
    const FrequencySmoother smoother;
    EXPECT_FALSE(smoother.update(110.0, std::nullopt).has_value());
    const auto restarted = smoother.update(std::nullopt, 146.83);
    ASSERT_TRUE(restarted.has_value());
    EXPECT_DOUBLE_EQ(*restarted, 146.83);
}

TEST(FrequencySmoother, ConvergesOnSteadyInput) {
    const FrequencySmoother smoother;
    std::optional<double> value = 100.0;
    for (int i = 0; i < 40; ++i)
        value = smoother.update(value, 110.0);
    ASSERT_TRUE(value.has_value());
    EXPECT_NEAR(*value, 110.0, 1e-3);
}
