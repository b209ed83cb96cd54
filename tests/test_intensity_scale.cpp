// ============================================================================
// test_intensity_scale.cpp
// ============================================================================
#include "intensity_scale.hpp"
#include <gtest/gtest.h>

TEST(IntensityScaleTest, AutoBoundsFollowObservedRows) {
    IntensityScale scale;
    EXPECT_TRUE(scale.min_is_auto());
    EXPECT_TRUE(scale.max_is_auto());
    EXPECT_FALSE(scale.has_range());
    EXPECT_FLOAT_EQ(scale.normalize(-20.0f), 0.0f);

    scale.observe({-80.0f, -40.0f});
    scale.observe({-60.0f, -20.0f});
    EXPECT_TRUE(scale.has_range());
    EXPECT_FLOAT_EQ(scale.min_db(), -80.0f);
    EXPECT_FLOAT_EQ(scale.max_db(), -20.0f);
    EXPECT_FLOAT_EQ(scale.range_db(), 60.0f);
    EXPECT_FLOAT_EQ(scale.normalize(-50.0f), 0.5f);
}

TEST(IntensityScaleTest, ResetForgetsAutoBoundsOnly) {
    IntensityScale scale;
    scale.set_max(0.0f);
    scale.observe({-90.0f, -10.0f});
    scale.reset();

    EXPECT_FALSE(scale.has_range());
    EXPECT_FLOAT_EQ(scale.max_db(), 0.0f);

    scale.observe({-70.0f});
    EXPECT_FLOAT_EQ(scale.min_db(), -70.0f);
    EXPECT_FLOAT_EQ(scale.max_db(), 0.0f);
}

TEST(IntensityScaleTest, FixedBoundsClampNormalizedValue) {
    IntensityScale scale;
    scale.set_min(-100.0f);
    scale.set_max(-20.0f);
    scale.observe({-150.0f, 10.0f});

    EXPECT_FLOAT_EQ(scale.min_db(), -100.0f);
    EXPECT_FLOAT_EQ(scale.max_db(), -20.0f);
    EXPECT_FLOAT_EQ(scale.normalize(-120.0f), 0.0f);
    EXPECT_FLOAT_EQ(scale.normalize(0.0f), 1.0f);
}

TEST(IntensityScaleTest, BoundStrings) {
    IntensityScale scale;
    EXPECT_EQ(scale.min_string(), "AUTO");
    scale.set_min(-87.4f);
    EXPECT_EQ(scale.min_string(), "-87");
    scale.set_min_auto();
    EXPECT_EQ(scale.min_string(), "AUTO");
    EXPECT_EQ(scale.max_string(), "AUTO");
}
