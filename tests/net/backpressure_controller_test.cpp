#include <gtest/gtest.h>

#include <speedline/net/backpressure_controller.hpp>

using speedline::net::backpressure_controller;
using transition = backpressure_controller::transition;

TEST(BackpressureController, SaturatesAboveHighWatermark)
{
    backpressure_controller bp{512, 1024};

    EXPECT_EQ(bp.update(1024), transition::none);
    EXPECT_FALSE(bp.is_saturated());
    EXPECT_EQ(bp.update(1025), transition::saturated);
    EXPECT_TRUE(bp.is_saturated());
}

TEST(BackpressureController, DrainsOnlyBelowLowWatermark)
{
    backpressure_controller bp{512, 1024};
    bp.update(2000);

    EXPECT_EQ(bp.update(800), transition::none);
    EXPECT_EQ(bp.update(512), transition::none);
    EXPECT_TRUE(bp.is_saturated());
    EXPECT_EQ(bp.update(511), transition::drained);
    EXPECT_FALSE(bp.is_saturated());
}

TEST(BackpressureController, ReportsEachTransitionOnce)
{
    backpressure_controller bp{10, 20};

    EXPECT_EQ(bp.update(30), transition::saturated);
    EXPECT_EQ(bp.update(40), transition::none);
    EXPECT_EQ(bp.update(0), transition::drained);
    EXPECT_EQ(bp.update(0), transition::none);
}

TEST(BackpressureController, ResetClearsSaturation)
{
    backpressure_controller bp{10, 20};
    bp.update(30);
    bp.reset();

    EXPECT_FALSE(bp.is_saturated());
    EXPECT_EQ(bp.low_watermark(), 10u);
    EXPECT_EQ(bp.high_watermark(), 20u);
}
