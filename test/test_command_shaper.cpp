#include "zlac8030l_driver/command_shaper.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>

using namespace zlac8030l_driver;

namespace {

DriveLimits defaultLimits() {
    DriveLimits l;
    l.max_vx = 2.0;
    l.max_w = 1.57;
    l.max_lin_accel = 10.0;
    l.max_ang_accel = 15.0;
    return l;
}

} // namespace

TEST(CommandShaper, RejectsNonPositiveLimits) {
    DriveLimits l = defaultLimits();
    l.max_vx = 0.0;
    EXPECT_THROW(CommandShaper{l}, std::invalid_argument);
    l = defaultLimits();
    l.max_ang_accel = -1.0;
    EXPECT_THROW(CommandShaper{l}, std::invalid_argument);
}

TEST(CommandShaper, StepCommandLimitedByAcceleration) {
    CommandShaper shaper(defaultLimits());
    for (double m : {0.05, 0.1, 0.5, 1.0, 1.9}) {
        ShapedCommand out = shaper.shape(m, 0.0, 0.0, 0.0, 0.01);
        EXPECT_DOUBLE_EQ(out.linear, std::min(m, 0.1)) << "M=" << m;
        ShapedCommand rev = shaper.shape(-m, 0.0, 0.0, 0.0, 0.01);
        EXPECT_DOUBLE_EQ(rev.linear, -std::min(m, 0.1)) << "M=" << m;
    }
}

TEST(CommandShaper, AngularAxisLimitedIndependently) {
    CommandShaper shaper(defaultLimits());
    ShapedCommand out = shaper.shape(0.05, 1.0, 0.0, 0.0, 0.01);
    EXPECT_DOUBLE_EQ(out.linear, 0.05);
    EXPECT_DOUBLE_EQ(out.angular, 0.15);
}

TEST(CommandShaper, ClampsToMaximumMagnitude) {
    CommandShaper shaper(defaultLimits());
    // 大 dt 下加速度不起作用，只剩幅值限幅
    ShapedCommand out = shaper.shape(5.0, 0.0, 0.0, 0.0, 10.0);
    EXPECT_DOUBLE_EQ(out.linear, 2.0);
    EXPECT_TRUE(out.linear_clamped);
    EXPECT_FALSE(out.angular_clamped);

    ShapedCommand neg = shaper.shape(-5.0, -3.0, 0.0, 0.0, 10.0);
    EXPECT_DOUBLE_EQ(neg.linear, -2.0);
    EXPECT_DOUBLE_EQ(neg.angular, -1.57);
    EXPECT_TRUE(neg.linear_clamped);
    EXPECT_TRUE(neg.angular_clamped);
}

TEST(CommandShaper, DecelerationTowardZeroIsNotBlocked) {
    CommandShaper shaper(defaultLimits());
    // 当前 1.0，指令 0.95，误差 0.05 小于一个周期可达的 0.1
    ShapedCommand out = shaper.shape(0.95, 0.0, 1.0, 0.0, 0.01);
    EXPECT_DOUBLE_EQ(out.linear, 0.95);
}

TEST(CommandShaper, LargeDecelerationStillRateLimited) {
    CommandShaper shaper(defaultLimits());
    ShapedCommand out = shaper.shape(0.0, 0.0, 1.0, 0.0, 0.01);
    EXPECT_NEAR(out.linear, 0.9, 1e-12);
}

TEST(CommandShaper, ZeroDeltaKeepsCommand) {
    CommandShaper shaper(defaultLimits());
    ShapedCommand out = shaper.shape(0.7, -0.2, 0.7, -0.2, 0.01);
    EXPECT_DOUBLE_EQ(out.linear, 0.7);
    EXPECT_DOUBLE_EQ(out.angular, -0.2);
    EXPECT_FALSE(out.linear_clamped);
}

TEST(CommandShaper, ZeroDtHoldsCurrentVelocity) {
    CommandShaper shaper(defaultLimits());
    ShapedCommand out = shaper.shape(1.0, 1.0, 0.3, 0.1, 0.0);
    EXPECT_DOUBLE_EQ(out.linear, 0.3);
    EXPECT_DOUBLE_EQ(out.angular, 0.1);
}
