#include "zlac8030l_driver/telemetry.hpp"
#include <gtest/gtest.h>
#include <tf2/utils.h>
#include <tf2_geometry_msgs/tf2_geometry_msgs.hpp>

using namespace zlac8030l_driver;

TEST(Telemetry, OdometryMessageCarriesPoseAndTwist) {
    RobotOdometry odom;
    odom.x = 1.5;
    odom.y = -0.25;
    odom.yaw = 0.7;
    odom.v = 0.4;
    odom.w = -0.1;

    rclcpp::Time stamp(12, 500, RCL_ROS_TIME);
    nav_msgs::msg::Odometry msg = makeOdometryMessage(odom, stamp, "odom_link", "base_link");

    EXPECT_EQ(msg.header.frame_id, "odom_link");
    EXPECT_EQ(msg.child_frame_id, "base_link");
    EXPECT_EQ(msg.header.stamp.sec, 12);
    EXPECT_EQ(msg.header.stamp.nanosec, 500u);
    EXPECT_DOUBLE_EQ(msg.pose.pose.position.x, 1.5);
    EXPECT_DOUBLE_EQ(msg.pose.pose.position.y, -0.25);
    EXPECT_NEAR(tf2::getYaw(msg.pose.pose.orientation), 0.7, 1e-9);
    EXPECT_DOUBLE_EQ(msg.twist.twist.linear.x, 0.4);
    EXPECT_DOUBLE_EQ(msg.twist.twist.linear.y, 0.0);
    EXPECT_DOUBLE_EQ(msg.twist.twist.angular.z, -0.1);
}

TEST(Telemetry, CovarianceDistinguishesTrustedAxes) {
    nav_msgs::msg::Odometry msg = makeOdometryMessage(
        RobotOdometry(), rclcpp::Time(0, 0, RCL_ROS_TIME), "odom", "base");

    const double twist_diag[6] = {0.1, 0.1, 1000.0, 1000.0, 1000.0, 0.1};
    for (int i = 0; i < 6; ++i) {
        EXPECT_DOUBLE_EQ(msg.pose.covariance[i * 7], 1000.0) << "pose " << i;
        EXPECT_DOUBLE_EQ(msg.twist.covariance[i * 7], twist_diag[i]) << "twist " << i;
    }
    // 非对角元为 0
    EXPECT_DOUBLE_EQ(msg.pose.covariance[1], 0.0);
    EXPECT_DOUBLE_EQ(msg.twist.covariance[6], 0.0);
}

TEST(Telemetry, TransformMirrorsOdometry) {
    RobotOdometry odom;
    odom.x = 2.0;
    odom.y = 3.0;
    odom.yaw = -1.2;
    nav_msgs::msg::Odometry msg = makeOdometryMessage(
        odom, rclcpp::Time(1, 0, RCL_ROS_TIME), "odom_link", "base_link");
    geometry_msgs::msg::TransformStamped tf = makeOdometryTransform(msg);

    EXPECT_EQ(tf.header.frame_id, "odom_link");
    EXPECT_EQ(tf.child_frame_id, "base_link");
    EXPECT_DOUBLE_EQ(tf.transform.translation.x, 2.0);
    EXPECT_DOUBLE_EQ(tf.transform.translation.y, 3.0);
    EXPECT_NEAR(tf2::getYaw(tf.transform.rotation), -1.2, 1e-9);
}

TEST(Telemetry, MotorStateMessageFields) {
    WheelState state;
    state.measured_rpm = -35.0;
    state.target_rpm = -40.0;
    state.target_current_ma = 1500.0;
    state.voltage = 48.0;
    state.current = 1.2;
    state.error_code = 0x0020;

    msg::MotorState msg = makeMotorStateMessage(WheelId::BACK_LEFT, state,
                                                rclcpp::Time(3, 0, RCL_ROS_TIME));
    EXPECT_EQ(msg.node_id, 2);
    EXPECT_DOUBLE_EQ(msg.voltage, 48.0);
    EXPECT_DOUBLE_EQ(msg.target_current_ma, 1500.0);
    EXPECT_DOUBLE_EQ(msg.target_current_a, 1.5);
    EXPECT_DOUBLE_EQ(msg.current, 1.2);
    EXPECT_EQ(msg.error_code, 0x0020);
    EXPECT_DOUBLE_EQ(msg.actual_speed, -35.0);
    EXPECT_DOUBLE_EQ(msg.target_speed, -40.0);
    EXPECT_EQ(msg.header.stamp.sec, 3);
}
