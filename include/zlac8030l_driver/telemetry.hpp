#ifndef ZLAC8030L_DRIVER_TELEMETRY_HPP
#define ZLAC8030L_DRIVER_TELEMETRY_HPP

/**
 * @file telemetry.hpp
 * @brief 控制循环结果 → ROS 消息
 */

#include "zlac8030l_driver/types.hpp"
#include "zlac8030l_driver/msg/motor_state.hpp"

#include <geometry_msgs/msg/transform_stamped.hpp>
#include <nav_msgs/msg/odometry.hpp>
#include <rclcpp/time.hpp>
#include <string>

namespace zlac8030l_driver {

/** 协方差对角线上"可信"与"不可信"的取值 */
constexpr double TRUSTED_COVARIANCE = 0.1;
constexpr double UNTRUSTED_COVARIANCE = 1000.0;

/**
 * @brief 里程计消息
 *
 * 位姿协方差对角线全部为 1000（纯航迹推算，不可信）；
 * 速度协方差只信任前向速度和偏航角速度（以及 vy，底盘不会侧滑）。
 */
nav_msgs::msg::Odometry makeOdometryMessage(const RobotOdometry& odom,
                                            const rclcpp::Time& stamp,
                                            const std::string& odom_frame,
                                            const std::string& robot_frame);

geometry_msgs::msg::TransformStamped makeOdometryTransform(const nav_msgs::msg::Odometry& odom);

msg::MotorState makeMotorStateMessage(WheelId wheel,
                                      const WheelState& state,
                                      const rclcpp::Time& stamp);

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_TELEMETRY_HPP
