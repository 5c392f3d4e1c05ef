#include "zlac8030l_driver/telemetry.hpp"

#include <tf2/LinearMath/Quaternion.h>
#include <tf2_geometry_msgs/tf2_geometry_msgs.hpp>
#include <Eigen/Dense>

namespace zlac8030l_driver {

namespace {

/** 6x6 对角协方差（x, y, z, roll, pitch, yaw），按行展开 */
std::array<double, 36> diagonalCovariance(const Eigen::Matrix<double, 6, 1>& diagonal) {
    Eigen::Matrix<double, 6, 6, Eigen::RowMajor> cov = diagonal.asDiagonal();
    std::array<double, 36> out;
    Eigen::Map<Eigen::Matrix<double, 6, 6, Eigen::RowMajor>>(out.data()) = cov;
    return out;
}

} // namespace

nav_msgs::msg::Odometry makeOdometryMessage(const RobotOdometry& odom,
                                            const rclcpp::Time& stamp,
                                            const std::string& odom_frame,
                                            const std::string& robot_frame) {
    nav_msgs::msg::Odometry msg;
    msg.header.stamp = stamp;
    msg.header.frame_id = odom_frame;
    msg.child_frame_id = robot_frame;

    msg.pose.pose.position.x = odom.x;
    msg.pose.pose.position.y = odom.y;
    msg.pose.pose.position.z = 0.0;

    tf2::Quaternion q;
    q.setRPY(0.0, 0.0, odom.yaw);
    msg.pose.pose.orientation = tf2::toMsg(q);

    Eigen::Matrix<double, 6, 1> pose_diag;
    pose_diag.setConstant(UNTRUSTED_COVARIANCE);
    msg.pose.covariance = diagonalCovariance(pose_diag);

    // 速度相对 robot_frame，只有前向速度和偏航角速度
    msg.twist.twist.linear.x = odom.v;
    msg.twist.twist.linear.y = 0.0;
    msg.twist.twist.angular.z = odom.w;

    Eigen::Matrix<double, 6, 1> twist_diag;
    twist_diag << TRUSTED_COVARIANCE, TRUSTED_COVARIANCE, UNTRUSTED_COVARIANCE,
                  UNTRUSTED_COVARIANCE, UNTRUSTED_COVARIANCE, TRUSTED_COVARIANCE;
    msg.twist.covariance = diagonalCovariance(twist_diag);

    return msg;
}

geometry_msgs::msg::TransformStamped makeOdometryTransform(const nav_msgs::msg::Odometry& odom) {
    geometry_msgs::msg::TransformStamped tf;
    tf.header = odom.header;
    tf.child_frame_id = odom.child_frame_id;
    tf.transform.translation.x = odom.pose.pose.position.x;
    tf.transform.translation.y = odom.pose.pose.position.y;
    tf.transform.translation.z = 0.0;
    tf.transform.rotation = odom.pose.pose.orientation;
    return tf;
}

msg::MotorState makeMotorStateMessage(WheelId wheel,
                                      const WheelState& state,
                                      const rclcpp::Time& stamp) {
    msg::MotorState msg;
    msg.header.stamp = stamp;
    msg.node_id = nodeId(wheel);

    msg.voltage = state.voltage;
    msg.target_current_ma = state.target_current_ma;
    msg.target_current_a = state.target_current_ma / 1000.0;
    msg.current = state.current;
    msg.error_code = state.error_code;

    msg.actual_speed = state.measured_rpm;
    msg.target_speed = state.target_rpm;
    return msg;
}

} // namespace zlac8030l_driver
