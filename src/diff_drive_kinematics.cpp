#include "zlac8030l_driver/diff_drive_kinematics.hpp"
#include <cmath>
#include <stdexcept>

namespace zlac8030l_driver {

DiffDriveKinematics::DiffDriveKinematics(const DriveGeometry& geometry)
    : geometry_(geometry) {
    if (geometry_.wheel_radius <= 0.0) {
        throw std::invalid_argument("wheel_radius must be positive");
    }
    if (geometry_.track_width <= 0.0) {
        throw std::invalid_argument("track_width must be positive");
    }

    const double r = geometry_.wheel_radius;
    const double half_t = 0.5 * geometry_.track_width;
    inverse_ << 1.0 / r, -half_t / r,
                1.0 / r,  half_t / r;
    forward_ << 0.5, 0.5,
                -1.0 / geometry_.track_width, 1.0 / geometry_.track_width;
}

SideWheelSpeeds DiffDriveKinematics::wheelSpeeds(double v, double w) const {
    Eigen::Vector2d wheels = inverse_ * Eigen::Vector2d(v, w);
    SideWheelSpeeds speeds;
    speeds.left = wheels(0);
    speeds.right = wheels(1);
    return speeds;
}

void DiffDriveKinematics::integrate(const PerWheel<double>& wheel_rad_s, double dt) {
    if (dt < 0.0) dt = 0.0;

    const double r = geometry_.wheel_radius;
    double v_left = r * 0.5 * (wheel_rad_s[index(WheelId::FRONT_LEFT)] +
                               wheel_rad_s[index(WheelId::BACK_LEFT)]);
    double v_right = r * 0.5 * (wheel_rad_s[index(WheelId::FRONT_RIGHT)] +
                                wheel_rad_s[index(WheelId::BACK_RIGHT)]);

    Eigen::Vector2d twist = forward_ * Eigen::Vector2d(v_left, v_right);
    odom_.v = twist(0);
    odom_.w = twist(1);

    // 先航向后位置
    odom_.yaw += odom_.w * dt;
    while (odom_.yaw > M_PI)  odom_.yaw -= 2.0 * M_PI;
    while (odom_.yaw < -M_PI) odom_.yaw += 2.0 * M_PI;

    odom_.x += odom_.v * std::cos(odom_.yaw) * dt;
    odom_.y += odom_.v * std::sin(odom_.yaw) * dt;
}

void DiffDriveKinematics::reset() {
    odom_ = RobotOdometry();
}

} // namespace zlac8030l_driver
