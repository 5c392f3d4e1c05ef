#ifndef ZLAC8030L_DRIVER_DIFF_DRIVE_KINEMATICS_HPP
#define ZLAC8030L_DRIVER_DIFF_DRIVE_KINEMATICS_HPP

/**
 * @file diff_drive_kinematics.hpp
 * @brief 四轮差速底盘运动学
 *
 *        FL ○─────────○ FR
 *           │    ↑ x  │
 *           │  y ←┘   │   T = track_width
 *           │         │   r = wheel_radius
 *        BL ○─────────○ BR
 *
 * 逆运动学（机器人速度 → 轮子角速度，同侧两轮相同）：
 *   ω_l = (v - w·T/2) / r
 *   ω_r = (v + w·T/2) / r
 *
 * 正运动学（轮子角速度 → 机器人速度），同侧两轮取平均：
 *   v_l = r·(ω_fl + ω_bl)/2,  v_r = r·(ω_fr + ω_br)/2
 *   v = (v_l + v_r)/2,  w = (v_r - v_l)/T
 *
 * 积分顺序：先更新航向，再用新航向更新位置。
 *   yaw += w·dt
 *   x   += v·cos(yaw)·dt
 *   y   += v·sin(yaw)·dt
 */

#include "zlac8030l_driver/types.hpp"
#include <Eigen/Dense>

namespace zlac8030l_driver {

/** 左右两侧轮子角速度 (rad/s)，运动学方向 */
struct SideWheelSpeeds {
    double left = 0.0;
    double right = 0.0;
};

class DiffDriveKinematics {
public:
    /**
     * @throws std::invalid_argument 轮半径或轮距不为正
     */
    explicit DiffDriveKinematics(const DriveGeometry& geometry);

    /**
     * @brief 逆运动学
     * @param v 线速度 (m/s)
     * @param w 角速度 (rad/s)
     */
    SideWheelSpeeds wheelSpeeds(double v, double w) const;

    /**
     * @brief 用四个轮子的实测角速度推算里程计
     * @param wheel_rad_s 各轮角速度 (rad/s)，已翻转到运动学方向
     * @param dt 距上次积分的时间 (s)，为负时按 0 处理
     */
    void integrate(const PerWheel<double>& wheel_rad_s, double dt);

    /** 位姿回到原点，速度清零 */
    void reset();

    const RobotOdometry& odometry() const { return odom_; }

private:
    DriveGeometry geometry_;
    Eigen::Matrix2d inverse_;   // [v, w] -> [ω_l, ω_r]
    Eigen::Matrix2d forward_;   // [v_l, v_r] -> [v, w]
    RobotOdometry odom_;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_DIFF_DRIVE_KINEMATICS_HPP
