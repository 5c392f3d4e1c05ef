#ifndef ZLAC8030L_DRIVER_TYPES_HPP
#define ZLAC8030L_DRIVER_TYPES_HPP

/**
 * @file types.hpp
 * @brief 四轮差速底盘驱动的公共类型：轮子编号、轮子状态、速度指令、里程计、限幅参数等
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace zlac8030l_driver {

/** rpm 与 rad/s 的换算系数，60 / (2π) */
constexpr double RPM_PER_RAD_S = 9.5493;

inline double rpmToRadPerSec(double rpm) { return rpm / RPM_PER_RAD_S; }
inline double radPerSecToRpm(double rad_s) { return rad_s * RPM_PER_RAD_S; }

/**
 * @brief 轮子编号
 *
 * 枚举值即数组下标，顺序与 CANopen 节点号 1..4 对应。
 */
enum class WheelId : std::size_t {
    FRONT_LEFT = 0,
    BACK_LEFT = 1,
    BACK_RIGHT = 2,
    FRONT_RIGHT = 3,
};

constexpr std::size_t WHEEL_COUNT = 4;

constexpr std::array<WheelId, WHEEL_COUNT> ALL_WHEELS = {
    WheelId::FRONT_LEFT, WheelId::BACK_LEFT, WheelId::BACK_RIGHT, WheelId::FRONT_RIGHT};

template <typename T>
using PerWheel = std::array<T, WHEEL_COUNT>;

constexpr std::size_t index(WheelId id) { return static_cast<std::size_t>(id); }

/** CANopen 节点号 */
constexpr uint8_t nodeId(WheelId id) { return static_cast<uint8_t>(index(id) + 1); }

/**
 * @brief 安装方向符号
 *
 * 左侧电机与右侧电机镜像安装，乘以该符号后统一到机器人运动学方向（前进为正）。
 */
constexpr double flipSign(WheelId id) {
    return (id == WheelId::FRONT_LEFT || id == WheelId::BACK_LEFT) ? -1.0 : 1.0;
}

constexpr bool isLeft(WheelId id) {
    return id == WheelId::FRONT_LEFT || id == WheelId::BACK_LEFT;
}

/** 短名，用于话题名和日志："fl" / "bl" / "br" / "fr" */
const char* shortName(WheelId id);

/** 控制模式，启动时确定，运行中不切换 */
enum class ControlMode {
    VELOCITY,   // 驱动器内部速度环，直接下发目标转速
    TORQUE,     // 本节点 PID 闭环，下发目标电流
};

const char* toString(ControlMode mode);

/**
 * @brief 单个轮子的状态（电机坐标系，未做方向翻转）
 */
struct WheelState {
    double measured_rpm = 0.0;       // 实测转速 (rpm)
    double target_rpm = 0.0;         // 目标转速 (rpm)
    double target_current_ma = 0.0;  // 目标电流 (mA)，仅力矩模式有效
    double voltage = 0.0;            // 最近一次读到的母线电压 (V)
    double current = 0.0;            // 最近一次读到的电机电流 (A)
    uint16_t error_code = 0;         // 最近一次读到的故障码
};

/** 速度指令：机器人坐标系线速度 + 角速度，stamp 为到达时刻 (s, steady clock) */
struct VelocityCommand {
    double linear = 0.0;    // m/s
    double angular = 0.0;   // rad/s
    double stamp = 0.0;
};

/** 航迹推算里程计，启动时位于原点 */
struct RobotOdometry {
    double x = 0.0;      // m
    double y = 0.0;      // m
    double yaw = 0.0;    // rad
    double v = 0.0;      // 前向速度 (m/s)
    double w = 0.0;      // 偏航角速度 (rad/s)
};

/** 底盘几何参数 */
struct DriveGeometry {
    double wheel_radius = 0.194;   // m
    double track_width = 0.8;      // 左右轮距 (m)
};

/** 速度 / 加速度限幅，均为正值 */
struct DriveLimits {
    double max_vx = 2.0;            // m/s
    double max_w = 1.57;            // rad/s
    double max_lin_accel = 10.0;    // m/s^2
    double max_ang_accel = 15.0;    // rad/s^2
};

struct PidGains {
    double kp = 200.0;
    double ki = 10.0;
    double kd = 0.0;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_TYPES_HPP
