#ifndef ZLAC8030L_DRIVER_CONTROL_LOOP_HPP
#define ZLAC8030L_DRIVER_CONTROL_LOOP_HPP

/**
 * @file control_loop.hpp
 * @brief 定频控制循环：指令整形、超时保护、下发控制量、里程计推算、读取诊断量
 *
 * 每个周期 tick() 依次执行：
 *   1. 从邮箱取最新指令，整形后换算成各轮目标转速
 *   2. 距上次指令超过 cmd_timeout 时所有目标清零
 *   3. 速度模式直接写目标转速；力矩模式读转速 → PID → 写目标电流
 *   4. 读各轮转速，翻转到运动学方向后推算里程计
 *   5. 读电压、电流、故障码（各字段独立，失败保留上次的值）
 *
 * 总线读写失败只计数并节流打印，不会中断循环。
 */

#include "zlac8030l_driver/command_mailbox.hpp"
#include "zlac8030l_driver/command_shaper.hpp"
#include "zlac8030l_driver/diff_drive_kinematics.hpp"
#include "zlac8030l_driver/pid_controller.hpp"
#include "zlac8030l_driver/types.hpp"
#include "zlac8030l_driver/wheel_actuator.hpp"

#include <rclcpp/clock.hpp>
#include <rclcpp/logger.hpp>
#include <string>

namespace zlac8030l_driver {

struct ControlLoopConfig {
    ControlMode mode = ControlMode::VELOCITY;
    DriveGeometry geometry;
    DriveLimits limits;
    PidGains gains;
    double cmd_timeout = 0.1;   // s
};

/** 单个周期的结果，供节点发布 */
struct TickReport {
    RobotOdometry odometry;
    PerWheel<WheelState> wheels;
    bool command_timed_out = false;
    int write_failures = 0;
    int velocity_read_failures = 0;
    int diagnostic_read_failures = 0;
};

/** 本周期总线读写失败的总次数 */
int busFailures(const TickReport& report);

/** 单行摘要，用于节点日志 */
std::string summarize(const TickReport& report);

class ControlLoop {
public:
    /**
     * @param start_time 启动时刻 (s)，作为首条指令和首次积分的时间基准
     * @param log_clock 节流日志使用的时钟
     */
    ControlLoop(const ControlLoopConfig& config,
                WheelActuator& actuator,
                double start_time,
                rclcpp::Logger logger,
                rclcpp::Clock::SharedPtr log_clock);

    /** 订阅回调线程调用，只写邮箱 */
    void postCommand(const VelocityCommand& cmd) { mailbox_.post(cmd); }

    /**
     * @brief 执行一个控制周期
     * @param now 当前时刻 (s, steady clock)
     */
    TickReport tick(double now);

    const PerWheel<WheelState>& wheels() const { return wheels_; }

private:
    void applyCommand(const VelocityCommand& cmd);
    void zeroTargets();
    void applyControls(TickReport& report);
    void updateOdometry(double dt, TickReport& report);
    void readDiagnostics(TickReport& report);

    ControlLoopConfig config_;
    WheelActuator& actuator_;
    rclcpp::Logger logger_;
    rclcpp::Clock::SharedPtr log_clock_;

    CommandMailbox mailbox_;
    CommandShaper shaper_;
    DiffDriveKinematics kinematics_;
    PerWheel<PidController> pids_;
    PerWheel<WheelState> wheels_;

    double last_cmd_stamp_;
    double last_tick_stamp_;
    bool timed_out_ = true;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_CONTROL_LOOP_HPP
