#include "zlac8030l_driver/control_loop.hpp"
#include <rclcpp/logging.hpp>
#include <sstream>

namespace zlac8030l_driver {

int busFailures(const TickReport& report) {
    return report.write_failures + report.velocity_read_failures +
           report.diagnostic_read_failures;
}

std::string summarize(const TickReport& report) {
    std::ostringstream oss;
    oss << "cmd_timeout=" << (report.command_timed_out ? "yes" : "no")
        << " write_failures=" << report.write_failures
        << " velocity_read_failures=" << report.velocity_read_failures
        << " diagnostic_read_failures=" << report.diagnostic_read_failures;
    return oss.str();
}

ControlLoop::ControlLoop(const ControlLoopConfig& config,
                         WheelActuator& actuator,
                         double start_time,
                         rclcpp::Logger logger,
                         rclcpp::Clock::SharedPtr log_clock)
    : config_(config),
      actuator_(actuator),
      logger_(logger),
      log_clock_(log_clock),
      shaper_(config.limits),
      kinematics_(config.geometry),
      last_cmd_stamp_(start_time),
      last_tick_stamp_(start_time) {
    for (PidController& pid : pids_) {
        pid = PidController(config_.gains);
    }
}

TickReport ControlLoop::tick(double now) {
    TickReport report;

    double dt = now - last_tick_stamp_;
    if (dt < 0.0) {
        RCLCPP_WARN_THROTTLE(logger_, *log_clock_, 1000,
                             "Clock went backwards by %.4f s, skipping odometry step", -dt);
        dt = 0.0;
    }
    last_tick_stamp_ = now;

    VelocityCommand cmd;
    if (mailbox_.take(cmd)) {
        applyCommand(cmd);
    }

    // 指令超时保护
    if (now - last_cmd_stamp_ > config_.cmd_timeout) {
        if (!timed_out_) {
            RCLCPP_WARN(logger_, "No velocity command for %.3f s (timeout %.3f s), stopping wheels",
                        now - last_cmd_stamp_, config_.cmd_timeout);
        }
        timed_out_ = true;
        zeroTargets();
    } else {
        timed_out_ = false;
    }
    report.command_timed_out = timed_out_;

    applyControls(report);
    updateOdometry(dt, report);
    readDiagnostics(report);

    report.odometry = kinematics_.odometry();
    report.wheels = wheels_;
    return report;
}

void ControlLoop::applyCommand(const VelocityCommand& cmd) {
    const double dt = cmd.stamp - last_cmd_stamp_;
    last_cmd_stamp_ = cmd.stamp;

    const RobotOdometry& odom = kinematics_.odometry();
    ShapedCommand shaped = shaper_.shape(cmd.linear, cmd.angular, odom.v, odom.w, dt);

    if (shaped.linear_clamped) {
        RCLCPP_WARN_THROTTLE(logger_, *log_clock_, 1000,
                             "Commanded linear velocity %.3f is more than maximum magnitude %.3f",
                             cmd.linear, config_.limits.max_vx);
    }
    if (shaped.angular_clamped) {
        RCLCPP_WARN_THROTTLE(logger_, *log_clock_, 1000,
                             "Commanded angular velocity %.3f is more than maximum magnitude %.3f",
                             cmd.angular, config_.limits.max_w);
    }

    SideWheelSpeeds speeds = kinematics_.wheelSpeeds(shaped.linear, shaped.angular);
    const double left_rpm = radPerSecToRpm(speeds.left);
    const double right_rpm = radPerSecToRpm(speeds.right);
    for (WheelId wheel : ALL_WHEELS) {
        double side_rpm = isLeft(wheel) ? left_rpm : right_rpm;
        wheels_[index(wheel)].target_rpm = side_rpm * flipSign(wheel);
    }
}

void ControlLoop::zeroTargets() {
    for (WheelState& state : wheels_) {
        state.target_rpm = 0.0;
    }
}

void ControlLoop::applyControls(TickReport& report) {
    if (config_.mode == ControlMode::VELOCITY) {
        for (WheelId wheel : ALL_WHEELS) {
            IoResult result = actuator_.writeVelocity(wheel, wheels_[index(wheel)].target_rpm);
            if (result != IoResult::OK) {
                ++report.write_failures;
                RCLCPP_ERROR_THROTTLE(logger_, *log_clock_, 1000,
                                      "[applyControls] Error in setting %s wheel velocity: %s",
                                      shortName(wheel), toString(result));
            }
        }
        return;
    }

    // 力矩模式：误差在电机坐标系下计算，目标与实测都未翻转，等价于都翻转
    for (WheelId wheel : ALL_WHEELS) {
        WheelState& state = wheels_[index(wheel)];
        double rpm = 0.0;
        IoResult result = actuator_.readVelocity(wheel, rpm);
        if (result == IoResult::OK) {
            state.measured_rpm = rpm;
            state.target_current_ma = pids_[index(wheel)].update(state.target_rpm - state.measured_rpm);
        } else {
            // 读失败时沿用上周期的目标电流
            ++report.velocity_read_failures;
            RCLCPP_ERROR_THROTTLE(logger_, *log_clock_, 1000,
                                  "[applyControls] Error in getting %s wheel velocity: %s. Check driver connection",
                                  shortName(wheel), toString(result));
        }
    }

    for (WheelId wheel : ALL_WHEELS) {
        IoResult result = actuator_.writeTorque(wheel, wheels_[index(wheel)].target_current_ma);
        if (result != IoResult::OK) {
            ++report.write_failures;
            RCLCPP_ERROR_THROTTLE(logger_, *log_clock_, 1000,
                                  "[applyControls] Error in setting %s wheel torque: %s",
                                  shortName(wheel), toString(result));
        }
    }
}

void ControlLoop::updateOdometry(double dt, TickReport& report) {
    PerWheel<double> wheel_rad_s;
    for (WheelId wheel : ALL_WHEELS) {
        WheelState& state = wheels_[index(wheel)];
        double rpm = 0.0;
        IoResult result = actuator_.readVelocity(wheel, rpm);
        if (result == IoResult::OK) {
            state.measured_rpm = rpm;
        } else {
            ++report.velocity_read_failures;
            RCLCPP_ERROR_THROTTLE(logger_, *log_clock_, 1000,
                                  "[updateOdometry] Error in getting %s wheel velocity: %s. Check driver connection",
                                  shortName(wheel), toString(result));
        }
        wheel_rad_s[index(wheel)] = rpmToRadPerSec(state.measured_rpm * flipSign(wheel));
    }
    kinematics_.integrate(wheel_rad_s, dt);
}

void ControlLoop::readDiagnostics(TickReport& report) {
    for (WheelId wheel : ALL_WHEELS) {
        WheelState& state = wheels_[index(wheel)];

        double volts = 0.0;
        IoResult result = actuator_.readVoltage(wheel, volts);
        if (result == IoResult::OK) {
            state.voltage = volts;
        } else {
            ++report.diagnostic_read_failures;
        }

        double amps = 0.0;
        result = actuator_.readCurrent(wheel, amps);
        if (result == IoResult::OK) {
            state.current = amps;
        } else {
            ++report.diagnostic_read_failures;
        }

        uint16_t code = 0;
        result = actuator_.readErrorCode(wheel, code);
        if (result == IoResult::OK) {
            state.error_code = code;
        } else {
            ++report.diagnostic_read_failures;
        }
    }

    if (report.diagnostic_read_failures > 0) {
        RCLCPP_WARN_THROTTLE(logger_, *log_clock_, 1000,
                             "[readDiagnostics] %d of %zu motor state reads failed, publishing last known values",
                             report.diagnostic_read_failures, 3 * WHEEL_COUNT);
    }
}

} // namespace zlac8030l_driver
