#include "zlac8030l_driver/pid_controller.hpp"

namespace zlac8030l_driver {

PidController::PidController(const PidGains& gains)
    : gains_(gains) {}

double PidController::update(double error) {
    integral_ += error;
    double derivative = error - prev_error_;
    prev_error_ = error;
    return gains_.kp * error + gains_.ki * integral_ + gains_.kd * derivative;
}

} // namespace zlac8030l_driver
