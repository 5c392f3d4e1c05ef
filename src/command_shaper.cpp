#include "zlac8030l_driver/command_shaper.hpp"
#include <cmath>
#include <stdexcept>

namespace zlac8030l_driver {

CommandShaper::CommandShaper(const DriveLimits& limits)
    : limits_(limits) {
    if (limits_.max_vx <= 0.0 || limits_.max_w <= 0.0) {
        throw std::invalid_argument("max_vx and max_w must be positive");
    }
    if (limits_.max_lin_accel <= 0.0 || limits_.max_ang_accel <= 0.0) {
        throw std::invalid_argument("max_lin_accel and max_ang_accel must be positive");
    }
}

ShapedCommand CommandShaper::shape(double raw_linear, double raw_angular,
                                   double current_linear, double current_angular,
                                   double dt) const {
    if (dt < 0.0) dt = 0.0;

    ShapedCommand out;
    out.linear = limitAcceleration(raw_linear, current_linear, dt, limits_.max_lin_accel);
    out.angular = limitAcceleration(raw_angular, current_angular, dt, limits_.max_ang_accel);

    out.linear = clampMagnitude(out.linear, limits_.max_vx, out.linear_clamped);
    out.angular = clampMagnitude(out.angular, limits_.max_w, out.angular_clamped);
    return out;
}

double CommandShaper::limitAcceleration(double raw, double current, double dt, double max_accel) {
    double delta = raw - current;
    double accel = max_accel;
    if (delta < 0.0) accel = -max_accel;

    double boundary = current + dt * accel;
    if (std::abs(raw - current) > std::abs(boundary - current)) {
        return boundary;
    }
    return raw;
}

double CommandShaper::clampMagnitude(double value, double max_abs, bool& clamped) {
    clamped = false;
    if (std::abs(value) > max_abs) {
        clamped = true;
        return value < 0.0 ? -max_abs : max_abs;
    }
    return value;
}

} // namespace zlac8030l_driver
