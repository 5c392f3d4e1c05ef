#ifndef ZLAC8030L_DRIVER_COMMAND_SHAPER_HPP
#define ZLAC8030L_DRIVER_COMMAND_SHAPER_HPP

/**
 * @file command_shaper.hpp
 * @brief 速度指令整形：加速度限制 + 幅值限幅
 */

#include "zlac8030l_driver/types.hpp"

namespace zlac8030l_driver {

/** 整形结果；*_clamped 表示触发了幅值限幅，由调用方节流告警 */
struct ShapedCommand {
    double linear = 0.0;
    double angular = 0.0;
    bool linear_clamped = false;
    bool angular_clamped = false;
};

/**
 * @brief 把原始速度指令整形为本周期可达的目标速度
 *
 * 每个轴独立处理：
 *   1. 加速度方向取 sign(raw - current)，差值恰为 0 时取 +max_accel
 *   2. 本周期可达边界 boundary = current + dt * accel
 *   3. |raw - current| > |boundary - current| 时取 boundary，否则取 raw
 *      （减速的误差不会超过边界，因此减速不受加速度限制阻挡）
 *   4. 按 max_vx / max_w 限幅，保留符号
 */
class CommandShaper {
public:
    explicit CommandShaper(const DriveLimits& limits);

    ShapedCommand shape(double raw_linear, double raw_angular,
                        double current_linear, double current_angular,
                        double dt) const;

private:
    static double limitAcceleration(double raw, double current, double dt, double max_accel);
    static double clampMagnitude(double value, double max_abs, bool& clamped);

    DriveLimits limits_;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_COMMAND_SHAPER_HPP
