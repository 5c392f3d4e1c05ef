#ifndef ZLAC8030L_DRIVER_PID_CONTROLLER_HPP
#define ZLAC8030L_DRIVER_PID_CONTROLLER_HPP

#include "zlac8030l_driver/types.hpp"

namespace zlac8030l_driver {

/**
 * @brief 轮速 PID，输入转速误差 (rpm)，输出目标电流 (mA)
 *
 * 积分为逐次累加（无抗饱和），微分为相邻两次调用的误差差分，
 * 因此增益隐含了控制周期。每个轮子各持有一个实例。
 */
class PidController {
public:
    PidController() = default;
    explicit PidController(const PidGains& gains);

    /**
     * @brief 用本周期误差更新并返回控制量
     * @param error 目标转速 - 实测转速
     */
    double update(double error);

    double integral() const { return integral_; }
    double previousError() const { return prev_error_; }

private:
    PidGains gains_;
    double integral_ = 0.0;
    double prev_error_ = 0.0;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_PID_CONTROLLER_HPP
