#ifndef ZLAC8030L_DRIVER_WHEEL_ACTUATOR_HPP
#define ZLAC8030L_DRIVER_WHEEL_ACTUATOR_HPP

/**
 * @file wheel_actuator.hpp
 * @brief 轮毂电机驱动器抽象接口，CANopen 实现与测试桩均继承此类
 */

#include "zlac8030l_driver/types.hpp"
#include <cstdint>
#include <string>

namespace zlac8030l_driver {

/** 单次总线读写的结果 */
enum class IoResult {
    OK,
    TIMEOUT,        // 超时未收到应答
    ABORTED,        // 驱动器返回 SDO abort
    BUS_ERROR,      // socket 发送/接收失败
    NOT_CONNECTED,
};

const char* toString(IoResult result);

/**
 * @brief 轮子执行器接口
 *
 * 所有读写均以电机坐标系（未翻转）表示。除 connect 外，任何一次调用失败
 * 都只影响该字段/该轮子，调用方记录后继续运行。
 */
class WheelActuator {
public:
    virtual ~WheelActuator() = default;

    /**
     * @brief 打开总线、设置控制模式并使能全部驱动器
     * @param error 失败原因
     * @return 失败时节点无法工作，应终止进程
     */
    virtual bool connect(ControlMode mode, std::string& error) = 0;

    /**
     * @brief 停止电机并关闭总线
     * @return 所有驱动器都确认停止时返回 true
     */
    virtual bool disconnect() = 0;

    virtual IoResult readVelocity(WheelId wheel, double& rpm) = 0;
    virtual IoResult readVoltage(WheelId wheel, double& volts) = 0;
    virtual IoResult readCurrent(WheelId wheel, double& amps) = 0;
    virtual IoResult readErrorCode(WheelId wheel, uint16_t& code) = 0;

    virtual IoResult writeVelocity(WheelId wheel, double rpm) = 0;
    virtual IoResult writeTorque(WheelId wheel, double current_ma) = 0;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_WHEEL_ACTUATOR_HPP
