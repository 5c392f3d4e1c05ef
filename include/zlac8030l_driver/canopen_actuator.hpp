#ifndef ZLAC8030L_DRIVER_CANOPEN_ACTUATOR_HPP
#define ZLAC8030L_DRIVER_CANOPEN_ACTUATOR_HPP

/**
 * @file canopen_actuator.hpp
 * @brief ZLAC8030L 执行器实现，四个驱动器各占一个 CANopen 节点，经 expedited SDO 读写
 */

#include "zlac8030l_driver/can_transport.hpp"
#include "zlac8030l_driver/wheel_actuator.hpp"
#include "zlac8030l_driver/sdo_codec.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace zlac8030l_driver {

/** ZLAC8030L 对象字典中用到的条目 */
namespace od {
constexpr uint16_t CONTROLWORD = 0x6040;
constexpr uint16_t ERROR_CODE = 0x603F;
constexpr uint16_t MODE_OF_OPERATION = 0x6060;
constexpr uint16_t ACTUAL_VELOCITY = 0x606C;   // int32, 0.1 rpm
constexpr uint16_t ACTUAL_CURRENT = 0x6078;    // int16, 0.1 A
constexpr uint16_t TARGET_TORQUE = 0x6071;     // int16, mA
constexpr uint16_t TARGET_VELOCITY = 0x60FF;   // int32, rpm
constexpr uint16_t BUS_VOLTAGE = 0x2035;       // uint16, 0.01 V

constexpr int8_t MODE_PROFILE_VELOCITY = 3;
constexpr int8_t MODE_PROFILE_TORQUE = 4;

constexpr uint16_t CW_SHUTDOWN = 0x06;
constexpr uint16_t CW_SWITCH_ON = 0x07;
constexpr uint16_t CW_ENABLE_OPERATION = 0x0F;

constexpr double VELOCITY_FEEDBACK_SCALE = 0.1;
constexpr double CURRENT_FEEDBACK_SCALE = 0.1;
constexpr double VOLTAGE_SCALE = 0.01;
} // namespace od

struct CanBusConfig {
    std::string channel = "can0";
    double sdo_timeout = 0.02;   // 单次 SDO 等待应答的上限 (s)
};

class CanopenActuator : public WheelActuator {
public:
    CanopenActuator(const CanBusConfig& config, std::unique_ptr<CanTransport> transport);
    /** 总线仍打开时先停止全部电机 */
    ~CanopenActuator() override;

    CanopenActuator(const CanopenActuator&) = delete;
    CanopenActuator& operator=(const CanopenActuator&) = delete;

    bool connect(ControlMode mode, std::string& error) override;
    bool disconnect() override;

    IoResult readVelocity(WheelId wheel, double& rpm) override;
    IoResult readVoltage(WheelId wheel, double& volts) override;
    IoResult readCurrent(WheelId wheel, double& amps) override;
    IoResult readErrorCode(WheelId wheel, uint16_t& code) override;

    IoResult writeVelocity(WheelId wheel, double rpm) override;
    IoResult writeTorque(WheelId wheel, double current_ma) override;

    /** 最近一次 SDO abort 的错误码 */
    uint32_t lastAbortCode() const { return last_abort_code_; }

private:
    /** 读一个对象，value 按 size 做符号扩展 */
    IoResult upload(uint8_t node, uint16_t index, uint8_t subindex, uint8_t size, int32_t& value);
    IoResult download(uint8_t node, uint16_t index, uint8_t subindex, uint32_t value, uint8_t size);
    /** 发送请求并等待 expected 类型的应答，超时由 sdo_timeout 限定 */
    IoResult transact(const can_frame& request, uint8_t node, uint16_t index, uint8_t subindex,
                      sdo::Reply expected, uint32_t& data);

    CanBusConfig config_;
    std::unique_ptr<CanTransport> transport_;
    uint32_t last_abort_code_ = 0;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_CANOPEN_ACTUATOR_HPP
