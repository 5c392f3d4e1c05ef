#ifndef ZLAC8030L_DRIVER_CAN_TRANSPORT_HPP
#define ZLAC8030L_DRIVER_CAN_TRANSPORT_HPP

/**
 * @file can_transport.hpp
 * @brief 原始 CAN 帧收发接口，CANopen 层只通过它访问总线
 */

#include "zlac8030l_driver/wheel_actuator.hpp"
#include <linux/can.h>
#include <chrono>
#include <string>

namespace zlac8030l_driver {

class CanTransport {
public:
    virtual ~CanTransport() = default;

    virtual bool open(std::string& error) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /** 发送一帧，OK 或 BUS_ERROR */
    virtual IoResult send(const can_frame& frame) = 0;

    /**
     * @brief 等待下一帧
     * @param timeout 最长等待时间
     * @return OK 收到一帧；TIMEOUT 在 timeout 内没有帧（或被信号打断）；BUS_ERROR 读失败
     */
    virtual IoResult receive(can_frame& frame, std::chrono::milliseconds timeout) = 0;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_CAN_TRANSPORT_HPP
