#ifndef ZLAC8030L_DRIVER_SOCKETCAN_TRANSPORT_HPP
#define ZLAC8030L_DRIVER_SOCKETCAN_TRANSPORT_HPP

/**
 * @file socketcan_transport.hpp
 * @brief Linux SocketCAN 原始套接字，内核过滤只收 SDO 应答 (0x580..0x5FF)
 */

#include "zlac8030l_driver/can_transport.hpp"
#include <string>

namespace zlac8030l_driver {

class SocketCanTransport : public CanTransport {
public:
    /** @param channel 网卡名，如 can0；波特率由 ip link 设置 */
    explicit SocketCanTransport(const std::string& channel);
    ~SocketCanTransport() override;

    SocketCanTransport(const SocketCanTransport&) = delete;
    SocketCanTransport& operator=(const SocketCanTransport&) = delete;

    bool open(std::string& error) override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }

    IoResult send(const can_frame& frame) override;
    IoResult receive(can_frame& frame, std::chrono::milliseconds timeout) override;

private:
    std::string channel_;
    int fd_ = -1;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_SOCKETCAN_TRANSPORT_HPP
