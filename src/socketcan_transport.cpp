#include "zlac8030l_driver/socketcan_transport.hpp"
#include "zlac8030l_driver/sdo_codec.hpp"

#include <linux/can/raw.h>
#include <net/if.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace zlac8030l_driver {

SocketCanTransport::SocketCanTransport(const std::string& channel)
    : channel_(channel) {}

SocketCanTransport::~SocketCanTransport() {
    close();
}

bool SocketCanTransport::open(std::string& error) {
    if (fd_ >= 0) return true;

    fd_ = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
    if (fd_ < 0) {
        error = std::string("socket(PF_CAN) failed: ") + std::strerror(errno);
        return false;
    }

    struct ifreq ifr;
    std::memset(&ifr, 0, sizeof(ifr));
    std::strncpy(ifr.ifr_name, channel_.c_str(), IFNAMSIZ - 1);
    if (::ioctl(fd_, SIOCGIFINDEX, &ifr) < 0) {
        error = "CAN interface '" + channel_ + "' not found: " + std::strerror(errno);
        close();
        return false;
    }

    // 只收 SDO 应答 0x580..0x5FF
    struct can_filter filter;
    filter.can_id = sdo::RX_BASE;
    filter.can_mask = 0x780;
    if (::setsockopt(fd_, SOL_CAN_RAW, CAN_RAW_FILTER, &filter, sizeof(filter)) < 0) {
        error = std::string("setsockopt(CAN_RAW_FILTER) failed: ") + std::strerror(errno);
        close();
        return false;
    }

    struct sockaddr_can addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.can_family = AF_CAN;
    addr.can_ifindex = ifr.ifr_ifindex;
    if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind to '" + channel_ + "' failed: " + std::strerror(errno);
        close();
        return false;
    }
    return true;
}

void SocketCanTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

IoResult SocketCanTransport::send(const can_frame& frame) {
    if (fd_ < 0) return IoResult::NOT_CONNECTED;
    if (::write(fd_, &frame, sizeof(frame)) != static_cast<ssize_t>(sizeof(frame))) {
        return IoResult::BUS_ERROR;
    }
    return IoResult::OK;
}

IoResult SocketCanTransport::receive(can_frame& frame, std::chrono::milliseconds timeout) {
    if (fd_ < 0) return IoResult::NOT_CONNECTED;

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) return IoResult::TIMEOUT;
    if (ready < 0) {
        // 被信号打断时由调用方按剩余时间重试
        return (errno == EINTR) ? IoResult::TIMEOUT : IoResult::BUS_ERROR;
    }

    if (::read(fd_, &frame, sizeof(frame)) != static_cast<ssize_t>(sizeof(frame))) {
        return IoResult::BUS_ERROR;
    }
    return IoResult::OK;
}

} // namespace zlac8030l_driver
