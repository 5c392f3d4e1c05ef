#include "zlac8030l_driver/canopen_actuator.hpp"
#include "zlac8030l_driver/sdo_codec.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include <rclcpp/logging.hpp>

namespace zlac8030l_driver {

CanopenActuator::CanopenActuator(const CanBusConfig& config,
                                 std::unique_ptr<CanTransport> transport)
    : config_(config),
      transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("CanopenActuator: transport must not be null");
    }
}

CanopenActuator::~CanopenActuator() {
    if (transport_->isOpen() && !disconnect()) {
        RCLCPP_WARN(rclcpp::get_logger("zlac8030l_driver"),
                    "Not all motor drivers acknowledged the stop request");
    }
}

bool CanopenActuator::connect(ControlMode mode, std::string& error) {
    if (!transport_->open(error)) return false;

    const int8_t op_mode = (mode == ControlMode::TORQUE) ? od::MODE_PROFILE_TORQUE
                                                         : od::MODE_PROFILE_VELOCITY;
    for (WheelId wheel : ALL_WHEELS) {
        const uint8_t node = nodeId(wheel);
        const uint16_t sequence[] = {od::CW_SHUTDOWN, od::CW_SWITCH_ON, od::CW_ENABLE_OPERATION};

        IoResult result = download(node, od::MODE_OF_OPERATION, 0,
                                   static_cast<uint8_t>(op_mode), 1);
        for (uint16_t cw : sequence) {
            if (result != IoResult::OK) break;
            result = download(node, od::CONTROLWORD, 0, cw, 2);
        }

        if (result != IoResult::OK) {
            std::ostringstream oss;
            oss << "failed to enable node " << static_cast<int>(node)
                << " (" << shortName(wheel) << ") in " << toString(mode)
                << " mode: " << toString(result);
            if (result == IoResult::ABORTED) {
                oss << " (abort code 0x" << std::hex << last_abort_code_ << ")";
            }
            // 已使能的节点要先停下再关总线
            if (!disconnect()) {
                oss << "; not all nodes acknowledged the stop request";
            }
            error = oss.str();
            return false;
        }
    }
    return true;
}

bool CanopenActuator::disconnect() {
    if (!transport_->isOpen()) return true;
    bool all_stopped = true;
    for (WheelId wheel : ALL_WHEELS) {
        const uint8_t node = nodeId(wheel);
        // 逐个停止，某个节点失败也继续处理下一个
        if (download(node, od::TARGET_VELOCITY, 0, 0, 4) != IoResult::OK) all_stopped = false;
        if (download(node, od::TARGET_TORQUE, 0, 0, 2) != IoResult::OK) all_stopped = false;
        if (download(node, od::CONTROLWORD, 0, od::CW_SHUTDOWN, 2) != IoResult::OK) all_stopped = false;
    }
    transport_->close();
    return all_stopped;
}

IoResult CanopenActuator::readVelocity(WheelId wheel, double& rpm) {
    int32_t raw = 0;
    IoResult result = upload(nodeId(wheel), od::ACTUAL_VELOCITY, 0, 4, raw);
    if (result == IoResult::OK) rpm = raw * od::VELOCITY_FEEDBACK_SCALE;
    return result;
}

IoResult CanopenActuator::readVoltage(WheelId wheel, double& volts) {
    int32_t raw = 0;
    IoResult result = upload(nodeId(wheel), od::BUS_VOLTAGE, 0, 2, raw);
    if (result == IoResult::OK) volts = static_cast<uint16_t>(raw) * od::VOLTAGE_SCALE;
    return result;
}

IoResult CanopenActuator::readCurrent(WheelId wheel, double& amps) {
    int32_t raw = 0;
    IoResult result = upload(nodeId(wheel), od::ACTUAL_CURRENT, 0, 2, raw);
    if (result == IoResult::OK) amps = raw * od::CURRENT_FEEDBACK_SCALE;
    return result;
}

IoResult CanopenActuator::readErrorCode(WheelId wheel, uint16_t& code) {
    int32_t raw = 0;
    IoResult result = upload(nodeId(wheel), od::ERROR_CODE, 0, 2, raw);
    if (result == IoResult::OK) code = static_cast<uint16_t>(raw);
    return result;
}

IoResult CanopenActuator::writeVelocity(WheelId wheel, double rpm) {
    int32_t value = static_cast<int32_t>(std::lround(rpm));
    return download(nodeId(wheel), od::TARGET_VELOCITY, 0, static_cast<uint32_t>(value), 4);
}

IoResult CanopenActuator::writeTorque(WheelId wheel, double current_ma) {
    double clamped = std::max(-32768.0, std::min(32767.0, current_ma));
    int16_t value = static_cast<int16_t>(std::lround(clamped));
    return download(nodeId(wheel), od::TARGET_TORQUE, 0,
                    static_cast<uint16_t>(value), 2);
}

IoResult CanopenActuator::upload(uint8_t node, uint16_t index, uint8_t subindex,
                                 uint8_t size, int32_t& value) {
    uint32_t data = 0;
    IoResult result = transact(sdo::makeUploadRequest(node, index, subindex),
                               node, index, subindex, sdo::Reply::UPLOAD_DATA, data);
    if (result == IoResult::OK) value = sdo::signExtend(data, size);
    return result;
}

IoResult CanopenActuator::download(uint8_t node, uint16_t index, uint8_t subindex,
                                   uint32_t value, uint8_t size) {
    uint32_t data = 0;
    return transact(sdo::makeDownloadRequest(node, index, subindex, value, size),
                    node, index, subindex, sdo::Reply::DOWNLOAD_ACK, data);
}

IoResult CanopenActuator::transact(const can_frame& request, uint8_t node, uint16_t index,
                                   uint8_t subindex, sdo::Reply expected, uint32_t& data) {
    if (!transport_->isOpen()) return IoResult::NOT_CONNECTED;

    IoResult result = transport_->send(request);
    if (result != IoResult::OK) return result;

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(config_.sdo_timeout));
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return IoResult::TIMEOUT;

        can_frame reply;
        result = transport_->receive(reply, remaining);
        if (result == IoResult::TIMEOUT) continue;
        if (result != IoResult::OK) return result;

        sdo::Reply kind = sdo::parseReply(reply, node, index, subindex, data);
        if (kind == expected) return IoResult::OK;
        if (kind == sdo::Reply::ABORT) {
            last_abort_code_ = data;
            return IoResult::ABORTED;
        }
        // 迟到的旧应答或其他节点的帧，继续等
    }
}

} // namespace zlac8030l_driver
