#include "zlac8030l_driver/sdo_codec.hpp"
#include <cstring>

namespace zlac8030l_driver {
namespace sdo {

namespace {

void writeHeader(can_frame& frame, uint8_t cmd, uint16_t index, uint8_t subindex) {
    frame.data[0] = cmd;
    frame.data[1] = static_cast<uint8_t>(index & 0xFF);
    frame.data[2] = static_cast<uint8_t>((index >> 8) & 0xFF);
    frame.data[3] = subindex;
}

uint32_t readLe32(const can_frame& frame) {
    return static_cast<uint32_t>(frame.data[4]) |
           (static_cast<uint32_t>(frame.data[5]) << 8) |
           (static_cast<uint32_t>(frame.data[6]) << 16) |
           (static_cast<uint32_t>(frame.data[7]) << 24);
}

} // namespace

can_frame makeUploadRequest(uint8_t node, uint16_t index, uint8_t subindex) {
    can_frame frame;
    std::memset(&frame, 0, sizeof(frame));
    frame.can_id = TX_BASE + node;
    frame.can_dlc = 8;
    writeHeader(frame, CMD_UPLOAD_REQUEST, index, subindex);
    return frame;
}

can_frame makeDownloadRequest(uint8_t node, uint16_t index, uint8_t subindex,
                              uint32_t value, uint8_t size) {
    if (size != 1 && size != 2) size = 4;

    can_frame frame;
    std::memset(&frame, 0, sizeof(frame));
    frame.can_id = TX_BASE + node;
    frame.can_dlc = 8;

    // 0x23 / 0x2B / 0x2F：expedited + size indicated，n = 4 - size
    uint8_t cmd = static_cast<uint8_t>(0x23 | ((4 - size) << 2));
    writeHeader(frame, cmd, index, subindex);
    for (uint8_t i = 0; i < size; ++i) {
        frame.data[4 + i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return frame;
}

Reply parseReply(const can_frame& frame, uint8_t node, uint16_t index, uint8_t subindex,
                 uint32_t& value) {
    if ((frame.can_id & CAN_SFF_MASK) != RX_BASE + node) return Reply::UNRELATED;
    if (frame.can_dlc < 8) return Reply::MALFORMED;

    uint16_t reply_index = static_cast<uint16_t>(frame.data[1] | (frame.data[2] << 8));
    if (reply_index != index || frame.data[3] != subindex) return Reply::UNRELATED;

    const uint8_t cmd = frame.data[0];
    if (cmd == CMD_ABORT) {
        value = readLe32(frame);
        return Reply::ABORT;
    }
    if (cmd == CMD_DOWNLOAD_ACK) {
        return Reply::DOWNLOAD_ACK;
    }
    if ((cmd & 0xE0) == 0x40) {
        // 只接受 expedited 应答
        if ((cmd & 0x02) == 0) return Reply::MALFORMED;
        uint8_t size = 4;
        if (cmd & 0x01) size = static_cast<uint8_t>(4 - ((cmd >> 2) & 0x03));

        uint32_t raw = readLe32(frame);
        value = (size == 4) ? raw : (raw & ((1u << (8 * size)) - 1u));
        return Reply::UPLOAD_DATA;
    }
    return Reply::MALFORMED;
}

int32_t signExtend(uint32_t value, uint8_t size) {
    if (size == 1) return static_cast<int8_t>(value & 0xFF);
    if (size == 2) return static_cast<int16_t>(value & 0xFFFF);
    return static_cast<int32_t>(value);
}

} // namespace sdo
} // namespace zlac8030l_driver
