#ifndef ZLAC8030L_DRIVER_SDO_CODEC_HPP
#define ZLAC8030L_DRIVER_SDO_CODEC_HPP

/**
 * @file sdo_codec.hpp
 * @brief CANopen 快速 SDO 帧的编解码（只支持 ≤4 字节的 expedited 传输）
 *
 * 请求 COB-ID = 0x600 + node，应答 COB-ID = 0x580 + node。
 * 数据区: [cmd][index_lo][index_hi][subindex][d0][d1][d2][d3]，小端。
 */

#include <linux/can.h>
#include <cstdint>

namespace zlac8030l_driver {
namespace sdo {

constexpr uint32_t TX_BASE = 0x600;
constexpr uint32_t RX_BASE = 0x580;

constexpr uint8_t CMD_UPLOAD_REQUEST = 0x40;
constexpr uint8_t CMD_DOWNLOAD_ACK = 0x60;
constexpr uint8_t CMD_ABORT = 0x80;

/** 应答类型 */
enum class Reply {
    UPLOAD_DATA,    // 读应答，value 为数据
    DOWNLOAD_ACK,   // 写确认
    ABORT,          // value 为 abort code
    UNRELATED,      // 不是本次请求的应答（其他节点、其他对象）
    MALFORMED,
};

can_frame makeUploadRequest(uint8_t node, uint16_t index, uint8_t subindex);

/**
 * @param size 数据字节数，1 / 2 / 4
 */
can_frame makeDownloadRequest(uint8_t node, uint16_t index, uint8_t subindex,
                              uint32_t value, uint8_t size);

/**
 * @brief 解析一帧应答
 * @param value 读应答时为按实际长度零扩展的数据，abort 时为 abort code
 */
Reply parseReply(const can_frame& frame, uint8_t node, uint16_t index, uint8_t subindex,
                 uint32_t& value);

/** 按字节数做符号扩展，用于有符号对象（速度、电流） */
int32_t signExtend(uint32_t value, uint8_t size);

} // namespace sdo
} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_SDO_CODEC_HPP
