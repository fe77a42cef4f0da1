#pragma once

/**
 * @page zetta-frame Zetta Wire Frame
 * @file frame.hpp
 * @brief Constants and encoder for the fixed, length-prefixed Zetta frame.
 *
 * @details
 * LAYOUT
 * ------
 * Every packet on the wire is one frame. All fields are single bytes except the
 * payload, so byte order never matters.
 *
 *   offset      size     field     value
 *   0           1        START     0xAA
 *   1           1        TYPE      packet type, 0..255
 *   2           1        LENGTH    payload length, 0..25
 *   3           LENGTH   PAYLOAD   raw bytes
 *   3+LENGTH    1        CRC8      over bytes [1, 3+LENGTH)
 *   4+LENGTH    1        STOP      0xBC
 *
 * Frame size is LENGTH + 5, so the largest frame is 30 bytes.
 *
 * NO BYTE STUFFING
 * ----------------
 * The length prefix marks where the frame ends. A wrong STOP means the frame
 * was misaligned, a wrong CRC means it was damaged. A corrupt LENGTH costs one
 * frame; the decoder then slides forward byte by byte until a START lines up
 * again (see stream_decoder.hpp).
 *
 * EXAMPLE
 * -------
 * @code
 *   std::vector<uint8_t> out;
 *   const uint8_t ab[] = {'A', 'B'};
 *   zetta::frame::encode(1, ab, 2, out);
 *   // out: AA 01 02 41 42 96 BC
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "zetta/crc8.hpp"

namespace zetta {
namespace frame {

/**
 * @name Framing constants
 * @{
 */
static constexpr uint8_t START            = 0xAA;  ///< First byte of every frame
static constexpr uint8_t STOP             = 0xBC;  ///< Last byte of every frame
static constexpr size_t  MAX_PAYLOAD_SIZE = 25;    ///< Largest LENGTH a sender may use
static constexpr size_t  OVERHEAD         = 5;     ///< START + TYPE + LENGTH + CRC + STOP
static constexpr size_t  HEADER_SIZE      = 3;     ///< START + TYPE + LENGTH
static constexpr size_t  MAX_FRAME_SIZE   = MAX_PAYLOAD_SIZE + OVERHEAD;
/** @} */

/// Outcome of encode(). Kept as a small enum so it can travel through bool-returning call sites.
enum class EncodeResult : uint8_t { Ok = 0, PayloadTooLarge = 1 };

/// @brief CRC of a frame's protected fields: TYPE, LENGTH, PAYLOAD.
inline uint8_t checksum(uint8_t type, const uint8_t* payload, size_t len) {
    uint8_t c = crc::update(crc::INIT, type);
    c = crc::update(c, static_cast<uint8_t>(len));
    return crc::update(c, payload, len);
}

/**
 * @brief Wrap a packet type and payload into one complete wire frame.
 *
 * @param type    Packet type code. Any byte value is legal on the wire.
 * @param payload Pointer to @p len payload bytes (may be null when @p len is 0).
 * @param len     Payload length; must not exceed MAX_PAYLOAD_SIZE.
 * @param out     Receives the frame. Cleared first; left empty on failure.
 *
 * @return EncodeResult::Ok, or PayloadTooLarge when @p len > MAX_PAYLOAD_SIZE.
 */
inline EncodeResult encode(uint8_t type, const uint8_t* payload, size_t len,
                           std::vector<uint8_t>& out) {
    out.clear();
    if (len > MAX_PAYLOAD_SIZE) return EncodeResult::PayloadTooLarge;

    out.reserve(len + OVERHEAD);
    out.push_back(START);
    out.push_back(type);
    out.push_back(static_cast<uint8_t>(len));
    out.insert(out.end(), payload, payload + len);
    out.push_back(checksum(type, payload, len));
    out.push_back(STOP);
    return EncodeResult::Ok;
}

/// @brief Vector convenience overload.
inline EncodeResult encode(uint8_t type, const std::vector<uint8_t>& payload,
                           std::vector<uint8_t>& out) {
    return encode(type, payload.data(), payload.size(), out);
}

} // namespace frame
} // namespace zetta
