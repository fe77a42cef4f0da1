#pragma once

/**
 * @file crc8.hpp
 * @brief CRC-8 used to protect the TYPE, LENGTH and PAYLOAD fields of a Zetta frame.
 *
 * @details
 * PARAMETERS
 * ----------
 *   width      8
 *   poly       0x07  (x^8 + x^2 + x + 1)
 *   init       0xFF
 *   refin      false
 *   refout     false
 *   xorout     0x00
 *
 * The same parameters are programmed into the MCU's hardware CRC unit on the
 * firmware side, so the host must not change them without changing both ends.
 *
 * Check values:
 *   checksum("")                      == 0xFF
 *   checksum({0x01,0x02,0x41,0x42})   == 0x96
 *   checksum("123456789")             == 0xFB
 */

#include <cstddef>
#include <cstdint>

namespace zetta {
namespace crc {

static constexpr uint8_t POLY = 0x07;
static constexpr uint8_t INIT = 0xFF;

/**
 * @brief Fold one byte into a running CRC register.
 *
 * Lets callers checksum fields that are not contiguous in memory
 * (type, length, then payload) without assembling a temporary buffer.
 */
inline uint8_t update(uint8_t crc, uint8_t byte) {
    crc ^= byte;
    for (int bit = 0; bit < 8; ++bit) {
        crc = (crc & 0x80) ? static_cast<uint8_t>((crc << 1) ^ POLY)
                           : static_cast<uint8_t>(crc << 1);
    }
    return crc;
}

/// @brief Checksum @p n bytes at @p data, continuing from @p crc.
inline uint8_t update(uint8_t crc, const uint8_t* data, size_t n) {
    for (size_t i = 0; i < n; ++i) crc = update(crc, data[i]);
    return crc;
}

/// @brief One-shot CRC-8 over a byte range.
inline uint8_t checksum(const uint8_t* data, size_t n) {
    return update(INIT, data, n);
}

} // namespace crc
} // namespace zetta
