/**
 * @file packet.hpp
 * @brief Zetta Packet - one validated frame, as handed to the application.
 *
 * This header defines the value type that travels from the stream decoder,
 * through the delivery queue, to the consumer:
 *
 *  - `Payload`  : fixed-capacity byte vector (0..25 bytes), the application data.
 *  - `RawFrame` : fixed-capacity byte vector (5..30 bytes), the frame exactly as
 *                 it arrived on the wire. Kept for logging and debugging.
 *  - `Packet`   : type + payload + capture timestamp + raw frame.
 *
 * ## Why fixed capacity
 * The wire format caps a payload at 25 bytes, so a packet never needs the heap.
 * ETL vectors make that cap part of the type: a Packet can be copied into the
 * delivery queue without allocation, and an oversized payload is impossible to
 * represent.
 *
 * ## Lifetime
 * - Created only by `StreamDecoder` after the STOP byte and CRC check out.
 * - Owned by the delivery queue until `Protocol::get_packet()` hands it out.
 * - Treated as immutable afterwards; nothing in the library writes to a Packet
 *   that has left the decoder.
 *
 * ## Packet types
 * Any byte is a legal TYPE. The three codes used by the firmware are named
 * below for readability; other codes pass through untouched.
 */

#pragma once
#include "etl/vector.h"
#include <stdint.h>
#include <stddef.h>
#include <chrono>

#include "zetta/frame.hpp"

namespace zetta {

/// Well-known packet types. The wire carries a plain byte; unknown codes are valid.
enum PacketType : uint8_t {
    MSG_ACK       = 0,  ///< Application-level acknowledgement (no protocol semantics)
    MSG_PUBLISH   = 1,  ///< Publish data on a topic
    MSG_SUBSCRIBE = 2,  ///< Subscribe to a topic
};

/// Application payload, 0..25 bytes.
using Payload  = etl::vector<uint8_t, frame::MAX_PAYLOAD_SIZE>;

/// Complete wire frame, START..STOP inclusive.
using RawFrame = etl::vector<uint8_t, frame::MAX_FRAME_SIZE>;

/// Wall-clock capture time.
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief A validated inbound packet.
 *
 * - `type`      : TYPE byte from the frame.
 * - `payload`   : PAYLOAD bytes (LENGTH of them).
 * - `timestamp` : system_clock::now() at the moment the frame validated.
 * - `raw_frame` : the original START..STOP bytes.
 */
struct Packet {
    uint8_t   type{0};
    Payload   payload;
    Timestamp timestamp{};
    RawFrame  raw_frame;

    /// @brief Convenience check against a named type.
    bool is(PacketType t) const { return type == static_cast<uint8_t>(t); }
};

/// @brief Short name for the well-known types; "UNKNOWN" otherwise.
inline const char* type_name(uint8_t type) {
    switch (type) {
        case MSG_ACK:       return "MSG_ACK";
        case MSG_PUBLISH:   return "MSG_PUBLISH";
        case MSG_SUBSCRIBE: return "MSG_SUBSCRIBE";
        default:            return "UNKNOWN";
    }
}

} // namespace zetta
