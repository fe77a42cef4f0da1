#pragma once

/**
 * @page zetta-stream-decoder Zetta Stream Decoder
 * @file stream_decoder.hpp
 * @brief Pulls validated frames out of an arbitrary, possibly noisy byte stream.
 *
 * @details
 * PURPOSE
 * -------
 * A serial link delivers bytes, not frames. Reads split frames at random
 * points, several frames can arrive in one read, and a device that resets
 * mid-frame leaves garbage behind. The decoder owns a growing buffer, takes
 * whatever bytes the receive loop hands it, and emits a Packet for every
 * complete frame whose STOP byte and CRC check out.
 *
 * SCANNING RULES
 * --------------
 * Each feed() runs the following steps until none of them can make progress:
 *
 *   1. Buffer head is not START (0xAA): drop that one byte and retry.
 *   2. START seen but fewer than 3 bytes buffered: wait (LENGTH unknown yet).
 *   3. LENGTH > 25: no valid frame can start here. Count a frame error, drop
 *      the START byte only, retry.
 *   4. Fewer than LENGTH + 5 bytes buffered: wait (partial frame).
 *   5. Take exactly LENGTH + 5 bytes as a candidate and check it:
 *        - last byte != STOP (0xBC)  -> frame_errors++, discard, continue
 *        - CRC byte mismatch         -> crc_errors++,   discard, continue
 *        - otherwise                 -> packets_received++, emit Packet
 *
 * Whatever is left (always shorter than one frame) stays buffered for the
 * next feed().
 *
 * PROGRESS GUARANTEE
 * ------------------
 * Every step either consumes at least one byte or stops the scan, and no step
 * ever consumes more than one byte without having a whole candidate frame in
 * hand. So the decoder terminates on any finite input, and a run of k garbage
 * bytes costs exactly k resync steps before the next real START is seen.
 *
 * Resync drops (step 1) are tallied in Stats::resync_bytes, not as frame or
 * CRC errors: noise between frames is expected on a serial line.
 *
 * THREADING
 * ---------
 * Not thread-safe. The receive loop is the only caller in a running Protocol.
 * The Stats reference is shared and its counters are atomic.
 *
 * EXAMPLE
 * -------
 * @code
 *   zetta::Stats stats;
 *   zetta::StreamDecoder dec(stats);
 *   std::vector<zetta::Packet> packets;
 *   dec.feed(bytes.data(), bytes.size(), packets);
 *   for (const auto& p : packets) handle(p);
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "zetta/packet.hpp"
#include "zetta/stats.hpp"

namespace zetta {

class StreamDecoder {
public:
  explicit StreamDecoder(Stats& stats);

  /**
   * @brief Append bytes to the buffer and extract every complete frame.
   *
   * @param data Incoming bytes (may be null when @p n is 0).
   * @param n    Number of bytes at @p data.
   * @param out  Decoded packets are appended here, in stream order.
   *
   * @return Number of packets appended to @p out by this call.
   */
  size_t feed(const uint8_t* data, size_t n, std::vector<Packet>& out);

  /// @brief Bytes currently held back waiting for the rest of a frame.
  size_t buffered() const { return buf_.size() - head_; }

  /// @brief Forget any partial frame. Counters are not touched.
  void reset();

private:
  enum class Step : uint8_t { Emitted, Dropped, NeedMore };

  Step step(std::vector<Packet>& out);
  void compact();

  Stats&               stats_;
  std::vector<uint8_t> buf_;
  size_t               head_{0};   // first unconsumed byte in buf_
};

} // namespace zetta
