/**
 * @file protocol.hpp
 * @brief Zetta Protocol - framed, CRC-checked packet link over a byte-stream transport.
 *
 * @details
 * ## Field Brief
 * A microcontroller on the other end of a UART speaks in small frames:
 * START, type, length, up to 25 payload bytes, CRC-8, STOP. This class is the
 * host side of that conversation. It owns a background receive loop that turns
 * the raw byte stream into validated packets, a queue the application drains
 * at its own pace, and a send path that frames outbound data.
 *
 * ---
 *
 * @par What This File Provides
 * - `zetta::Protocol` - the facade that:
 *   - Runs one receive thread between `start()` and `stop()`.
 *   - Frames and writes outbound packets (`send_raw()`, `send()`).
 *   - Queues inbound packets for `get_packet()`, optionally also calling an
 *     rx callback on the receive thread.
 *   - Converts payloads to application values through registered codecs
 *     (`register_handler()`, `process_packet()`).
 *   - Counts everything (`get_stats()`).
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [caller thread]                          [receive thread]
 *       │                                          │
 *   send(type, value)                       available()? ──no──► sleep(idle)
 *       │ builder                                  │ yes
 *   send_raw(type, bytes)                   lock ─ recv() ─ unlock
 *       │ frame::encode                            │
 *   lock ─ transport.send() ─ unlock        StreamDecoder::feed()
 *                                                  │ per packet
 *   get_packet(timeout) ◄────── queue ◄──── push ──┴─► rx callback
 *       │
 *   process_packet() ── parser (or raw payload)
 * ```
 *
 * - One mutex covers every transport call, on both threads, so a read burst
 *   and a frame write never interleave on the wire.
 * - The receive loop polls availability before reading; it never sits in a
 *   blocking read, so it sees the stop flag within one idle sleep.
 *
 * ---
 *
 * @par Failure Model
 * Nothing here throws and nothing stops the receive loop.
 * - **Payload too large** (> 25 bytes): send returns false, nothing written.
 * - **Transport failure**: send returns false; a failed read backs the loop
 *   off for `error_backoff` and it carries on.
 * - **Bad frame / bad CRC**: counted in stats, frame dropped, scanning resumes;
 *   reported once per read burst (FrameError, CrcError).
 * - **No builder**: send() returns false, `packets_sent` unchanged.
 * - **No parser**: process_packet() returns the raw payload.
 * - **User code throws** (parser, builder, rx callback): caught where it was
 *   called and reported.
 * Every reported error goes to stderr as one `key=value` line and to the
 * error callback, if one is set.
 *
 * ---
 *
 * @par Callbacks
 * The rx callback runs synchronously on the receive thread. While it runs,
 * no bytes are read. Keep it short and non-blocking; hand heavy work to
 * another thread or just use the queue.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * auto port = std::make_shared<zetta::transport::LinuxSerial>();
 * zetta::transport::Config tc; tc.path = "/dev/ttyACM0";
 * if (!port->begin(tc)) return 1;
 *
 * zetta::Protocol link(port);
 * link.register_handler(zetta::MSG_ACK, zetta::make_string_parser(),
 *                                       zetta::make_string_builder());
 * link.start();
 *
 * link.send(zetta::MSG_ACK, std::string("hello"));
 *
 * if (auto pkt = link.get_packet(std::chrono::milliseconds(500))) {
 *   std::any v = link.process_packet(*pkt);
 * }
 * link.stop();
 * @endcode
 */
#ifndef ZETTA_PROTOCOL_HPP
#define ZETTA_PROTOCOL_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <thread>

#include "zetta/codec_registry.hpp"
#include "zetta/delivery_queue.hpp"
#include "zetta/errors.hpp"
#include "zetta/packet.hpp"
#include "zetta/stats.hpp"
#include "zetta/transport/transport_base.hpp"

namespace zetta {

/**
 * @brief Runtime knobs for the receive loop and logging.
 *
 * Defaults match a 115200 baud UART: a 1 ms idle sleep is shorter than the
 * time a full 30-byte frame takes to arrive (~2.6 ms).
 */
struct ProtocolConfig {
  std::chrono::milliseconds idle_sleep{1};       ///< Sleep when no bytes were waiting
  std::chrono::milliseconds error_backoff{100};  ///< Sleep after a transport read failure
  std::chrono::milliseconds join_timeout{1000};  ///< How long stop() waits for the loop
  bool log_to_stderr{true};                      ///< Emit key=value log lines on stderr
};

/// Called on the receive thread for every packet, after it is queued.
using RxCallback = std::function<void(const Packet&)>;

class Protocol {
public:
  /// @name Compile-time capacities
  ///@{

  /**
   * @brief Delivery queue depth.
   *
   * @details
   * At 115200 baud the link carries at most ~380 full frames per second, so
   * 128 packets is a third of a second of backlog. Past that, the oldest
   * packet is evicted and `queue_overflows` goes up.
   */
  static constexpr size_t QUEUE_CAP  = 128;

  /// Initial size of the receive read buffer; grows to the largest burst seen.
  static constexpr size_t READ_CHUNK = 256;
  ///@}

  using Queue = DeliveryQueue<Packet, QUEUE_CAP>;

  /**
   * @brief Bind a link to an already opened transport.
   *
   * @param transport Shared with the receive thread, which keeps it alive
   *                  even if it outlives this object after a timed-out stop().
   * @param cfg       Loop and logging knobs.
   */
  explicit Protocol(std::shared_ptr<transport::ITransport> transport,
                    ProtocolConfig cfg = ProtocolConfig{});

  /// Stops the receive loop if it is still running.
  ~Protocol();

  Protocol(const Protocol&) = delete;
  Protocol& operator=(const Protocol&) = delete;

  /**
   * @brief Launch the receive loop.
   *
   * Any partial frame buffered by a previous session is discarded first.
   *
   * @return true if the loop is running on return. false if the transport is
   *         not open (reported as TransportFailure) or a previous loop that
   *         missed its stop deadline has not exited yet.
   */
  bool start();

  /**
   * @brief Stop the receive loop and close the transport.
   *
   * @details
   * Raises the stop flag and waits up to `join_timeout` for the loop to
   * notice. A loop stuck in a slow rx callback is detached rather than waited
   * on forever; it exits on its own once the callback returns. The timeout is
   * reported as HandlerException when a callback is still running, otherwise
   * as TransportFailure. The transport
   * is closed either way. Queued packets stay available to get_packet().
   */
  void stop();

  /// @brief true between a successful start() and the loop's exit.
  bool is_running() const;

  /**
   * @brief Register the codec for @p type; replaces any earlier one.
   * @see CodecRegistry::register_codec()
   */
  void register_handler(uint8_t type, Parser parser, Builder builder = {});

  void set_rx_callback(RxCallback cb);
  void set_error_callback(ErrorCallback cb);

  /**
   * @brief Build a payload from @p value with the registered builder and send it.
   *
   * @return false if no builder exists (NoBuilder), the builder throws
   *         (HandlerException), or send_raw() fails.
   */
  bool send(uint8_t type, const Value& value);

  /**
   * @brief Frame and write a raw payload.
   *
   * @return true once the whole frame was handed to the transport.
   *         false for a payload over 25 bytes (nothing written) or a
   *         transport failure.
   */
  bool send_raw(uint8_t type, const uint8_t* data, size_t len);
  bool send_raw(uint8_t type, const Bytes& payload);

  /**
   * @brief Take the oldest received packet.
   * @param timeout 0 polls; otherwise waits up to @p timeout.
   */
  std::optional<Packet> get_packet(std::chrono::milliseconds timeout);

  /// @brief Take the oldest received packet, waiting indefinitely.
  std::optional<Packet> get_packet();

  /**
   * @brief Run the registered parser on a packet's payload.
   * @return The parsed value, or the raw `Payload` when there is no parser
   *         or the parser throws.
   */
  Value process_packet(const Packet& packet);

  /// @brief Drop every queued packet unprocessed. @return how many were dropped.
  size_t flush();

  /// @brief Copy of the counters.
  StatsSnapshot get_stats() const;

private:
  struct Context;

  static void receive_loop(const std::shared_ptr<Context>& ctx);

  std::shared_ptr<Context> ctx_;
  std::thread              rx_thread_;
  std::future<void>        rx_done_;
};

} // namespace zetta

#endif // ZETTA_PROTOCOL_HPP
