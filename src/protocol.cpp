// -----------------------------------------------------------------------------
// protocol.cpp - Implementation of the Zetta link facade and receive loop
//
// API, failure model and threading contract:
//   see include/zetta/protocol.hpp
//
// Usage tests:
//   see tests/test_protocol.cpp (in-memory transport)
//
// NOTE: Everything the receive thread touches lives in Protocol::Context and is
// reached through a shared_ptr, never through `this`. That is what makes it
// safe to detach a loop that misses the stop deadline.
// -----------------------------------------------------------------------------
#include "zetta/protocol.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "zetta/frame.hpp"
#include "zetta/stream_decoder.hpp"

namespace zetta {

// ---------- shared state ----------

struct Protocol::Context {
  Context(std::shared_ptr<transport::ITransport> t, ProtocolConfig c)
  : transport(std::move(t)), cfg(c), decoder(stats) {}

  std::shared_ptr<transport::ITransport> transport;
  ProtocolConfig    cfg;

  std::mutex        io_mtx;            // guards every transport call
  Stats             stats;
  StreamDecoder     decoder;           // receive thread only
  Queue             queue;
  CodecRegistry     codecs;

  std::mutex        cb_mtx;            // guards the two callbacks below
  RxCallback        rx_cb;
  ErrorCallback     err_cb;

  std::atomic<bool> stop_requested{false};
  std::atomic<bool> running{false};
  std::atomic<bool> in_rx_callback{false};   // lets stop() name what it timed out on

  void log_event(const char* event) {
    if (!cfg.log_to_stderr) return;
    std::cerr << "zetta status=ok event=" << event
              << " transport=" << (transport ? transport->name() : "none") << "\n";
  }

  // report() - one error, two sinks: the stderr log line and the user callback.
  void report(ErrorKind kind, const std::string& message) {
    if (cfg.log_to_stderr) {
      std::cerr << "zetta status=error kind=" << to_string(kind)
                << " detail=" << message << "\n";
    }

    ErrorCallback cb;
    {
      std::lock_guard<std::mutex> lock(cb_mtx);
      cb = err_cb;
    }
    if (!cb) return;

    try {
      cb(kind, message);
    } catch (const std::exception& e) {
      if (cfg.log_to_stderr) {
        std::cerr << "zetta status=error kind=" << to_string(ErrorKind::HandlerException)
                  << " detail=error callback failed: " << e.what() << "\n";
      }
    } catch (...) {
      if (cfg.log_to_stderr) {
        std::cerr << "zetta status=error kind=" << to_string(ErrorKind::HandlerException)
                  << " detail=error callback threw a non-standard exception\n";
      }
    }
  }
};

// ---------- lifecycle ----------

Protocol::Protocol(std::shared_ptr<transport::ITransport> transport, ProtocolConfig cfg)
: ctx_(std::make_shared<Context>(std::move(transport), cfg)) {}

Protocol::~Protocol() {
  if (rx_thread_.joinable()) stop();
}

bool Protocol::start() {
  if (ctx_->running.load()) return !ctx_->stop_requested.load();   // already up (or still draining)

  if (!ctx_->transport || !ctx_->transport->is_open()) {
    ctx_->report(ErrorKind::TransportFailure, "cannot start: transport is not open");
    return false;
  }

  ctx_->decoder.reset();                  // a partial frame from the last session is stale
  ctx_->stop_requested.store(false);
  ctx_->running.store(true);

  std::promise<void> done;
  rx_done_ = done.get_future();
  std::shared_ptr<Context> ctx = ctx_;
  rx_thread_ = std::thread([ctx, done = std::move(done)]() mutable {
    receive_loop(ctx);
    done.set_value();
  });

  ctx_->log_event("started");
  return true;
}

void Protocol::stop() {
  ctx_->stop_requested.store(true);

  if (rx_thread_.joinable()) {
    if (rx_done_.wait_for(ctx_->cfg.join_timeout) == std::future_status::ready) {
      rx_thread_.join();
    } else {
      // Loop is busy elsewhere; let it finish on its own time.
      if (ctx_->in_rx_callback.load()) {
        ctx_->report(ErrorKind::HandlerException,
                     "rx callback still running after join timeout; detaching receive loop");
      } else {
        ctx_->report(ErrorKind::TransportFailure,
                     "receive loop did not stop within join timeout; detaching");
      }
      rx_thread_.detach();
    }
  }

  {
    std::lock_guard<std::mutex> lock(ctx_->io_mtx);
    if (ctx_->transport) ctx_->transport->end();
  }
  ctx_->log_event("stopped");
}

bool Protocol::is_running() const {
  return ctx_->running.load() && !ctx_->stop_requested.load();
}

// ---------- configuration ----------

void Protocol::register_handler(uint8_t type, Parser parser, Builder builder) {
  ctx_->codecs.register_codec(type, std::move(parser), std::move(builder));
}

void Protocol::set_rx_callback(RxCallback cb) {
  std::lock_guard<std::mutex> lock(ctx_->cb_mtx);
  ctx_->rx_cb = std::move(cb);
}

void Protocol::set_error_callback(ErrorCallback cb) {
  std::lock_guard<std::mutex> lock(ctx_->cb_mtx);
  ctx_->err_cb = std::move(cb);
}

// ---------- send path ----------

bool Protocol::send(uint8_t type, const Value& value) {
  Bytes payload;
  std::string err;
  switch (ctx_->codecs.build(type, value, payload, err)) {
    case CodecResult::Ok:
      break;
    case CodecResult::HandlerError:
      ctx_->report(ErrorKind::HandlerException, err);
      return false;
    default:
      ctx_->report(ErrorKind::NoBuilder, err);
      return false;
  }
  return send_raw(type, payload);
}

bool Protocol::send_raw(uint8_t type, const Bytes& payload) {
  return send_raw(type, payload.data(), payload.size());
}

bool Protocol::send_raw(uint8_t type, const uint8_t* data, size_t len) {
  std::vector<uint8_t> out;
  if (frame::encode(type, data, len, out) != frame::EncodeResult::Ok) {
    ctx_->report(ErrorKind::PayloadTooLarge,
                 "payload too large: " + std::to_string(len) + " > " +
                 std::to_string(frame::MAX_PAYLOAD_SIZE));
    return false;                                   // nothing written, no counters touched
  }

  transport::TxResult r = transport::TxResult::Error;
  {
    std::lock_guard<std::mutex> lock(ctx_->io_mtx);  // one exclusive region per frame
    if (ctx_->transport) r = ctx_->transport->send(out.data(), out.size());
    if (r == transport::TxResult::Ok) Stats::bump(ctx_->stats.packets_sent);
  }

  if (r != transport::TxResult::Ok) {
    Stats::bump(ctx_->stats.send_errors);
    ctx_->report(ErrorKind::TransportFailure,
                 r == transport::TxResult::Busy ? "send failed: transport busy"
                                                : "send failed: transport write error");
    return false;
  }
  return true;
}

// ---------- consumer side ----------

std::optional<Packet> Protocol::get_packet(std::chrono::milliseconds timeout) {
  return ctx_->queue.pop(timeout);
}

std::optional<Packet> Protocol::get_packet() {
  return ctx_->queue.pop();
}

Value Protocol::process_packet(const Packet& packet) {
  Value out;
  std::string err;
  if (ctx_->codecs.parse(packet.type, packet.payload, out, err) == CodecResult::HandlerError) {
    ctx_->report(ErrorKind::HandlerException, err);
  }
  return out;                                       // parsed value or raw payload
}

size_t Protocol::flush() {
  return ctx_->queue.flush();
}

StatsSnapshot Protocol::get_stats() const {
  return ctx_->stats.snapshot();
}

// -----------------------------------------------------------------------------
// receive_loop() - Body of the receive thread.
// LOOP:  stop flag -> (lock) available + recv (unlock) -> decode -> queue + callback
// IDLE:  sleeps `idle_sleep` when nothing was read, `error_backoff` after a read error
// EXIT:  only via the stop flag; clears `running` on the way out
// -----------------------------------------------------------------------------
void Protocol::receive_loop(const std::shared_ptr<Context>& ctx) {
  std::vector<uint8_t> chunk(READ_CHUNK);
  std::vector<Packet>  packets;

  while (!ctx->stop_requested.load()) {
    transport::RxResult r = transport::RxResult::None;
    size_t got = 0;
    {
      std::lock_guard<std::mutex> lock(ctx->io_mtx);
      const size_t avail = ctx->transport->available();
      if (avail > 0) {
        if (chunk.size() < avail) chunk.resize(avail);   // read the whole burst at once
        r = ctx->transport->recv(chunk.data(), avail, got);
      }
    }

    if (r == transport::RxResult::Error) {
      ctx->report(ErrorKind::TransportFailure, "read failed");
      std::this_thread::sleep_for(ctx->cfg.error_backoff);
      continue;
    }
    if (got == 0) {
      std::this_thread::sleep_for(ctx->cfg.idle_sleep);
      continue;
    }

    Stats::bump(ctx->stats.bytes_received, got);

    const uint64_t frame_before = ctx->stats.frame_errors.load(std::memory_order_relaxed);
    const uint64_t crc_before   = ctx->stats.crc_errors.load(std::memory_order_relaxed);

    packets.clear();
    ctx->decoder.feed(chunk.data(), got, packets);

    // One report per burst, not per bad candidate.
    const uint64_t bad_frames = ctx->stats.frame_errors.load(std::memory_order_relaxed) - frame_before;
    const uint64_t bad_crcs   = ctx->stats.crc_errors.load(std::memory_order_relaxed) - crc_before;
    if (bad_frames > 0) {
      ctx->report(ErrorKind::FrameError, std::to_string(bad_frames) + " malformed frame(s) dropped");
    }
    if (bad_crcs > 0) {
      ctx->report(ErrorKind::CrcError, std::to_string(bad_crcs) + " frame(s) failed CRC");
    }

    for (const Packet& p : packets) {
      if (!ctx->queue.push(p)) Stats::bump(ctx->stats.queue_overflows);

      RxCallback cb;
      {
        std::lock_guard<std::mutex> lock(ctx->cb_mtx);
        cb = ctx->rx_cb;
      }
      if (!cb) continue;

      ctx->in_rx_callback.store(true);
      try {
        cb(p);
      } catch (const std::exception& e) {
        ctx->report(ErrorKind::HandlerException, std::string("rx callback failed: ") + e.what());
      } catch (...) {
        ctx->report(ErrorKind::HandlerException, "rx callback threw a non-standard exception");
      }
      ctx->in_rx_callback.store(false);
    }
  }

  ctx->running.store(false);
}

} // namespace zetta
