// -----------------------------------------------------------------------------
// stream_decoder.cpp - Implementation of the Zetta stream decoder
//
// API & scanning rules:
//   see include/zetta/stream_decoder.hpp
//
// Usage tests:
//   see tests/test_stream_decoder.cpp
// -----------------------------------------------------------------------------
#include "zetta/stream_decoder.hpp"

#include "zetta/frame.hpp"

namespace zetta {

StreamDecoder::StreamDecoder(Stats& stats)
: stats_(stats) {
  buf_.reserve(frame::MAX_FRAME_SIZE * 4);   // typical read burst plus a tail
}

size_t StreamDecoder::feed(const uint8_t* data, size_t n, std::vector<Packet>& out) {
  if (n > 0) buf_.insert(buf_.end(), data, data + n);

  size_t emitted = 0;
  for (;;) {
    const Step s = step(out);
    if (s == Step::NeedMore) break;       // nothing more to do until next feed
    if (s == Step::Emitted) ++emitted;
  }

  compact();                              // leftover is shorter than one frame
  return emitted;
}

void StreamDecoder::reset() {
  buf_.clear();
  head_ = 0;
}

// -----------------------------------------------------------------------------
// step() - Run one scanning step at head_.
// OUT:   Emitted  one packet appended to `out`
//        Dropped  bytes consumed, nothing emitted (resync or bad candidate)
//        NeedMore cannot progress without more input
// -----------------------------------------------------------------------------
StreamDecoder::Step StreamDecoder::step(std::vector<Packet>& out) {
  const size_t avail = buf_.size() - head_;
  if (avail == 0) return Step::NeedMore;

  // RESYNC: eat one byte at a time until a START lines up
  if (buf_[head_] != frame::START) {
    ++head_;
    Stats::bump(stats_.resync_bytes);
    return Step::Dropped;
  }

  if (avail < frame::HEADER_SIZE) return Step::NeedMore;   // LENGTH not here yet

  const size_t len = buf_[head_ + 2];
  if (len > frame::MAX_PAYLOAD_SIZE) {
    // No sender produces this; the START was noise or the LENGTH got hit.
    // Drop only the START so a real frame hiding behind it is still found.
    ++head_;
    Stats::bump(stats_.frame_errors);
    return Step::Dropped;
  }

  const size_t expected = len + frame::OVERHEAD;
  if (avail < expected) return Step::NeedMore;             // partial frame

  // CANDIDATE: consume exactly one frame's worth, valid or not
  const uint8_t* f = buf_.data() + head_;
  head_ += expected;

  if (f[expected - 1] != frame::STOP) {
    Stats::bump(stats_.frame_errors);
    return Step::Dropped;
  }

  const uint8_t type = f[1];
  const uint8_t* payload = f + frame::HEADER_SIZE;
  if (frame::checksum(type, payload, len) != f[expected - 2]) {
    Stats::bump(stats_.crc_errors);
    return Step::Dropped;
  }

  Packet p;
  p.type = type;
  p.payload.assign(payload, payload + len);
  p.timestamp = std::chrono::system_clock::now();
  p.raw_frame.assign(f, f + expected);
  out.push_back(p);
  Stats::bump(stats_.packets_received);
  return Step::Emitted;
}

// compact() - Slide the unconsumed tail to the front of the buffer.
void StreamDecoder::compact() {
  if (head_ == 0) return;
  buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(head_));
  head_ = 0;
}

} // namespace zetta
