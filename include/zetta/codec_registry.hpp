#pragma once
/**
 * @page zetta-codecs Zetta Codec Registry
 * @file codec_registry.hpp
 * @brief Per-packet-type parsers and builders between payload bytes and application values.
 *
 * @details
 * PURPOSE
 * -------
 * The framing layer only moves bytes. The registry is where an application
 * says what a given packet type *means*:
 *
 *   - Parser  : Payload -> Value   (used when the consumer processes a packet)
 *   - Builder : Value   -> Bytes   (used by Protocol::send)
 *
 * Either side is optional. A type with only a parser can be received but not
 * sent through send(); send_raw() still works for it. A type with no parser
 * passes its payload through untouched.
 *
 * VALUES
 * ------
 * Values are `std::any`. A parser may return any copyable type; the consumer
 * any_casts to what it registered. A passthrough value holds a `Payload`.
 *
 * FAILURE MODEL
 * -------------
 * User code may throw. build() and parse() catch everything at the call,
 * return CodecResult::HandlerError and fill in a readable message. They never
 * let an exception reach the receive loop.
 *
 * THREADING
 * -------------
 * Lookups and registrations take an internal mutex, and the handler is
 * copied out before it runs, so a handler can be replaced while packets are
 * in flight. Handlers themselves run unlocked on the caller's thread.
 *
 * EXAMPLE
 * -------
 * @code
 *   zetta::CodecRegistry reg;
 *   reg.register_codec(zetta::MSG_ACK, zetta::make_string_parser(),
 *                                      zetta::make_string_builder());
 *   zetta::Bytes bytes; std::string err;
 *   reg.build(zetta::MSG_ACK, std::string("hi"), bytes, err);   // bytes == "hi"
 * @endcode
 */

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "zetta/packet.hpp"

namespace zetta {

using Bytes   = std::vector<uint8_t>;
using Value   = std::any;
using Parser  = std::function<Value(const Payload&)>;
using Builder = std::function<Bytes(const Value&)>;

enum class CodecResult : uint8_t {
  Ok = 0,
  NoParser,       ///< No parser for the type; output is the raw payload
  NoBuilder,      ///< No builder for the type; output untouched
  HandlerError,   ///< Handler threw; see the error string
};

/// Parser/builder pair for one packet type. Either member may be empty.
struct Codec {
  Parser  parser;
  Builder builder;
};

class CodecRegistry {
public:
  /**
   * @brief Install the codec for @p type, replacing any previous one.
   * @param parser  May be empty; received payloads then pass through raw.
   * @param builder May be empty; send() for this type then fails with NoBuilder.
   */
  void register_codec(uint8_t type, Parser parser, Builder builder = {});

  /// @brief Remove the codec for @p type. @return true if one was present.
  bool remove(uint8_t type);

  bool   has_parser(uint8_t type) const;
  bool   has_builder(uint8_t type) const;
  size_t size() const;

  /**
   * @brief Turn an application value into payload bytes.
   *
   * @param out Receives the builder's bytes on Ok. Not size-checked here;
   *            the send path rejects anything over 25 bytes.
   * @param err Receives a readable reason on NoBuilder / HandlerError.
   */
  CodecResult build(uint8_t type, const Value& value, Bytes& out, std::string& err) const;

  /**
   * @brief Turn payload bytes into an application value.
   *
   * On NoParser and HandlerError @p out is set to the raw payload, so the
   * caller always gets something usable back.
   */
  CodecResult parse(uint8_t type, const Payload& payload, Value& out, std::string& err) const;

private:
  bool lookup(uint8_t type, Codec& out) const;

  mutable std::mutex       mtx_;
  std::map<uint8_t, Codec> codecs_;
};

} // namespace zetta
