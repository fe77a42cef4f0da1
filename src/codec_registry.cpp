// -----------------------------------------------------------------------------
// codec_registry.cpp - Implementation of the Zetta codec registry
//
// API & failure model:
//   see include/zetta/codec_registry.hpp
// -----------------------------------------------------------------------------
#include "zetta/codec_registry.hpp"

#include <exception>

namespace zetta {

void CodecRegistry::register_codec(uint8_t type, Parser parser, Builder builder) {
  std::lock_guard<std::mutex> lock(mtx_);
  codecs_[type] = Codec{std::move(parser), std::move(builder)};   // last registration wins
}

bool CodecRegistry::remove(uint8_t type) {
  std::lock_guard<std::mutex> lock(mtx_);
  return codecs_.erase(type) > 0;
}

bool CodecRegistry::has_parser(uint8_t type) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = codecs_.find(type);
  return it != codecs_.end() && static_cast<bool>(it->second.parser);
}

bool CodecRegistry::has_builder(uint8_t type) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = codecs_.find(type);
  return it != codecs_.end() && static_cast<bool>(it->second.builder);
}

size_t CodecRegistry::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return codecs_.size();
}

// lookup() - Copy the codec out so the handler runs without holding mtx_.
bool CodecRegistry::lookup(uint8_t type, Codec& out) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = codecs_.find(type);
  if (it == codecs_.end()) return false;
  out = it->second;
  return true;
}

CodecResult CodecRegistry::build(uint8_t type, const Value& value,
                                 Bytes& out, std::string& err) const {
  Codec c;
  if (!lookup(type, c) || !c.builder) {
    err = "no builder registered for packet type " + std::to_string(type);
    return CodecResult::NoBuilder;
  }

  try {
    out = c.builder(value);
  } catch (const std::exception& e) {
    err = std::string("builder for packet type ") + std::to_string(type) + " failed: " + e.what();
    return CodecResult::HandlerError;
  } catch (...) {
    err = "builder for packet type " + std::to_string(type) + " threw a non-standard exception";
    return CodecResult::HandlerError;
  }
  return CodecResult::Ok;
}

CodecResult CodecRegistry::parse(uint8_t type, const Payload& payload,
                                 Value& out, std::string& err) const {
  Codec c;
  if (!lookup(type, c) || !c.parser) {
    out = payload;                       // passthrough: raw bytes are the value
    return CodecResult::NoParser;
  }

  try {
    out = c.parser(payload);
  } catch (const std::exception& e) {
    err = std::string("parser for packet type ") + std::to_string(type) + " failed: " + e.what();
    out = payload;
    return CodecResult::HandlerError;
  } catch (...) {
    err = "parser for packet type " + std::to_string(type) + " threw a non-standard exception";
    out = payload;
    return CodecResult::HandlerError;
  }
  return CodecResult::Ok;
}

} // namespace zetta
