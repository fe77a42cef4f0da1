#pragma once
/**
 * @file codecs.hpp
 * @brief Ready-made parsers and builders for the two payload shapes the firmware uses.
 *
 *  - Text:   payload bytes are a string (no terminator on the wire).
 *  - Struct: payload bytes are a packed, trivially copyable struct, byte for
 *            byte as the MCU lays it out (both ends are little-endian).
 *
 * Struct codecs check their sizes at compile time where they can and at run
 * time where they must. A size mismatch on receive throws std::length_error,
 * which the registry reports as a handler error and answers with the raw
 * payload.
 *
 * @code
 *   #pragma pack(push, 1)
 *   struct Reading { char tag[4]; int32_t count; float value; };
 *   #pragma pack(pop)
 *
 *   link.register_handler(zetta::MSG_PUBLISH,
 *                         zetta::make_struct_parser<Reading>(),
 *                         zetta::make_struct_builder<Reading>());
 * @endcode
 */

#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "zetta/codec_registry.hpp"
#include "zetta/frame.hpp"

namespace zetta {

/// @brief Parser yielding std::string from the payload bytes.
inline Parser make_string_parser() {
  return [](const Payload& p) -> Value {
    return std::string(p.begin(), p.end());
  };
}

/// @brief Builder accepting std::string or const char*.
inline Builder make_string_builder() {
  return [](const Value& v) -> Bytes {
    if (const auto* s = std::any_cast<std::string>(&v)) return Bytes(s->begin(), s->end());
    if (const auto* c = std::any_cast<const char*>(&v)) {
      if (*c == nullptr) throw std::invalid_argument("string builder got a null pointer");
      return Bytes(*c, *c + std::strlen(*c));
    }
    throw std::invalid_argument("string builder expects std::string or const char*");
  };
}

/// @brief Parser that copies an exact-size payload into a T.
template <typename T>
Parser make_struct_parser() {
  static_assert(std::is_trivially_copyable<T>::value, "struct codec needs a trivially copyable type");
  static_assert(sizeof(T) <= frame::MAX_PAYLOAD_SIZE, "struct does not fit in one payload");
  return [](const Payload& p) -> Value {
    if (p.size() != sizeof(T)) {
      throw std::length_error("payload is " + std::to_string(p.size()) +
                              " bytes, struct needs " + std::to_string(sizeof(T)));
    }
    T out;
    std::memcpy(&out, p.data(), sizeof(T));
    return out;
  };
}

/// @brief Builder that emits the object representation of a T.
template <typename T>
Builder make_struct_builder() {
  static_assert(std::is_trivially_copyable<T>::value, "struct codec needs a trivially copyable type");
  static_assert(sizeof(T) <= frame::MAX_PAYLOAD_SIZE, "struct does not fit in one payload");
  return [](const Value& v) -> Bytes {
    const T* in = std::any_cast<T>(&v);
    if (!in) throw std::invalid_argument("struct builder got a value of the wrong type");
    Bytes out(sizeof(T));
    std::memcpy(out.data(), in, sizeof(T));
    return out;
  };
}

} // namespace zetta
