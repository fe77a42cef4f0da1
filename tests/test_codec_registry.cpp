#include <doctest/doctest.h>
#include "zetta/codec_registry.hpp"
#include "zetta/codecs.hpp"

#include <stdexcept>
#include <string>

using namespace zetta;

namespace {
Payload payload_of(const std::string& s) {
  Payload p;
  p.assign(s.begin(), s.end());
  return p;
}

#pragma pack(push, 1)
struct Reading {
  uint16_t id;
  int32_t  millivolts;
};
#pragma pack(pop)
} // namespace

TEST_CASE("Unregistered type parses to the raw payload") {
  CodecRegistry reg;
  Value v;
  std::string err;
  CHECK(reg.parse(MSG_PUBLISH, payload_of("AB"), v, err) == CodecResult::NoParser);
  const Payload* raw = std::any_cast<Payload>(&v);
  REQUIRE(raw != nullptr);
  CHECK(raw->size() == 2);
  CHECK((*raw)[0] == 'A');
}

TEST_CASE("Unregistered type has no builder and leaves output alone") {
  CodecRegistry reg;
  Bytes out{0x01};
  std::string err;
  CHECK(reg.build(MSG_ACK, std::string("x"), out, err) == CodecResult::NoBuilder);
  CHECK(out == Bytes{0x01});
  CHECK(err.find("no builder") != std::string::npos);
}

TEST_CASE("String codec converts both ways") {
  CodecRegistry reg;
  reg.register_codec(MSG_ACK, make_string_parser(), make_string_builder());
  CHECK(reg.has_parser(MSG_ACK));
  CHECK(reg.has_builder(MSG_ACK));

  Bytes out;
  std::string err;
  REQUIRE(reg.build(MSG_ACK, std::string("hello"), out, err) == CodecResult::Ok);
  CHECK(out == Bytes{'h', 'e', 'l', 'l', 'o'});

  REQUIRE(reg.build(MSG_ACK, static_cast<const char*>("hi"), out, err) == CodecResult::Ok);
  CHECK(out == Bytes{'h', 'i'});

  Value v;
  REQUIRE(reg.parse(MSG_ACK, payload_of("hello"), v, err) == CodecResult::Ok);
  CHECK(std::any_cast<std::string>(v) == "hello");
}

TEST_CASE("Parser-only registration has no builder") {
  CodecRegistry reg;
  reg.register_codec(MSG_SUBSCRIBE, make_string_parser());
  CHECK(reg.has_parser(MSG_SUBSCRIBE));
  CHECK_FALSE(reg.has_builder(MSG_SUBSCRIBE));

  Bytes out;
  std::string err;
  CHECK(reg.build(MSG_SUBSCRIBE, std::string("x"), out, err) == CodecResult::NoBuilder);
}

TEST_CASE("Re-registering a type replaces the earlier codec") {
  CodecRegistry reg;
  reg.register_codec(5, [](const Payload&) -> Value { return 1; });
  reg.register_codec(5, [](const Payload&) -> Value { return 2; });
  CHECK(reg.size() == 1);

  Value v;
  std::string err;
  REQUIRE(reg.parse(5, Payload{}, v, err) == CodecResult::Ok);
  CHECK(std::any_cast<int>(v) == 2);

  CHECK(reg.remove(5));
  CHECK_FALSE(reg.remove(5));
  CHECK(reg.size() == 0);
}

TEST_CASE("Throwing handlers are contained") {
  CodecRegistry reg;
  reg.register_codec(9,
      [](const Payload&) -> Value { throw std::runtime_error("bad parse"); },
      [](const Value&) -> Bytes { throw 42; });

  Value v;
  std::string err;
  CHECK(reg.parse(9, payload_of("Z"), v, err) == CodecResult::HandlerError);
  CHECK(err.find("bad parse") != std::string::npos);
  CHECK(std::any_cast<Payload>(&v) != nullptr);    // raw payload handed back

  Bytes out;
  err.clear();
  CHECK(reg.build(9, 1, out, err) == CodecResult::HandlerError);
  CHECK(err.find("non-standard") != std::string::npos);
}

TEST_CASE("String builder rejects values of other types") {
  CodecRegistry reg;
  reg.register_codec(MSG_ACK, make_string_parser(), make_string_builder());
  Bytes out;
  std::string err;
  CHECK(reg.build(MSG_ACK, 3.5, out, err) == CodecResult::HandlerError);
}

TEST_CASE("Struct codec copies a packed struct through a payload") {
  CodecRegistry reg;
  reg.register_codec(20, make_struct_parser<Reading>(), make_struct_builder<Reading>());

  Reading r{7, -1250};
  Bytes out;
  std::string err;
  REQUIRE(reg.build(20, r, out, err) == CodecResult::Ok);
  CHECK(out.size() == sizeof(Reading));

  Payload p;
  p.assign(out.begin(), out.end());
  Value v;
  REQUIRE(reg.parse(20, p, v, err) == CodecResult::Ok);
  const Reading back = std::any_cast<Reading>(v);
  CHECK(back.id == 7);
  CHECK(back.millivolts == -1250);

  p.pop_back();
  CHECK(reg.parse(20, p, v, err) == CodecResult::HandlerError);   // short payload
}
