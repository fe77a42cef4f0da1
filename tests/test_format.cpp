#include <doctest/doctest.h>
#include "zetta/format.hpp"
#include "fake_transport.hpp"

#include <string>
#include <vector>

using namespace zetta;

TEST_CASE("to_hex is uppercase with no separators") {
  const uint8_t data[] = {0x00, 0x0a, 0xAB, 0xff};
  CHECK(to_hex(data, sizeof data) == "000AABFF");
  CHECK(to_hex(nullptr, 0).empty());
}

TEST_CASE("parse_hex accepts a prefix and common separators") {
  std::vector<uint8_t> out;
  REQUIRE(parse_hex("4142", out));
  CHECK(out == std::vector<uint8_t>{0x41, 0x42});
  REQUIRE(parse_hex("0xdeadBEEF", out));
  CHECK(out == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
  REQUIRE(parse_hex("01 02:03-04", out));
  CHECK(out == std::vector<uint8_t>{1, 2, 3, 4});
  REQUIRE(parse_hex("", out));
  CHECK(out.empty());
}

TEST_CASE("parse_hex rejects malformed text") {
  std::vector<uint8_t> out;
  CHECK_FALSE(parse_hex("414", out));
  CHECK_FALSE(parse_hex("4 1", out));
  CHECK_FALSE(parse_hex("zz", out));
}

TEST_CASE("Packets print as one key=value line") {
  Packet p;
  p.type = MSG_PUBLISH;
  p.payload.push_back(0x41);
  p.payload.push_back(0x42);
  CHECK(format_packet(p) == "type=1 name=MSG_PUBLISH len=2 payload=4142");

  p.type = 200;
  p.payload.clear();
  CHECK(format_packet(p) == "type=200 name=UNKNOWN len=0 payload=");
}

TEST_CASE("Stats print every counter in order") {
  StatsSnapshot s;
  s.packets_sent = 3;
  s.crc_errors = 1;
  s.send_errors = 2;
  CHECK(format_stats(s) ==
        "packets_sent=3 packets_received=0 crc_errors=1 frame_errors=0 "
        "bytes_received=0 queue_overflows=0 resync_bytes=0 send_errors=2");
}

TEST_CASE("JSON forms carry the same fields") {
  Packet p;
  p.type = MSG_ACK;
  p.payload.push_back(0x01);
  const auto wire = test::frame_for(MSG_ACK, {0x01});
  p.raw_frame.assign(wire.begin(), wire.end());

  const nlohmann::json j = packet_to_json(p);
  CHECK(j["type"] == 0);
  CHECK(j["name"] == "MSG_ACK");
  CHECK(j["len"] == 1);
  CHECK(j["payload"] == "01");
  CHECK(j["raw"].get<std::string>() == to_hex(wire.data(), wire.size()));
  CHECK(j.contains("timestamp_ms"));

  StatsSnapshot s;
  s.bytes_received = 42;
  const nlohmann::json js = stats_to_json(s);
  CHECK(js["bytes_received"] == 42);
  CHECK(js.size() == 8);
}
