#include <doctest/doctest.h>
#include "zetta/frame.hpp"

#include <vector>

using namespace zetta;

TEST_CASE("Encode type 1 payload \"AB\" produces the documented frame") {
    std::vector<uint8_t> out;
    REQUIRE(frame::encode(1, std::vector<uint8_t>{'A', 'B'}, out) == frame::EncodeResult::Ok);
    const std::vector<uint8_t> expected = {0xAA, 0x01, 0x02, 0x41, 0x42, 0x96, 0xBC};
    CHECK(out == expected);
}

TEST_CASE("Empty payload is a five byte frame") {
    std::vector<uint8_t> out;
    REQUIRE(frame::encode(0, nullptr, 0, out) == frame::EncodeResult::Ok);
    const std::vector<uint8_t> expected = {0xAA, 0x00, 0x00, 0xD7, 0xBC};
    CHECK(out == expected);
}

TEST_CASE("25 byte payload fits, 26 is rejected and leaves output empty") {
    std::vector<uint8_t> out;
    std::vector<uint8_t> max(25, 0x55);
    REQUIRE(frame::encode(7, max, out) == frame::EncodeResult::Ok);
    CHECK(out.size() == frame::MAX_FRAME_SIZE);
    CHECK(out[2] == 25);
    CHECK(out.back() == frame::STOP);

    std::vector<uint8_t> big(26, 0x55);
    CHECK(frame::encode(7, big, out) == frame::EncodeResult::PayloadTooLarge);
    CHECK(out.empty());
}

TEST_CASE("CRC covers type and length, not START/STOP") {
    std::vector<uint8_t> a, b;
    frame::encode(1, std::vector<uint8_t>{0x10}, a);
    frame::encode(2, std::vector<uint8_t>{0x10}, b);
    CHECK(a[4] != b[4]);                           // type changes the CRC
    CHECK(a[4] == frame::checksum(1, &a[3], 1));
}
