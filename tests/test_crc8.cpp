#include <doctest/doctest.h>
#include "zetta/crc8.hpp"

#include <cstring>

using namespace zetta;

TEST_CASE("CRC-8 check values for poly 0x07, init 0xFF") {
    CHECK(crc::checksum(nullptr, 0) == 0xFF);

    const uint8_t ab[] = {0x01, 0x02, 0x41, 0x42};
    CHECK(crc::checksum(ab, sizeof(ab)) == 0x96);

    const char* digits = "123456789";
    CHECK(crc::checksum(reinterpret_cast<const uint8_t*>(digits), std::strlen(digits)) == 0xFB);

    const uint8_t zeros[] = {0x00, 0x00};
    CHECK(crc::checksum(zeros, sizeof(zeros)) == 0xD7);
}

TEST_CASE("Byte-wise update matches one-shot checksum") {
    const uint8_t data[] = {0x02, 0x03, 0x10, 0x20, 0x30};
    uint8_t c = crc::INIT;
    for (uint8_t b : data) c = crc::update(c, b);
    CHECK(c == crc::checksum(data, sizeof(data)));
    CHECK(c == 0x5B);
}
