#include <doctest/doctest.h>
#include "checksum.hpp"
#include <cstring>
#include <string>

using namespace zwlink;

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST_CASE("xor_sum is seeded with 0xFF") {
    CHECK(xor_sum(std::vector<uint8_t>{}) == 0xFF);
    CHECK(xor_sum(std::vector<uint8_t>{0x03, 0x00, 0x02}) == 0xFE);
    CHECK(xor_sum(std::vector<uint8_t>{0xFF}) == 0x00);
}

TEST_CASE("crc16 matches the AUG-CCITT reference vectors") {
    CHECK(crc16(std::vector<uint8_t>{}) == 0x1D0F);
    CHECK(crc16(bytes_of("A")) == 0x9479);
    CHECK(crc16(bytes_of("123456789")) == 0xE5CC);
}

TEST_CASE("incremental crc16 equals one-shot over any split") {
    auto data = bytes_of("123456789");
    for (size_t split = 0; split <= data.size(); split++) {
        Crc16 c;
        c.update(data.data(), split);
        c.update(data.data() + split, data.size() - split);
        CHECK(c.get() == 0xE5CC);
    }

    Crc16 bytewise;
    for (uint8_t b : data)
        bytewise.update(&b, 1);
    CHECK(bytewise.get() == crc16(data));

    bytewise.reset();
    CHECK(bytewise.get() == 0x1D0F);
}
