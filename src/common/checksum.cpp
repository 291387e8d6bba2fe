#include "checksum.hpp"
#include <array>

namespace zwlink {

namespace {

const std::array<uint16_t, 256> &crc16_table() {
  static const std::array<uint16_t, 256> table = [] {
    std::array<uint16_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint16_t c = (uint16_t)(i << 8);
      for (int j = 0; j < 8; j++)
        c = (c & 0x8000) ? (uint16_t)((c << 1) ^ 0x1021) : (uint16_t)(c << 1);
      t[i] = c;
    }
    return t;
  }();
  return table;
}

} // namespace

uint8_t xor_sum(const uint8_t *data, size_t len) {
  uint8_t r = 0xFF;
  for (size_t i = 0; i < len; i++)
    r ^= data[i];
  return r;
}

void Crc16::update(const uint8_t *data, size_t len) {
  const auto &table = crc16_table();
  uint16_t c = crc_;
  for (size_t i = 0; i < len; i++)
    c = (uint16_t)((c << 8) ^ table[((c >> 8) ^ data[i]) & 0xFF]);
  crc_ = c;
}

uint16_t crc16(const uint8_t *data, size_t len) {
  Crc16 c;
  c.update(data, len);
  return c.get();
}

} // namespace zwlink
