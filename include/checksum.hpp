#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace zwlink {

// XOR of all bytes, seeded with 0xFF. Used as the data frame checksum.
uint8_t xor_sum(const uint8_t* data, size_t len);
inline uint8_t xor_sum(const std::vector<uint8_t>& data) { return xor_sum(data.data(), data.size()); }

// CRC-16/AUG-CCITT: poly 0x1021, init 0x1D0F, no reflection, no final xor.
constexpr uint16_t kCrc16Init = 0x1D0F;
uint16_t crc16(const uint8_t* data, size_t len);
inline uint16_t crc16(const std::vector<uint8_t>& data) { return crc16(data.data(), data.size()); }

class Crc16 {
public:
    void update(const uint8_t* data, size_t len);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
    uint16_t get() const { return crc_; }
    void reset() { crc_ = kCrc16Init; }
private:
    uint16_t crc_{kCrc16Init};
};

} // namespace zwlink
