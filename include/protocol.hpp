#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace zwlink {

enum class ControlByte : uint8_t {
    SOF = 0x01,
    ACK = 0x06,
    NAK = 0x15,
    CAN = 0x18
};

constexpr size_t kMaxPayload = 254;

enum class FrameKind : uint8_t { Ack, Nak, Can, Data };

const char* to_string(FrameKind k);

class Frame {
public:
    static Frame ack() { return Frame(FrameKind::Ack, {}); }
    static Frame nak() { return Frame(FrameKind::Nak, {}); }
    static Frame can() { return Frame(FrameKind::Can, {}); }
    static Frame data(std::vector<uint8_t> payload);
    static Frame control(ControlByte b);

    FrameKind kind() const { return kind_; }
    bool is_control() const { return kind_ != FrameKind::Data; }
    const std::vector<uint8_t>& payload() const { return payload_; }
    // Only meaningful for data frames.
    uint8_t checksum() const { return checksum_; }
    ControlByte control_byte() const;

    bool operator==(const Frame& o) const {
        return kind_ == o.kind_ && payload_ == o.payload_ && checksum_ == o.checksum_;
    }
    bool operator!=(const Frame& o) const { return !(*this == o); }

private:
    Frame(FrameKind k, std::vector<uint8_t> payload);
    FrameKind kind_;
    std::vector<uint8_t> payload_;
    uint8_t checksum_{0};
};

enum class DecodeStatus : uint8_t { Ok, Incomplete, Corrupt, Garbage };

struct DecodeResult {
    DecodeStatus status{DecodeStatus::Incomplete};
    size_t consumed{0};
    // Additional bytes required when Incomplete.
    size_t needed{0};
    // errc::incomplete or errc::checksum_mismatch; empty for Ok and Garbage.
    std::error_code error;
    std::optional<Frame> frame;
};

DecodeResult decode_frame(const uint8_t* data, size_t len);
inline DecodeResult decode_frame(const std::vector<uint8_t>& data) { return decode_frame(data.data(), data.size()); }

std::vector<uint8_t> encode_frame(const Frame& f);
std::vector<uint8_t> encode_data(const std::vector<uint8_t>& payload);
std::vector<uint8_t> encode_control(ControlByte b);

// Accumulates inbound chunks and yields decode results in byte order.
class FrameReassembler {
public:
    void feed(const uint8_t* data, size_t len);
    // Returns false once only an incomplete tail (or nothing) is left.
    bool next(DecodeResult& out);
    size_t buffered() const { return inbuf_.size() - off_; }
    void clear() { inbuf_.clear(); off_ = 0; }
private:
    std::vector<uint8_t> inbuf_;
    size_t off_{0};
};

} // namespace zwlink
