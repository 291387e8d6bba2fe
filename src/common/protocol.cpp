#include "protocol.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include <stdexcept>

namespace zwlink {

namespace {

bool is_frame_start(uint8_t b) {
  switch ((ControlByte)b) {
  case ControlByte::SOF:
  case ControlByte::ACK:
  case ControlByte::NAK:
  case ControlByte::CAN:
    return true;
  default:
    return false;
  }
}

uint8_t data_checksum(const std::vector<uint8_t> &payload) {
  uint8_t len = (uint8_t)(payload.size() + 1);
  return (uint8_t)(xor_sum(payload) ^ len);
}

} // namespace

const char *to_string(FrameKind k) {
  switch (k) {
  case FrameKind::Ack:
    return "ACK";
  case FrameKind::Nak:
    return "NAK";
  case FrameKind::Can:
    return "CAN";
  default:
    return "DATA";
  }
}

Frame::Frame(FrameKind k, std::vector<uint8_t> payload)
    : kind_(k), payload_(std::move(payload)) {
  if (kind_ == FrameKind::Data)
    checksum_ = data_checksum(payload_);
}

Frame Frame::data(std::vector<uint8_t> payload) {
  if (payload.size() > kMaxPayload)
    throw std::length_error("frame payload exceeds 254 bytes");
  return Frame(FrameKind::Data, std::move(payload));
}

Frame Frame::control(ControlByte b) {
  switch (b) {
  case ControlByte::ACK:
    return ack();
  case ControlByte::NAK:
    return nak();
  case ControlByte::CAN:
    return can();
  default:
    throw std::invalid_argument("SOF is not a control frame");
  }
}

ControlByte Frame::control_byte() const {
  switch (kind_) {
  case FrameKind::Ack:
    return ControlByte::ACK;
  case FrameKind::Nak:
    return ControlByte::NAK;
  case FrameKind::Can:
    return ControlByte::CAN;
  default:
    return ControlByte::SOF;
  }
}

DecodeResult decode_frame(const uint8_t *data, size_t len) {
  DecodeResult r;
  if (len == 0) {
    r.status = DecodeStatus::Incomplete;
    r.needed = 1;
    r.error = make_error_code(errc::incomplete);
    return r;
  }
  uint8_t first = data[0];
  if (!is_frame_start(first)) {
    size_t n = 1;
    while (n < len && !is_frame_start(data[n]))
      n++;
    r.status = DecodeStatus::Garbage;
    r.consumed = n;
    return r;
  }
  if ((ControlByte)first != ControlByte::SOF) {
    r.status = DecodeStatus::Ok;
    r.consumed = 1;
    r.frame = Frame::control((ControlByte)first);
    return r;
  }
  if (len < 2) {
    r.status = DecodeStatus::Incomplete;
    r.needed = 2 - len;
    r.error = make_error_code(errc::incomplete);
    return r;
  }
  uint8_t flen = data[1];
  if (flen == 0) {
    r.status = DecodeStatus::Corrupt;
    r.consumed = 1;
    r.error = make_error_code(errc::checksum_mismatch);
    return r;
  }
  size_t total = (size_t)flen + 2;
  if (len < total) {
    r.status = DecodeStatus::Incomplete;
    r.needed = total - len;
    r.error = make_error_code(errc::incomplete);
    return r;
  }
  // LEN and payload, checksum excluded.
  uint8_t expected = xor_sum(data + 1, flen);
  if (expected != data[total - 1]) {
    r.status = DecodeStatus::Corrupt;
    r.consumed = 1;
    r.error = make_error_code(errc::checksum_mismatch);
    return r;
  }
  r.status = DecodeStatus::Ok;
  r.consumed = total;
  r.frame = Frame::data(std::vector<uint8_t>(data + 2, data + total - 1));
  return r;
}

std::vector<uint8_t> encode_frame(const Frame &f) {
  if (f.is_control())
    return encode_control(f.control_byte());
  std::vector<uint8_t> out;
  out.reserve(f.payload().size() + 3);
  out.push_back((uint8_t)ControlByte::SOF);
  out.push_back((uint8_t)(f.payload().size() + 1));
  out.insert(out.end(), f.payload().begin(), f.payload().end());
  out.push_back(f.checksum());
  return out;
}

std::vector<uint8_t> encode_data(const std::vector<uint8_t> &payload) {
  return encode_frame(Frame::data(payload));
}

std::vector<uint8_t> encode_control(ControlByte b) {
  return std::vector<uint8_t>{(uint8_t)b};
}

void FrameReassembler::feed(const uint8_t *data, size_t len) {
  if (off_ > 0) {
    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off_);
    off_ = 0;
  }
  inbuf_.insert(inbuf_.end(), data, data + len);
}

bool FrameReassembler::next(DecodeResult &out) {
  if (off_ >= inbuf_.size())
    return false;
  out = decode_frame(inbuf_.data() + off_, inbuf_.size() - off_);
  if (out.status == DecodeStatus::Incomplete)
    return false;
  off_ += out.consumed;
  return true;
}

} // namespace zwlink
