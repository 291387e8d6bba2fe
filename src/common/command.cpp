#include "command.hpp"
#include "errors.hpp"
#include <cstdio>

namespace zwlink {

const char *to_string(CommandType t) {
  return t == CommandType::Request ? "Request" : "Response";
}

std::string to_string(FunctionType f) {
  switch (f) {
  case FunctionType::GetSerialApiInitData:
    return "GetSerialApiInitData";
  case FunctionType::ApplicationCommand:
    return "ApplicationCommand";
  case FunctionType::GetControllerCapabilities:
    return "GetControllerCapabilities";
  case FunctionType::GetSerialApiCapabilities:
    return "GetSerialApiCapabilities";
  case FunctionType::SoftReset:
    return "SoftReset";
  case FunctionType::SerialApiStarted:
    return "SerialApiStarted";
  case FunctionType::SerialApiSetup:
    return "SerialApiSetup";
  case FunctionType::SendData:
    return "SendData";
  case FunctionType::GetControllerVersion:
    return "GetControllerVersion";
  case FunctionType::GetControllerId:
    return "GetControllerId";
  case FunctionType::GetNodeProtocolInfo:
    return "GetNodeProtocolInfo";
  case FunctionType::ApplicationUpdateRequest:
    return "ApplicationUpdateRequest";
  case FunctionType::GetSucNodeId:
    return "GetSucNodeId";
  case FunctionType::RequestNodeInfo:
    return "RequestNodeInfo";
  }
  char buf[16];
  std::snprintf(buf, sizeof(buf), "0x%02x", (unsigned)f);
  return buf;
}

std::error_code RawCommand::parse(const std::vector<uint8_t> &frame_payload,
                                  RawCommand &out) {
  if (frame_payload.size() < 2)
    return make_error_code(errc::parse_error);
  uint8_t t = frame_payload[0];
  if (t != (uint8_t)CommandType::Request && t != (uint8_t)CommandType::Response)
    return make_error_code(errc::parse_error);
  out.type = (CommandType)t;
  out.function = (FunctionType)frame_payload[1];
  out.payload.assign(frame_payload.begin() + 2, frame_payload.end());
  return {};
}

std::vector<uint8_t> RawCommand::to_frame_payload() const {
  std::vector<uint8_t> out;
  out.reserve(payload.size() + 2);
  out.push_back((uint8_t)type);
  out.push_back((uint8_t)function);
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

bool ByteReader::u8(uint8_t &out) {
  if (remaining() < 1)
    return false;
  out = data_[off_++];
  return true;
}

bool ByteReader::u16(uint16_t &out) {
  if (remaining() < 2)
    return false;
  out = (uint16_t)((data_[off_] << 8) | data_[off_ + 1]);
  off_ += 2;
  return true;
}

bool ByteReader::u32(uint32_t &out) {
  if (remaining() < 4)
    return false;
  out = ((uint32_t)data_[off_] << 24) | ((uint32_t)data_[off_ + 1] << 16) |
        ((uint32_t)data_[off_ + 2] << 8) | (uint32_t)data_[off_ + 3];
  off_ += 4;
  return true;
}

bool ByteReader::node_id(NodeId &out, const EncodingContext &ctx) {
  if (ctx.node_id_type == NodeIdType::NodeId16Bit) {
    uint16_t v;
    if (!u16(v))
      return false;
    out = v;
    return true;
  }
  uint8_t v;
  if (!u8(v))
    return false;
  out = v;
  return true;
}

bool ByteReader::bytes(size_t n, std::vector<uint8_t> &out) {
  if (remaining() < n)
    return false;
  out.assign(data_ + off_, data_ + off_ + n);
  off_ += n;
  return true;
}

std::vector<uint8_t> ByteReader::rest() {
  std::vector<uint8_t> out(data_ + off_, data_ + len_);
  off_ = len_;
  return out;
}

void put_u16(std::vector<uint8_t> &out, uint16_t v) {
  out.push_back((uint8_t)(v >> 8));
  out.push_back((uint8_t)(v & 0xFF));
}

void put_u32(std::vector<uint8_t> &out, uint32_t v) {
  out.push_back((uint8_t)(v >> 24));
  out.push_back((uint8_t)(v >> 16));
  out.push_back((uint8_t)(v >> 8));
  out.push_back((uint8_t)(v & 0xFF));
}

void put_node_id(std::vector<uint8_t> &out, NodeId id,
                 const EncodingContext &ctx) {
  if (ctx.node_id_type == NodeIdType::NodeId16Bit)
    put_u16(out, id);
  else
    out.push_back((uint8_t)id);
}

bool Command::test_response(const Command &response) const {
  return response.command_type() == CommandType::Response &&
         response.function_type() == function_type();
}

bool Command::test_callback(const Command &callback) const {
  return callback.command_type() == CommandType::Request &&
         callback.function_type() == function_type() && callback_id() != 0 &&
         callback.callback_id() == callback_id();
}

bool Command::test_raw_callback(const RawCommand &raw,
                                const EncodingContext &) const {
  if (raw.type != CommandType::Request || raw.function != function_type())
    return false;
  return raw.payload.empty() || raw.payload[0] == callback_id();
}

std::string Command::describe() const {
  std::string s = to_string(function_type());
  s += " (";
  s += to_string(command_type());
  s += ")";
  if (callback_id() != 0)
    s += " callback id " + std::to_string(callback_id());
  return s;
}

RawCommand Command::to_raw(const EncodingContext &ctx) const {
  RawCommand raw;
  raw.type = command_type();
  raw.function = function_type();
  encode_payload(raw.payload, ctx);
  return raw;
}

} // namespace zwlink
