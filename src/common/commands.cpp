#include "commands.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstdio>

namespace zwlink {

namespace {

std::error_code truncated() { return make_error_code(errc::parse_error); }

template <typename T>
std::error_code decode_into(ByteReader &r, const EncodingContext &ctx,
                            CommandPtr &out) {
  auto cmd = std::make_shared<T>();
  auto ec = cmd->decode(r, ctx);
  if (ec)
    return ec;
  out = std::move(cmd);
  return {};
}

} // namespace

// ---- GetControllerId ----

void GetControllerIdResponse::encode_payload(std::vector<uint8_t> &out,
                                             const EncodingContext &ctx) const {
  put_u32(out, home_id);
  put_node_id(out, own_node_id, ctx);
}

std::string GetControllerIdResponse::describe() const {
  char buf[96];
  std::snprintf(buf, sizeof(buf),
                "GetControllerId (Response) home id 0x%08x, own node id %u",
                (unsigned)home_id, (unsigned)own_node_id);
  return buf;
}

std::error_code GetControllerIdResponse::decode(ByteReader &r,
                                                const EncodingContext &ctx) {
  if (!r.u32(home_id) || !r.node_id(own_node_id, ctx))
    return truncated();
  return {};
}

// ---- GetControllerCapabilities ----

void GetControllerCapabilitiesResponse::encode_payload(
    std::vector<uint8_t> &out, const EncodingContext &) const {
  uint8_t b = 0;
  if (role == ControllerRole::Secondary)
    b |= 0x01;
  if (!started_this_network)
    b |= 0x02;
  if (sis_present)
    b |= 0x04;
  if (is_suc)
    b |= 0x10;
  out.push_back(b);
}

std::string GetControllerCapabilitiesResponse::describe() const {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "GetControllerCapabilities (Response) role %s, started this "
                "network %d, SIS present %d, is SUC %d",
                to_string(role), (int)started_this_network, (int)sis_present,
                (int)is_suc);
  return buf;
}

std::error_code
GetControllerCapabilitiesResponse::decode(ByteReader &r,
                                          const EncodingContext &) {
  uint8_t b;
  if (!r.u8(b))
    return truncated();
  role = (b & 0x01) ? ControllerRole::Secondary : ControllerRole::Primary;
  started_this_network = (b & 0x02) == 0;
  sis_present = (b & 0x04) != 0;
  is_suc = (b & 0x10) != 0;
  return {};
}

// ---- GetSerialApiCapabilities ----

void GetSerialApiCapabilitiesResponse::encode_payload(
    std::vector<uint8_t> &out, const EncodingContext &) const {
  out.push_back(firmware_major);
  out.push_back(firmware_minor);
  put_u16(out, manufacturer_id);
  put_u16(out, product_type);
  put_u16(out, product_id);
  std::vector<uint8_t> mask(kFunctionBitmaskLen, 0);
  for (FunctionType f : supported_function_types) {
    unsigned id = (unsigned)f;
    if (id == 0)
      continue;
    mask[(id - 1) / 8] |= (uint8_t)(1u << ((id - 1) % 8));
  }
  out.insert(out.end(), mask.begin(), mask.end());
}

std::string GetSerialApiCapabilitiesResponse::describe() const {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "GetSerialApiCapabilities (Response) firmware %u.%u, "
                "manufacturer 0x%04x, product type 0x%04x, product id 0x%04x, "
                "%zu functions",
                (unsigned)firmware_major, (unsigned)firmware_minor,
                (unsigned)manufacturer_id, (unsigned)product_type,
                (unsigned)product_id, supported_function_types.size());
  return buf;
}

std::error_code
GetSerialApiCapabilitiesResponse::decode(ByteReader &r,
                                         const EncodingContext &) {
  std::vector<uint8_t> mask;
  if (!r.u8(firmware_major) || !r.u8(firmware_minor) ||
      !r.u16(manufacturer_id) || !r.u16(product_type) ||
      !r.u16(product_id) || !r.bytes(kFunctionBitmaskLen, mask))
    return truncated();
  supported_function_types.clear();
  for (size_t j = 0; j < mask.size(); j++)
    for (unsigned i = 0; i < 8; i++)
      if ((mask[j] & (1u << i)) && j * 8 + i + 1 <= 0xFF)
        supported_function_types.push_back((FunctionType)(j * 8 + i + 1));
  return {};
}

// ---- GetControllerVersion ----

void GetControllerVersionResponse::encode_payload(
    std::vector<uint8_t> &out, const EncodingContext &) const {
  out.insert(out.end(), library_version.begin(), library_version.end());
  out.push_back(0);
  out.push_back((uint8_t)library_type);
}

std::string GetControllerVersionResponse::describe() const {
  return "GetControllerVersion (Response) " + library_version + ", " +
         to_string(library_type);
}

std::error_code
GetControllerVersionResponse::decode(ByteReader &r, const EncodingContext &) {
  std::string version;
  uint8_t c;
  for (;;) {
    if (!r.u8(c))
      return truncated();
    if (c == 0)
      break;
    version.push_back((char)c);
  }
  uint8_t type;
  if (version.empty() || !r.u8(type))
    return truncated();
  library_version = version;
  library_type = type <= (uint8_t)LibraryType::AvDevice ? (LibraryType)type
                                                         : LibraryType::Unknown;
  return {};
}

// ---- GetSucNodeId ----

void GetSucNodeIdResponse::encode_payload(std::vector<uint8_t> &out,
                                          const EncodingContext &ctx) const {
  put_node_id(out, suc_node_id ? *suc_node_id : 0, ctx);
}

std::string GetSucNodeIdResponse::describe() const {
  if (!suc_node_id)
    return "GetSucNodeId (Response) no SUC";
  return "GetSucNodeId (Response) SUC node " + std::to_string(*suc_node_id);
}

std::error_code GetSucNodeIdResponse::decode(ByteReader &r,
                                             const EncodingContext &ctx) {
  NodeId id;
  if (!r.node_id(id, ctx))
    return truncated();
  suc_node_id.reset();
  if (id != 0)
    suc_node_id = id;
  return {};
}

// ---- SerialApiSetup ----

std::shared_ptr<SerialApiSetupRequest>
SerialApiSetupRequest::set_node_id_type(NodeIdType t) {
  return std::make_shared<SerialApiSetupRequest>(
      SETUP_SET_NODE_ID_TYPE, std::vector<uint8_t>{(uint8_t)t});
}

bool SerialApiSetupRequest::test_response(const Command &response) const {
  auto *r = dynamic_cast<const SerialApiSetupResponse *>(&response);
  return r && (r->command == command || r->command == SETUP_UNSUPPORTED);
}

void SerialApiSetupRequest::encode_payload(std::vector<uint8_t> &out,
                                           const EncodingContext &) const {
  out.push_back(command);
  out.insert(out.end(), payload.begin(), payload.end());
}

std::string SerialApiSetupRequest::describe() const {
  char buf[64];
  std::snprintf(buf, sizeof(buf),
                "SerialApiSetup (Request) command 0x%02x, payload 0x",
                (unsigned)command);
  return buf + to_hex(payload);
}

void SerialApiSetupResponse::encode_payload(std::vector<uint8_t> &out,
                                            const EncodingContext &) const {
  out.push_back(command);
  out.insert(out.end(), payload.begin(), payload.end());
}

std::string SerialApiSetupResponse::describe() const {
  char buf[64];
  std::snprintf(buf, sizeof(buf),
                "SerialApiSetup (Response) command 0x%02x, payload 0x",
                (unsigned)command);
  return buf + to_hex(payload);
}

std::error_code SerialApiSetupResponse::decode(ByteReader &r,
                                               const EncodingContext &) {
  if (!r.u8(command))
    return truncated();
  payload = r.rest();
  return {};
}

// ---- GetSerialApiInitData ----

void GetSerialApiInitDataResponse::encode_payload(
    std::vector<uint8_t> &out, const EncodingContext &) const {
  out.push_back(api_version);
  uint8_t caps = 0;
  if (node_type == NodeType::EndNode)
    caps |= 0x01;
  if (supports_timers)
    caps |= 0x02;
  if (is_secondary)
    caps |= 0x04;
  if (is_sis)
    caps |= 0x08;
  out.push_back(caps);
  std::vector<uint8_t> mask(kNodeBitmaskLen, 0);
  for (NodeId id : node_ids) {
    if (id == 0 || id > kNodeBitmaskLen * 8)
      continue;
    mask[(id - 1) / 8] |= (uint8_t)(1u << ((id - 1) % 8));
  }
  out.push_back((uint8_t)mask.size());
  out.insert(out.end(), mask.begin(), mask.end());
  if (chip) {
    out.push_back(chip->type);
    out.push_back(chip->version);
  }
}

std::string GetSerialApiInitDataResponse::describe() const {
  std::string s = "GetSerialApiInitData (Response) api version " +
                  std::to_string(api_version) + ", " + to_string(node_type) +
                  ", nodes [";
  for (size_t i = 0; i < node_ids.size(); i++) {
    if (i)
      s += ", ";
    s += std::to_string(node_ids[i]);
  }
  s += "]";
  return s;
}

std::error_code GetSerialApiInitDataResponse::decode(ByteReader &r,
                                                     const EncodingContext &) {
  uint8_t caps, mask_len;
  if (!r.u8(api_version) || !r.u8(caps) || !r.u8(mask_len))
    return truncated();
  node_type = (caps & 0x01) ? NodeType::EndNode : NodeType::Controller;
  supports_timers = (caps & 0x02) != 0;
  is_secondary = (caps & 0x04) != 0;
  is_sis = (caps & 0x08) != 0;
  std::vector<uint8_t> mask;
  if (!r.bytes(mask_len, mask))
    return truncated();
  node_ids.clear();
  for (size_t j = 0; j < mask.size(); j++)
    for (unsigned i = 0; i < 8; i++)
      if (mask[j] & (1u << i))
        node_ids.push_back((NodeId)(j * 8 + i + 1));
  ChipType c;
  if (r.remaining() >= 2 && r.u8(c.type) && r.u8(c.version))
    chip = c;
  return {};
}

// ---- GetNodeProtocolInfo ----

void GetNodeProtocolInfoRequest::encode_payload(
    std::vector<uint8_t> &out, const EncodingContext &ctx) const {
  put_node_id(out, node_id, ctx);
}

std::string GetNodeProtocolInfoRequest::describe() const {
  return "GetNodeProtocolInfo (Request) node " + std::to_string(node_id);
}

std::error_code GetNodeProtocolInfoRequest::decode(ByteReader &r,
                                                   const EncodingContext &ctx) {
  if (!r.node_id(node_id, ctx))
    return truncated();
  return {};
}

void GetNodeProtocolInfoResponse::encode_payload(
    std::vector<uint8_t> &out, const EncodingContext &) const {
  uint8_t b0 = (uint8_t)((uint8_t)info.protocol_version & 0x07);
  if (info.listening)
    b0 |= 0x80;
  if (info.routing)
    b0 |= 0x40;
  if (info.data_rates & DR_40K)
    b0 |= 0x10;
  if (info.data_rates & DR_9K6)
    b0 |= 0x08;
  uint8_t b1 = 0;
  if (info.optional_functionality)
    b1 |= 0x80;
  if (info.frequent_listening)
    b1 |= (uint8_t)(((uint8_t)*info.frequent_listening & 0x03) << 5);
  if (info.beaming)
    b1 |= 0x10;
  if (info.node_type == NodeType::EndNode)
    b1 |= 0x08;
  else
    b1 |= 0x02;
  if (info.specific_device_class)
    b1 |= 0x04;
  if (info.supports_security)
    b1 |= 0x01;
  uint8_t b2 = (info.data_rates & DR_100K) ? 0x01 : 0x00;
  out.push_back(b0);
  out.push_back(b1);
  out.push_back(b2);
  out.push_back(info.basic_device_class);
  out.push_back(info.generic_device_class);
  if (info.specific_device_class)
    out.push_back(*info.specific_device_class);
}

std::string GetNodeProtocolInfoResponse::describe() const {
  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "GetNodeProtocolInfo (Response) %s, listening %d, routing %d, "
                "generic class 0x%02x",
                to_string(info.node_type), (int)info.listening,
                (int)info.routing, (unsigned)info.generic_device_class);
  return buf;
}

std::error_code GetNodeProtocolInfoResponse::decode(ByteReader &r,
                                                    const EncodingContext &) {
  uint8_t b0, b1, b2;
  if (!r.u8(b0) || !r.u8(b1) || !r.u8(b2))
    return truncated();
  NodeProtocolInfo p;
  p.listening = (b0 & 0x80) != 0;
  p.routing = (b0 & 0x40) != 0;
  if (b0 & 0x10)
    p.data_rates |= DR_40K;
  if (b0 & 0x08)
    p.data_rates |= DR_9K6;
  uint8_t pv = b0 & 0x07;
  p.protocol_version = pv <= 3 ? (ProtocolVersion)pv : ProtocolVersion::Unknown;
  p.optional_functionality = (b1 & 0x80) != 0;
  uint8_t beam = (b1 >> 5) & 0x03;
  if (beam == (uint8_t)Beam::Beam250ms || beam == (uint8_t)Beam::Beam1000ms)
    p.frequent_listening = (Beam)beam;
  p.beaming = (b1 & 0x10) != 0;
  p.node_type = (b1 & 0x08) ? NodeType::EndNode : NodeType::Controller;
  bool has_specific = (b1 & 0x04) != 0;
  p.supports_security = (b1 & 0x01) != 0;
  if (b2 & 0x01)
    p.data_rates |= DR_100K;
  if (!r.u8(p.basic_device_class) || !r.u8(p.generic_device_class))
    return truncated();
  if (has_specific) {
    uint8_t s;
    if (!r.u8(s))
      return truncated();
    p.specific_device_class = s;
  }
  info = p;
  return {};
}

// ---- SendData ----

void SendDataRequest::encode_payload(std::vector<uint8_t> &out,
                                     const EncodingContext &ctx) const {
  put_node_id(out, node_id, ctx);
  out.push_back((uint8_t)payload.size());
  out.insert(out.end(), payload.begin(), payload.end());
  out.push_back(transmit_options);
  out.push_back(callback_id_);
}

std::string SendDataRequest::describe() const {
  char buf[96];
  std::snprintf(buf, sizeof(buf),
                "SendData (Request) node %u, callback id %u, payload 0x",
                (unsigned)node_id, (unsigned)callback_id_);
  return buf + to_hex(payload);
}

void SendDataResponse::encode_payload(std::vector<uint8_t> &out,
                                      const EncodingContext &) const {
  out.push_back(was_sent ? 0x01 : 0x00);
}

std::string SendDataResponse::describe() const {
  return std::string("SendData (Response) was sent ") +
         (was_sent ? "true" : "false");
}

std::error_code SendDataResponse::decode(ByteReader &r,
                                         const EncodingContext &) {
  uint8_t b;
  if (!r.u8(b))
    return truncated();
  was_sent = b != 0;
  return {};
}

void SendDataCallback::encode_payload(std::vector<uint8_t> &out,
                                      const EncodingContext &) const {
  out.push_back(callback_id_);
  out.push_back(transmit_status);
  if (tx_ticks)
    put_u16(out, *tx_ticks);
}

std::string SendDataCallback::describe() const {
  char buf[112];
  if (tx_ticks)
    std::snprintf(buf, sizeof(buf),
                  "SendData (Callback) callback id %u, status 0x%02x, took %u ms",
                  (unsigned)callback_id_, (unsigned)transmit_status,
                  (unsigned)*tx_ticks * 10);
  else
    std::snprintf(buf, sizeof(buf),
                  "SendData (Callback) callback id %u, status 0x%02x",
                  (unsigned)callback_id_, (unsigned)transmit_status);
  return buf;
}

std::error_code SendDataCallback::decode(ByteReader &r,
                                         const EncodingContext &) {
  if (!r.u8(callback_id_) || !r.u8(transmit_status))
    return truncated();
  uint16_t ticks;
  if (r.u16(ticks))
    tx_ticks = ticks;
  // The rest of the transmit report is not interpreted.
  r.rest();
  return {};
}

// ---- RequestNodeInfo ----

bool RequestNodeInfoRequest::test_callback(const Command &callback) const {
  auto *update = dynamic_cast<const ApplicationUpdateRequest *>(&callback);
  if (!update)
    return false;
  if (update->update_type == AU_NODE_INFO_RECEIVED)
    return update->node_id == node_id;
  return update->update_type == AU_NODE_INFO_REQUEST_FAILED;
}

bool RequestNodeInfoRequest::test_raw_callback(
    const RawCommand &raw, const EncodingContext &ctx) const {
  if (raw.type != CommandType::Request ||
      raw.function != FunctionType::ApplicationUpdateRequest)
    return false;
  ByteReader r(raw.payload);
  uint8_t update_type;
  if (!r.u8(update_type))
    return false;
  if (update_type == AU_NODE_INFO_REQUEST_FAILED)
    return true;
  if (update_type != AU_NODE_INFO_RECEIVED)
    return false;
  NodeId id;
  return !r.node_id(id, ctx) || id == node_id;
}

void RequestNodeInfoRequest::encode_payload(std::vector<uint8_t> &out,
                                            const EncodingContext &ctx) const {
  put_node_id(out, node_id, ctx);
}

std::string RequestNodeInfoRequest::describe() const {
  return "RequestNodeInfo (Request) node " + std::to_string(node_id);
}

std::error_code RequestNodeInfoRequest::decode(ByteReader &r,
                                               const EncodingContext &ctx) {
  if (!r.node_id(node_id, ctx))
    return truncated();
  return {};
}

void RequestNodeInfoResponse::encode_payload(std::vector<uint8_t> &out,
                                             const EncodingContext &) const {
  out.push_back(was_sent ? 0x01 : 0x00);
}

std::error_code RequestNodeInfoResponse::decode(ByteReader &r,
                                                const EncodingContext &) {
  uint8_t b;
  if (!r.u8(b))
    return truncated();
  was_sent = b != 0;
  return {};
}

// ---- ApplicationUpdateRequest ----

namespace {

bool carries_node_info(uint8_t update_type) {
  return update_type == AU_NODE_INFO_RECEIVED || update_type == AU_NODE_ADDED;
}

} // namespace

void ApplicationUpdateRequest::encode_payload(
    std::vector<uint8_t> &out, const EncodingContext &ctx) const {
  out.push_back(update_type);
  put_node_id(out, node_id, ctx);
  if (!carries_node_info(update_type)) {
    out.push_back(0);
    return;
  }
  out.push_back((uint8_t)(3 + command_classes.size()));
  out.push_back(basic_device_class);
  out.push_back(generic_device_class);
  out.push_back(specific_device_class);
  out.insert(out.end(), command_classes.begin(), command_classes.end());
}

std::string ApplicationUpdateRequest::describe() const {
  char buf[128];
  std::snprintf(buf, sizeof(buf),
                "ApplicationUpdateRequest type 0x%02x, node %u, %u command "
                "classes",
                (unsigned)update_type, (unsigned)node_id,
                (unsigned)command_classes.size());
  return buf;
}

std::error_code ApplicationUpdateRequest::decode(ByteReader &r,
                                                 const EncodingContext &ctx) {
  if (!r.u8(update_type))
    return truncated();
  if (!carries_node_info(update_type)) {
    // Failure and status updates may or may not carry a node id.
    NodeId id;
    if (r.node_id(id, ctx))
      node_id = id;
    r.rest();
    return {};
  }
  uint8_t len;
  if (!r.node_id(node_id, ctx) || !r.u8(len) || len < 3)
    return truncated();
  std::vector<uint8_t> info;
  if (!r.bytes(len, info))
    return truncated();
  basic_device_class = info[0];
  generic_device_class = info[1];
  specific_device_class = info[2];
  command_classes.assign(info.begin() + 3, info.end());
  return {};
}

// ---- ApplicationCommandRequest ----

void ApplicationCommandRequest::encode_payload(
    std::vector<uint8_t> &out, const EncodingContext &ctx) const {
  out.push_back(rx_status);
  put_node_id(out, source_node_id, ctx);
  out.push_back((uint8_t)payload.size());
  out.insert(out.end(), payload.begin(), payload.end());
}

std::string ApplicationCommandRequest::describe() const {
  char buf[80];
  std::snprintf(buf, sizeof(buf),
                "ApplicationCommand from node %u, payload 0x",
                (unsigned)source_node_id);
  return buf + to_hex(payload);
}

std::error_code ApplicationCommandRequest::decode(ByteReader &r,
                                                  const EncodingContext &ctx) {
  uint8_t len;
  if (!r.u8(rx_status) || !r.node_id(source_node_id, ctx) || !r.u8(len))
    return truncated();
  if (len == 0 || !r.bytes(len, payload))
    return truncated();
  // Trailing RSSI is ignored.
  r.rest();
  return {};
}

// ---- SerialApiStarted ----

void SerialApiStartedRequest::encode_payload(std::vector<uint8_t> &out,
                                             const EncodingContext &) const {
  out.push_back(wake_up_reason);
  out.push_back(watchdog_enabled ? 0x01 : 0x00);
  out.push_back(is_listening ? 0x80 : 0x00);
  out.push_back(generic_device_class);
  out.push_back(specific_device_class);
  out.push_back((uint8_t)command_classes.size());
  out.insert(out.end(), command_classes.begin(), command_classes.end());
  out.push_back(supports_long_range ? 0x01 : 0x00);
}

std::string SerialApiStartedRequest::describe() const {
  char buf[96];
  std::snprintf(buf, sizeof(buf),
                "SerialApiStarted wake up reason 0x%02x, watchdog %d",
                (unsigned)wake_up_reason, (int)watchdog_enabled);
  return buf;
}

std::error_code SerialApiStartedRequest::decode(ByteReader &r,
                                                const EncodingContext &) {
  uint8_t wd, flags, len;
  if (!r.u8(wake_up_reason) || !r.u8(wd) || !r.u8(flags) ||
      !r.u8(generic_device_class) || !r.u8(specific_device_class) ||
      !r.u8(len))
    return truncated();
  watchdog_enabled = wd == 0x01;
  is_listening = (flags & 0x80) != 0;
  if (!r.bytes(len, command_classes))
    return truncated();
  uint8_t lr;
  if (r.u8(lr))
    supports_long_range = (lr & 0x01) != 0;
  return {};
}

// ---- UnknownCommand ----

std::string UnknownCommand::describe() const {
  return to_string(raw_.function) + " (" + to_string(raw_.type) +
         ") payload 0x" + to_hex(raw_.payload);
}

std::error_code decode_command(const RawCommand &raw,
                               const EncodingContext &ctx, CommandPtr &out) {
  ByteReader r(raw.payload);
  bool req = raw.type == CommandType::Request;
  switch (raw.function) {
  case FunctionType::GetControllerId:
    if (!req)
      return decode_into<GetControllerIdResponse>(r, ctx, out);
    out = std::make_shared<GetControllerIdRequest>();
    return {};
  case FunctionType::GetControllerCapabilities:
    if (!req)
      return decode_into<GetControllerCapabilitiesResponse>(r, ctx, out);
    out = std::make_shared<GetControllerCapabilitiesRequest>();
    return {};
  case FunctionType::GetSerialApiCapabilities:
    if (!req)
      return decode_into<GetSerialApiCapabilitiesResponse>(r, ctx, out);
    out = std::make_shared<GetSerialApiCapabilitiesRequest>();
    return {};
  case FunctionType::GetControllerVersion:
    if (!req)
      return decode_into<GetControllerVersionResponse>(r, ctx, out);
    out = std::make_shared<GetControllerVersionRequest>();
    return {};
  case FunctionType::GetSucNodeId:
    if (!req)
      return decode_into<GetSucNodeIdResponse>(r, ctx, out);
    out = std::make_shared<GetSucNodeIdRequest>();
    return {};
  case FunctionType::SerialApiSetup:
    if (!req)
      return decode_into<SerialApiSetupResponse>(r, ctx, out);
    break;
  case FunctionType::GetSerialApiInitData:
    if (!req)
      return decode_into<GetSerialApiInitDataResponse>(r, ctx, out);
    out = std::make_shared<GetSerialApiInitDataRequest>();
    return {};
  case FunctionType::GetNodeProtocolInfo:
    if (!req)
      return decode_into<GetNodeProtocolInfoResponse>(r, ctx, out);
    return decode_into<GetNodeProtocolInfoRequest>(r, ctx, out);
  case FunctionType::SendData:
    // A SendData request from the controller is the transmit callback.
    if (!req)
      return decode_into<SendDataResponse>(r, ctx, out);
    return decode_into<SendDataCallback>(r, ctx, out);
  case FunctionType::RequestNodeInfo:
    if (!req)
      return decode_into<RequestNodeInfoResponse>(r, ctx, out);
    return decode_into<RequestNodeInfoRequest>(r, ctx, out);
  case FunctionType::ApplicationUpdateRequest:
    if (req)
      return decode_into<ApplicationUpdateRequest>(r, ctx, out);
    break;
  case FunctionType::ApplicationCommand:
    if (req)
      return decode_into<ApplicationCommandRequest>(r, ctx, out);
    break;
  case FunctionType::SerialApiStarted:
    if (req)
      return decode_into<SerialApiStartedRequest>(r, ctx, out);
    break;
  case FunctionType::SoftReset:
    if (req) {
      out = std::make_shared<SoftResetRequest>();
      return {};
    }
    break;
  }
  out = std::make_shared<UnknownCommand>(raw);
  return {};
}

} // namespace zwlink
