#pragma once
#include <optional>
#include "command.hpp"

namespace zwlink {

// Node id bitmask length used by GetSerialApiInitData (232 classic nodes).
constexpr size_t kNodeBitmaskLen = 29;
constexpr uint8_t kDefaultTransmitOptions = 0x25; // ACK | AutoRoute | Explore

enum TransmitStatus : uint8_t {
    TS_OK = 0x00,
    TS_NO_ACK = 0x01,
    TS_FAIL = 0x02,
    TS_NOT_IDLE = 0x03,
    TS_NO_ROUTE = 0x04
};

enum ApplicationUpdateType : uint8_t {
    AU_SUC_ID_CHANGED = 0x10,
    AU_NODE_REMOVED = 0x20,
    AU_NODE_ADDED = 0x40,
    AU_ROUTING_PENDING = 0x80,
    AU_NODE_INFO_REQUEST_FAILED = 0x81,
    AU_NODE_INFO_REQUEST_DONE = 0x82,
    AU_NODE_INFO_RECEIVED = 0x84
};

// ---- GetControllerId ----
class GetControllerIdRequest : public Command {
public:
    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::GetControllerId; }
    bool expects_response() const override { return true; }
    void encode_payload(std::vector<uint8_t>&, const EncodingContext&) const override {}
};

class GetControllerIdResponse : public Command {
public:
    HomeId home_id{0};
    NodeId own_node_id{0};

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::GetControllerId; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- GetControllerCapabilities ----
class GetControllerCapabilitiesRequest : public Command {
public:
    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::GetControllerCapabilities; }
    bool expects_response() const override { return true; }
    void encode_payload(std::vector<uint8_t>&, const EncodingContext&) const override {}
};

class GetControllerCapabilitiesResponse : public Command {
public:
    ControllerRole role{ControllerRole::Primary};
    bool started_this_network{true};
    bool sis_present{false};
    bool is_suc{false};

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::GetControllerCapabilities; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- GetSerialApiCapabilities ----
class GetSerialApiCapabilitiesRequest : public Command {
public:
    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::GetSerialApiCapabilities; }
    bool expects_response() const override { return true; }
    void encode_payload(std::vector<uint8_t>&, const EncodingContext&) const override {}
};

// Supported function bitmask length: one bit per function type 1..255.
constexpr size_t kFunctionBitmaskLen = 32;

class GetSerialApiCapabilitiesResponse : public Command {
public:
    uint8_t firmware_major{0};
    uint8_t firmware_minor{0};
    uint16_t manufacturer_id{0};
    uint16_t product_type{0};
    uint16_t product_id{0};
    std::vector<FunctionType> supported_function_types;

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::GetSerialApiCapabilities; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- GetControllerVersion ----
class GetControllerVersionRequest : public Command {
public:
    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::GetControllerVersion; }
    bool expects_response() const override { return true; }
    void encode_payload(std::vector<uint8_t>&, const EncodingContext&) const override {}
};

class GetControllerVersionResponse : public Command {
public:
    // e.g. "Z-Wave 7.18"
    std::string library_version;
    LibraryType library_type{LibraryType::Unknown};

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::GetControllerVersion; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- GetSucNodeId ----
class GetSucNodeIdRequest : public Command {
public:
    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::GetSucNodeId; }
    bool expects_response() const override { return true; }
    void encode_payload(std::vector<uint8_t>&, const EncodingContext&) const override {}
};

class GetSucNodeIdResponse : public Command {
public:
    // Absent when the network has no SUC.
    std::optional<NodeId> suc_node_id;

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::GetSucNodeId; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- SerialApiSetup ----
enum SerialApiSetupCommand : uint8_t {
    SETUP_UNSUPPORTED = 0x00,
    SETUP_GET_SUPPORTED_COMMANDS = 0x01,
    SETUP_SET_NODE_ID_TYPE = 0x80
};

class SerialApiSetupRequest : public Command {
public:
    SerialApiSetupRequest() = default;
    SerialApiSetupRequest(uint8_t sub_command, std::vector<uint8_t> args)
        : command(sub_command), payload(std::move(args)) {}
    static std::shared_ptr<SerialApiSetupRequest> set_node_id_type(NodeIdType t);

    uint8_t command{SETUP_GET_SUPPORTED_COMMANDS};
    std::vector<uint8_t> payload;

    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::SerialApiSetup; }
    bool expects_response() const override { return true; }
    // The controller answers with the same sub command, or SETUP_UNSUPPORTED.
    bool test_response(const Command& response) const override;
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
};

class SerialApiSetupResponse : public Command {
public:
    uint8_t command{SETUP_UNSUPPORTED};
    // Sub command specific result bytes.
    std::vector<uint8_t> payload;

    // For setters the first result byte is a success flag.
    bool success() const { return command != SETUP_UNSUPPORTED && !payload.empty() && payload[0] != 0; }

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::SerialApiSetup; }
    bool is_ok() const override { return command != SETUP_UNSUPPORTED; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- GetSerialApiInitData ----
class GetSerialApiInitDataRequest : public Command {
public:
    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::GetSerialApiInitData; }
    bool expects_response() const override { return true; }
    void encode_payload(std::vector<uint8_t>&, const EncodingContext&) const override {}
};

struct ChipType {
    uint8_t type{0};
    uint8_t version{0};
};

class GetSerialApiInitDataResponse : public Command {
public:
    uint8_t api_version{0};
    NodeType node_type{NodeType::Controller};
    bool supports_timers{false};
    bool is_secondary{false};
    bool is_sis{false};
    std::vector<NodeId> node_ids;
    std::optional<ChipType> chip;

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::GetSerialApiInitData; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- GetNodeProtocolInfo ----
class GetNodeProtocolInfoRequest : public Command {
public:
    GetNodeProtocolInfoRequest() = default;
    explicit GetNodeProtocolInfoRequest(NodeId id) : node_id(id) {}
    NodeId node_id{0};

    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::GetNodeProtocolInfo; }
    bool expects_response() const override { return true; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

class GetNodeProtocolInfoResponse : public Command {
public:
    NodeProtocolInfo info;

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::GetNodeProtocolInfo; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- SendData ----
class SendDataRequest : public CallbackCommand {
public:
    SendDataRequest() = default;
    SendDataRequest(NodeId node, std::vector<uint8_t> cc_payload, uint8_t tx_options = kDefaultTransmitOptions)
        : node_id(node), payload(std::move(cc_payload)), transmit_options(tx_options) {}
    NodeId node_id{0};
    std::vector<uint8_t> payload;
    uint8_t transmit_options{kDefaultTransmitOptions};

    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::SendData; }
    bool needs_callback_id() const override { return true; }
    bool expects_response() const override { return true; }
    bool expects_callback() const override { return callback_id_ != 0; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
};

class SendDataResponse : public Command {
public:
    bool was_sent{false};

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::SendData; }
    bool is_ok() const override { return was_sent; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

class SendDataCallback : public CallbackCommand {
public:
    uint8_t transmit_status{TS_OK};
    // Transmission time in 10 ms ticks, when reported.
    std::optional<uint16_t> tx_ticks;

    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::SendData; }
    bool is_ok() const override { return transmit_status == TS_OK; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- RequestNodeInfo ----
class RequestNodeInfoRequest : public Command {
public:
    RequestNodeInfoRequest() = default;
    explicit RequestNodeInfoRequest(NodeId id) : node_id(id) {}
    NodeId node_id{0};

    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::RequestNodeInfo; }
    bool expects_response() const override { return true; }
    bool expects_callback() const override { return true; }
    // The callback arrives as an ApplicationUpdateRequest.
    bool test_callback(const Command& callback) const override;
    bool test_raw_callback(const RawCommand& raw, const EncodingContext& ctx) const override;
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

class RequestNodeInfoResponse : public Command {
public:
    bool was_sent{false};

    CommandType command_type() const override { return CommandType::Response; }
    FunctionType function_type() const override { return FunctionType::RequestNodeInfo; }
    bool is_ok() const override { return was_sent; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// ---- Unsolicited requests from the controller ----
class ApplicationUpdateRequest : public Command {
public:
    uint8_t update_type{AU_NODE_INFO_RECEIVED};
    NodeId node_id{0};
    uint8_t basic_device_class{0};
    uint8_t generic_device_class{0};
    uint8_t specific_device_class{0};
    std::vector<uint8_t> command_classes;

    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::ApplicationUpdateRequest; }
    bool is_ok() const override { return update_type != AU_NODE_INFO_REQUEST_FAILED; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

class ApplicationCommandRequest : public Command {
public:
    uint8_t rx_status{0};
    NodeId source_node_id{0};
    // Command class frame: class id, command id, parameters.
    std::vector<uint8_t> payload;

    uint8_t cc_id() const { return payload.empty() ? 0 : payload[0]; }
    uint8_t cc_command() const { return payload.size() < 2 ? 0 : payload[1]; }

    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::ApplicationCommand; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

class SerialApiStartedRequest : public Command {
public:
    uint8_t wake_up_reason{0};
    bool watchdog_enabled{false};
    bool is_listening{false};
    uint8_t generic_device_class{0};
    uint8_t specific_device_class{0};
    std::vector<uint8_t> command_classes;
    bool supports_long_range{false};

    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::SerialApiStarted; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const override;
    std::string describe() const override;
    std::error_code decode(ByteReader& r, const EncodingContext& ctx);
};

// Restarts the controller. Acknowledged on the link only.
class SoftResetRequest : public Command {
public:
    CommandType command_type() const override { return CommandType::Request; }
    FunctionType function_type() const override { return FunctionType::SoftReset; }
    void encode_payload(std::vector<uint8_t>&, const EncodingContext&) const override {}
};

// Any command without a dedicated decoder.
class UnknownCommand : public Command {
public:
    explicit UnknownCommand(RawCommand raw) : raw_(std::move(raw)) {}
    const RawCommand& raw() const { return raw_; }

    CommandType command_type() const override { return raw_.type; }
    FunctionType function_type() const override { return raw_.function; }
    void encode_payload(std::vector<uint8_t>& out, const EncodingContext&) const override {
        out.insert(out.end(), raw_.payload.begin(), raw_.payload.end());
    }
    std::string describe() const override;
private:
    RawCommand raw_;
};

// Maps a raw command arriving from the controller to its typed command.
std::error_code decode_command(const RawCommand& raw, const EncodingContext& ctx, CommandPtr& out);

} // namespace zwlink
