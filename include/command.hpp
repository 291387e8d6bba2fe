#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include "definitions.hpp"

namespace zwlink {

enum class CommandType : uint8_t { Request = 0x00, Response = 0x01 };

enum class FunctionType : uint8_t {
    GetSerialApiInitData = 0x02,
    ApplicationCommand = 0x04,
    GetControllerCapabilities = 0x05,
    GetSerialApiCapabilities = 0x07,
    SoftReset = 0x08,
    SerialApiStarted = 0x0a,
    SerialApiSetup = 0x0b,
    SendData = 0x13,
    GetControllerVersion = 0x15,
    GetControllerId = 0x20,
    GetNodeProtocolInfo = 0x41,
    ApplicationUpdateRequest = 0x49,
    GetSucNodeId = 0x56,
    RequestNodeInfo = 0x60
};

const char* to_string(CommandType t);
std::string to_string(FunctionType f);

// Shared by encoders and decoders; filled from ControllerStorage.
struct EncodingContext {
    NodeId own_node_id{1};
    NodeIdType node_id_type{NodeIdType::NodeId8Bit};
};

// Command type, function type and payload as carried by a data frame.
struct RawCommand {
    CommandType type{CommandType::Request};
    FunctionType function{FunctionType::SoftReset};
    std::vector<uint8_t> payload;

    static std::error_code parse(const std::vector<uint8_t>& frame_payload, RawCommand& out);
    std::vector<uint8_t> to_frame_payload() const;
};

// Bounds-checked reader over a command payload. Every read fails once the
// input is exhausted and leaves the output untouched.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}
    explicit ByteReader(const std::vector<uint8_t>& v) : data_(v.data()), len_(v.size()) {}
    bool u8(uint8_t& out);
    bool u16(uint16_t& out);
    bool u32(uint32_t& out);
    bool node_id(NodeId& out, const EncodingContext& ctx);
    bool bytes(size_t n, std::vector<uint8_t>& out);
    std::vector<uint8_t> rest();
    size_t remaining() const { return len_ - off_; }
    bool at_end() const { return off_ >= len_; }
private:
    const uint8_t* data_;
    size_t len_;
    size_t off_{0};
};

void put_u16(std::vector<uint8_t>& out, uint16_t v);
void put_u32(std::vector<uint8_t>& out, uint32_t v);
void put_node_id(std::vector<uint8_t>& out, NodeId id, const EncodingContext& ctx);

class Command {
public:
    virtual ~Command() = default;

    virtual CommandType command_type() const = 0;
    virtual FunctionType function_type() const = 0;

    // 0 means the command carries no callback id.
    virtual uint8_t callback_id() const { return 0; }
    virtual void set_callback_id(uint8_t) {}
    virtual bool needs_callback_id() const { return false; }

    virtual bool expects_response() const { return false; }
    virtual bool expects_callback() const { return false; }

    // Default: a Response with the same function type.
    virtual bool test_response(const Command& response) const;
    // Default: a Request with the same function type and the same non-zero callback id.
    virtual bool test_callback(const Command& callback) const;
    // Whether an inbound Request that failed to decode is the callback this
    // command waits for. Default: same function type, and the same callback
    // id when the payload is long enough to carry one in its first byte.
    virtual bool test_raw_callback(const RawCommand& raw, const EncodingContext& ctx) const;

    virtual bool is_ok() const { return true; }

    virtual void encode_payload(std::vector<uint8_t>& out, const EncodingContext& ctx) const = 0;
    virtual std::string describe() const;

    RawCommand to_raw(const EncodingContext& ctx) const;
};

using CommandPtr = std::shared_ptr<const Command>;

// Holds the callback id for commands whose wire format carries one.
class CallbackCommand : public Command {
public:
    uint8_t callback_id() const override { return callback_id_; }
    void set_callback_id(uint8_t id) override { callback_id_ = id; }
protected:
    uint8_t callback_id_{0};
};

} // namespace zwlink
