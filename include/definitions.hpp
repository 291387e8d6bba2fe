#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace zwlink {

using NodeId = uint16_t;
using HomeId = uint32_t;

enum class NodeIdType : uint8_t { NodeId8Bit = 1, NodeId16Bit = 2 };

enum class ControllerRole : uint8_t { Primary, Secondary };

enum class NodeType : uint8_t { Controller = 0, EndNode = 1 };

enum class InterviewStage : uint8_t { None, ProtocolInfo, NodeInfo, CommandClasses, Done };

enum class Beam : uint8_t { Beam250ms = 1, Beam1000ms = 2 };

enum class ProtocolVersion : uint8_t { Unknown = 0, V2 = 1, V5 = 2, V6 = 3 };

// Z-Wave library built into the controller firmware.
enum class LibraryType : uint8_t {
    Unknown = 0,
    StaticController = 1,
    Controller = 2,
    EnhancedSlave = 3,
    Slave = 4,
    Installer = 5,
    RoutingSlave = 6,
    BridgeController = 7,
    DeviceUnderTest = 8,
    NotApplicable = 9,
    AvRemote = 10,
    AvDevice = 11
};

enum DataRate : uint8_t {
    DR_9K6 = 0x01,
    DR_40K = 0x02,
    DR_100K = 0x04
};

const char* to_string(ControllerRole r);
const char* to_string(NodeType t);
const char* to_string(InterviewStage s);
const char* to_string(Beam b);
const char* to_string(LibraryType t);
const char* to_string(NodeIdType t);

struct NodeProtocolInfo {
    bool listening{false};
    std::optional<Beam> frequent_listening;
    bool routing{false};
    // DataRate bit set
    uint8_t data_rates{0};
    ProtocolVersion protocol_version{ProtocolVersion::Unknown};
    bool optional_functionality{false};
    NodeType node_type{NodeType::EndNode};
    bool supports_security{false};
    bool beaming{false};
    uint8_t basic_device_class{0};
    uint8_t generic_device_class{0};
    std::optional<uint8_t> specific_device_class;

    bool operator==(const NodeProtocolInfo& o) const;
    bool operator!=(const NodeProtocolInfo& o) const { return !(*this == o); }
};

struct ValueId {
    uint8_t command_class{0};
    uint32_t property{0};
    std::optional<uint32_t> property_key;

    bool operator==(const ValueId& o) const {
        return command_class == o.command_class && property == o.property && property_key == o.property_key;
    }
    bool operator<(const ValueId& o) const;
};

using CacheValue = std::variant<bool, int32_t, uint32_t, float, std::string, std::vector<uint8_t>>;

} // namespace zwlink
