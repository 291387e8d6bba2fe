#include "definitions.hpp"
#include <tuple>

namespace zwlink {

const char *to_string(ControllerRole r) {
  return r == ControllerRole::Primary ? "primary" : "secondary";
}

const char *to_string(NodeType t) {
  return t == NodeType::Controller ? "controller" : "end node";
}

const char *to_string(InterviewStage s) {
  switch (s) {
  case InterviewStage::None:
    return "None";
  case InterviewStage::ProtocolInfo:
    return "ProtocolInfo";
  case InterviewStage::NodeInfo:
    return "NodeInfo";
  case InterviewStage::CommandClasses:
    return "CommandClasses";
  default:
    return "Done";
  }
}

const char *to_string(Beam b) {
  return b == Beam::Beam250ms ? "250 ms" : "1000 ms";
}

const char *to_string(LibraryType t) {
  switch (t) {
  case LibraryType::StaticController:
    return "Static Controller";
  case LibraryType::Controller:
    return "Controller";
  case LibraryType::EnhancedSlave:
    return "Enhanced Slave";
  case LibraryType::Slave:
    return "Slave";
  case LibraryType::Installer:
    return "Installer";
  case LibraryType::RoutingSlave:
    return "Routing Slave";
  case LibraryType::BridgeController:
    return "Bridge Controller";
  case LibraryType::DeviceUnderTest:
    return "Device under Test";
  case LibraryType::NotApplicable:
    return "N/A";
  case LibraryType::AvRemote:
    return "AV Remote";
  case LibraryType::AvDevice:
    return "AV Device";
  default:
    return "Unknown";
  }
}

const char *to_string(NodeIdType t) {
  return t == NodeIdType::NodeId16Bit ? "16 bit" : "8 bit";
}

bool NodeProtocolInfo::operator==(const NodeProtocolInfo &o) const {
  return listening == o.listening &&
         frequent_listening == o.frequent_listening && routing == o.routing &&
         data_rates == o.data_rates && protocol_version == o.protocol_version &&
         optional_functionality == o.optional_functionality &&
         node_type == o.node_type && supports_security == o.supports_security &&
         beaming == o.beaming && basic_device_class == o.basic_device_class &&
         generic_device_class == o.generic_device_class &&
         specific_device_class == o.specific_device_class;
}

bool ValueId::operator<(const ValueId &o) const {
  return std::tie(command_class, property, property_key) <
         std::tie(o.command_class, o.property, o.property_key);
}

} // namespace zwlink
