#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "command.hpp"
#include "definitions.hpp"

namespace zwlink {

struct ControllerInfo {
    HomeId home_id{0};
    NodeId own_node_id{0};
    std::optional<NodeId> suc_node_id;
    ControllerRole role{ControllerRole::Primary};
    bool is_suc{false};
    bool is_sis{false};
    bool sis_present{false};
    bool started_this_network{true};
    NodeType node_type{NodeType::Controller};
    bool supports_timers{false};
    uint8_t api_version{0};
    uint8_t chip_type{0};
    uint8_t chip_version{0};
    uint8_t firmware_major{0};
    uint8_t firmware_minor{0};
    uint16_t manufacturer_id{0};
    uint16_t product_type{0};
    uint16_t product_id{0};
    std::vector<FunctionType> supported_function_types;
    LibraryType library_type{LibraryType::Unknown};
    std::string library_version;
};

// Controller facts learned during identification. Every accessor locks only
// for the duration of the call.
class ControllerStorage {
public:
    ControllerInfo snapshot() const;
    void update(const std::function<void(ControllerInfo&)>& fn);

    HomeId home_id() const;
    NodeId own_node_id() const;
    std::optional<NodeId> suc_node_id() const;
    ControllerRole role() const;
    bool supports_function(FunctionType f) const;

    void set_ids(HomeId home_id, NodeId own_node_id);
    void set_suc_node_id(std::optional<NodeId> id);

    EncodingContext encoding_context() const;
    void set_node_id_type(NodeIdType t);

private:
    mutable std::shared_mutex mtx_;
    ControllerInfo info_;
    NodeIdType node_id_type_{NodeIdType::NodeId8Bit};
};

class NodeStorage {
public:
    explicit NodeStorage(NodeId id) : id_(id) {}
    NodeId id() const { return id_; }

    InterviewStage interview_stage() const;
    // Moves the stage only if it still equals `from`.
    bool try_advance_interview_stage(InterviewStage from, InterviewStage to);

    std::optional<NodeProtocolInfo> protocol_info() const;
    void set_protocol_info(const NodeProtocolInfo& info);

    std::optional<CacheValue> value(const ValueId& id) const;
    void set_value(const ValueId& id, CacheValue v);
    bool erase_value(const ValueId& id);
    size_t value_count() const;

private:
    const NodeId id_;
    mutable std::shared_mutex mtx_;
    InterviewStage stage_{InterviewStage::None};
    std::optional<NodeProtocolInfo> protocol_info_;
    std::map<ValueId, CacheValue> values_;
};

using NodePtr = std::shared_ptr<NodeStorage>;

class NodeRegistry {
public:
    // Returns the existing node if already present.
    NodePtr add(NodeId id);
    bool remove(NodeId id);
    NodePtr get(NodeId id) const;
    std::vector<NodeId> ids() const;
    size_t size() const;
private:
    mutable std::shared_mutex mtx_;
    std::map<NodeId, NodePtr> nodes_;
};

} // namespace zwlink
