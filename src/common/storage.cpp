#include "storage.hpp"
#include <algorithm>
#include <mutex>

namespace zwlink {

using ReadLock = std::shared_lock<std::shared_mutex>;
using WriteLock = std::unique_lock<std::shared_mutex>;

ControllerInfo ControllerStorage::snapshot() const {
  ReadLock lk(mtx_);
  return info_;
}

void ControllerStorage::update(
    const std::function<void(ControllerInfo &)> &fn) {
  WriteLock lk(mtx_);
  fn(info_);
}

HomeId ControllerStorage::home_id() const {
  ReadLock lk(mtx_);
  return info_.home_id;
}

NodeId ControllerStorage::own_node_id() const {
  ReadLock lk(mtx_);
  return info_.own_node_id;
}

std::optional<NodeId> ControllerStorage::suc_node_id() const {
  ReadLock lk(mtx_);
  return info_.suc_node_id;
}

ControllerRole ControllerStorage::role() const {
  ReadLock lk(mtx_);
  return info_.role;
}

bool ControllerStorage::supports_function(FunctionType f) const {
  ReadLock lk(mtx_);
  const auto &v = info_.supported_function_types;
  return std::find(v.begin(), v.end(), f) != v.end();
}

void ControllerStorage::set_ids(HomeId home_id, NodeId own_node_id) {
  WriteLock lk(mtx_);
  info_.home_id = home_id;
  info_.own_node_id = own_node_id;
}

void ControllerStorage::set_suc_node_id(std::optional<NodeId> id) {
  WriteLock lk(mtx_);
  info_.suc_node_id = id;
}

EncodingContext ControllerStorage::encoding_context() const {
  ReadLock lk(mtx_);
  EncodingContext ctx;
  if (info_.own_node_id != 0)
    ctx.own_node_id = info_.own_node_id;
  ctx.node_id_type = node_id_type_;
  return ctx;
}

void ControllerStorage::set_node_id_type(NodeIdType t) {
  WriteLock lk(mtx_);
  node_id_type_ = t;
}

InterviewStage NodeStorage::interview_stage() const {
  ReadLock lk(mtx_);
  return stage_;
}

bool NodeStorage::try_advance_interview_stage(InterviewStage from,
                                              InterviewStage to) {
  WriteLock lk(mtx_);
  if (stage_ != from)
    return false;
  stage_ = to;
  return true;
}

std::optional<NodeProtocolInfo> NodeStorage::protocol_info() const {
  ReadLock lk(mtx_);
  return protocol_info_;
}

void NodeStorage::set_protocol_info(const NodeProtocolInfo &info) {
  WriteLock lk(mtx_);
  protocol_info_ = info;
}

std::optional<CacheValue> NodeStorage::value(const ValueId &id) const {
  ReadLock lk(mtx_);
  auto it = values_.find(id);
  if (it == values_.end())
    return std::nullopt;
  return it->second;
}

void NodeStorage::set_value(const ValueId &id, CacheValue v) {
  WriteLock lk(mtx_);
  values_[id] = std::move(v);
}

bool NodeStorage::erase_value(const ValueId &id) {
  WriteLock lk(mtx_);
  return values_.erase(id) > 0;
}

size_t NodeStorage::value_count() const {
  ReadLock lk(mtx_);
  return values_.size();
}

NodePtr NodeRegistry::add(NodeId id) {
  WriteLock lk(mtx_);
  auto &slot = nodes_[id];
  if (!slot)
    slot = std::make_shared<NodeStorage>(id);
  return slot;
}

bool NodeRegistry::remove(NodeId id) {
  WriteLock lk(mtx_);
  return nodes_.erase(id) > 0;
}

NodePtr NodeRegistry::get(NodeId id) const {
  ReadLock lk(mtx_);
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : it->second;
}

std::vector<NodeId> NodeRegistry::ids() const {
  ReadLock lk(mtx_);
  std::vector<NodeId> out;
  out.reserve(nodes_.size());
  for (const auto &kv : nodes_)
    out.push_back(kv.first);
  return out;
}

size_t NodeRegistry::size() const {
  ReadLock lk(mtx_);
  return nodes_.size();
}

} // namespace zwlink
