#include "driver.hpp"
#include "commands.hpp"

namespace zwlink {

Driver::Driver(const DriverConfig &cfg)
    : Driver(
          [port = cfg.port, baud = cfg.baud](asio::io_context &io) {
            return open_link(io, port, baud);
          },
          cfg) {}

Driver::Driver(LinkFactory factory, const DriverConfig &cfg) : cfg_(cfg) {
  actor_.reset(new TransportActor(std::move(factory), cfg_.exec, [this]() {
    return controller_.encoding_context();
  }));
  cache_sub_ = actor_->subscribe(
      [this](CommandPtr cmd) { handle_unsolicited(cmd); });
}

Driver::~Driver() { stop(); }

void Driver::start() {
  actor_->start();
  Logger::instance().log_tagged(LogLevel::INFO, kLogDriver,
                                "driver started on %s", cfg_.port.c_str());
}

void Driver::stop() {
  if (cache_sub_) {
    actor_->unsubscribe(cache_sub_);
    cache_sub_ = 0;
  }
  actor_->stop();
}

ExecutionResult Driver::execute(std::shared_ptr<Command> cmd) {
  return actor_->execute(std::move(cmd)).get();
}

std::error_code Driver::identify_controller() {
  std::error_code ec;
  auto &log = Logger::instance();

  log.log_tagged(LogLevel::INFO, kLogController,
                 "querying Serial API capabilities...");
  auto api = execute_for<GetSerialApiCapabilitiesResponse>(
      std::make_shared<GetSerialApiCapabilitiesRequest>(), ec);
  if (!api)
    return ec;
  controller_.update([&](ControllerInfo &c) {
    c.firmware_major = api->firmware_major;
    c.firmware_minor = api->firmware_minor;
    c.manufacturer_id = api->manufacturer_id;
    c.product_type = api->product_type;
    c.product_id = api->product_id;
    c.supported_function_types = api->supported_function_types;
  });
  log.log_tagged(LogLevel::INFO, kLogController,
                 "firmware %u.%u, manufacturer 0x%04x, product type 0x%04x, "
                 "product id 0x%04x",
                 (unsigned)api->firmware_major, (unsigned)api->firmware_minor,
                 (unsigned)api->manufacturer_id, (unsigned)api->product_type,
                 (unsigned)api->product_id);

  log.log_tagged(LogLevel::INFO, kLogController, "querying version info...");
  auto version = execute_for<GetControllerVersionResponse>(
      std::make_shared<GetControllerVersionRequest>(), ec);
  if (!version)
    return ec;
  controller_.update([&](ControllerInfo &c) {
    c.library_type = version->library_type;
    c.library_version = version->library_version;
  });
  log.log_tagged(LogLevel::INFO, kLogController, "%s, %s",
                 version->library_version.c_str(),
                 to_string(version->library_type));

  if (cfg_.node_id_type == NodeIdType::NodeId16Bit) {
    ec = switch_node_id_type();
    if (ec)
      return ec;
  }

  log.log_tagged(LogLevel::INFO, kLogController, "querying controller IDs...");
  auto ids = execute_for<GetControllerIdResponse>(
      std::make_shared<GetControllerIdRequest>(), ec);
  if (!ids)
    return ec;
  controller_.set_ids(ids->home_id, ids->own_node_id);
  log.log_tagged(LogLevel::INFO, kLogController,
                 "home ID 0x%08x, own node ID %u", (unsigned)ids->home_id,
                 (unsigned)ids->own_node_id);

  log.log_tagged(LogLevel::INFO, kLogController,
                 "querying controller capabilities...");
  auto caps = execute_for<GetControllerCapabilitiesResponse>(
      std::make_shared<GetControllerCapabilitiesRequest>(), ec);
  if (!caps)
    return ec;
  controller_.update([&](ControllerInfo &c) {
    c.role = caps->role;
    c.started_this_network = caps->started_this_network;
    c.sis_present = caps->sis_present;
    c.is_suc = caps->is_suc;
  });

  if (controller_.supports_function(FunctionType::GetSucNodeId)) {
    auto suc = execute_for<GetSucNodeIdResponse>(
        std::make_shared<GetSucNodeIdRequest>(), ec);
    if (!suc)
      return ec;
    controller_.set_suc_node_id(suc->suc_node_id);
    log.log_tagged(LogLevel::INFO, kLogController, "%s",
                   suc->describe().c_str());
  }

  log.log_tagged(LogLevel::INFO, kLogController,
                 "querying Serial API init data...");
  auto init = execute_for<GetSerialApiInitDataResponse>(
      std::make_shared<GetSerialApiInitDataRequest>(), ec);
  if (!init)
    return ec;
  controller_.update([&](ControllerInfo &c) {
    c.api_version = init->api_version;
    c.node_type = init->node_type;
    c.supports_timers = init->supports_timers;
    c.is_sis = init->is_sis;
    if (init->chip) {
      c.chip_type = init->chip->type;
      c.chip_version = init->chip->version;
    }
  });
  for (NodeId id : init->node_ids)
    nodes_.add(id);
  log.log_tagged(LogLevel::INFO, kLogController, "%zu nodes in the network",
                 init->node_ids.size());

  for (NodeId id : init->node_ids) {
    auto node = nodes_.get(id);
    if (!node)
      continue;
    auto info = execute_for<GetNodeProtocolInfoResponse>(
        std::make_shared<GetNodeProtocolInfoRequest>(id), ec);
    if (!info)
      return ec;
    node->set_protocol_info(info->info);
    if (!node->try_advance_interview_stage(InterviewStage::None,
                                           InterviewStage::ProtocolInfo))
      log.log_tagged(LogLevel::DEBUG, kLogController,
                     "node %u already past stage None", (unsigned)id);
    log.log_tagged(LogLevel::INFO, kLogController,
                   "node %u: %s, listening %d, routing %d", (unsigned)id,
                   to_string(info->info.node_type), (int)info->info.listening,
                   (int)info->info.routing);
  }
  return {};
}

std::error_code Driver::switch_node_id_type() {
  auto &log = Logger::instance();
  if (!controller_.supports_function(FunctionType::SerialApiSetup)) {
    log.log_tagged(LogLevel::WARN, kLogController,
                   "controller cannot switch node id type, staying at 8 bit");
    return {};
  }
  std::error_code ec;
  auto resp = execute_for<SerialApiSetupResponse>(
      SerialApiSetupRequest::set_node_id_type(NodeIdType::NodeId16Bit), ec);
  if (!resp) {
    if (ec != errc::response_nok)
      return ec;
    log.log_tagged(LogLevel::WARN, kLogController,
                   "SetNodeIDType is not supported, staying at 8 bit");
    return {};
  }
  if (!resp->success()) {
    log.log_tagged(LogLevel::WARN, kLogController,
                   "controller refused 16 bit node ids");
    return {};
  }
  controller_.set_node_id_type(NodeIdType::NodeId16Bit);
  log.log_tagged(LogLevel::INFO, kLogController, "switched to %s node ids",
                 to_string(NodeIdType::NodeId16Bit));
  return {};
}

CommandPtr Driver::await_command(CommandCorrelator::Predicate pred,
                                 std::chrono::milliseconds timeout,
                                 std::error_code &ec) {
  AwaitedCommand awaited(*actor_->correlator(), std::move(pred));
  return awaited.wait(timeout, ec);
}

void Driver::handle_unsolicited(const CommandPtr &cmd) {
  if (auto ac = std::dynamic_pointer_cast<const ApplicationCommandRequest>(cmd)) {
    auto node = nodes_.get(ac->source_node_id);
    if (!node) {
      Logger::instance().log_tagged(LogLevel::DEBUG, kLogController,
                                    "command from unknown node %u",
                                    (unsigned)ac->source_node_id);
      return;
    }
    ValueId vid;
    vid.command_class = ac->cc_id();
    vid.property = ac->cc_command();
    std::vector<uint8_t> params;
    if (ac->payload.size() > 2)
      params.assign(ac->payload.begin() + 2, ac->payload.end());
    node->set_value(vid, params);
    return;
  }
  if (auto au = std::dynamic_pointer_cast<const ApplicationUpdateRequest>(cmd)) {
    if (au->update_type == AU_NODE_ADDED) {
      nodes_.add(au->node_id);
      Logger::instance().log_tagged(LogLevel::INFO, kLogController,
                                    "node %u was added", (unsigned)au->node_id);
    } else if (au->update_type == AU_NODE_REMOVED) {
      nodes_.remove(au->node_id);
      Logger::instance().log_tagged(LogLevel::INFO, kLogController,
                                    "node %u was removed",
                                    (unsigned)au->node_id);
    } else if (au->update_type == AU_SUC_ID_CHANGED) {
      controller_.set_suc_node_id(au->node_id ? std::optional<NodeId>(au->node_id)
                                              : std::nullopt);
    }
    return;
  }
  if (std::dynamic_pointer_cast<const SerialApiStartedRequest>(cmd))
    Logger::instance().log_tagged(LogLevel::INFO, kLogController,
                                  "controller restarted: %s",
                                  cmd->describe().c_str());
}

} // namespace zwlink
