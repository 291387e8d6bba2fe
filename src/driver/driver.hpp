#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "errors.hpp"
#include "logging.hpp"
#include "storage.hpp"
#include "transport_actor.hpp"

namespace zwlink {

struct DriverConfig {
    // Serial device path, or tcp://host:port.
    std::string port{"/dev/ttyACM0"};
    unsigned baud{115200};
    // 16 bit node ids are requested during identification when the
    // controller supports SerialApiSetup.
    NodeIdType node_id_type{NodeIdType::NodeId8Bit};
    ExecutorOptions exec;
    LogLevel log_level{LogLevel::INFO};
};

class Driver {
public:
    explicit Driver(const DriverConfig& cfg);
    Driver(LinkFactory factory, const DriverConfig& cfg);
    ~Driver();

    // Throws std::system_error if the link cannot be opened.
    void start();
    void stop();

    // Blocks until the command reaches a terminal state.
    ExecutionResult execute(std::shared_ptr<Command> cmd);

    // Executes `cmd` and returns its response as T, or nullptr with ec set.
    template <typename T>
    std::shared_ptr<const T> execute_for(std::shared_ptr<Command> cmd, std::error_code& ec) {
        ExecutionResult r = execute(std::move(cmd));
        if (r.error) {
            ec = r.error;
            return nullptr;
        }
        auto resp = std::dynamic_pointer_cast<const T>(r.response);
        if (!resp) {
            ec = make_error_code(errc::unexpected_response);
            return nullptr;
        }
        ec.clear();
        return resp;
    }

    // Queries the Serial API capabilities, library version, identity,
    // capabilities, SUC and node list, then the protocol info of every node.
    std::error_code identify_controller();

    // Waits for an inbound command that no in-flight execution claims.
    CommandPtr await_command(CommandCorrelator::Predicate pred, std::chrono::milliseconds timeout,
                             std::error_code& ec);

    uint64_t on_unsolicited(UnsolicitedHandler handler) { return actor_->subscribe(std::move(handler)); }
    void remove_unsolicited(uint64_t id) { actor_->unsubscribe(id); }

    ControllerStorage& controller() { return controller_; }
    NodeRegistry& nodes() { return nodes_; }
    TransportActor& transport() { return *actor_; }

private:
    std::error_code switch_node_id_type();
    void handle_unsolicited(const CommandPtr& cmd);

    DriverConfig cfg_;
    ControllerStorage controller_;
    NodeRegistry nodes_;
    std::unique_ptr<TransportActor> actor_;
    uint64_t cache_sub_{0};
};

} // namespace zwlink
