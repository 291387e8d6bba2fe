#pragma once
#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include "command.hpp"
#include "correlator.hpp"
#include "protocol.hpp"

namespace zwlink {

struct ExecutorOptions {
    unsigned max_attempts{3};
    std::chrono::milliseconds ack_timeout{1600};
    std::chrono::milliseconds response_timeout{10000};
    std::chrono::milliseconds callback_timeout{30000};
    // Multiplied by the number of attempts made so far.
    std::chrono::milliseconds retry_delay{100};
};

struct ExecutionResult {
    std::error_code error;
    CommandPtr response;
    CommandPtr callback;
    unsigned attempts{0};
    bool ok() const { return !error; }
};

class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void write_frame(const Frame& f) = 0;
};

// Drives one command through send, link handshake, response and callback.
// Every member function must be called on the link's io_context thread.
class CommandExecutor : public std::enable_shared_from_this<CommandExecutor> {
public:
    enum class State { Idle, Sending, AwaitingLinkAck, AwaitingResponse, AwaitingCallback, Completed, Failed };
    using DoneHandler = std::function<void(ExecutionResult)>;

    CommandExecutor(asio::io_context& io, FrameSink& sink, std::shared_ptr<CommandCorrelator> correlator,
                    CommandPtr cmd, EncodingContext ctx, ExecutorOptions opts, DoneHandler done);

    void start();
    // Returns false if the executor is not waiting for a link handshake.
    bool on_control(ControlByte b);
    // Claims an inbound frame that failed to decode if it is what the
    // current stage waits for; the execution then fails with parse_error.
    bool on_undecodable(const RawCommand& raw, std::error_code ec);
    void abort(std::error_code ec);

    State state() const { return state_; }
    bool finished() const { return state_ == State::Completed || state_ == State::Failed; }
    const CommandPtr& command() const { return cmd_; }
    unsigned attempts() const { return attempts_; }

private:
    void send();
    void after_ack();
    void enter_awaiting_response();
    void enter_awaiting_callback();
    void on_response(CommandPtr resp);
    void on_callback(CommandPtr cb);
    void handshake_failed(std::error_code cause);
    void arm_timer(std::chrono::milliseconds d);
    void on_timeout();
    void finish(std::error_code ec);

    FrameSink& sink_;
    std::shared_ptr<CommandCorrelator> correlator_;
    CommandPtr cmd_;
    EncodingContext ctx_;
    ExecutorOptions opts_;
    DoneHandler done_;

    State state_{State::Idle};
    unsigned attempts_{0};
    asio::steady_timer timer_;
    uint64_t gen_{0};
    CommandCorrelator::Registration reg_;
    CommandPtr response_;
    CommandPtr callback_;
};

const char* to_string(CommandExecutor::State s);

} // namespace zwlink
