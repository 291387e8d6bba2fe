#include "command_executor.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace zwlink {

const char *to_string(CommandExecutor::State s) {
  switch (s) {
  case CommandExecutor::State::Idle:
    return "Idle";
  case CommandExecutor::State::Sending:
    return "Sending";
  case CommandExecutor::State::AwaitingLinkAck:
    return "AwaitingLinkAck";
  case CommandExecutor::State::AwaitingResponse:
    return "AwaitingResponse";
  case CommandExecutor::State::AwaitingCallback:
    return "AwaitingCallback";
  case CommandExecutor::State::Completed:
    return "Completed";
  default:
    return "Failed";
  }
}

CommandExecutor::CommandExecutor(asio::io_context &io, FrameSink &sink,
                                 std::shared_ptr<CommandCorrelator> correlator,
                                 CommandPtr cmd, EncodingContext ctx,
                                 ExecutorOptions opts, DoneHandler done)
    : sink_(sink), correlator_(std::move(correlator)),
      cmd_(std::move(cmd)), ctx_(ctx), opts_(opts), done_(std::move(done)),
      timer_(io) {
  if (opts_.max_attempts == 0)
    opts_.max_attempts = 1;
}

void CommandExecutor::start() {
  if (state_ != State::Idle)
    return;
  send();
}

void CommandExecutor::send() {
  attempts_++;
  state_ = State::Sending;
  std::vector<uint8_t> payload = cmd_->to_raw(ctx_).to_frame_payload();
  if (payload.size() > kMaxPayload) {
    Logger::instance().log_tagged(LogLevel::ERROR, kLogDriver,
                                  "%s does not fit in a frame (%zu bytes)",
                                  cmd_->describe().c_str(), payload.size());
    finish(std::make_error_code(std::errc::message_size));
    return;
  }
  Logger::instance().log_tagged(LogLevel::DEBUG, kLogController,
                                "» %s (attempt %u/%u)",
                                cmd_->describe().c_str(), attempts_,
                                opts_.max_attempts);
  state_ = State::AwaitingLinkAck;
  arm_timer(opts_.ack_timeout);
  sink_.write_frame(Frame::data(std::move(payload)));
}

bool CommandExecutor::on_control(ControlByte b) {
  if (state_ != State::AwaitingLinkAck)
    return false;
  switch (b) {
  case ControlByte::ACK:
    after_ack();
    break;
  case ControlByte::NAK:
    handshake_failed(make_error_code(errc::nak));
    break;
  case ControlByte::CAN:
    handshake_failed(make_error_code(errc::can));
    break;
  default:
    return false;
  }
  return true;
}

void CommandExecutor::after_ack() {
  if (cmd_->expects_response())
    enter_awaiting_response();
  else if (cmd_->expects_callback())
    enter_awaiting_callback();
  else
    finish({});
}

void CommandExecutor::enter_awaiting_response() {
  state_ = State::AwaitingResponse;
  arm_timer(opts_.response_timeout);
  CommandPtr req = cmd_;
  std::weak_ptr<CommandExecutor> weak = shared_from_this();
  reg_ = correlator_->add(
      [req](const Command &c) {
        return c.command_type() == CommandType::Response &&
               c.function_type() == req->function_type() &&
               req->test_response(c);
      },
      [weak](CommandPtr c) {
        if (auto self = weak.lock())
          self->on_response(std::move(c));
      });
}

void CommandExecutor::enter_awaiting_callback() {
  state_ = State::AwaitingCallback;
  arm_timer(opts_.callback_timeout);
  CommandPtr req = cmd_;
  std::weak_ptr<CommandExecutor> weak = shared_from_this();
  reg_ = correlator_->add(
      [req](const Command &c) { return req->test_callback(c); },
      [weak](CommandPtr c) {
        if (auto self = weak.lock())
          self->on_callback(std::move(c));
      });
}

void CommandExecutor::on_response(CommandPtr resp) {
  if (state_ != State::AwaitingResponse)
    return;
  response_ = std::move(resp);
  if (!response_->is_ok())
    finish(make_error_code(errc::response_nok));
  else if (cmd_->expects_callback())
    enter_awaiting_callback();
  else
    finish({});
}

void CommandExecutor::on_callback(CommandPtr cb) {
  if (state_ != State::AwaitingCallback)
    return;
  callback_ = std::move(cb);
  if (!callback_->is_ok())
    finish(make_error_code(errc::callback_nok));
  else
    finish({});
}

bool CommandExecutor::on_undecodable(const RawCommand &raw,
                                     std::error_code ec) {
  bool claimed = false;
  if (state_ == State::AwaitingResponse)
    claimed = raw.type == CommandType::Response &&
              raw.function == cmd_->function_type();
  else if (state_ == State::AwaitingCallback)
    claimed = cmd_->test_raw_callback(raw, ctx_);
  if (!claimed)
    return false;
  Logger::instance().log_tagged(LogLevel::WARN, kLogController,
                                "could not parse reply to %s: %s",
                                cmd_->describe().c_str(), ec.message().c_str());
  finish(make_error_code(errc::parse_error));
  return true;
}

void CommandExecutor::handshake_failed(std::error_code cause) {
  if (attempts_ >= opts_.max_attempts) {
    finish(cause);
    return;
  }
  Logger::instance().log_tagged(LogLevel::DEBUG, kLogSerial,
                                "%s, retrying %s", cause.message().c_str(),
                                cmd_->describe().c_str());
  state_ = State::Sending;
  arm_timer(opts_.retry_delay * attempts_);
}

void CommandExecutor::arm_timer(std::chrono::milliseconds d) {
  uint64_t gen = ++gen_;
  timer_.expires_after(d);
  std::weak_ptr<CommandExecutor> weak = shared_from_this();
  timer_.async_wait([weak, gen](std::error_code ec) {
    if (ec)
      return;
    auto self = weak.lock();
    if (!self || self->gen_ != gen)
      return;
    self->on_timeout();
  });
}

void CommandExecutor::on_timeout() {
  switch (state_) {
  case State::Sending:
    send();
    break;
  case State::AwaitingLinkAck:
    handshake_failed(make_error_code(errc::ack_timeout));
    break;
  case State::AwaitingResponse:
    finish(make_error_code(errc::response_timeout));
    break;
  case State::AwaitingCallback:
    finish(make_error_code(errc::callback_timeout));
    break;
  default:
    break;
  }
}

void CommandExecutor::abort(std::error_code ec) {
  if (!finished())
    finish(ec);
}

void CommandExecutor::finish(std::error_code ec) {
  if (finished())
    return;
  auto self = shared_from_this();
  state_ = ec ? State::Failed : State::Completed;
  ++gen_;
  timer_.cancel();
  reg_.reset();

  ExecutionResult r;
  r.error = ec;
  r.response = response_;
  r.callback = callback_;
  r.attempts = attempts_;
  if (ec)
    Logger::instance().log_tagged(LogLevel::WARN, kLogDriver, "%s failed: %s",
                                  cmd_->describe().c_str(),
                                  ec.message().c_str());
  else
    Logger::instance().log_tagged(LogLevel::DEBUG, kLogDriver, "%s completed",
                                  cmd_->describe().c_str());

  DoneHandler done = std::move(done_);
  done_ = nullptr;
  if (done)
    done(std::move(r));
}

} // namespace zwlink
