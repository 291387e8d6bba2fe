#include "transport_actor.hpp"
#include "commands.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <stdexcept>

namespace zwlink {

TransportActor::TransportActor(LinkFactory factory, ExecutorOptions opts,
                               ContextProvider ctx)
    : factory_(std::move(factory)), opts_(opts), ctx_(std::move(ctx)),
      work_(asio::make_work_guard(io_)),
      events_work_(asio::make_work_guard(events_io_)), read_buf_(4096),
      correlator_(std::make_shared<CommandCorrelator>()) {
  if (!ctx_)
    ctx_ = [] { return EncodingContext{}; };
}

TransportActor::~TransportActor() { stop(); }

void TransportActor::start() {
  std::lock_guard<std::mutex> lk(lifecycle_mtx_);
  if (stopped_)
    throw std::logic_error("transport actor cannot be restarted");
  if (started_)
    return;
  link_ = factory_(io_);
  started_ = true;
  running_ = true;
  io_thread_ = std::thread([this]() { io_.run(); });
  events_thread_ = std::thread([this]() { events_io_.run(); });
  asio::post(io_, [this]() {
    Logger::instance().log_tagged(LogLevel::INFO, kLogDriver,
                                  "link %s ready", link_->describe().c_str());
    do_read();
  });
}

void TransportActor::stop() {
  {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (stopped_)
      return;
    stopped_ = true;
    running_ = false;
    if (started_) {
      asio::post(io_, [this]() {
        closed_ = true;
        shutting_down_ = true;
        fail_all(make_error_code(errc::aborted));
        if (link_)
          link_->close();
      });
    } else {
      // No thread runs the contexts: commands submitted so far are still
      // posted and fail here, on the caller's thread.
      closed_ = true;
      shutting_down_ = true;
    }
  }
  work_.reset();
  if (io_thread_.joinable())
    io_thread_.join();
  else
    io_.run();
  events_work_.reset();
  if (events_thread_.joinable())
    events_thread_.join();
  else
    events_io_.run();
  Logger::instance().log_tagged(LogLevel::INFO, kLogDriver, "transport stopped");
}

void TransportActor::submit(std::shared_ptr<Command> cmd,
                            ResultHandler handler) {
  post_pending(Pending{std::move(cmd), std::move(handler), false});
}

std::future<ExecutionResult>
TransportActor::execute(std::shared_ptr<Command> cmd) {
  auto p = std::make_shared<std::promise<ExecutionResult>>();
  auto f = p->get_future();
  post_pending(Pending{std::move(cmd),
                       [p](ExecutionResult r) { p->set_value(std::move(r)); },
                       true});
  return f;
}

void TransportActor::post_pending(Pending p) {
  {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (!stopped_) {
      asio::post(io_, [this, p = std::move(p)]() mutable {
        enqueue(std::move(p));
      });
      return;
    }
  }
  ExecutionResult r;
  r.error = make_error_code(errc::aborted);
  if (p.handler)
    p.handler(std::move(r));
}

uint64_t TransportActor::subscribe(UnsolicitedHandler handler) {
  std::lock_guard<std::mutex> lk(subs_mtx_);
  uint64_t id = next_sub_++;
  subscribers_[id] = std::move(handler);
  return id;
}

void TransportActor::unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lk(subs_mtx_);
  subscribers_.erase(id);
}

void TransportActor::enqueue(Pending p) {
  if (closed_) {
    ExecutionResult r;
    r.error = make_error_code(shutting_down_ ? errc::aborted : errc::link_closed);
    deliver(p.handler, p.direct, std::move(r));
    return;
  }
  queue_.push_back(std::move(p));
  start_next();
}

void TransportActor::start_next() {
  if (closed_ || active_ || queue_.empty())
    return;
  Pending p = std::move(queue_.front());
  queue_.pop_front();

  uint8_t cb_id = 0;
  if (p.cmd->needs_callback_id() && p.cmd->callback_id() == 0) {
    cb_id = callback_ids_.allocate();
    p.cmd->set_callback_id(cb_id);
  }
  ResultHandler handler = std::move(p.handler);
  bool direct = p.direct;
  auto exec = std::make_shared<CommandExecutor>(
      io_, *this, correlator_, p.cmd, ctx_(), opts_,
      [this, cb_id, handler, direct](ExecutionResult r) {
        callback_ids_.release(cb_id);
        active_.reset();
        deliver(handler, direct, std::move(r));
        // Let the finished exchange unwind before the next one starts.
        asio::post(io_, [this]() { start_next(); });
      });
  active_ = exec;
  exec->start();
}

void TransportActor::fail_all(std::error_code ec) {
  if (active_) {
    auto exec = active_;
    exec->abort(ec);
  }
  std::deque<Pending> q;
  q.swap(queue_);
  for (auto &p : q) {
    ExecutionResult r;
    r.error = ec;
    deliver(p.handler, p.direct, std::move(r));
  }
}

void TransportActor::link_failed(std::error_code ec) {
  Logger::instance().log_tagged(LogLevel::ERROR, kLogSerial, "link error: %s",
                                ec.message().c_str());
  closed_ = true;
  link_->close();
  fail_all(make_error_code(errc::link_closed));
}

void TransportActor::deliver(const ResultHandler &h, bool direct,
                             ExecutionResult r) {
  if (!h)
    return;
  if (direct) {
    h(std::move(r));
    return;
  }
  asio::post(events_io_, [h, r = std::move(r)]() {
    try {
      h(r);
    } catch (const std::exception &e) {
      Logger::instance().log_tagged(LogLevel::ERROR, kLogDriver,
                                    "result handler threw: %s", e.what());
    }
  });
}

void TransportActor::write_frame(const Frame &f) {
  if (closed_)
    return;
  auto bytes = encode_frame(f);
  if (Logger::instance().enabled(LogLevel::DEBUG))
    Logger::instance().log_tagged(LogLevel::DEBUG, kLogSerial, "» 0x%s",
                                  to_hex(bytes).c_str());
  write_q_.emplace_back(std::move(bytes));
  if (write_q_.size() == 1)
    do_write();
}

void TransportActor::send_control(ControlByte b) {
  write_frame(Frame::control(b));
}

void TransportActor::do_write() {
  if (write_q_.empty())
    return;
  link_->async_write(write_q_.front(), [this](std::error_code ec) {
    if (closed_)
      return;
    if (ec) {
      link_failed(ec);
      return;
    }
    write_q_.pop_front();
    if (!write_q_.empty())
      do_write();
  });
}

void TransportActor::do_read() {
  link_->async_read_some(
      asio::buffer(read_buf_), [this](std::error_code ec, std::size_t n) {
        if (closed_)
          return;
        if (ec) {
          link_failed(ec);
          return;
        }
        parse_and_handle(read_buf_.data(), n);
        if (!closed_)
          do_read();
      });
}

void TransportActor::parse_and_handle(const uint8_t *data, size_t len) {
  if (Logger::instance().enabled(LogLevel::TRACE))
    Logger::instance().log_tagged(LogLevel::TRACE, kLogSerial, "« 0x%s",
                                  to_hex(data, len).c_str());
  reassembler_.feed(data, len);
  DecodeResult r;
  while (!closed_ && reassembler_.next(r)) {
    switch (r.status) {
    case DecodeStatus::Ok:
      handle_frame(*r.frame);
      break;
    case DecodeStatus::Corrupt:
      Logger::instance().log_tagged(LogLevel::WARN, kLogSerial,
                                    "%s, sending NAK",
                                    r.error.message().c_str());
      send_control(ControlByte::NAK);
      break;
    case DecodeStatus::Garbage:
      Logger::instance().log_tagged(LogLevel::DEBUG, kLogSerial,
                                    "discarded %zu bytes of garbage",
                                    r.consumed);
      break;
    default:
      break;
    }
  }
}

void TransportActor::handle_frame(const Frame &f) {
  if (f.is_control()) {
    Logger::instance().log_tagged(LogLevel::DEBUG, kLogSerial, "« [%s]",
                                  to_string(f.kind()));
    if (!active_ || !active_->on_control(f.control_byte()))
      Logger::instance().log_tagged(LogLevel::DEBUG, kLogSerial,
                                    "unexpected %s ignored",
                                    to_string(f.kind()));
    return;
  }
  handle_data(f);
}

void TransportActor::handle_data(const Frame &f) {
  RawCommand raw;
  auto ec = RawCommand::parse(f.payload(), raw);
  if (ec) {
    Logger::instance().log_tagged(LogLevel::WARN, kLogSerial,
                                  "malformed data frame 0x%s, sending NAK",
                                  to_hex(f.payload()).c_str());
    send_control(ControlByte::NAK);
    return;
  }
  send_control(ControlByte::ACK);

  CommandPtr cmd;
  ec = decode_command(raw, ctx_(), cmd);
  if (ec) {
    if (active_ && active_->on_undecodable(raw, ec))
      return;
    Logger::instance().log_tagged(LogLevel::WARN, kLogController,
                                  "dropping undecodable %s (%s): %s",
                                  to_string(raw.function).c_str(),
                                  to_string(raw.type), ec.message().c_str());
    return;
  }
  Logger::instance().log_tagged(LogLevel::INFO, kLogController, "« %s",
                                cmd->describe().c_str());
  if (correlator_->dispatch(cmd))
    return;
  notify_unsolicited(cmd);
}

void TransportActor::notify_unsolicited(const CommandPtr &cmd) {
  std::vector<UnsolicitedHandler> handlers;
  {
    std::lock_guard<std::mutex> lk(subs_mtx_);
    for (const auto &kv : subscribers_)
      handlers.push_back(kv.second);
  }
  if (handlers.empty()) {
    Logger::instance().log_tagged(LogLevel::DEBUG, kLogController,
                                  "no handler for %s", cmd->describe().c_str());
    return;
  }
  for (auto &h : handlers) {
    asio::post(events_io_, [h, cmd]() {
      try {
        h(cmd);
      } catch (const std::exception &e) {
        Logger::instance().log_tagged(LogLevel::ERROR, kLogDriver,
                                      "unsolicited handler threw: %s",
                                      e.what());
      }
    });
  }
}

} // namespace zwlink
