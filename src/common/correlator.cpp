#include "correlator.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace zwlink {

CommandCorrelator::Registration::Registration(Registration &&o) noexcept
    : owner_(std::move(o.owner_)), id_(o.id_) {
  o.id_ = 0;
}

CommandCorrelator::Registration &
CommandCorrelator::Registration::operator=(Registration &&o) noexcept {
  if (this != &o) {
    reset();
    owner_ = std::move(o.owner_);
    id_ = o.id_;
    o.id_ = 0;
  }
  return *this;
}

bool CommandCorrelator::Registration::cancel() {
  if (id_ == 0)
    return false;
  uint64_t id = id_;
  id_ = 0;
  auto owner = owner_.lock();
  owner_.reset();
  return owner && owner->remove(id);
}

CommandCorrelator::Registration CommandCorrelator::add(Predicate pred,
                                                       Completion done) {
  std::lock_guard<std::mutex> lk(mtx_);
  uint64_t id = next_id_++;
  entries_.push_back(Entry{id, std::move(pred), std::move(done)});
  return Registration(weak_from_this(), id);
}

bool CommandCorrelator::dispatch(const CommandPtr &cmd) {
  Completion done;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry &e) { return e.pred(*cmd); });
    if (it == entries_.end())
      return false;
    done = std::move(it->done);
    entries_.erase(it);
  }
  // Outside the lock so the completion may register follow-up waiters.
  done(cmd);
  return true;
}

size_t CommandCorrelator::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return entries_.size();
}

bool CommandCorrelator::remove(uint64_t id) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [id](const Entry &e) { return e.id == id; });
  if (it == entries_.end())
    return false;
  entries_.erase(it);
  return true;
}

AwaitedCommand::AwaitedCommand(CommandCorrelator &correlator,
                               CommandCorrelator::Predicate pred)
    : promise_(std::make_shared<std::promise<CommandPtr>>()),
      future_(promise_->get_future()) {
  auto p = promise_;
  reg_ = correlator.add(std::move(pred),
                        [p](CommandPtr cmd) { p->set_value(std::move(cmd)); });
}

CommandPtr AwaitedCommand::wait(std::chrono::milliseconds timeout,
                                std::error_code &ec) {
  ec.clear();
  if (future_.wait_for(timeout) == std::future_status::ready)
    return future_.get();
  // Already taken by a concurrent dispatch: the value is on its way.
  if (!reg_.cancel())
    return future_.get();
  ec = make_error_code(errc::timeout);
  Logger::instance().log_tagged(LogLevel::DEBUG, kLogDriver,
                                "awaited command timed out after %lld ms",
                                (long long)timeout.count());
  return nullptr;
}

} // namespace zwlink
