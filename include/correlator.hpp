#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>
#include "command.hpp"

namespace zwlink {

// Matches inbound commands to whoever registered interest in them.
// Predicates are tested in registration order and the first match wins;
// a matched entry is removed before its completion runs.
class CommandCorrelator : public std::enable_shared_from_this<CommandCorrelator> {
public:
    using Predicate = std::function<bool(const Command&)>;
    using Completion = std::function<void(CommandPtr)>;

    // Removes its entry when destroyed unless the entry was already matched.
    class Registration {
    public:
        Registration() = default;
        Registration(Registration&& o) noexcept;
        Registration& operator=(Registration&& o) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        ~Registration() { reset(); }

        void reset() { cancel(); }
        // True if the entry was still waiting and is now removed.
        bool cancel();
        uint64_t id() const { return id_; }
        explicit operator bool() const { return id_ != 0; }
    private:
        friend class CommandCorrelator;
        Registration(std::weak_ptr<CommandCorrelator> owner, uint64_t id)
            : owner_(std::move(owner)), id_(id) {}
        std::weak_ptr<CommandCorrelator> owner_;
        uint64_t id_{0};
    };

    // Must be owned by a std::shared_ptr.
    Registration add(Predicate pred, Completion done);
    // Returns false and leaves the registry untouched if nothing matches.
    bool dispatch(const CommandPtr& cmd);
    size_t size() const;

private:
    bool remove(uint64_t id);

    struct Entry {
        uint64_t id;
        Predicate pred;
        Completion done;
    };
    mutable std::mutex mtx_;
    std::vector<Entry> entries_;
    uint64_t next_id_{1};
};

// Blocking single-use waiter for one inbound command.
class AwaitedCommand {
public:
    AwaitedCommand(CommandCorrelator& correlator, CommandCorrelator::Predicate pred);
    // Returns the command, or nullptr with ec set to errc::timeout.
    CommandPtr wait(std::chrono::milliseconds timeout, std::error_code& ec);
private:
    std::shared_ptr<std::promise<CommandPtr>> promise_;
    std::future<CommandPtr> future_;
    CommandCorrelator::Registration reg_;
};

} // namespace zwlink
