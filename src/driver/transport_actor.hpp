#pragma once
#include <asio.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "callback_ids.hpp"
#include "command_executor.hpp"
#include "correlator.hpp"
#include "link.hpp"
#include "protocol.hpp"

namespace zwlink {

using LinkFactory = std::function<std::unique_ptr<Link>(asio::io_context&)>;
using ContextProvider = std::function<EncodingContext()>;
using ResultHandler = std::function<void(ExecutionResult)>;
using UnsolicitedHandler = std::function<void(CommandPtr)>;

// Sole owner of the link. Link I/O, frame handling and command execution run
// on one worker thread; result and unsolicited handlers run on a second one.
class TransportActor : public FrameSink {
public:
    TransportActor(LinkFactory factory, ExecutorOptions opts, ContextProvider ctx = {});
    ~TransportActor() override;

    // Opens the link and starts both threads. Throws std::system_error if the
    // link cannot be opened.
    void start();
    // Fails queued and active commands with errc::aborted and joins. The
    // actor cannot be restarted.
    void stop();
    bool running() const { return running_.load(); }

    // The command must not be modified after submission. Commands that need a
    // callback id and carry none get one when they start. Commands submitted
    // before start() wait for it; stop() fails them with errc::aborted.
    // `handler` runs on the events thread.
    void submit(std::shared_ptr<Command> cmd, ResultHandler handler);
    // The future is fulfilled on the link thread, so it may be waited on from
    // an unsolicited or result handler.
    std::future<ExecutionResult> execute(std::shared_ptr<Command> cmd);

    uint64_t subscribe(UnsolicitedHandler handler);
    void unsubscribe(uint64_t id);

    const std::shared_ptr<CommandCorrelator>& correlator() const { return correlator_; }
    const CallbackIdAllocator& callback_ids() const { return callback_ids_; }

private:
    struct Pending {
        std::shared_ptr<Command> cmd;
        ResultHandler handler;
        // Run the handler on the link thread instead of the events thread.
        bool direct{false};
    };

    void write_frame(const Frame& f) override;
    void do_read();
    void do_write();
    void parse_and_handle(const uint8_t* data, size_t len);
    void handle_frame(const Frame& f);
    void handle_data(const Frame& f);
    void send_control(ControlByte b);
    void notify_unsolicited(const CommandPtr& cmd);

    void post_pending(Pending p);
    void enqueue(Pending p);
    void start_next();
    void fail_all(std::error_code ec);
    void link_failed(std::error_code ec);
    void deliver(const ResultHandler& h, bool direct, ExecutionResult r);

    LinkFactory factory_;
    ExecutorOptions opts_;
    ContextProvider ctx_;

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    asio::io_context events_io_;
    asio::executor_work_guard<asio::io_context::executor_type> events_work_;
    std::thread io_thread_;
    std::thread events_thread_;
    std::atomic<bool> running_{false};
    std::mutex lifecycle_mtx_;
    bool started_{false};
    bool stopped_{false};

    // Link thread only.
    std::unique_ptr<Link> link_;
    std::vector<uint8_t> read_buf_;
    FrameReassembler reassembler_;
    std::deque<std::vector<uint8_t>> write_q_;
    std::deque<Pending> queue_;
    std::shared_ptr<CommandExecutor> active_;
    bool closed_{false};
    bool shutting_down_{false};

    std::shared_ptr<CommandCorrelator> correlator_;
    CallbackIdAllocator callback_ids_;

    std::mutex subs_mtx_;
    std::map<uint64_t, UnsolicitedHandler> subscribers_;
    uint64_t next_sub_{1};
};

} // namespace zwlink
