#pragma once
#include <asio.hpp>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "link.hpp"
#include "protocol.hpp"
#include "transport_actor.hpp"

namespace zwlink {
namespace test {

// State shared between a test and the FakeLink owned by the transport.
// Inbound bytes are injected from the test thread; writes are recorded and
// optionally answered by a scripted controller running on the link thread.
class FakeWire : public std::enable_shared_from_this<FakeWire> {
public:
    using Responder = std::function<void(FakeWire&, const std::vector<uint8_t>&)>;

    void set_responder(Responder r) {
        std::lock_guard<std::mutex> lk(mtx_);
        responder_ = std::move(r);
    }

    // Test thread.
    void inject(std::vector<uint8_t> bytes) {
        auto self = shared_from_this();
        asio::post(*io_, [self, bytes = std::move(bytes)]() {
            self->inbox_.insert(self->inbox_.end(), bytes.begin(), bytes.end());
            self->complete_read();
        });
    }

    void fail_link() {
        auto self = shared_from_this();
        asio::post(*io_, [self]() {
            self->read_error_ = asio::error::eof;
            self->complete_read();
        });
    }

    // Link thread, from a responder.
    void reply(const std::vector<uint8_t>& bytes) {
        inbox_.insert(inbox_.end(), bytes.begin(), bytes.end());
        complete_read();
    }

    std::vector<std::vector<uint8_t>> writes() {
        std::lock_guard<std::mutex> lk(mtx_);
        return writes_;
    }

    // Only the data frames the host wrote, decoded.
    std::vector<std::vector<uint8_t>> data_frames() {
        std::vector<std::vector<uint8_t>> out;
        for (const auto& w : writes()) {
            DecodeResult r = decode_frame(w);
            if (r.status == DecodeStatus::Ok && r.frame->kind() == FrameKind::Data)
                out.push_back(r.frame->payload());
        }
        return out;
    }

    bool wait_for_writes(size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [&] { return writes_.size() >= n; });
    }

    bool closed() {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

private:
    friend class FakeLink;

    void complete_read() {
        if (!pending_handler_)
            return;
        if (read_error_) {
            auto h = std::move(pending_handler_);
            pending_handler_ = nullptr;
            asio::post(*io_, [h, ec = read_error_]() { h(ec, 0); });
            return;
        }
        if (inbox_.empty())
            return;
        size_t n = std::min(inbox_.size(), pending_buf_.size());
        auto* dst = static_cast<uint8_t*>(pending_buf_.data());
        for (size_t i = 0; i < n; i++) {
            dst[i] = inbox_.front();
            inbox_.pop_front();
        }
        auto h = std::move(pending_handler_);
        pending_handler_ = nullptr;
        asio::post(*io_, [h, n]() { h(std::error_code(), n); });
    }

    void record_write(const std::vector<uint8_t>& data) {
        Responder r;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            writes_.push_back(data);
            r = responder_;
        }
        cv_.notify_all();
        if (r)
            r(*this, data);
    }

    asio::io_context* io_{nullptr};
    std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<std::vector<uint8_t>> writes_;
    Responder responder_;
    bool closed_{false};

    // Link thread only.
    std::deque<uint8_t> inbox_;
    asio::mutable_buffer pending_buf_;
    Link::ReadHandler pending_handler_;
    std::error_code read_error_;
};

class FakeLink : public Link {
public:
    FakeLink(asio::io_context& io, std::shared_ptr<FakeWire> wire) : io_(io), wire_(std::move(wire)) {
        wire_->io_ = &io_;
    }

    void async_read_some(asio::mutable_buffer buf, ReadHandler h) override {
        wire_->pending_buf_ = buf;
        wire_->pending_handler_ = std::move(h);
        wire_->complete_read();
    }

    void async_write(const std::vector<uint8_t>& data, WriteHandler h) override {
        wire_->record_write(data);
        asio::post(io_, [h]() { h(std::error_code()); });
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lk(wire_->mtx_);
            wire_->closed_ = true;
        }
        if (wire_->pending_handler_) {
            auto h = std::move(wire_->pending_handler_);
            wire_->pending_handler_ = nullptr;
            asio::post(io_, [h]() { h(asio::error::operation_aborted, 0); });
        }
    }

    std::string describe() const override { return "fake"; }

private:
    asio::io_context& io_;
    std::shared_ptr<FakeWire> wire_;
};

inline LinkFactory fake_link_factory(std::shared_ptr<FakeWire> wire) {
    return [wire](asio::io_context& io) { return std::unique_ptr<Link>(new FakeLink(io, wire)); };
}

// Complete data frame bytes for a raw command.
inline std::vector<uint8_t> data_frame(std::vector<uint8_t> frame_payload) {
    return encode_data(frame_payload);
}

inline ExecutorOptions fast_options() {
    ExecutorOptions o;
    o.max_attempts = 3;
    o.ack_timeout = std::chrono::milliseconds(60);
    o.response_timeout = std::chrono::milliseconds(120);
    o.callback_timeout = std::chrono::milliseconds(120);
    o.retry_delay = std::chrono::milliseconds(1);
    return o;
}

} // namespace test
} // namespace zwlink
