#include <doctest/doctest.h>
#include "commands.hpp"
#include "errors.hpp"
#include "fake_link.hpp"
#include "transport_actor.hpp"
#include <atomic>
#include <thread>

using namespace zwlink;
using namespace zwlink::test;

namespace {

using Replies = std::function<std::vector<std::vector<uint8_t>>(const RawCommand&)>;

// Acknowledges every data frame the host writes and answers with the frame
// payloads `replies` returns for it.
FakeWire::Responder controller_script(Replies replies) {
    return [replies](FakeWire& wire, const std::vector<uint8_t>& written) {
        DecodeResult r = decode_frame(written);
        if (r.status != DecodeStatus::Ok || r.frame->kind() != FrameKind::Data)
            return;
        wire.reply({0x06});
        RawCommand raw;
        if (RawCommand::parse(r.frame->payload(), raw))
            return;
        for (const auto& p : replies(raw))
            wire.reply(data_frame(p));
    };
}

ExecutionResult wait_result(std::future<ExecutionResult>& f) {
    REQUIRE(f.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
    return f.get();
}

ExecutorOptions patient_options() {
    ExecutorOptions o = fast_options();
    o.response_timeout = std::chrono::milliseconds(3000);
    o.callback_timeout = std::chrono::milliseconds(3000);
    return o;
}

} // namespace

TEST_CASE("SendData runs through response and callback") {
    auto wire = std::make_shared<FakeWire>();
    wire->set_responder(controller_script([](const RawCommand& raw) {
        uint8_t cb_id = raw.payload.back();
        return std::vector<std::vector<uint8_t>>{{0x01, 0x13, 0x01}, {0x00, 0x13, cb_id, 0x00, 0x00, 0x02}};
    }));
    TransportActor actor(fake_link_factory(wire), fast_options());
    actor.start();

    auto f = actor.execute(std::make_shared<SendDataRequest>(5, std::vector<uint8_t>{0x20, 0x01, 0xFF}));
    ExecutionResult r = wait_result(f);
    CHECK(r.ok());
    REQUIRE(r.response);
    REQUIRE(r.callback);
    CHECK(r.callback->callback_id() == 1);
    CHECK(actor.callback_ids().outstanding() == 0);
    CHECK(actor.correlator()->size() == 0);

    auto frames = wire->data_frames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == std::vector<uint8_t>{0x00, 0x13, 0x05, 0x03, 0x20, 0x01, 0xFF, 0x25, 0x01});

    // Both inbound data frames were acknowledged.
    REQUIRE(wire->wait_for_writes(3));
    auto writes = wire->writes();
    CHECK(writes[1] == std::vector<uint8_t>{0x06});
    CHECK(writes[2] == std::vector<uint8_t>{0x06});
}

TEST_CASE("callback ids advance between commands") {
    auto wire = std::make_shared<FakeWire>();
    wire->set_responder(controller_script([](const RawCommand& raw) {
        uint8_t cb_id = raw.payload.back();
        return std::vector<std::vector<uint8_t>>{{0x01, 0x13, 0x01}, {0x00, 0x13, cb_id, 0x00}};
    }));
    TransportActor actor(fake_link_factory(wire), fast_options());
    actor.start();

    auto f1 = actor.execute(std::make_shared<SendDataRequest>(5, std::vector<uint8_t>{0x20, 0x02}));
    auto f2 = actor.execute(std::make_shared<SendDataRequest>(6, std::vector<uint8_t>{0x20, 0x02}));
    ExecutionResult r1 = wait_result(f1);
    ExecutionResult r2 = wait_result(f2);
    CHECK(r1.ok());
    CHECK(r2.ok());
    REQUIRE(r1.callback);
    REQUIRE(r2.callback);
    CHECK(r1.callback->callback_id() == 1);
    CHECK(r2.callback->callback_id() == 2);
}

TEST_CASE("only one command is in flight at a time") {
    auto wire = std::make_shared<FakeWire>();
    // Acknowledge but leave the response to the test.
    wire->set_responder(controller_script([](const RawCommand&) { return std::vector<std::vector<uint8_t>>{}; }));
    TransportActor actor(fake_link_factory(wire), patient_options());
    actor.start();

    auto f1 = actor.execute(std::make_shared<GetControllerIdRequest>());
    auto f2 = actor.execute(std::make_shared<GetControllerCapabilitiesRequest>());
    REQUIRE(wire->wait_for_writes(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    CHECK(wire->data_frames().size() == 1);

    wire->inject(data_frame({0x01, 0x20, 0xC0, 0xFF, 0xEE, 0x01, 0x01}));
    ExecutionResult r1 = wait_result(f1);
    CHECK(r1.ok());

    REQUIRE(wire->wait_for_writes(3));
    auto frames = wire->data_frames();
    REQUIRE(frames.size() == 2);
    CHECK(frames[1] == std::vector<uint8_t>{0x00, 0x05});

    wire->inject(data_frame({0x01, 0x05, 0x08}));
    ExecutionResult r2 = wait_result(f2);
    CHECK(r2.ok());
    auto caps = std::dynamic_pointer_cast<const GetControllerCapabilitiesResponse>(r2.response);
    REQUIRE(caps);
    CHECK(caps->is_suc == false);
}

TEST_CASE("unacknowledged frames are retransmitted") {
    auto wire = std::make_shared<FakeWire>();
    std::atomic<int> seen{0};
    wire->set_responder([&seen](FakeWire& w, const std::vector<uint8_t>& written) {
        DecodeResult r = decode_frame(written);
        if (r.status != DecodeStatus::Ok || r.frame->kind() != FrameKind::Data)
            return;
        if (seen++ == 0) {
            w.reply({0x15});
            return;
        }
        w.reply({0x06});
        w.reply(data_frame({0x01, 0x20, 0x00, 0x00, 0x00, 0x01, 0x01}));
    });
    TransportActor actor(fake_link_factory(wire), fast_options());
    actor.start();

    auto f = actor.execute(std::make_shared<GetControllerIdRequest>());
    ExecutionResult r = wait_result(f);
    CHECK(r.ok());
    CHECK(r.attempts == 2);
    CHECK(wire->data_frames().size() == 2);
}

TEST_CASE("unsolicited commands reach subscribers") {
    auto wire = std::make_shared<FakeWire>();
    TransportActor actor(fake_link_factory(wire), fast_options());
    auto got = std::make_shared<std::promise<CommandPtr>>();
    auto fut = got->get_future();
    uint64_t sub = actor.subscribe([got](CommandPtr cmd) { got->set_value(cmd); });
    CHECK(sub != 0);
    actor.start();

    wire->inject(data_frame({0x00, 0x04, 0x00, 0x0C, 0x03, 0x25, 0x03, 0xFF}));
    REQUIRE(fut.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
    auto ac = std::dynamic_pointer_cast<const ApplicationCommandRequest>(fut.get());
    REQUIRE(ac);
    CHECK(ac->source_node_id == 12);

    REQUIRE(wire->wait_for_writes(1));
    CHECK(wire->writes()[0] == std::vector<uint8_t>{0x06});
    actor.unsubscribe(sub);
}

TEST_CASE("corrupt and malformed frames are NAKed") {
    auto wire = std::make_shared<FakeWire>();
    TransportActor actor(fake_link_factory(wire), fast_options());
    actor.start();

    wire->inject({0x01, 0x03, 0x00, 0x02, 0xFF});
    REQUIRE(wire->wait_for_writes(1));
    CHECK(wire->writes()[0] == std::vector<uint8_t>{0x15});

    // Valid frame whose payload is too short to hold a command.
    wire->inject(data_frame({0x00}));
    REQUIRE(wire->wait_for_writes(2));
    CHECK(wire->writes()[1] == std::vector<uint8_t>{0x15});
}

TEST_CASE("link failure fails the active and later commands") {
    auto wire = std::make_shared<FakeWire>();
    wire->set_responder(controller_script([](const RawCommand&) { return std::vector<std::vector<uint8_t>>{}; }));
    TransportActor actor(fake_link_factory(wire), patient_options());
    actor.start();

    auto f1 = actor.execute(std::make_shared<GetControllerIdRequest>());
    auto f2 = actor.execute(std::make_shared<GetControllerCapabilitiesRequest>());
    REQUIRE(wire->wait_for_writes(1));
    wire->fail_link();

    CHECK(wait_result(f1).error == errc::link_closed);
    CHECK(wait_result(f2).error == errc::link_closed);
    auto f3 = actor.execute(std::make_shared<GetControllerIdRequest>());
    CHECK(wait_result(f3).error == errc::link_closed);
    CHECK(wire->closed());
}

TEST_CASE("stop aborts pending commands and rejects new ones") {
    auto wire = std::make_shared<FakeWire>();
    wire->set_responder(controller_script([](const RawCommand&) { return std::vector<std::vector<uint8_t>>{}; }));
    TransportActor actor(fake_link_factory(wire), patient_options());
    actor.start();
    CHECK(actor.running());

    auto f1 = actor.execute(std::make_shared<GetControllerIdRequest>());
    auto f2 = actor.execute(std::make_shared<GetControllerCapabilitiesRequest>());
    REQUIRE(wire->wait_for_writes(1));
    actor.stop();
    CHECK_FALSE(actor.running());

    CHECK(wait_result(f1).error == errc::aborted);
    CHECK(wait_result(f2).error == errc::aborted);
    auto f3 = actor.execute(std::make_shared<GetControllerIdRequest>());
    CHECK(wait_result(f3).error == errc::aborted);
    CHECK(wire->closed());
    CHECK(actor.correlator()->size() == 0);
}

TEST_CASE("commands submitted before start run once the link starts") {
    auto wire = std::make_shared<FakeWire>();
    wire->set_responder(controller_script([](const RawCommand&) {
        return std::vector<std::vector<uint8_t>>{{0x01, 0x20, 0xC0, 0xFF, 0xEE, 0x01, 0x01}};
    }));
    TransportActor actor(fake_link_factory(wire), fast_options());

    auto f = actor.execute(std::make_shared<GetControllerIdRequest>());
    CHECK(f.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
    CHECK(wire->writes().empty());

    actor.start();
    ExecutionResult r = wait_result(f);
    CHECK(r.ok());
    CHECK(wire->data_frames().size() == 1);
}

TEST_CASE("an actor that never started aborts what was submitted") {
    std::future<ExecutionResult> f;
    auto handled = std::make_shared<std::promise<ExecutionResult>>();
    auto handled_f = handled->get_future();
    {
        auto wire = std::make_shared<FakeWire>();
        TransportActor actor(fake_link_factory(wire), fast_options());
        f = actor.execute(std::make_shared<GetControllerIdRequest>());
        actor.submit(std::make_shared<SoftResetRequest>(),
                     [handled](ExecutionResult r) { handled->set_value(std::move(r)); });
    }
    REQUIRE(f.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    CHECK(f.get().error == errc::aborted);
    REQUIRE(handled_f.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    CHECK(handled_f.get().error == errc::aborted);
}

TEST_CASE("a subscriber can wait on a command it executes") {
    auto wire = std::make_shared<FakeWire>();
    wire->set_responder(controller_script([](const RawCommand& raw) {
        if (raw.function != FunctionType::GetControllerId)
            return std::vector<std::vector<uint8_t>>{};
        return std::vector<std::vector<uint8_t>>{{0x01, 0x20, 0xC0, 0xFF, 0xEE, 0x01, 0x01}};
    }));
    TransportActor actor(fake_link_factory(wire), patient_options());
    auto answered = std::make_shared<std::promise<ExecutionResult>>();
    auto answered_f = answered->get_future();
    actor.subscribe([&actor, answered](CommandPtr cmd) {
        if (cmd->function_type() != FunctionType::ApplicationCommand)
            return;
        auto f = actor.execute(std::make_shared<GetControllerIdRequest>());
        answered->set_value(f.get());
    });
    actor.start();

    wire->inject(data_frame({0x00, 0x04, 0x00, 0x0C, 0x02, 0x20, 0x03}));
    REQUIRE(answered_f.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
    ExecutionResult r = answered_f.get();
    CHECK(r.ok());
    auto ids = std::dynamic_pointer_cast<const GetControllerIdResponse>(r.response);
    REQUIRE(ids);
    CHECK(ids->home_id == 0xC0FFEE01u);
    actor.stop();
}
