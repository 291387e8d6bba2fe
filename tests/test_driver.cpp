#include <doctest/doctest.h>
#include "commands.hpp"
#include "driver.hpp"
#include "fake_link.hpp"
#include <atomic>
#include <initializer_list>
#include <string>
#include <thread>

using namespace zwlink;
using namespace zwlink::test;

namespace {

using Payloads = std::vector<std::vector<uint8_t>>;

std::vector<uint8_t> function_bitmask(std::initializer_list<uint8_t> functions) {
    std::vector<uint8_t> mask(kFunctionBitmaskLen, 0);
    for (uint8_t f : functions)
        mask[(f - 1) / 8] |= (uint8_t)(1u << ((f - 1) % 8));
    return mask;
}

// A 700 series bridge controller with home id 0xC0FFEE01, node id 1, SUC 1,
// and one end node (5). Node ids are 8 bit until SetNodeIDType switches them.
struct ScriptedController {
    bool respond{true};
    bool wide{false};

    void node_id(std::vector<uint8_t>& out, uint8_t id) const {
        if (wide)
            out.push_back(0x00);
        out.push_back(id);
    }

    Payloads answer(const RawCommand& raw) {
        switch (raw.function) {
        case FunctionType::GetSerialApiCapabilities: {
            std::vector<uint8_t> p{0x01, 0x07, 0x07, 0x12, 0x00, 0x86, 0x00, 0x01, 0x00, 0x5A};
            auto mask = function_bitmask({0x02, 0x05, 0x07, 0x0B, 0x13, 0x15, 0x20, 0x41, 0x56});
            p.insert(p.end(), mask.begin(), mask.end());
            return {p};
        }
        case FunctionType::GetControllerVersion: {
            std::string v = "Z-Wave 7.18";
            std::vector<uint8_t> p{0x01, 0x15};
            p.insert(p.end(), v.begin(), v.end());
            p.push_back(0x00);
            p.push_back(0x07);
            return {p};
        }
        case FunctionType::SerialApiSetup:
            if (raw.payload.size() == 2 && raw.payload[0] == 0x80 && raw.payload[1] == 0x02) {
                wide = true;
                return {{0x01, 0x0B, 0x80, 0x01}};
            }
            return {{0x01, 0x0B, 0x00}};
        case FunctionType::GetControllerId: {
            std::vector<uint8_t> p{0x01, 0x20, 0xC0, 0xFF, 0xEE, 0x01};
            node_id(p, 1);
            return {p};
        }
        case FunctionType::GetControllerCapabilities:
            return {{0x01, 0x05, 0x10}};
        case FunctionType::GetSucNodeId: {
            std::vector<uint8_t> p{0x01, 0x56};
            node_id(p, 1);
            return {p};
        }
        case FunctionType::GetSerialApiInitData: {
            std::vector<uint8_t> p{0x01, 0x02, 0x08, 0x08, kNodeBitmaskLen};
            std::vector<uint8_t> mask(kNodeBitmaskLen, 0);
            mask[0] = 0x11;
            p.insert(p.end(), mask.begin(), mask.end());
            p.push_back(0x07);
            p.push_back(0x00);
            return {p};
        }
        case FunctionType::GetNodeProtocolInfo:
            if (!raw.payload.empty() && raw.payload.back() == 5)
                return {{0x01, 0x41, 0xD3, 0x4C, 0x01, 0x04, 0x10, 0x01}};
            return {{0x01, 0x41, 0xD3, 0x16, 0x01, 0x02, 0x02, 0x07}};
        default:
            return {};
        }
    }
};

// Runs on the link thread only.
FakeWire::Responder scripted_controller(std::shared_ptr<ScriptedController> ctrl) {
    return [ctrl](FakeWire& wire, const std::vector<uint8_t>& written) {
        DecodeResult r = decode_frame(written);
        if (r.status != DecodeStatus::Ok || r.frame->kind() != FrameKind::Data)
            return;
        wire.reply({0x06});
        RawCommand raw;
        if (!ctrl->respond || RawCommand::parse(r.frame->payload(), raw))
            return;
        for (const auto& p : ctrl->answer(raw))
            wire.reply(data_frame(p));
    };
}

FakeWire::Responder scripted_controller(bool respond) {
    auto ctrl = std::make_shared<ScriptedController>();
    ctrl->respond = respond;
    return scripted_controller(ctrl);
}

DriverConfig test_config() {
    DriverConfig cfg;
    cfg.port = "fake";
    cfg.exec = fast_options();
    cfg.exec.response_timeout = std::chrono::milliseconds(1000);
    return cfg;
}

template <typename Pred>
bool eventually(Pred pred) {
    for (int i = 0; i < 300; i++) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace

TEST_CASE("identify_controller fills controller and node storage") {
    auto wire = std::make_shared<FakeWire>();
    wire->set_responder(scripted_controller(true));
    Driver driver(fake_link_factory(wire), test_config());
    driver.start();

    REQUIRE_FALSE(driver.identify_controller());

    ControllerInfo c = driver.controller().snapshot();
    CHECK(c.home_id == 0xC0FFEE01u);
    CHECK(c.own_node_id == 1);
    CHECK(c.is_suc);
    CHECK(c.is_sis);
    CHECK(c.role == ControllerRole::Primary);
    CHECK(c.api_version == 8);
    CHECK(c.chip_type == 0x07);
    CHECK(c.firmware_major == 7);
    CHECK(c.firmware_minor == 0x12);
    CHECK(c.manufacturer_id == 0x0086);
    CHECK(c.product_type == 0x0001);
    CHECK(c.product_id == 0x005A);
    CHECK(c.library_version == "Z-Wave 7.18");
    CHECK(c.library_type == LibraryType::BridgeController);
    CHECK(driver.controller().supports_function(FunctionType::SendData));
    CHECK_FALSE(driver.controller().supports_function(FunctionType::RequestNodeInfo));
    REQUIRE(c.suc_node_id);
    CHECK(*c.suc_node_id == 1);
    CHECK(driver.controller().encoding_context().node_id_type == NodeIdType::NodeId8Bit);

    CHECK(driver.nodes().ids() == std::vector<NodeId>{1, 5});
    auto node = driver.nodes().get(5);
    REQUIRE(node);
    auto info = node->protocol_info();
    REQUIRE(info);
    CHECK(info->node_type == NodeType::EndNode);
    CHECK(info->generic_device_class == 0x10);
    CHECK(node->interview_stage() == InterviewStage::ProtocolInfo);

    auto own = driver.nodes().get(1)->protocol_info();
    REQUIRE(own);
    CHECK(own->node_type == NodeType::Controller);
    CHECK(own->beaming);

    // Serial API capabilities, version, controller id, capabilities, SUC,
    // init data and one protocol info per node.
    auto frames = wire->data_frames();
    REQUIRE(frames.size() == 8);
    CHECK(frames[0] == std::vector<uint8_t>{0x00, 0x07});
    CHECK(frames[1] == std::vector<uint8_t>{0x00, 0x15});
    CHECK(frames[4] == std::vector<uint8_t>{0x00, 0x56});
    driver.stop();
}

TEST_CASE("identify_controller switches to 16 bit node ids on request") {
    auto wire = std::make_shared<FakeWire>();
    auto ctrl = std::make_shared<ScriptedController>();
    wire->set_responder(scripted_controller(ctrl));
    DriverConfig cfg = test_config();
    cfg.node_id_type = NodeIdType::NodeId16Bit;
    Driver driver(fake_link_factory(wire), cfg);
    driver.start();

    REQUIRE_FALSE(driver.identify_controller());
    CHECK(driver.controller().encoding_context().node_id_type == NodeIdType::NodeId16Bit);
    CHECK(driver.controller().own_node_id() == 1);
    REQUIRE(driver.controller().suc_node_id());
    CHECK(*driver.controller().suc_node_id() == 1);

    auto frames = wire->data_frames();
    REQUIRE(frames.size() == 9);
    CHECK(frames[2] == std::vector<uint8_t>{0x00, 0x0B, 0x80, 0x02});
    // Protocol info requests carry two byte node ids after the switch.
    CHECK(frames[7] == std::vector<uint8_t>{0x00, 0x41, 0x00, 0x01});
    CHECK(frames[8] == std::vector<uint8_t>{0x00, 0x41, 0x00, 0x05});
    auto node = driver.nodes().get(5);
    REQUIRE(node);
    REQUIRE(node->protocol_info());
    CHECK(node->protocol_info()->node_type == NodeType::EndNode);
    driver.stop();
}

TEST_CASE("identify_controller reports the failing step") {
    auto wire = std::make_shared<FakeWire>();
    wire->set_responder(scripted_controller(false));
    DriverConfig cfg = test_config();
    cfg.exec.response_timeout = std::chrono::milliseconds(100);
    Driver driver(fake_link_factory(wire), cfg);
    driver.start();

    CHECK(driver.identify_controller() == errc::response_timeout);
    CHECK(driver.controller().home_id() == 0);
    CHECK(driver.nodes().size() == 0);
}

TEST_CASE("execute_for rejects a response of the wrong type") {
    auto wire = std::make_shared<FakeWire>();
    wire->set_responder(scripted_controller(true));
    Driver driver(fake_link_factory(wire), test_config());
    driver.start();

    std::error_code ec;
    auto caps = driver.execute_for<GetControllerCapabilitiesResponse>(std::make_shared<GetControllerIdRequest>(), ec);
    CHECK_FALSE(caps);
    CHECK(ec == errc::unexpected_response);

    auto ids = driver.execute_for<GetControllerIdResponse>(std::make_shared<GetControllerIdRequest>(), ec);
    REQUIRE(ids);
    CHECK_FALSE(ec);
    CHECK(ids->own_node_id == 1);
}

TEST_CASE("unsolicited updates keep the node cache current") {
    auto wire = std::make_shared<FakeWire>();
    Driver driver(fake_link_factory(wire), test_config());
    driver.start();

    wire->inject(data_frame({0x00, 0x49, 0x40, 0x09, 0x03, 0x04, 0x10, 0x01}));
    REQUIRE(eventually([&] { return driver.nodes().get(9) != nullptr; }));

    wire->inject(data_frame({0x00, 0x04, 0x00, 0x09, 0x03, 0x25, 0x03, 0xFF}));
    ValueId vid{0x25, 0x03, std::nullopt};
    REQUIRE(eventually([&] { return driver.nodes().get(9)->value(vid).has_value(); }));
    auto v = driver.nodes().get(9)->value(vid);
    CHECK(std::get<std::vector<uint8_t>>(*v) == std::vector<uint8_t>{0xFF});

    wire->inject(data_frame({0x00, 0x49, 0x10, 0x02, 0x00}));
    REQUIRE(eventually([&] { return driver.controller().suc_node_id().has_value(); }));
    CHECK(*driver.controller().suc_node_id() == 2);

    wire->inject(data_frame({0x00, 0x49, 0x20, 0x09, 0x00}));
    CHECK(eventually([&] { return driver.nodes().get(9) == nullptr; }));
}

TEST_CASE("awaited commands are claimed before subscribers see them") {
    auto wire = std::make_shared<FakeWire>();
    std::atomic<int> forwarded{0};
    Driver driver(fake_link_factory(wire), test_config());
    driver.on_unsolicited([&forwarded](CommandPtr) { forwarded++; });
    driver.start();

    std::thread injector([wire]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        wire->inject(data_frame({0x00, 0x04, 0x00, 0x0C, 0x02, 0x20, 0x03}));
    });
    std::error_code ec;
    CommandPtr cmd = driver.await_command(
        [](const Command& c) { return c.function_type() == FunctionType::ApplicationCommand; },
        std::chrono::milliseconds(3000), ec);
    injector.join();
    CHECK_FALSE(ec);
    REQUIRE(cmd);
    auto ac = std::dynamic_pointer_cast<const ApplicationCommandRequest>(cmd);
    REQUIRE(ac);
    CHECK(ac->source_node_id == 12);

    cmd = driver.await_command([](const Command&) { return false; }, std::chrono::milliseconds(20), ec);
    CHECK_FALSE(cmd);
    CHECK(ec == errc::timeout);

    driver.stop();
    CHECK(forwarded.load() == 0);
}
