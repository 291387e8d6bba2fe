#include <doctest/doctest.h>
#include "storage.hpp"
#include <atomic>
#include <thread>

using namespace zwlink;

TEST_CASE("controller storage keeps identification results") {
    ControllerStorage c;
    CHECK(c.home_id() == 0);
    CHECK(c.encoding_context().own_node_id == 1);

    c.set_ids(0xC0FFEE01u, 5);
    c.update([](ControllerInfo& info) {
        info.is_suc = true;
        info.supported_function_types = {FunctionType::SendData, FunctionType::GetControllerId};
    });
    CHECK(c.home_id() == 0xC0FFEE01u);
    CHECK(c.own_node_id() == 5);
    CHECK(c.snapshot().is_suc);
    CHECK(c.supports_function(FunctionType::SendData));
    CHECK_FALSE(c.supports_function(FunctionType::RequestNodeInfo));

    EncodingContext ctx = c.encoding_context();
    CHECK(ctx.own_node_id == 5);
    CHECK(ctx.node_id_type == NodeIdType::NodeId8Bit);
    c.set_node_id_type(NodeIdType::NodeId16Bit);
    CHECK(c.encoding_context().node_id_type == NodeIdType::NodeId16Bit);

    CHECK_FALSE(c.suc_node_id());
    c.set_suc_node_id(NodeId(1));
    REQUIRE(c.suc_node_id());
    CHECK(*c.suc_node_id() == 1);
    c.update([](ControllerInfo& info) { info.role = ControllerRole::Secondary; });
    CHECK(c.role() == ControllerRole::Secondary);
}

TEST_CASE("interview stage advances only from the expected stage") {
    NodeStorage node(3);
    CHECK(node.interview_stage() == InterviewStage::None);
    CHECK(node.try_advance_interview_stage(InterviewStage::None, InterviewStage::ProtocolInfo));
    CHECK_FALSE(node.try_advance_interview_stage(InterviewStage::None, InterviewStage::ProtocolInfo));
    CHECK(node.interview_stage() == InterviewStage::ProtocolInfo);
}

TEST_CASE("concurrent stage transitions let exactly one caller win") {
    NodeStorage node(3);
    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++)
        threads.emplace_back([&]() {
            if (node.try_advance_interview_stage(InterviewStage::None, InterviewStage::ProtocolInfo))
                wins++;
        });
    for (auto& t : threads)
        t.join();
    CHECK(wins.load() == 1);
}

TEST_CASE("value cache stores, replaces and erases") {
    NodeStorage node(7);
    ValueId level{0x26, 0x03, std::nullopt};
    ValueId keyed{0x26, 0x03, 1u};
    CHECK(level < keyed);
    CHECK_FALSE(level == keyed);

    node.set_value(level, int32_t(42));
    node.set_value(keyed, std::string("on"));
    CHECK(node.value_count() == 2);
    auto v = node.value(level);
    REQUIRE(v);
    CHECK(std::get<int32_t>(*v) == 42);

    node.set_value(level, int32_t(7));
    CHECK(std::get<int32_t>(*node.value(level)) == 7);
    CHECK(node.value_count() == 2);

    CHECK(node.erase_value(keyed));
    CHECK_FALSE(node.erase_value(keyed));
    CHECK_FALSE(node.value(keyed));
}

TEST_CASE("protocol info is absent until set") {
    NodeStorage node(2);
    CHECK_FALSE(node.protocol_info());
    NodeProtocolInfo info;
    info.listening = true;
    info.generic_device_class = 0x10;
    node.set_protocol_info(info);
    REQUIRE(node.protocol_info());
    CHECK(*node.protocol_info() == info);
}

TEST_CASE("node registry adds idempotently") {
    NodeRegistry reg;
    auto a = reg.add(4);
    auto b = reg.add(4);
    CHECK(a == b);
    reg.add(1);
    CHECK(reg.size() == 2);
    CHECK(reg.ids() == std::vector<NodeId>{1, 4});
    CHECK(reg.get(4) == a);
    CHECK(reg.remove(4));
    CHECK_FALSE(reg.remove(4));
    CHECK_FALSE(reg.get(4));
    // Holders keep the node alive after removal.
    CHECK(a->id() == 4);
}
