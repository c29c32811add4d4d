#include <doctest/doctest.h>
#include "fake_channel.hpp"
#include "ventilink/binding.hpp"

#include <vector>

using namespace ventilink;
using ventilink::testing::Request;
using ventilink::testing::Rig;
using transport::ChannelStatus;

static constexpr uint8_t GW = DEFAULT_GATEWAY_ADDRESS;

struct Step {
    Request::Kind         kind;
    uint16_t              address;
    std::vector<uint16_t> words;
};

static void check_sequence(const std::vector<Request>& got, const std::vector<Step>& want) {
    REQUIRE(got.size() == want.size());
    for (std::size_t i = 0; i < want.size(); ++i) {
        CAPTURE(i);
        CHECK(got[i].unit == GW);
        CHECK(got[i].kind == want[i].kind);
        CHECK(got[i].address == want[i].address);
        if (want[i].kind == Request::Write) CHECK(got[i].words == want[i].words);
    }
}

TEST_CASE("Binding command word packs address and mode") {
    CHECK(binding_command_word(12, BindingMode::OutgoingSingleProduct) == 0x0C03);
    CHECK(binding_command_word(12, BindingMode::IncomingOnExistingNode) == 0x0C14);
}

TEST_CASE("Bind a controller: abort, idle check, product, node, command") {
    Rig rig;
    Bridge bridge(rig.client);
    BindingController binder(bridge);

    Error err;
    REQUIRE(binder.bind_controller(12, ProductId::VMD_02RPS78, std::nullopt, err));
    check_sequence(rig.ch->requests, {
        {Request::Write, 43004, {0x00C8}},
        {Request::Read,  43900, {}},
        {Request::Write, 43000, {0xC892, 0x0001}},
        {Request::Write, 43005, {12}},
        {Request::Write, 43004, {0x0C03}},
    });
}

TEST_CASE("Bind a controller with a serial number") {
    Rig rig;
    Bridge bridge(rig.client);
    BindingController binder(bridge);

    Error err;
    REQUIRE(binder.bind_controller(30, ProductId::VMD_02RPS78, 0x00012345u, err));
    check_sequence(rig.ch->requests, {
        {Request::Write, 43004, {0x00C8}},
        {Request::Read,  43900, {}},
        {Request::Write, 43000, {0xC892, 0x0001}},
        {Request::Write, 43005, {30}},
        {Request::Write, 43002, {0x2345, 0x0001}},
        {Request::Write, 43004, {0x1E04}},
    });
}

TEST_CASE("Bind an accessory to an existing controller") {
    Rig rig;
    Bridge bridge(rig.client);
    BindingController binder(bridge);

    Error err;
    REQUIRE(binder.bind_accessory(12, 40, ProductId::VMN_05LM02, err));
    check_sequence(rig.ch->requests, {
        {Request::Write, 43004, {0x00C8}},
        {Request::Read,  43900, {}},
        {Request::Write, 43000, {0xC83E, 0x0001}},
        {Request::Write, 43005, {40}},
        {Request::Write, 43004, {0x2814}},
    });
}

TEST_CASE("A gateway that is not idle gets nothing past the abort") {
    Rig rig;
    Bridge bridge(rig.client);
    BindingController binder(bridge);
    rig.ch->set_u16(GW, 43900, 3);

    Error err;
    CHECK_FALSE(binder.bind_controller(12, ProductId::VMD_02RPS78, std::nullopt, err));
    CHECK(err.kind == ErrorKind::Binding);
    CHECK(err.reason == "not_ready_for_binding:3");
    CHECK(rig.ch->requests.size() == 2);
    CHECK(rig.ch->count(Request::Write) == 1);
}

TEST_CASE("Addresses outside 2..247 or equal to the gateway are rejected without I/O") {
    Rig rig;
    Bridge bridge(rig.client);
    BindingController binder(bridge);

    for (uint8_t bad : {uint8_t(0), uint8_t(1), uint8_t(248), uint8_t(GW)}) {
        CAPTURE(int(bad));
        Error err;
        CHECK_FALSE(binder.bind_controller(bad, ProductId::VMD_02RPS78, std::nullopt, err));
        CHECK(err.kind == ErrorKind::InvalidArgument);
    }
    Error err;
    CHECK_FALSE(binder.bind_accessory(1, 40, ProductId::VMN_05LM02, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK(rig.ch->requests.empty());
}

TEST_CASE("A failing step is reported as a binding error naming the step") {
    Rig rig;
    Bridge bridge(rig.client);
    BindingController binder(bridge);
    rig.ch->fail_write(GW, 43005, ChannelStatus::Exception, transport::exception_code::DEVICE_FAILURE);

    Error err;
    CHECK_FALSE(binder.bind_controller(12, ProductId::VMD_02RPS78, std::nullopt, err));
    CHECK(err.kind == ErrorKind::Binding);
    CHECK(err.reason.find("create_node") != std::string::npos);
    CHECK(err.exception_code == 4);
    CHECK(rig.ch->requests.size() == 4);
}

TEST_CASE("Unbind writes the node address to the remove register") {
    Rig rig;
    Bridge bridge(rig.client);
    BindingController binder(bridge);

    Error err;
    REQUIRE(binder.unbind(12, err));
    check_sequence(rig.ch->requests, {{Request::Write, 43399, {12}}});
}

TEST_CASE("Binding status never fails") {
    Rig rig;
    Bridge bridge(rig.client);
    BindingController binder(bridge);

    rig.ch->set_u16(GW, 43900, 2);
    CHECK(binder.bind_status() == BindingStatus::OutgoingBindingCompleted);

    rig.ch->set_u16(GW, 43900, 77);
    CHECK(binder.bind_status() == BindingStatus::NotAvailable);

    rig.ch->fail_read(GW, 43900, ChannelStatus::Exception, transport::exception_code::DEVICE_BUSY);
    CHECK(binder.bind_status() == BindingStatus::NotAvailable);

    CHECK(std::string(binding_status_name(BindingStatus::OutgoingFailedNoAnswer)) == "outgoing_failed_no_answer");
}
