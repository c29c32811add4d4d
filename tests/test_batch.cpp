#include <doctest/doctest.h>
#include "fake_channel.hpp"
#include "ventilink/batch.hpp"

using namespace ventilink;
using ventilink::testing::Request;
using ventilink::testing::Rig;
using transport::ChannelStatus;

static constexpr uint8_t UNIT = 5;
static constexpr uint8_t R = access::READ;

static const RegisterDescriptor kA = reg_u16(Property::FanSpeedExhaust, 10, R);
static const RegisterDescriptor kB = reg_u16(Property::FanSpeedSupply, 11, R);
static const RegisterDescriptor kC = reg_u32(Property::Uptime, 12, R);
static const RegisterDescriptor kD = reg_u16(Property::ErrorCode, 20, R);

TEST_CASE("plan_runs sorts by address and merges contiguous registers") {
    RegisterList regs{&kD, &kC, &kA, &kB};
    auto runs = plan_runs(regs);
    REQUIRE(runs.size() == 2);
    CHECK(runs[0].address == 10);
    CHECK(runs[0].count == 4);
    CHECK(runs[0].first == 0);
    CHECK(runs[0].last == 2);
    CHECK(runs[1].address == 20);
    CHECK(runs[1].count == 1);
    CHECK(regs[0] == &kA);
    CHECK(regs[3] == &kD);
}

TEST_CASE("plan_runs caps a run at 125 words") {
    static RegisterDescriptor strings[13];
    RegisterList regs;
    for (std::size_t i = 0; i < 13; ++i) {
        strings[i] = reg_string(node_slot_property(i), uint16_t(1000 + i * 10), 10, R);
        regs.push_back(&strings[i]);
    }
    auto runs = plan_runs(regs);
    REQUIRE(runs.size() == 2);
    CHECK(runs[0].count == 120);
    CHECK(runs[1].address == 1120);
    CHECK(runs[1].count == 10);
}

TEST_CASE("read_batch issues one read per run and decodes every register") {
    Rig rig;
    rig.ch->set_u16(UNIT, 10, 30);
    rig.ch->set_u16(UNIT, 11, 31);
    rig.ch->set_u32(UNIT, 12, 0x00020001);
    rig.ch->set_u16(UNIT, 20, 4);

    ValueMap out;
    Error err;
    REQUIRE(read_batch(rig.client, UNIT, {&kA, &kB, &kC, &kD}, out, err));

    REQUIRE(rig.ch->requests.size() == 2);
    CHECK(rig.ch->requests[0].address == 10);
    CHECK(rig.ch->requests[0].count == 4);
    CHECK(rig.ch->requests[1].address == 20);
    CHECK(rig.ch->requests[1].count == 1);

    REQUIRE(out.size() == 4);
    CHECK(std::get<int64_t>(out[Property::FanSpeedExhaust].value) == 30);
    CHECK(std::get<int64_t>(out[Property::FanSpeedSupply].value) == 31);
    CHECK(std::get<int64_t>(out[Property::Uptime].value) == 0x00020001);
    CHECK(std::get<int64_t>(out[Property::ErrorCode].value) == 4);
}

TEST_CASE("read_batch skips a run answered with acknowledge") {
    Rig rig;
    rig.ch->set_u16(UNIT, 20, 4);
    rig.ch->fail_read(UNIT, 10, ChannelStatus::Exception, transport::exception_code::ACKNOWLEDGE);

    ValueMap out;
    Error err;
    REQUIRE(read_batch(rig.client, UNIT, {&kA, &kB, &kC, &kD}, out, err));
    CHECK(out.size() == 1);
    CHECK(out.count(Property::ErrorCode) == 1);
    CHECK(out.count(Property::FanSpeedExhaust) == 0);
}

TEST_CASE("read_batch aborts on any other run failure") {
    Rig rig;
    rig.ch->fail_read(UNIT, 20, ChannelStatus::Exception, transport::exception_code::DEVICE_BUSY);

    ValueMap out;
    Error err;
    CHECK_FALSE(read_batch(rig.client, UNIT, {&kA, &kB, &kC, &kD}, out, err));
    CHECK(err.kind == ErrorKind::Busy);
}

TEST_CASE("read_batch drops only the register that fails to decode") {
    static const RegisterDescriptor name = reg_string(Property::ProductName, 30, 2, R);
    static const RegisterDescriptor after = reg_u16(Property::OemNumber, 32, R);
    Rig rig;
    rig.ch->set_u16(UNIT, 30, 0xFF41);
    rig.ch->set_u16(UNIT, 32, 7);

    ValueMap out;
    Error err;
    REQUIRE(read_batch(rig.client, UNIT, {&name, &after}, out, err));
    CHECK(rig.ch->requests.size() == 1);
    CHECK(out.count(Property::ProductName) == 0);
    CHECK(std::get<int64_t>(out[Property::OemNumber].value) == 7);
}

TEST_CASE("read_batch rejects empty and unreadable lists without I/O") {
    static const RegisterDescriptor write_only = reg_u16(Property::FilterReset, 42000, access::WRITE);
    Rig rig;
    ValueMap out;
    Error err;
    CHECK_FALSE(read_batch(rig.client, UNIT, {}, out, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK(err.reason == "empty_register_list");

    err.clear();
    CHECK_FALSE(read_batch(rig.client, UNIT, {&kA, &write_only}, out, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK(rig.ch->requests.empty());
}
