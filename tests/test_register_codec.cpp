#include <doctest/doctest.h>
#include "ventilink/bridge.hpp"
#include "ventilink/device.hpp"
#include "ventilink/register.hpp"
#include "ventilink/vmd.hpp"
#include "ventilink/vmn.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace ventilink;

static Payload decode_ok(const RegisterDescriptor& d, std::vector<uint16_t> words) {
    Payload p;
    Error err;
    REQUIRE(decode_value(d, words.data(), words.size(), p, err));
    return p;
}

static Error decode_err(const RegisterDescriptor& d, std::vector<uint16_t> words) {
    Payload p;
    Error err;
    CHECK_FALSE(decode_value(d, words.data(), words.size(), p, err));
    return err;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

TEST_CASE("U16 and I16 decode one word") {
    auto u = reg_u16(Property::FanSpeedSupply, 41002, access::READ);
    auto i = reg_i16(Property::TimezoneOffset, 41022, access::READ);
    CHECK(std::get<int64_t>(decode_ok(u, {0xFFFE})) == 65534);
    CHECK(std::get<int64_t>(decode_ok(i, {0xFFFE})) == -2);
}

TEST_CASE("U32 puts the low word first") {
    auto d = reg_u32(Property::Uptime, 41019, access::READ);
    CHECK(std::get<int64_t>(decode_ok(d, {0x5678, 0x1234})) == 0x12345678);

    Words out;
    Error err;
    REQUIRE(encode_value(d, int64_t(0x12345678), out, err));
    REQUIRE(out.size() == 2);
    CHECK(out[0] == 0x5678);
    CHECK(out[1] == 0x1234);
}

TEST_CASE("Float uses IEEE-754 single precision, low word first") {
    auto d = reg_float(Property::RfLoadLastHour, 42104, access::READ | access::WRITE);
    // 21.5f == 0x41AC0000
    CHECK(std::get<float>(decode_ok(d, {0x0000, 0x41AC})) == doctest::Approx(21.5));

    Words out;
    Error err;
    REQUIRE(encode_value(d, int64_t(2), out, err));  // integers are accepted for floats
    CHECK(out[0] == 0x0000);
    CHECK(out[1] == 0x4000);
}

TEST_CASE("Word count mismatch is a decode error") {
    auto d = reg_u32(Property::Uptime, 41019, access::READ);
    Error e = decode_err(d, {0x0001});
    CHECK(e.kind == ErrorKind::Decode);
    CHECK(starts_with(e.reason, "word_count:"));
}

TEST_CASE("String: high byte first, NUL padding stripped on decode and added on encode") {
    auto d = reg_string(Property::ProductName, 40011, 3, access::READ | access::WRITE);
    Payload p = decode_ok(d, {0x564D, 0x4400, 0x0000});
    CHECK(std::string(std::get<Text>(p).c_str()) == "VMD");

    Words out;
    Error err;
    REQUIRE(encode_value(d, Text("VMD"), out, err));
    REQUIRE(out.size() == 3);
    CHECK(out[0] == 0x564D);
    CHECK(out[1] == 0x4400);
    CHECK(out[2] == 0x0000);

    CHECK_FALSE(encode_value(d, Text("ABCDEFG"), out, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK(starts_with(err.reason, "string_too_long:"));
}

TEST_CASE("String with invalid UTF-8 fails to decode") {
    auto d = reg_string(Property::ProductName, 40011, 2, access::READ);
    Error e = decode_err(d, {0xFF41, 0x0000});
    CHECK(e.kind == ErrorKind::Decode);
    CHECK(starts_with(e.reason, "bad_utf8:"));

    // two-byte sequence for U+00E9 is fine
    Payload p = decode_ok(d, {0xC3A9, 0x0000});
    CHECK(std::get<Text>(p).size() == 2);
}

TEST_CASE("Date packs day, month and year into a U32") {
    auto d = reg_date(Property::ManufactureDate, 40007, access::READ | access::WRITE);
    // 7 March 2024 -> 0x070307E8
    Payload p = decode_ok(d, {0x07E8, 0x0703});
    CHECK(std::get<Date>(p) == Date{2024, 3, 7});

    Words out;
    Error err;
    REQUIRE(encode_value(d, Date{2024, 3, 7}, out, err));
    CHECK(out[0] == 0x07E8);
    CHECK(out[1] == 0x0703);

    // 31 February never exists
    Error e = decode_err(d, {0x07E8, 0x1F02});
    CHECK(e.kind == ErrorKind::Decode);

    // 29 February in a leap year does
    CHECK(std::get<Date>(decode_ok(d, {0x07E8, 0x1D02})) == Date{2024, 2, 29});
}

TEST_CASE("Unknown date and datetime sentinels") {
    auto plain = reg_date(Property::ManufactureDate, 40007, access::READ);
    CHECK(std::get<Date>(decode_ok(plain, {0xFFFF, 0xFFFF})) == Date::unknown());

    auto known = plain.adapt(adapt_known_date);
    Error e = decode_err(known, {0xFFFF, 0xFFFF});
    CHECK(e.kind == ErrorKind::Decode);
    CHECK(starts_with(e.reason, "adapter_rejected:"));

    auto dt = reg_datetime(Property::UtcTime, 41015, access::READ | access::WRITE);
    CHECK_FALSE(std::get<DateTime>(decode_ok(dt, {0xFFFF, 0xFFFF})).known());
    CHECK(std::get<DateTime>(decode_ok(dt, {0x5E00, 0x65E9})).timestamp == 0x65E95E00u);
    CHECK(decode_err(dt.adapt(adapt_known_datetime), {0xFFFF, 0xFFFF}).kind == ErrorKind::Decode);

    Words out;
    Error err;
    REQUIRE(encode_value(plain, Date::unknown(), out, err));
    CHECK(out[0] == 0xFFFF);
    CHECK(out[1] == 0xFFFF);
}

TEST_CASE("Encoding rejects the wrong payload type") {
    Words out;
    Error err;
    auto d = reg_u16(Property::OemCode, 41101, access::READ | access::WRITE);
    CHECK_FALSE(encode_value(d, Text("12"), out, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK(starts_with(err.reason, "type_mismatch:"));

    err.clear();
    CHECK_FALSE(encode_value(reg_date(Property::ManufactureDate, 40007, access::WRITE), int64_t(5), out, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
}

TEST_CASE("Encoding enforces the type range and declared limits") {
    Words out;
    Error err;
    auto u16 = reg_u16(Property::OemCode, 41101, access::WRITE);
    CHECK_FALSE(encode_value(u16, int64_t(70000), out, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK_FALSE(encode_value(u16, int64_t(-1), out, err));

    auto i16 = reg_i16(Property::TimezoneOffset, 41022, access::WRITE);
    REQUIRE(encode_value(i16, int64_t(-2), out, err));
    CHECK(out[0] == 0xFFFE);

    auto create = reg_u16(Property::CreateNode, 43005, access::WRITE).limits(2, 247);
    err.clear();
    CHECK_FALSE(encode_value(create, int64_t(1), out, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK(err.reason == "out_of_range:create_node(2..247)");
    CHECK_FALSE(encode_value(create, int64_t(248), out, err));
    CHECK(encode_value(create, int64_t(247), out, err));
}

TEST_CASE("Result adapters") {
    auto battery = reg_u16(Property::BatteryStatus, 40102, access::READ).adapt(adapt_battery);
    CHECK(std::get<BatteryStatus>(decode_ok(battery, {0xFFFF})) == BatteryStatus{false, false});
    CHECK(std::get<BatteryStatus>(decode_ok(battery, {0x0000})) == BatteryStatus{true, false});
    CHECK(std::get<BatteryStatus>(decode_ok(battery, {0x0001})) == BatteryStatus{true, true});

    auto heater = reg_u16(Property::Preheater, 41013, access::READ).adapt(adapt_heater);
    CHECK_FALSE(std::get<HeaterState>(decode_ok(heater, {0x00EF})).available);
    CHECK(std::get<HeaterState>(decode_ok(heater, {40})) == HeaterState{40, true});

    auto temp = reg_float(Property::TemperatureIndoor, 41005, access::READ).adapt(adapt_temperature);
    CHECK(std::get<Temperature>(decode_ok(temp, {0x0000, 0x7FC0})).status == SensorStatus::Unavailable);
    CHECK(std::get<Temperature>(decode_ok(temp, {0x0000, 0xC3FA})).status == SensorStatus::Error);  // -500
    auto ok = std::get<Temperature>(decode_ok(temp, {0x0000, 0x41AC}));
    CHECK(ok.status == SensorStatus::Ok);
    CHECK(ok.celsius == doctest::Approx(21.5));

    auto bypass = reg_u16(Property::BypassPosition, 41016, access::READ).adapt(adapt_bypass_position);
    CHECK_FALSE(std::get<BypassPosition>(decode_ok(bypass, {100})).error);
    CHECK(std::get<BypassPosition>(decode_ok(bypass, {121})).error);
}

TEST_CASE("Product identity adapter rejects unknown products") {
    auto d = common_registers::PRODUCT_ID.adapt(adapt_product_id);
    CHECK(std::get<int64_t>(decode_ok(d, {0xC892, 0x0001})) == 0x0001C892);
    CHECK(decode_err(d, {0x2345, 0x0001}).kind == ErrorKind::Decode);
}

TEST_CASE("Built-in register tables have no overlapping addresses") {
    Error err;
    CHECK(validate_table(common_register_table(), err));
    CHECK(validate_table(bridge_register_table(), err));
    CHECK(validate_table(vmd02rps78_register_table(), err));
    CHECK(validate_table(vmn_register_table(), err));

    for (RegisterTable extra : {bridge_register_table(), vmd02rps78_register_table(), vmn_register_table()}) {
        std::vector<RegisterDescriptor> merged(common_register_table().begin(), common_register_table().end());
        merged.insert(merged.end(), extra.begin(), extra.end());
        CHECK(validate_table(RegisterTable{merged.data(), merged.size()}, err));
    }
}

TEST_CASE("validate_table reports overlaps and duplicate properties") {
    Error err;
    const RegisterDescriptor overlap[] = {
        reg_u32(Property::Uptime, 100, access::READ),
        reg_u16(Property::OemCode, 101, access::READ),
    };
    CHECK_FALSE(validate_table(make_table(overlap), err));
    CHECK(err.kind == ErrorKind::InvalidArgument);

    const RegisterDescriptor dup[] = {
        reg_u16(Property::OemCode, 100, access::READ),
        reg_u16(Property::OemCode, 200, access::READ),
    };
    err.clear();
    CHECK_FALSE(validate_table(make_table(dup), err));
    CHECK(starts_with(err.reason, "duplicate_property:"));
}

TEST_CASE("validate_table rejects a status register whose status word would wrap") {
    Error err;
    const RegisterDescriptor edge[] = {
        reg_u16(Property::OemCode, 55535, access::READ | access::STATUS),
        reg_u16(Property::Uptime, 60000, access::READ),
    };
    CHECK(validate_table(make_table(edge), err));

    const RegisterDescriptor wrap[] = {
        reg_u16(Property::OemCode, 55536, access::READ | access::STATUS),
    };
    CHECK_FALSE(validate_table(make_table(wrap), err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK(err.reason == "status_address_overflow:oem_code");
}
