#include <doctest/doctest.h>
#include "ventilink/status.hpp"

using namespace ventilink;

TEST_CASE("Status word: age in seconds, no flags, unknown source") {
    Freshness f = decode_status(0b0000000000100101);
    CHECK(f.age == std::chrono::seconds(37));
    CHECK(f.flags == 0);
    CHECK(f.source == ValueSource::Unknown);
}

TEST_CASE("Status word: hours bit scales the age") {
    Freshness f = decode_status(0x0085);
    CHECK(f.age == std::chrono::hours(5));
}

TEST_CASE("Status word: flags and source share the high byte") {
    Freshness wire = decode_status(0x2185);
    CHECK(wire.source == ValueSource::Wire);
    CHECK(wire.flags == value_flags::VALID);
    CHECK(wire.has(value_flags::VALID));
    CHECK_FALSE(wire.has(value_flags::ERROR));

    Freshness radio = decode_status(0x1F00);
    CHECK(radio.source == ValueSource::Radio);
    CHECK(radio.flags == (value_flags::VALID | value_flags::ERROR | value_flags::READ_PENDING |
                          value_flags::WRITE_PENDING));
    CHECK(radio.age == std::chrono::seconds(0));

    Freshness fresh = decode_status(0x4000);
    CHECK(fresh.has(value_flags::NEW_VALUE));
    CHECK(fresh.source == ValueSource::Unknown);
}

TEST_CASE("Status word: reserved source 3 reads as unknown") {
    Freshness f = decode_status(0x3000);
    CHECK(f.source == ValueSource::Unknown);
    CHECK(f.flags == 0);
}
