#include <doctest/doctest.h>
#include "modbus_pdu.hpp"

using namespace ventilink;
using namespace ventilink::modbus;

TEST_CASE("CRC-16 of a read request frame") {
    Bytes frame{0x01, 0x03, 0x00, 0x00, 0x00, 0x01};
    CHECK(crc16(frame.data(), frame.size()) == 0x0A84);

    append_crc(frame);
    REQUIRE(frame.size() == 8);
    CHECK(frame[6] == 0x84);
    CHECK(frame[7] == 0x0A);
    CHECK(check_crc(frame.data(), frame.size()));

    frame[3] ^= 0x01;
    CHECK_FALSE(check_crc(frame.data(), frame.size()));
}

TEST_CASE("Read request layout and bounds") {
    Bytes pdu;
    REQUIRE(build_read_request(43902, 32, pdu));
    CHECK(pdu == Bytes{0x03, 0xAB, 0x7E, 0x00, 0x20});

    CHECK_FALSE(build_read_request(0, 0, pdu));
    CHECK_FALSE(build_read_request(0, 126, pdu));
    CHECK(build_read_request(0, 125, pdu));
}

TEST_CASE("Write request uses 0x06 for one word and 0x10 for more") {
    Bytes pdu;
    Words one{0x00C8};
    REQUIRE(build_write_request(43004, one, pdu));
    CHECK(pdu == Bytes{0x06, 0xA7, 0xFC, 0x00, 0xC8});

    Words two{0xC892, 0x0001};
    REQUIRE(build_write_request(43000, two, pdu));
    CHECK(pdu == Bytes{0x10, 0xA7, 0xF8, 0x00, 0x02, 0x04, 0xC8, 0x92, 0x00, 0x01});

    Words none;
    CHECK_FALSE(build_write_request(43000, none, pdu));
    Words too_many(124, 0);
    CHECK_FALSE(build_write_request(43000, too_many, pdu));
}

TEST_CASE("Read response parsing") {
    Words out;
    uint8_t exc = 0;

    const uint8_t ok[] = {0x03, 0x04, 0x12, 0x34, 0x00, 0x07};
    REQUIRE(parse_read_response(ok, sizeof(ok), out, exc) == PduResult::Ok);
    REQUIRE(out.size() == 2);
    CHECK(out[0] == 0x1234);
    CHECK(out[1] == 0x0007);

    const uint8_t exception[] = {0x83, 0x06};
    out.clear();
    CHECK(parse_read_response(exception, sizeof(exception), out, exc) == PduResult::Exception);
    CHECK(exc == 0x06);

    const uint8_t odd[] = {0x03, 0x03, 0x12, 0x34, 0x00};
    out.clear();
    CHECK(parse_read_response(odd, sizeof(odd), out, exc) == PduResult::Malformed);

    const uint8_t short_body[] = {0x03, 0x04, 0x12, 0x34};
    out.clear();
    CHECK(parse_read_response(short_body, sizeof(short_body), out, exc) == PduResult::Malformed);

    const uint8_t wrong_fc[] = {0x04, 0x02, 0x00, 0x01};
    out.clear();
    CHECK(parse_read_response(wrong_fc, sizeof(wrong_fc), out, exc) == PduResult::Malformed);
}

TEST_CASE("Write response must echo the request") {
    uint8_t exc = 0;
    Words one{12};
    const uint8_t echo_single[] = {0x06, 0xA7, 0xFD, 0x00, 0x0C};
    CHECK(parse_write_response(echo_single, sizeof(echo_single), 43005, one, exc) == PduResult::Ok);

    const uint8_t wrong_value[] = {0x06, 0xA7, 0xFD, 0x00, 0x0D};
    CHECK(parse_write_response(wrong_value, sizeof(wrong_value), 43005, one, exc) == PduResult::Malformed);

    const uint8_t wrong_address[] = {0x06, 0xA7, 0xFE, 0x00, 0x0C};
    CHECK(parse_write_response(wrong_address, sizeof(wrong_address), 43005, one, exc) == PduResult::Malformed);

    Words two{0x2345, 0x0001};
    const uint8_t echo_multi[] = {0x10, 0xA7, 0xFA, 0x00, 0x02};
    CHECK(parse_write_response(echo_multi, sizeof(echo_multi), 43002, two, exc) == PduResult::Ok);

    const uint8_t wrong_count[] = {0x10, 0xA7, 0xFA, 0x00, 0x03};
    CHECK(parse_write_response(wrong_count, sizeof(wrong_count), 43002, two, exc) == PduResult::Malformed);

    const uint8_t exception[] = {0x90, 0x04};
    CHECK(parse_write_response(exception, sizeof(exception), 43002, two, exc) == PduResult::Exception);
    CHECK(exc == 0x04);
}

TEST_CASE("Bytes still to come after the function byte") {
    CHECK(response_tail_length(0x83, 0x02) == 1);
    CHECK(response_tail_length(FC_READ_HOLDING_REGISTERS, 8) == 8);
    CHECK(response_tail_length(FC_WRITE_SINGLE_REGISTER, 0xA7) == 4);
    CHECK(response_tail_length(FC_WRITE_MULTIPLE_REGISTERS, 0xA7) == 4);
    CHECK(response_tail_length(0x2B, 0) == 0);
}
