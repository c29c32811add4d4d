// ============================================================================
// modbus_pdu.cpp — implementation for modbus_pdu.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "modbus_pdu.hpp"

namespace ventilink::modbus {

static void put_u16(Bytes& out, uint16_t v) {
    out.push_back(uint8_t(v >> 8));
    out.push_back(uint8_t(v & 0xFF));
}

static uint16_t get_u16(const uint8_t* p) {
    return uint16_t((uint16_t(p[0]) << 8) | p[1]);
}

uint16_t crc16(const uint8_t* data, std::size_t n) {
    uint16_t crc = 0xFFFF;
    for (std::size_t i = 0; i < n; ++i) {
        crc ^= data[i];
        for (int b = 0; b < 8; ++b) {
            if (crc & 1) crc = uint16_t((crc >> 1) ^ 0xA001);
            else         crc >>= 1;
        }
    }
    return crc;
}

void append_crc(Bytes& frame) {
    uint16_t crc = crc16(frame.data(), frame.size());
    frame.push_back(uint8_t(crc & 0xFF));
    frame.push_back(uint8_t(crc >> 8));
}

bool check_crc(const uint8_t* frame, std::size_t n) {
    if (n < 3) return false;
    uint16_t want = crc16(frame, n - 2);
    uint16_t got = uint16_t(frame[n - 2] | (uint16_t(frame[n - 1]) << 8));
    return want == got;
}

bool build_read_request(uint16_t address, uint16_t count, Bytes& pdu) {
    if (count == 0 || count > MAX_READ_WORDS) return false;
    pdu.clear();
    pdu.push_back(FC_READ_HOLDING_REGISTERS);
    put_u16(pdu, address);
    put_u16(pdu, count);
    return true;
}

bool build_write_request(uint16_t address, const Words& words, Bytes& pdu) {
    if (words.empty() || words.size() > MAX_WRITE_WORDS) return false;
    pdu.clear();
    if (words.size() == 1) {
        pdu.push_back(FC_WRITE_SINGLE_REGISTER);
        put_u16(pdu, address);
        put_u16(pdu, words[0]);
        return true;
    }
    pdu.push_back(FC_WRITE_MULTIPLE_REGISTERS);
    put_u16(pdu, address);
    put_u16(pdu, uint16_t(words.size()));
    pdu.push_back(uint8_t(words.size() * 2));
    for (uint16_t w : words) put_u16(pdu, w);
    return true;
}

// Exception reply for @p function? Fills exc and returns true.
static bool is_exception(const uint8_t* pdu, std::size_t n, uint8_t function, uint8_t& exc) {
    if (n < 1 || pdu[0] != (function | EXCEPTION_BIT)) return false;
    exc = n >= 2 ? pdu[1] : 0;
    return true;
}

PduResult parse_read_response(const uint8_t* pdu, std::size_t n, Words& out, uint8_t& exc) {
    out.clear();
    if (is_exception(pdu, n, FC_READ_HOLDING_REGISTERS, exc))
        return n == 2 ? PduResult::Exception : PduResult::Malformed;
    if (n < 2 || pdu[0] != FC_READ_HOLDING_REGISTERS) return PduResult::Malformed;

    const std::size_t byte_count = pdu[1];
    if (byte_count % 2 != 0 || n != 2 + byte_count) return PduResult::Malformed;
    if (byte_count / 2 > MAX_READ_WORDS) return PduResult::Malformed;

    for (std::size_t i = 0; i < byte_count; i += 2) out.push_back(get_u16(pdu + 2 + i));
    return PduResult::Ok;
}

PduResult parse_write_response(const uint8_t* pdu, std::size_t n, uint16_t address,
                               const Words& words, uint8_t& exc) {
    const uint8_t function = words.size() == 1 ? FC_WRITE_SINGLE_REGISTER : FC_WRITE_MULTIPLE_REGISTERS;
    if (is_exception(pdu, n, function, exc))
        return n == 2 ? PduResult::Exception : PduResult::Malformed;
    if (n != 5 || pdu[0] != function) return PduResult::Malformed;

    const uint16_t echo_address = get_u16(pdu + 1);
    const uint16_t echo_value = get_u16(pdu + 3);
    if (echo_address != address) return PduResult::Malformed;
    if (function == FC_WRITE_SINGLE_REGISTER) {
        if (echo_value != words[0]) return PduResult::Malformed;
    } else if (echo_value != words.size()) {
        return PduResult::Malformed;
    }
    return PduResult::Ok;
}

std::size_t response_tail_length(uint8_t function, uint8_t byte_count) {
    if (function & EXCEPTION_BIT) return 1;
    switch (function) {
        case FC_READ_HOLDING_REGISTERS:   return byte_count;
        case FC_WRITE_SINGLE_REGISTER:
        case FC_WRITE_MULTIPLE_REGISTERS: return 4;
        default:                          return 0;
    }
}

} // namespace ventilink::modbus
