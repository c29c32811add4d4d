/**
 * @page vl-modbus-pdu ventilink Modbus PDU
 * @file modbus_pdu.hpp
 * @brief Holding-register request/response PDUs and the RTU CRC, shared by both channels.
 *
 * @details
 * PURPOSE
 * -------
 * The RTU and TCP channels differ only in what wraps the PDU (unit id + CRC
 * versus MBAP header). Everything between the wrapper bytes is built and
 * checked here, once.
 *
 * FUNCTIONS SUPPORTED
 * -------------------
 *   0x03  read holding registers    -> [fc, byte_count, hi, lo, ...]
 *   0x06  write single register     -> echo [fc, addr, value]
 *   0x10  write multiple registers  -> echo [fc, addr, count]
 *   fc | 0x80                       -> exception, one code byte
 *
 * A write of exactly one word goes out as 0x06; anything longer as 0x10.
 * parse_write_response() compares the echo with the request and reports a
 * mismatch as Malformed.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "ventilink/register.hpp"

namespace ventilink::modbus {

constexpr uint8_t FC_READ_HOLDING_REGISTERS   = 0x03;
constexpr uint8_t FC_WRITE_SINGLE_REGISTER    = 0x06;
constexpr uint8_t FC_WRITE_MULTIPLE_REGISTERS = 0x10;
constexpr uint8_t EXCEPTION_BIT               = 0x80;

using Bytes = std::vector<uint8_t>;

enum class PduResult { Ok, Exception, Malformed };

/// CRC-16/MODBUS (poly 0xA001 reflected, init 0xFFFF).
uint16_t crc16(const uint8_t* data, std::size_t n);

/// Append the CRC low byte first, as RTU sends it.
void append_crc(Bytes& frame);

/// True when the last two bytes of @p frame are the CRC of the rest.
bool check_crc(const uint8_t* frame, std::size_t n);

/// Read request PDU; false when @p count is 0 or above MAX_READ_WORDS.
bool build_read_request(uint16_t address, uint16_t count, Bytes& pdu);

/// Write request PDU (0x06 for one word, 0x10 otherwise); false when empty or above MAX_WRITE_WORDS.
bool build_write_request(uint16_t address, const Words& words, Bytes& pdu);

/**
 * @brief Parse a 0x03 response PDU.
 *
 * @p out gets byte_count / 2 words. The count is not compared with the
 * request here; the client owns that check.
 */
PduResult parse_read_response(const uint8_t* pdu, std::size_t n, Words& out, uint8_t& exc);

/// Parse the echo of a write built by build_write_request(address, words).
PduResult parse_write_response(const uint8_t* pdu, std::size_t n, uint16_t address,
                               const Words& words, uint8_t& exc);

/**
 * @brief Bytes still to come for a response whose first PDU byte is @p function
 *        and, for reads, whose second byte is @p byte_count.
 *
 * Counts PDU bytes after the function byte (and after the byte count for
 * reads); the RTU channel adds two for the CRC.
 */
std::size_t response_tail_length(uint8_t function, uint8_t byte_count);

} // namespace ventilink::modbus
