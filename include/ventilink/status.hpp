#pragma once
/**
 * @file status.hpp
 * @brief Decoder for the per-register status word (age, source, flags).
 *
 * Registers declared with access::STATUS have a companion word at
 * address + STATUS_OFFSET. Bit layout:
 *
 *   bit  15 14 13 12 11 10  9  8  7  6  5  4  3  2  1  0
 *        [fl:hi ][src ][ flags:lo  ][h][      age        ]
 *
 * - age    bits 0..6, in seconds, or in hours when bit 7 is set
 * - flags  bits 8..11 (VALID, ERROR, READ_PENDING, WRITE_PENDING) and
 *          bits 14..15 (NEW_VALUE lives in bit 14), kept in the same
 *          positions they have after a shift right by 8
 * - source bits 12..13 (0 unknown, 1 radio, 2 wire)
 */

#include <cstdint>

#include "ventilink/values.hpp"

namespace ventilink {

constexpr uint16_t STATUS_OFFSET = 10000;

constexpr uint16_t STATUS_AGE_MASK   = 0x007F;
constexpr uint16_t STATUS_HOURS_BIT  = 0x0080;
constexpr uint8_t  STATUS_FLAGS_MASK = 0xCF;   // after >> 8
constexpr uint8_t  STATUS_SOURCE_MASK = 0x03;  // after >> 12

Freshness decode_status(uint16_t word);

} // namespace ventilink
