/**
 * @page vl-serial-io-hdr ventilink Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode and move byte buffers with a deadline.
 *
 * @details
 * PURPOSE
 * -------
 * The RS485 side of the gateway is reached through a USB serial adapter. This
 * header is the thin POSIX layer under the Modbus RTU channel: open the port
 * with the line settings the gateway expects, write one request, read back
 * an exact number of bytes before a deadline. Framing and CRC live in
 * modbus_pdu.hpp; this file never looks inside the bytes.
 *
 * WHAT THIS DOES
 * --------------
 * - open_serial: O_RDWR | O_NOCTTY | O_NONBLOCK, raw 8-bit mode, baud,
 *   parity ('N', 'E', 'O') and 1 or 2 stop bits.
 * - flush_input: drop whatever the adapter buffered since the last exchange
 *   (late replies, line noise) so the next read starts clean.
 * - write_bytes: one write(2), then tcdrain so the request is on the wire
 *   before the response timer starts.
 * - read_exact: poll/read loop until exactly N bytes arrive or the deadline
 *   passes. A hangup or end-of-file is Closed, distinct from Error. Works on
 *   any pollable descriptor, so the TCP channel reads its sockets with it.
 * - close_serial: close the descriptor.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths.
 * - Permissions: the runtime user needs the dialout group.
 * - Concurrency: one fd per channel, and the client serializes all exchanges.
 *
 * EXAMPLE
 * -------
 * @code
 *   using namespace ventilink;
 *   int fd = open_serial("/dev/ttyACM0", 19200, 'E', 1);
 *   if (fd < 0) { // handle open failure  }
 *
 *   flush_input(fd);
 *   write_bytes(fd, request.data(), request.size());
 *   uint8_t head[2];
 *   if (read_exact(fd, head, sizeof(head), 1000) != ReadStatus::Ok) {
 *       // timeout or link error
 *   }
 *   close_serial(fd);
 * @endcode
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace ventilink {

enum class ReadStatus { Ok, Timeout, Closed, Error };

/**
 * @brief Open @p dev and configure it for raw I/O.
 *
 * @param baud           300..230400; unknown values fall back to 19200.
 * @param parity         'N', 'E' or 'O' (case-insensitive); anything else is 'N'.
 * @param stop_bits      1 or 2.
 * @param boot_delay_ms  Sleep after open for adapters that reset on open.
 * @return File descriptor (non-negative) on success, or -1 on failure.
 */
int open_serial(const std::string& dev, int baud, char parity, int stop_bits, int boot_delay_ms = 0);

/// Discard unread input.
void flush_input(int fd);

/// True when all @p n bytes were written and drained.
bool write_bytes(int fd, const uint8_t* data, std::size_t n);

/// Read exactly @p n bytes within @p timeout_ms (whole-call deadline).
ReadStatus read_exact(int fd, uint8_t* out, std::size_t n, int timeout_ms);

/// Close a descriptor from open_serial(); negative values are a no-op.
void close_serial(int fd);

} // namespace ventilink
