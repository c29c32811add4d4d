/**
 * @page vl-modbus-rtu ventilink Modbus RTU channel
 * @file modbus_rtu.hpp
 * @brief Register channel over an RS485 serial line (termios + CRC-16).
 *
 * @details
 * One request, one reply, no pipelining. Each exchange:
 *   1. flush stale input,
 *   2. write [unit][pdu][crc lo][crc hi] and drain,
 *   3. read the unit and function bytes, work out the reply length from the
 *      function (and byte count for reads), read the rest,
 *   4. verify the unit id and the CRC, hand the PDU to modbus_pdu.
 * The response timeout covers each read in step 3. A timeout is IoError;
 * the Client closes the channel and the next call reopens the port.
 */
#pragma once
#include <cstdint>
#include <string>
#include <utility>

#include "modbus_pdu.hpp"
#include "ventilink/transport/channel.hpp"

namespace ventilink {

struct RtuConfig {
    std::string device{"/dev/ttyACM0"};
    int         baud{19200};
    char        parity{'E'};
    int         stop_bits{1};
    int         timeout_ms{1000};
};

class ModbusRtuChannel : public transport::IChannel {
public:
    explicit ModbusRtuChannel(RtuConfig cfg) : cfg_(std::move(cfg)) {}
    ~ModbusRtuChannel() override { close(); }

    bool connect() override;
    void close() override;
    bool connected() const override { return fd_ >= 0; }

    transport::ChannelStatus read_registers(uint8_t unit, uint16_t address, uint16_t count,
                                            Words& out, uint8_t& exc) override;
    transport::ChannelStatus write_registers(uint8_t unit, uint16_t address, const Words& words,
                                             uint8_t& exc) override;

    const char* name() const override { return "rtu"; }

private:
    transport::ChannelStatus exchange(uint8_t unit, const modbus::Bytes& pdu, modbus::Bytes& reply);

    RtuConfig cfg_;
    int       fd_{-1};
};

} // namespace ventilink
