/**
 * @page vl-modbus-tcp ventilink Modbus TCP channel
 * @file modbus_tcp.hpp
 * @brief Register channel over a TCP socket to a Modbus TCP gateway.
 *
 * @details
 * Frames are [MBAP 7 bytes][pdu]:
 *   transaction id (2)  rolling, one per request
 *   protocol id    (2)  always 0
 *   length         (2)  unit id + pdu bytes
 *   unit id        (1)
 * Replies carrying an earlier transaction id are discarded while waiting
 * for ours. A later id, an unframeable length or no matching reply before
 * the timeout is IoError, which makes the client drop and reopen the
 * socket. A matching id with the wrong protocol or unit id is Malformed.
 * connect() resolves the host, then does a non-blocking connect bounded by
 * the response timeout.
 */
#pragma once
#include <cstdint>
#include <string>
#include <utility>

#include "modbus_pdu.hpp"
#include "ventilink/transport/channel.hpp"

namespace ventilink {

struct TcpConfig {
    std::string host{"192.168.0.207"};
    uint16_t    port{502};
    int         timeout_ms{1000};
};

class ModbusTcpChannel : public transport::IChannel {
public:
    explicit ModbusTcpChannel(TcpConfig cfg) : cfg_(std::move(cfg)) {}
    ~ModbusTcpChannel() override { close(); }

    bool connect() override;
    void close() override;
    bool connected() const override { return fd_ >= 0; }

    transport::ChannelStatus read_registers(uint8_t unit, uint16_t address, uint16_t count,
                                            Words& out, uint8_t& exc) override;
    transport::ChannelStatus write_registers(uint8_t unit, uint16_t address, const Words& words,
                                             uint8_t& exc) override;

    const char* name() const override { return "tcp"; }

private:
    transport::ChannelStatus exchange(uint8_t unit, const modbus::Bytes& pdu, modbus::Bytes& reply);

    TcpConfig cfg_;
    int       fd_{-1};
    uint16_t  next_tid_{1};
};

} // namespace ventilink
