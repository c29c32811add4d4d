// ============================================================================
// modbus_rtu.cpp — implementation for modbus_rtu.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "modbus_rtu.hpp"
#include "serial_io.hpp"

namespace ventilink {

using transport::ChannelStatus;

static ChannelStatus from_read_status(ReadStatus rs) {
    switch (rs) {
        case ReadStatus::Ok:      return ChannelStatus::Ok;
        case ReadStatus::Closed:  return ChannelStatus::ConnectionLost;
        case ReadStatus::Timeout:
        case ReadStatus::Error:   return ChannelStatus::IoError;
    }
    return ChannelStatus::IoError;
}

static ChannelStatus from_pdu_result(modbus::PduResult r) {
    switch (r) {
        case modbus::PduResult::Ok:        return ChannelStatus::Ok;
        case modbus::PduResult::Exception: return ChannelStatus::Exception;
        case modbus::PduResult::Malformed: return ChannelStatus::Malformed;
    }
    return ChannelStatus::Malformed;
}

bool ModbusRtuChannel::connect() {
    close();
    fd_ = open_serial(cfg_.device, cfg_.baud, cfg_.parity, cfg_.stop_bits);
    return fd_ >= 0;
}

void ModbusRtuChannel::close() {
    close_serial(fd_);
    fd_ = -1;
}

// ---------------------------------------------------------------------------
// exchange()
// ----------
// Send one framed request and collect one framed reply. @p reply receives
// the PDU only (unit id and CRC stripped).
// ---------------------------------------------------------------------------
ChannelStatus ModbusRtuChannel::exchange(uint8_t unit, const modbus::Bytes& pdu, modbus::Bytes& reply) {
    if (fd_ < 0) return ChannelStatus::ConnectionLost;

    modbus::Bytes frame;
    frame.reserve(pdu.size() + 3);
    frame.push_back(unit);
    frame.insert(frame.end(), pdu.begin(), pdu.end());
    modbus::append_crc(frame);

    flush_input(fd_);
    if (!write_bytes(fd_, frame.data(), frame.size())) return ChannelStatus::IoError;

    // unit, function and (for reads) byte count
    modbus::Bytes in(3, 0);
    ReadStatus rs = read_exact(fd_, in.data(), 2, cfg_.timeout_ms);
    if (rs != ReadStatus::Ok) return from_read_status(rs);

    const uint8_t function = in[1];
    uint8_t byte_count = 0;
    std::size_t head = 2;
    if (function == modbus::FC_READ_HOLDING_REGISTERS) {
        rs = read_exact(fd_, in.data() + 2, 1, cfg_.timeout_ms);
        if (rs != ReadStatus::Ok) return from_read_status(rs);
        byte_count = in[2];
        head = 3;
    }

    const std::size_t tail = modbus::response_tail_length(function, byte_count);
    if (tail == 0) {
        flush_input(fd_);
        return ChannelStatus::Malformed;
    }

    in.resize(head + tail + 2);
    rs = read_exact(fd_, in.data() + head, tail + 2, cfg_.timeout_ms);
    if (rs != ReadStatus::Ok) return from_read_status(rs);

    if (in[0] != unit || !modbus::check_crc(in.data(), in.size())) return ChannelStatus::Malformed;

    reply.assign(in.begin() + 1, in.end() - 2);
    return ChannelStatus::Ok;
}

ChannelStatus ModbusRtuChannel::read_registers(uint8_t unit, uint16_t address, uint16_t count,
                                               Words& out, uint8_t& exc) {
    modbus::Bytes pdu, reply;
    if (!modbus::build_read_request(address, count, pdu)) return ChannelStatus::Malformed;

    ChannelStatus st = exchange(unit, pdu, reply);
    if (st != ChannelStatus::Ok) return st;
    return from_pdu_result(modbus::parse_read_response(reply.data(), reply.size(), out, exc));
}

ChannelStatus ModbusRtuChannel::write_registers(uint8_t unit, uint16_t address, const Words& words,
                                                uint8_t& exc) {
    modbus::Bytes pdu, reply;
    if (!modbus::build_write_request(address, words, pdu)) return ChannelStatus::Malformed;

    ChannelStatus st = exchange(unit, pdu, reply);
    if (st != ChannelStatus::Ok) return st;
    return from_pdu_result(modbus::parse_write_response(reply.data(), reply.size(), address, words, exc));
}

} // namespace ventilink
