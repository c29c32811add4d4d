#pragma once
/**
 * @file bridge.hpp
 * @brief BRDG-02R13 RF gateway: the device every other node is reached through.
 *
 * Adds the gateway-only registers (clock, serial settings, RF load, binding
 * and node table) on top of the common table. Binding and node enumeration
 * are separate classes (binding.hpp, node_directory.hpp) that work on a
 * Bridge reference.
 */

#include <cstdint>

#include "ventilink/device.hpp"

namespace ventilink {

enum class ResetMode : uint16_t {
    Soft    = 12345,
    Factory = 56789,
};

enum class ModbusEvents : uint16_t {
    None   = 0,
    Bridge = 1,
    Node   = 2,
    Data   = 3,
};

/// Gateway serial baud-rate register codes.
enum class BaudCode : uint16_t {
    B300 = 0, B600, B1200, B2400, B4800, B9600, B19200, B38400, B57600, B115200,
};

class Bridge : public Device {
public:
    Bridge(Client& client, uint8_t address = DEFAULT_GATEWAY_ADDRESS);

    ProductId product() const override { return ProductId::BRDG_02R13; }

    bool uptime(Value<int64_t>& out, Error& err)     { return get_as(Property::Uptime, out, err); }
    bool utc_time(Value<DateTime>& out, Error& err)  { return get_as(Property::UtcTime, out, err); }
    bool local_time(Value<DateTime>& out, Error& err){ return get_as(Property::LocalTime, out, err); }
    bool set_utc_time(const DateTime& t, Error& err) { return set(Property::UtcTime, t, err); }

    bool set_oem_code(uint16_t code, Error& err)     { return set(Property::OemCode, int64_t(code), err); }
    bool set_modbus_events(ModbusEvents mode, Error& err) {
        return set(Property::ModbusEvents, int64_t(mode), err);
    }
    bool reset(ResetMode mode, Error& err)           { return set(Property::ResetDevice, int64_t(mode), err); }

    bool rf_load_current_hour(Value<float>& out, Error& err) { return get_as(Property::RfLoadCurrentHour, out, err); }
    bool rf_load_last_hour(Value<float>& out, Error& err)    { return get_as(Property::RfLoadLastHour, out, err); }
    bool rf_sent_messages_current_hour(Value<int64_t>& out, Error& err) {
        return get_as(Property::RfMessagesCurrentHour, out, err);
    }
    bool rf_sent_messages_last_hour(Value<int64_t>& out, Error& err) {
        return get_as(Property::RfMessagesLastHour, out, err);
    }
};

/// Gateway-only registers (without the common table).
RegisterTable bridge_register_table();

} // namespace ventilink
