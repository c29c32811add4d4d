// ============================================================================
// bridge.cpp — implementation for ventilink/bridge.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/bridge.hpp"

namespace ventilink {

static constexpr uint8_t R  = access::READ;
static constexpr uint8_t W  = access::WRITE;
static constexpr uint8_t RW = access::READ | access::WRITE;

static constexpr RegisterDescriptor kBridgeRegisters[] = {
    reg_u16(Property::CustomerProductId,       40023, RW),
    reg_datetime(Property::UtcTime,            41015, RW).adapt(adapt_known_datetime),
    reg_datetime(Property::LocalTime,          41017, R).adapt(adapt_known_datetime),
    reg_u32(Property::Uptime,                  41019, R),
    reg_u16(Property::DaylightSavingType,      41021, RW),
    reg_u16(Property::TimezoneOffset,          41022, RW),
    reg_u16(Property::OemCode,                 41101, RW),
    reg_u16(Property::ModbusEvents,            41103, RW).limits(0, 3),
    reg_u16(Property::ResetDevice,             41107, W),
    reg_string(Property::CustomerNodeId,       41108, 10, W),
    reg_u16(Property::SerialParity,            41998, RW).limits(0, 2),
    reg_u16(Property::SerialStopBits,          41999, RW).limits(0, 1),
    reg_u16(Property::SerialBaudrate,          42000, RW).limits(0, 9),
    reg_u16(Property::ModbusDeviceId,          42001, RW).limits(1, 247),
    reg_u16(Property::RfMessagesCurrentHour,   42100, R),
    reg_u16(Property::RfMessagesLastHour,      42101, R),
    reg_float(Property::RfLoadCurrentHour,     42102, R),
    reg_float(Property::RfLoadLastHour,        42104, R),
    reg_u32(Property::BindingProductId,        43000, RW),
    reg_u32(Property::BindingProductSerial,    43002, RW),
    reg_u16(Property::BindingCommand,          43004, W),
    reg_u16(Property::CreateNode,              43005, W).limits(2, 247),
    reg_u16(Property::FirstAddressToAssign,    43006, RW),
    reg_u16(Property::RemoveNode,              43399, W),
    reg_u16(Property::ActualBindingStatus,     43900, R),
    reg_u16(Property::NumberOfNodes,           43901, R),
    reg_u16(node_slot_property(0), 43902, R),
    reg_u16(node_slot_property(1), 43903, R),
    reg_u16(node_slot_property(2), 43904, R),
    reg_u16(node_slot_property(3), 43905, R),
    reg_u16(node_slot_property(4), 43906, R),
    reg_u16(node_slot_property(5), 43907, R),
    reg_u16(node_slot_property(6), 43908, R),
    reg_u16(node_slot_property(7), 43909, R),
    reg_u16(node_slot_property(8), 43910, R),
    reg_u16(node_slot_property(9), 43911, R),
    reg_u16(node_slot_property(10), 43912, R),
    reg_u16(node_slot_property(11), 43913, R),
    reg_u16(node_slot_property(12), 43914, R),
    reg_u16(node_slot_property(13), 43915, R),
    reg_u16(node_slot_property(14), 43916, R),
    reg_u16(node_slot_property(15), 43917, R),
    reg_u16(node_slot_property(16), 43918, R),
    reg_u16(node_slot_property(17), 43919, R),
    reg_u16(node_slot_property(18), 43920, R),
    reg_u16(node_slot_property(19), 43921, R),
    reg_u16(node_slot_property(20), 43922, R),
    reg_u16(node_slot_property(21), 43923, R),
    reg_u16(node_slot_property(22), 43924, R),
    reg_u16(node_slot_property(23), 43925, R),
    reg_u16(node_slot_property(24), 43926, R),
    reg_u16(node_slot_property(25), 43927, R),
    reg_u16(node_slot_property(26), 43928, R),
    reg_u16(node_slot_property(27), 43929, R),
    reg_u16(node_slot_property(28), 43930, R),
    reg_u16(node_slot_property(29), 43931, R),
    reg_u16(node_slot_property(30), 43932, R),
    reg_u16(node_slot_property(31), 43933, R),
};

RegisterTable bridge_register_table() { return make_table(kBridgeRegisters); }

Bridge::Bridge(Client& client, uint8_t address) : Device(client, address) {
    add_registers(bridge_register_table());
}

} // namespace ventilink
