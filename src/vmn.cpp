// ============================================================================
// vmn.cpp — implementation for ventilink/vmn.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/vmn.hpp"

namespace ventilink {

static constexpr RegisterDescriptor kVmnRegisters[] = {
    reg_u16(Property::RequestedVentilationSpeed, 41000, access::READ | access::STATUS),
};

RegisterTable vmn_register_table() { return make_table(kVmnRegisters); }

Vmn::Vmn(Client& client, uint8_t address, ProductId product)
    : Device(client, address), product_(product) {
    add_registers(vmn_register_table());
}

bool Vmn::requested_ventilation_speed(Value<RequestedVentilationSpeed>& out, Error& err) {
    Value<int64_t> raw;
    if (!get_as(Property::RequestedVentilationSpeed, raw, err)) return false;
    out.value = static_cast<RequestedVentilationSpeed>(raw.value);
    out.freshness = raw.freshness;
    return true;
}

} // namespace ventilink
