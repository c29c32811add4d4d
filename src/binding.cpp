// ============================================================================
// binding.cpp — implementation for ventilink/binding.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/binding.hpp"
#include "ventilink/log.hpp"

namespace ventilink {

const char* binding_status_name(BindingStatus s) {
    switch (s) {
        case BindingStatus::NotAvailable:                       return "not_available";
        case BindingStatus::OutgoingBindingInitialized:         return "outgoing_binding_initialized";
        case BindingStatus::OutgoingBindingCompleted:           return "outgoing_binding_completed";
        case BindingStatus::IncomingBindingActive:              return "incoming_binding_active";
        case BindingStatus::IncomingBindingCompleted:           return "incoming_binding_completed";
        case BindingStatus::LearningCompleted:                  return "learning_completed";
        case BindingStatus::IncomingAutodetectWindowClosed:     return "incoming_autodetect_window_closed";
        case BindingStatus::OutgoingFailedNoAnswer:             return "outgoing_failed_no_answer";
        case BindingStatus::OutgoingFailedIncompatibleDevice:   return "outgoing_failed_incompatible_device";
        case BindingStatus::OutgoingFailedNodeListFull:         return "outgoing_failed_node_list_full";
        case BindingStatus::OutgoingFailedModbusAddressInvalid: return "outgoing_failed_modbus_address_invalid";
        case BindingStatus::IncomingWindowClosedWithoutBinding: return "incoming_window_closed_without_binding";
        case BindingStatus::FailedSerialNumberInvalid:          return "failed_serial_number_invalid";
        case BindingStatus::UnknownBindingCommand:              return "unknown_binding_command";
        case BindingStatus::UnknownProductType:                 return "unknown_product_type";
    }
    return "unknown";
}

bool binding_status_from_raw(int64_t raw, BindingStatus& out) {
    switch (raw) {
        case 0: case 1: case 2: case 3: case 4: case 5: case 10:
        case 100: case 101: case 102: case 103: case 104: case 105:
        case 200: case 201:
            out = static_cast<BindingStatus>(raw);
            return true;
        default:
            return false;
    }
}

bool BindingController::check_address(uint8_t address, Error& err) const {
    if (address < MIN_NODE_ADDRESS || address > MAX_NODE_ADDRESS)
        return fail(err, ErrorKind::InvalidArgument, "address_out_of_range:" + std::to_string(address) + "(2..247)");
    if (address == bridge_.address())
        return fail(err, ErrorKind::InvalidArgument, "address_in_use:" + std::to_string(address));
    return true;
}

// One configuration write; any failure is reported as a Binding error naming the step.
bool BindingController::step(Property p, const Payload& value, const char* name, Error& err) {
    Error e;
    if (bridge_.set(p, value, e)) return true;
    log_warn(std::string("event=bind_step_failed step=") + name + " " + describe(e));
    return fail(err, ErrorKind::Binding, std::string("bind_step:") + name + " " + describe(e), e.exception_code);
}

// ---------------------------------------------------------------------------
// prepare()
// ---------
// Steps 1-4 shared by both bind flavours: abort, verify idle, product id,
// create node. On a non-zero status nothing past the abort is written.
// ---------------------------------------------------------------------------
bool BindingController::prepare(uint8_t address, ProductId product, Error& err) {
    if (!step(Property::BindingCommand, int64_t(BindingMode::Abort), "abort", err)) return false;

    AnyValue st;
    Error e;
    if (!bridge_.get(Property::ActualBindingStatus, st, e)) {
        log_warn("event=bind_step_failed step=status " + describe(e));
        return fail(err, ErrorKind::Binding, "bind_step:status " + describe(e), e.exception_code);
    }
    int64_t raw = -1;
    if (!as_integer(st.value, raw))
        return fail(err, ErrorKind::Binding, "bind_step:status unreadable");
    if (raw != 0) {
        log_warn("event=bind_not_ready status=" + std::to_string(raw));
        return fail(err, ErrorKind::Binding, "not_ready_for_binding:" + std::to_string(raw));
    }

    if (!step(Property::BindingProductId, int64_t(static_cast<uint32_t>(product)), "product_id", err)) return false;
    if (!step(Property::CreateNode, int64_t(address), "create_node", err)) return false;
    return true;
}

bool BindingController::bind_controller(uint8_t address, ProductId product,
                                        std::optional<uint32_t> serial, Error& err) {
    if (!check_address(address, err)) return false;
    if (!prepare(address, product, err)) return false;

    BindingMode mode = BindingMode::OutgoingSingleProduct;
    if (serial) {
        if (!step(Property::BindingProductSerial, int64_t(*serial), "product_serial", err)) return false;
        mode = BindingMode::OutgoingSingleProductPlusSerial;
    }

    log_info("event=bind_controller address=" + std::to_string(address) +
             " mode=" + std::to_string(static_cast<uint16_t>(mode)));
    return bridge_.set(Property::BindingCommand, int64_t(binding_command_word(address, mode)), err);
}

bool BindingController::bind_accessory(uint8_t controller_address, uint8_t address,
                                       ProductId product, Error& err) {
    if (controller_address < MIN_NODE_ADDRESS || controller_address > MAX_NODE_ADDRESS) {
        return fail(err, ErrorKind::InvalidArgument,
                    "controller_out_of_range:" + std::to_string(controller_address) + "(2..247)");
    }
    if (!check_address(address, err)) return false;
    if (!prepare(address, product, err)) return false;

    log_info("event=bind_accessory controller=" + std::to_string(controller_address) +
             " address=" + std::to_string(address));
    return bridge_.set(Property::BindingCommand,
                       int64_t(binding_command_word(address, BindingMode::IncomingOnExistingNode)), err);
}

bool BindingController::unbind(uint8_t address, Error& err) {
    return bridge_.set(Property::RemoveNode, int64_t(address), err);
}

BindingStatus BindingController::bind_status() {
    AnyValue v;
    Error e;
    if (!bridge_.get(Property::ActualBindingStatus, v, e)) {
        log_info("event=bind_status_unavailable " + describe(e));
        return BindingStatus::NotAvailable;
    }
    int64_t raw = 0;
    BindingStatus s = BindingStatus::NotAvailable;
    if (!as_integer(v.value, raw) || !binding_status_from_raw(raw, s)) return BindingStatus::NotAvailable;
    return s;
}

} // namespace ventilink
