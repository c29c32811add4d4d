#pragma once
/**
 * @page vl-binding ventilink Binding Controller
 * @file binding.hpp
 * @brief Pairing wireless devices with the gateway.
 *
 * @details
 * PURPOSE
 * -------
 * Binding associates a wireless product with a gateway-assigned device
 * address. The gateway firmware runs the actual radio exchange; this class
 * only issues the command sequence that starts it, then the caller polls
 * bind_status() to watch the firmware move through its states.
 *
 * SEQUENCE (bind_controller / bind_accessory)
 * -------------------------------------------
 *   1. write Abort to the binding command register   (clears a stale session)
 *   2. read the binding status; it must be 0         (the one gate)
 *   3. write the product identity to binding_product_id
 *   4. write the target address to create_node        (allocates the slot)
 *   5. controller with serial only: write binding_product_serial
 *   6. write the command word (address << 8) | mode    (return value of the call)
 *
 * Any failure in steps 1-5 returns ErrorKind::Binding with reason
 * "bind_step:<step>" and stops; nothing is retried. Address checks (2..247,
 * not the gateway's own address) happen before the first write and fail with
 * InvalidArgument.
 *
 * Binding and node scans share one gateway; callers that need both to agree
 * must serialize them themselves.
 */

#include <cstdint>
#include <optional>

#include "ventilink/bridge.hpp"

namespace ventilink {

enum class BindingMode : uint16_t {
    OutgoingSingleProduct           = 0x0003,
    OutgoingSingleProductPlusSerial = 0x0004,
    IncomingOnExistingNode          = 0x0014,
    Abort                           = 0x00C8,
};

enum class BindingStatus : uint16_t {
    NotAvailable                      = 0,   ///< idle, nothing in progress
    OutgoingBindingInitialized        = 1,
    OutgoingBindingCompleted          = 2,
    IncomingBindingActive             = 3,
    IncomingBindingCompleted          = 4,
    LearningCompleted                 = 5,
    IncomingAutodetectWindowClosed    = 10,
    OutgoingFailedNoAnswer            = 100,
    OutgoingFailedIncompatibleDevice  = 101,
    OutgoingFailedNodeListFull        = 102,
    OutgoingFailedModbusAddressInvalid = 103,
    IncomingWindowClosedWithoutBinding = 104,
    FailedSerialNumberInvalid         = 105,
    UnknownBindingCommand             = 200,
    UnknownProductType                = 201,
};

constexpr uint8_t MIN_NODE_ADDRESS = 2;
constexpr uint8_t MAX_NODE_ADDRESS = 247;

constexpr uint16_t binding_command_word(uint8_t address, BindingMode mode) {
    return uint16_t((uint16_t(address) << 8) | static_cast<uint16_t>(mode));
}

const char* binding_status_name(BindingStatus s);

/// Map a raw status word onto BindingStatus; false for values with no name.
bool binding_status_from_raw(int64_t raw, BindingStatus& out);

class BindingController {
public:
    explicit BindingController(Bridge& bridge) : bridge_(bridge) {}

    bool bind_controller(uint8_t address, ProductId product, std::optional<uint32_t> serial, Error& err);
    bool bind_accessory(uint8_t controller_address, uint8_t address, ProductId product, Error& err);
    bool unbind(uint8_t address, Error& err);

    /// Never fails: anything unreadable or unnamed is NotAvailable.
    BindingStatus bind_status();

private:
    bool check_address(uint8_t address, Error& err) const;
    bool prepare(uint8_t address, ProductId product, Error& err);
    bool step(Property p, const Payload& value, const char* name, Error& err);

    Bridge& bridge_;
};

} // namespace ventilink
