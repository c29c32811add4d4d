#pragma once
/**
 * @file vmn.hpp
 * @brief Wireless remotes (VMN-05LM02 4-button, VMN-02LM11 2-button).
 *
 * Both remotes expose the same single register on top of the common table:
 * the speed the user last asked for. One class serves both; the product
 * identity is passed in by the factory.
 */

#include <cstdint>

#include "ventilink/device.hpp"
#include "ventilink/vmd.hpp"

namespace ventilink {

class Vmn : public Device {
public:
    Vmn(Client& client, uint8_t address, ProductId product = ProductId::VMN_05LM02);

    ProductId product() const override { return product_; }

    bool requested_ventilation_speed(Value<RequestedVentilationSpeed>& out, Error& err);

private:
    ProductId product_;
};

RegisterTable vmn_register_table();

} // namespace ventilink
