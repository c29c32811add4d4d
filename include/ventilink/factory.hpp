#pragma once
/**
 * @file factory.hpp
 * @brief ProductId -> device model, resolved by one switch.
 */

#include <cstdint>
#include <memory>

#include "ventilink/device.hpp"

namespace ventilink {

/**
 * @brief Build the device model for @p product at @p address.
 * @return false with NotImplemented when no model exists for the product.
 */
bool make_device(ProductId product, uint8_t address, Client& client,
                 std::unique_ptr<Device>& out, Error& err);

} // namespace ventilink
