#pragma once
/**
 * @file products.hpp
 * @brief Compile-time registry of the products this library can model.
 *
 * The set of supported products is fixed at build time: one constexpr array
 * of ProductInfo rows, looked up by raw identity or by name. Device
 * construction for a row lives in factory.hpp.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "ventilink/values.hpp"

namespace ventilink {

enum class ProductId : uint32_t {
    BRDG_02R13  = 0x0001C849,   ///< RF-to-Modbus gateway
    VMD_02RPS78 = 0x0001C892,   ///< ventilation controller
    VMN_05LM02  = 0x0001C83E,   ///< 4-button remote
    VMN_02LM11  = 0x0001C852,   ///< 2-button remote
};

enum class DeviceFamily : uint8_t { Gateway, VentilationController, Remote };

struct ProductInfo {
    ProductId    id;
    const char*  name;          ///< model code, e.g. "VMD-02RPS78"
    const char*  description;
    DeviceFamily family;
};

/// Default device address of a factory-fresh gateway.
constexpr uint8_t DEFAULT_GATEWAY_ADDRESS = 207;

/// Row for a raw identity, or nullptr when the product is unknown.
const ProductInfo* find_product(uint32_t raw_id);

/// Row by model code ("VMD-02RPS78", case-insensitive, '_' accepted for '-').
const ProductInfo* find_product_by_name(const std::string& name);

const ProductInfo* products_begin();
const ProductInfo* products_end();

/// Result adapter: keeps the integer payload only when it names a known product.
bool adapt_product_id(const Payload& raw, Payload& out);

} // namespace ventilink
