// ============================================================================
// products.cpp — implementation for ventilink/products.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/products.hpp"

#include <cctype>
#include <iterator>

namespace ventilink {

static constexpr ProductInfo kProducts[] = {
    {ProductId::BRDG_02R13,  "BRDG-02R13",  "RS485 RF gateway",              DeviceFamily::Gateway},
    {ProductId::VMD_02RPS78, "VMD-02RPS78", "heat recovery ventilation unit", DeviceFamily::VentilationController},
    {ProductId::VMN_05LM02,  "VMN-05LM02",  "4-button remote control",       DeviceFamily::Remote},
    {ProductId::VMN_02LM11,  "VMN-02LM11",  "2-button remote control",       DeviceFamily::Remote},
};

const ProductInfo* products_begin() { return std::begin(kProducts); }
const ProductInfo* products_end()   { return std::end(kProducts); }

const ProductInfo* find_product(uint32_t raw_id) {
    for (const auto& p : kProducts)
        if (static_cast<uint32_t>(p.id) == raw_id) return &p;
    return nullptr;
}

static std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '_') c = '-';
        out.push_back((char)std::toupper((unsigned char)c));
    }
    return out;
}

const ProductInfo* find_product_by_name(const std::string& name) {
    const std::string want = normalize(name);
    for (const auto& p : kProducts)
        if (want == p.name) return &p;
    return nullptr;
}

bool adapt_product_id(const Payload& raw, Payload& out) {
    int64_t v;
    if (!as_integer(raw, v) || v < 0 || v > 0xFFFFFFFFll) return false;
    if (!find_product(uint32_t(v))) return false;
    out = v;
    return true;
}

} // namespace ventilink
