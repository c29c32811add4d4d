// ============================================================================
// factory.cpp — implementation for ventilink/factory.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/factory.hpp"
#include "ventilink/bridge.hpp"
#include "ventilink/vmd.hpp"
#include "ventilink/vmn.hpp"

#include <memory>

namespace ventilink {

bool make_device(ProductId product, uint8_t address, Client& client,
                 std::unique_ptr<Device>& out, Error& err) {
    switch (product) {
        case ProductId::BRDG_02R13:
            out = std::make_unique<Bridge>(client, address);
            return true;
        case ProductId::VMD_02RPS78:
            out = std::make_unique<Vmd02rps78>(client, address);
            return true;
        case ProductId::VMN_05LM02:
        case ProductId::VMN_02LM11:
            out = std::make_unique<Vmn>(client, address, product);
            return true;
    }
    return fail(err, ErrorKind::NotImplemented,
                "no_model_for_product:" + std::to_string(static_cast<uint32_t>(product)));
}

} // namespace ventilink
