// ============================================================================
// node_directory.cpp — implementation for ventilink/node_directory.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/node_directory.hpp"
#include "ventilink/factory.hpp"
#include "ventilink/log.hpp"

namespace ventilink {

// Errors that mean "this slot, not the scan": skip and keep going.
static bool slot_local(const Error& e) {
    return e.kind == ErrorKind::Acknowledge || e.kind == ErrorKind::Decode;
}

static bool link_error(const Error& e) {
    return e.kind == ErrorKind::Connection || e.kind == ErrorKind::ConnectionInterrupted;
}

// ---------------------------------------------------------------------------
// nodes()
// -------
// Phases:
//   1) bulk read of the 32 slot registers,
//   2) per non-zero slot, in slot order: product identity, then RF address,
//   3) keep the slot only when the product identity is a known product.
// ---------------------------------------------------------------------------
bool NodeDirectory::nodes(NodeList& out, Error& err) {
    out.clear();

    RegisterList slots;
    for (std::size_t i = 0; i < MAX_BOUND_NODES; ++i) {
        const auto* d = bridge_.find(node_slot_property(i));
        if (!d) return fail(err, ErrorKind::NotImplemented, "gateway_without_node_table");
        slots.push_back(d);
    }

    ValueMap table;
    if (!read_batch(bridge_.client(), bridge_.address(), slots, table, err)) return false;

    Client& client = bridge_.client();
    for (std::size_t i = 0; i < MAX_BOUND_NODES; ++i) {
        auto it = table.find(node_slot_property(i));
        if (it == table.end()) continue;

        int64_t slot = 0;
        if (!as_integer(it->second.value, slot) || slot == 0) continue;
        if (slot > 255) {
            log_warn("event=node_skip slot=" + std::to_string(i + 1) + " reason=bad_address value=" + std::to_string(slot));
            continue;
        }
        const uint8_t address = uint8_t(slot);

        AnyValue pid, rf;
        Error e;
        if (!client.get_register(common_registers::PRODUCT_ID, address, pid, e) ||
            !client.get_register(common_registers::RF_ADDRESS, address, rf, e)) {
            if (!slot_local(e)) { err = e; return false; }
            log_warn("event=node_skip slot=" + std::to_string(i + 1) + " device=" + std::to_string(address) +
                     " " + describe(e));
            continue;
        }

        int64_t raw_pid = -1;
        const ProductInfo* info = nullptr;
        if (as_integer(pid.value, raw_pid) && raw_pid >= 0 && raw_pid <= 0xFFFFFFFFll)
            info = find_product(uint32_t(raw_pid));
        if (!info) {
            log_warn("event=node_skip slot=" + std::to_string(i + 1) + " device=" + std::to_string(address) +
                     " reason=unknown_product value=" + std::to_string(raw_pid));
            continue;
        }

        int64_t rf_address = 0;
        as_integer(rf.value, rf_address);

        out.push_back(BoundNodeInfo{address, info->id, uint32_t(rf_address)});
    }
    return true;
}

bool NodeDirectory::node(uint8_t address, std::unique_ptr<Device>& out, Error& err) {
    if (address == bridge_.address())
        return make_device(ProductId::BRDG_02R13, address, bridge_.client(), out, err);

    NodeList list;
    if (!nodes(list, err)) return false;
    for (const auto& n : list) {
        if (n.address == address) return make_device(n.product, n.address, bridge_.client(), out, err);
    }
    return fail(err, ErrorKind::NotFound, "node:" + std::to_string(address));
}

bool fetch_all(NodeDirectory& directory, FetchAllResult& out, Error& err, bool with_status) {
    out.clear();
    Bridge& bridge = directory.bridge();

    ValueMap own;
    if (!bridge.fetch(own, err, true, with_status)) return false;
    out[bridge.address()] = std::move(own);

    NodeList list;
    if (!directory.nodes(list, err)) return false;

    for (const auto& n : list) {
        std::unique_ptr<Device> dev;
        Error e;
        if (!make_device(n.product, n.address, bridge.client(), dev, e)) {
            log_warn("event=fetch_all_skip device=" + std::to_string(n.address) + " " + describe(e));
            continue;
        }
        ValueMap values;
        if (!dev->fetch(values, e, true, with_status)) {
            if (link_error(e)) { err = e; return false; }
            log_warn("event=fetch_all_skip device=" + std::to_string(n.address) + " " + describe(e));
            continue;
        }
        out[n.address] = std::move(values);
    }
    return true;
}

} // namespace ventilink
