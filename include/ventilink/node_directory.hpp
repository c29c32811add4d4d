#pragma once
/**
 * @page vl-node-directory ventilink Node Directory
 * @file node_directory.hpp
 * @brief Enumerate the nodes bound to a gateway and open device models for them.
 *
 * @details
 * WHAT THIS DOES
 * --------------
 * - nodes(): one bulk read of the 32 node-address slots (they are
 *   contiguous, so the batch reader makes it a single request). For every
 *   non-zero slot, two single reads against that address: product identity,
 *   then RF address. A slot whose product identity is unknown or unreadable
 *   is logged and skipped; the scan continues with the next slot.
 * - node(address): the gateway itself for its own address, otherwise a fresh
 *   scan and the matching model from the factory. No match is NotFound.
 * - fetch_all(): the gateway's own map followed by one map per bound node.
 *
 * Nothing is cached. Every call rescans, so a bind or unbind running at the
 * same time can race a scan; callers serialize the two when that matters.
 */

#include <cstdint>
#include <map>
#include <memory>

#include <etl/vector.h>

#include "ventilink/bridge.hpp"

namespace ventilink {

struct BoundNodeInfo {
    uint8_t   address{0};
    ProductId product{ProductId::BRDG_02R13};
    uint32_t  rf_address{0};
};

using NodeList = etl::vector<BoundNodeInfo, MAX_BOUND_NODES>;

class NodeDirectory {
public:
    explicit NodeDirectory(Bridge& bridge) : bridge_(bridge) {}

    Bridge& bridge() const { return bridge_; }

    bool nodes(NodeList& out, Error& err);
    bool node(uint8_t address, std::unique_ptr<Device>& out, Error& err);

private:
    Bridge& bridge_;
};

using FetchAllResult = std::map<uint8_t, ValueMap>;

/**
 * @brief Fetch the gateway and every bound node, keyed by device address.
 *
 * Nodes whose product has no model, or whose fetch fails with a
 * device-reported error, are logged and left out. Link errors
 * (Connection, ConnectionInterrupted) end the call.
 */
bool fetch_all(NodeDirectory& directory, FetchAllResult& out, Error& err, bool with_status = false);

} // namespace ventilink
