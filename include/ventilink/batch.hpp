#pragma once
/**
 * @file batch.hpp
 * @brief Contiguous-run batching for bulk register fetches.
 *
 * @details
 * Registers are sorted by address and cut into runs: a register joins the
 * current run when its address equals the previous register's
 * address + length and the run stays within MAX_READ_WORDS. Each run costs
 * one bulk read; the returned words are sliced back per register and decoded
 * with each register's own codec and adapter.
 *
 * Partial failure policy:
 * - a decode/adapter failure drops only that property (logged);
 * - Acknowledge on a run drops that run's properties and moves on;
 * - any other error ends the batch and is returned to the caller.
 *
 * Bulk reads never carry Freshness; use Client::get_register for that.
 */

#include <cstdint>
#include <map>
#include <vector>

#include "ventilink/client.hpp"
#include "ventilink/register.hpp"

namespace ventilink {

using ValueMap = std::map<Property, AnyValue>;
using RegisterList = std::vector<const RegisterDescriptor*>;

struct ReadRun {
    uint16_t    address{0};  ///< first register address
    uint16_t    count{0};    ///< words spanned by the run
    std::size_t first{0};    ///< index of the first register in the sorted list
    std::size_t last{0};     ///< index of the last register (inclusive)
};

/// Sort @p regs by address and split them into maximal contiguous runs.
std::vector<ReadRun> plan_runs(RegisterList& regs);

/**
 * @brief Read every register in @p regs from @p device with one request per run.
 *
 * Decoded values are inserted into @p out (existing entries are replaced).
 * Fails with InvalidArgument, before any I/O, for an empty list or a
 * register without read access.
 */
bool read_batch(Client& client, uint8_t device, RegisterList regs, ValueMap& out, Error& err);

} // namespace ventilink
