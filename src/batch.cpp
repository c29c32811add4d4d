// ============================================================================
// batch.cpp — implementation for ventilink/batch.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/batch.hpp"
#include "ventilink/log.hpp"

#include <algorithm>

namespace ventilink {

std::vector<ReadRun> plan_runs(RegisterList& regs) {
    std::stable_sort(regs.begin(), regs.end(),
                     [](const RegisterDescriptor* a, const RegisterDescriptor* b) {
                         return a->address < b->address;
                     });

    std::vector<ReadRun> runs;
    for (std::size_t i = 0; i < regs.size(); ++i) {
        const auto* r = regs[i];
        if (!runs.empty()) {
            ReadRun& cur = runs.back();
            const auto* prev = regs[cur.last];
            bool contiguous = uint32_t(prev->address) + prev->length == r->address;
            bool fits = std::size_t(cur.count) + r->length <= MAX_READ_WORDS;
            if (contiguous && fits) {
                cur.count = uint16_t(cur.count + r->length);
                cur.last = i;
                continue;
            }
        }
        runs.push_back(ReadRun{r->address, r->length, i, i});
    }
    return runs;
}

bool read_batch(Client& client, uint8_t device, RegisterList regs, ValueMap& out, Error& err) {
    if (regs.empty()) return fail(err, ErrorKind::InvalidArgument, "empty_register_list");
    for (const auto* r : regs) {
        if (!r->can_read())
            return fail(err, ErrorKind::InvalidArgument, "not_readable:" + property_name(r->property));
    }

    const auto runs = plan_runs(regs);

    Words words;
    for (const auto& run : runs) {
        Error run_err;
        if (!client.read_block(device, run.address, run.count, words, run_err)) {
            if (run_err.kind == ErrorKind::Acknowledge) {
                log_info("event=batch_run_skip device=" + std::to_string(device) +
                         " address=" + std::to_string(run.address) +
                         " count=" + std::to_string(run.count) + " kind=acknowledge");
                continue;
            }
            err = run_err;
            return false;
        }

        std::size_t offset = 0;
        for (std::size_t i = run.first; i <= run.last; ++i) {
            const auto* r = regs[i];
            AnyValue v;
            Error dec_err;
            if (decode_value(*r, words.data() + offset, r->length, v.value, dec_err)) {
                out[r->property] = std::move(v);
            } else {
                log_info("event=batch_value_skip device=" + std::to_string(device) +
                         " property=" + property_name(r->property) + " " + describe(dec_err));
            }
            offset += r->length;
        }
    }
    return true;
}

} // namespace ventilink
