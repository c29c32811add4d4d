// ============================================================================
// device.cpp — implementation for ventilink/device.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/device.hpp"
#include "ventilink/log.hpp"

#include <algorithm>

namespace ventilink {

// ---------------------------------------------------------------------------
// Common register table
// ---------------------------------------------------------------------------
static constexpr uint8_t R  = access::READ;
static constexpr uint8_t RW = access::READ | access::WRITE;

static constexpr RegisterDescriptor kCommonRegisters[] = {
    common_registers::RF_ADDRESS,
    common_registers::PRODUCT_ID.adapt(adapt_product_id),
    reg_u16(Property::SoftwareVersion,        40004, R),
    reg_u16(Property::OemNumber,              40005, R),
    reg_u16(Property::RfCapabilities,         40006, R),
    reg_date(Property::ManufactureDate,       40007, R).adapt(adapt_known_date),
    reg_date(Property::SoftwareBuildDate,     40009, R).adapt(adapt_known_date),
    reg_string(Property::ProductName,         40011, 10, R),
    reg_u32(Property::ReceivedProductId,      40021, R),
    reg_u16(Property::RfLastSeen,             40100, R),
    reg_u16(Property::RfCommStatus,           40101, R),
    reg_u16(Property::BatteryStatus,          40102, R).adapt(adapt_battery),
    reg_u16(Property::FaultStatus,            40103, R).adapt(adapt_fault),
    reg_u16(Property::RfStatsIndex,           40120, RW),
    reg_u16(Property::RfStatsLength,          40121, R),
    reg_u32(Property::RfStatsDevice,          40122, R),
    reg_u16(Property::RfStatsAverage,         40124, R),
    reg_float(Property::RfStatsStddev,        40125, R),
    reg_u16(Property::RfStatsMin,             40127, R),
    reg_u16(Property::RfStatsMax,             40128, R),
    reg_u16(Property::RfStatsMissed,          40129, R),
    reg_u16(Property::RfStatsReceived,        40130, R),
    reg_u16(Property::RfStatsAge,             40131, R),
    reg_u16(Property::FaultHistoryIndex,      40300, RW),
    reg_u16(Property::FaultHistoryLength,     40301, RW),
    reg_datetime(Property::FaultHistoryTimestamp, 40302, R),
    reg_u16(Property::FaultHistoryFaultCode,  40304, R),
    reg_u32(Property::FaultHistoryStatusInfo, 40305, R),
    reg_u16(Property::FaultHistoryCommStatus, 40307, R),
};

RegisterTable common_register_table() { return make_table(kCommonRegisters); }

Device::Device(Client& client, uint8_t address) : client_(client), address_(address) {
    add_registers(common_register_table());
}

void Device::add_registers(const RegisterTable& table) {
    for (const auto& d : table) {
        registers_.push_back(&d);
        by_property_[d.property] = &d;
    }
    std::stable_sort(registers_.begin(), registers_.end(),
                     [](const RegisterDescriptor* a, const RegisterDescriptor* b) {
                         return a->address < b->address;
                     });
}

const RegisterDescriptor* Device::find(Property p) const {
    auto it = by_property_.find(p);
    return it == by_property_.end() ? nullptr : it->second;
}

bool Device::get(Property p, AnyValue& out, Error& err) {
    const auto* d = find(p);
    if (!d) return fail(err, ErrorKind::PropertyNotSupported, property_name(p));
    return client_.get_register(*d, address_, out, err);
}

bool Device::set(Property p, const Payload& value, Error& err) {
    const auto* d = find(p);
    if (!d) return fail(err, ErrorKind::PropertyNotSupported, property_name(p));
    return client_.set_register(*d, value, address_, err);
}

bool Device::get_int(Property p, int64_t& out, Error& err) {
    Value<int64_t> v;
    if (!get_as(p, v, err)) return false;
    out = v.value;
    return true;
}

// ---------------------------------------------------------------------------
// fetch()
// -------
// Accumulate into @p out and keep going on per-property trouble. Only errors
// that say the link itself is unusable (or a batch run failing with anything
// but Acknowledge) end the fetch early.
// ---------------------------------------------------------------------------
bool Device::fetch(ValueMap& out, Error& err, bool all_properties, bool with_status) {
    RegisterList readable;
    for (const auto* d : registers_)
        if (d->can_read()) readable.push_back(d);

    if (!with_status) {
        if (!readable.empty() && !read_batch(client_, address_, readable, out, err)) return false;
    } else {
        for (const auto* d : readable) {
            AnyValue v;
            Error e;
            if (client_.get_register(*d, address_, v, e)) {
                out[d->property] = std::move(v);
                continue;
            }
            if (e.kind == ErrorKind::Acknowledge || e.kind == ErrorKind::Decode) {
                log_info("event=fetch_skip device=" + std::to_string(address_) +
                         " property=" + property_name(d->property) + " " + describe(e));
                continue;
            }
            err = e;
            return false;
        }
    }

    if (all_properties) {
        for (const auto& kv : by_property_)
            if (out.find(kv.first) == out.end()) out[kv.first] = AnyValue{};
    }
    return true;
}

bool Device::battery_status(Value<BatteryStatus>& out, Error& err) {
    return get_as(Property::BatteryStatus, out, err);
}

bool Device::fault_status(Value<FaultStatus>& out, Error& err) {
    return get_as(Property::FaultStatus, out, err);
}

bool Device::clear_rf_stats(Error& err) {
    return set(Property::RfStatsIndex, int64_t(RF_STATS_CLEAR), err);
}

bool Device::rf_stats(std::vector<RfStatsRecord>& out, Error& err) {
    out.clear();
    int64_t length = 0;
    if (!get_int(Property::RfStatsLength, length, err)) return false;

    for (int64_t i = 0; i < length; ++i) {
        Error werr;
        if (!set(Property::RfStatsIndex, i, werr)) {
            log_warn("event=rf_stats_index_failed device=" + std::to_string(address_) +
                     " index=" + std::to_string(i) + " " + describe(werr));
            continue;
        }

        RfStatsRecord rec;
        int64_t v = 0;
        if (!get_int(Property::RfStatsDevice, v, err)) return false;
        rec.device = uint32_t(v);
        if (!get_int(Property::RfStatsAverage, v, err)) return false;
        rec.average = uint16_t(v);

        Value<float> sd;
        if (!get_as(Property::RfStatsStddev, sd, err)) return false;
        rec.stddev = sd.value;

        if (!get_int(Property::RfStatsMin, v, err)) return false;
        rec.minimum = uint16_t(v);
        if (!get_int(Property::RfStatsMax, v, err)) return false;
        rec.maximum = uint16_t(v);
        if (!get_int(Property::RfStatsMissed, v, err)) return false;
        rec.missed = uint16_t(v);
        if (!get_int(Property::RfStatsReceived, v, err)) return false;
        rec.received = uint16_t(v);
        if (!get_int(Property::RfStatsAge, v, err)) return false;
        rec.age = std::chrono::minutes(v);

        out.push_back(rec);
    }
    return true;
}

} // namespace ventilink
