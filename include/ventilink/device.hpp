#pragma once
/**
 * @page vl-device ventilink Device Model
 * @file device.hpp
 * @brief Named, typed surface over one device's register table.
 *
 * @details
 * PURPOSE
 * -------
 * A Device is a device address plus a reference to the shared Client and the
 * register table of its product. Callers ask for properties by name; the
 * Device finds the descriptor and lets the Client do the I/O.
 *
 * WHAT THIS DOES
 * --------------
 * - get(property) / set(property, value): single-register path. Unknown
 *   properties fail with PropertyNotSupported.
 * - fetch(): everything readable in one call.
 *     with_status = false  batch reader, one request per contiguous run,
 *                          no Freshness.
 *     with_status = true   one get per register, each with its Freshness;
 *                          Acknowledge and Decode failures skip that
 *                          property only.
 *     all_properties       fill skipped properties with an absent value, so
 *                          the map has one entry per declared property.
 * - Common accessors every product shares (RF address, battery, fault,
 *   RF statistics).
 *
 * Product classes (Bridge, Vmd02rps78, Vmn) only add their own register
 * table and typed convenience accessors. Nothing is cached: every call reads
 * from the device again.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <vector>

#include "ventilink/batch.hpp"
#include "ventilink/client.hpp"
#include "ventilink/products.hpp"
#include "ventilink/register.hpp"

namespace ventilink {

/// Registers present on every device. Also used directly by the node directory.
namespace common_registers {
inline constexpr RegisterDescriptor RF_ADDRESS = reg_u32(Property::RfAddress, 40000, access::READ);
inline constexpr RegisterDescriptor PRODUCT_ID = reg_u32(Property::ProductId, 40002, access::READ);
} // namespace common_registers

/// Value written to the RF statistics index register to clear the window.
constexpr uint16_t RF_STATS_CLEAR = 255;

struct RfStatsRecord {
    uint32_t             device{0};     ///< RF address of the peer
    uint16_t             average{0};
    float                stddev{0.0f};
    uint16_t             minimum{0};
    uint16_t             maximum{0};
    uint16_t             missed{0};
    uint16_t             received{0};
    std::chrono::minutes age{0};
};

class Device {
public:
    Device(Client& client, uint8_t address);
    virtual ~Device() = default;

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    uint8_t address() const { return address_; }
    Client& client() const { return client_; }

    /// Product identity this model was built for.
    virtual ProductId product() const = 0;

    /// Descriptors sorted by address.
    const RegisterList& registers() const { return registers_; }

    const RegisterDescriptor* find(Property p) const;
    bool supports(Property p) const { return find(p) != nullptr; }

    bool get(Property p, AnyValue& out, Error& err);
    bool set(Property p, const Payload& value, Error& err);
    bool fetch(ValueMap& out, Error& err, bool all_properties = true, bool with_status = true);

    /// get() narrowed to one payload alternative; a different alternative is a Decode error.
    template <typename T>
    bool get_as(Property p, Value<T>& out, Error& err) {
        AnyValue any;
        if (!get(p, any, err)) return false;
        const T* v = std::get_if<T>(&any.value);
        if (!v) return fail(err, ErrorKind::Decode, "unexpected_type:" + property_name(p));
        out.value = *v;
        out.freshness = any.freshness;
        return true;
    }

    // ---- common accessors ----
    bool rf_address(Value<int64_t>& out, Error& err)       { return get_as(Property::RfAddress, out, err); }
    bool product_name(Value<Text>& out, Error& err)        { return get_as(Property::ProductName, out, err); }
    bool software_version(Value<int64_t>& out, Error& err) { return get_as(Property::SoftwareVersion, out, err); }
    bool battery_status(Value<BatteryStatus>& out, Error& err);
    bool fault_status(Value<FaultStatus>& out, Error& err);

    /// Walk the RF statistics window: write each index, then read the record fields.
    bool rf_stats(std::vector<RfStatsRecord>& out, Error& err);
    bool clear_rf_stats(Error& err);

protected:
    /// Merge @p table into this device's registers and keep them sorted.
    void add_registers(const RegisterTable& table);

    bool get_int(Property p, int64_t& out, Error& err);

private:
    Client&                                        client_;
    uint8_t                                        address_;
    RegisterList                                   registers_;
    std::map<Property, const RegisterDescriptor*>  by_property_;
};

/// Register table shared by every product (identity, RF status, statistics).
RegisterTable common_register_table();

} // namespace ventilink
