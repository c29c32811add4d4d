#pragma once
/**
 * @page vl-register ventilink Register Codec
 * @file register.hpp
 * @brief Register descriptors and the word-level codec behind every property.
 *
 * @details
 * PURPOSE
 * -------
 * A register is N consecutive 16-bit words at a fixed address on a device.
 * A RegisterDescriptor names which property it holds, how many words it
 * spans, whether it may be read, written or carries a status word, and how
 * those words turn into a Payload (and back).
 *
 * WORD LAYOUT
 * -----------
 * - U16 / I16         1 word.
 * - U32 / Float       2 words, low word first.
 * - String(n)         n words, two bytes per word (high byte first), UTF-8,
 *                     trailing NULs stripped on decode and padded on encode.
 * - Date              U32 whose big-endian bytes are (day, month, year16).
 * - DateTime          U32 UNIX timestamp, UTC.
 * For Date and DateTime, 0xFFFFFFFF decodes to the "unknown" sentinel
 * rather than failing. Registers that require a real date attach
 * adapt_known_date, which turns the sentinel into a Decode error.
 *
 * RESULT ADAPTERS
 * ---------------
 * A descriptor may carry a plain function pointer that turns the raw decoded
 * payload into a richer domain value (battery word -> BatteryStatus). A false
 * return from the adapter is a Decode error for that one value.
 *
 * TABLES
 * ------
 * Device tables are constexpr arrays built with the reg_* helpers below, e.g.
 * @code
 *   constexpr RegisterDescriptor kRegs[] = {
 *       reg_u32(Property::RfAddress, 40000, access::READ),
 *       reg_u16(Property::CreateNode, 43005, access::WRITE).limits(2, 247),
 *       reg_u16(Property::BatteryStatus, 40102, access::READ).adapt(adapt_battery),
 *   };
 * @endcode
 */

#include <cstddef>
#include <cstdint>

#include <etl/vector.h>

#include "ventilink/error.hpp"
#include "ventilink/property.hpp"
#include "ventilink/values.hpp"

namespace ventilink {

/// Largest word count one read-holding-registers request may carry.
constexpr std::size_t MAX_READ_WORDS = 125;

/// Largest word count one write-multiple-registers request may carry.
constexpr std::size_t MAX_WRITE_WORDS = 123;

using Words = etl::vector<uint16_t, MAX_READ_WORDS>;

enum class RegisterType : uint8_t { U16, I16, U32, Float, String, Date, DateTime };

namespace access {
constexpr uint8_t READ   = 0x01;
constexpr uint8_t WRITE  = 0x02;
constexpr uint8_t STATUS = 0x04;
} // namespace access

using ResultAdapter = bool (*)(const Payload& raw, Payload& out);

struct RegisterDescriptor {
    Property      property{};
    uint16_t      address{0};
    uint8_t       length{1};
    RegisterType  type{RegisterType::U16};
    uint8_t       access_mask{0};
    ResultAdapter adapter{nullptr};
    bool          has_limits{false};
    int64_t       min_value{0};
    int64_t       max_value{0};

    constexpr bool can_read()   const { return (access_mask & access::READ) != 0; }
    constexpr bool can_write()  const { return (access_mask & access::WRITE) != 0; }
    constexpr bool has_status() const { return (access_mask & access::STATUS) != 0; }

    constexpr RegisterDescriptor adapt(ResultAdapter fn) const {
        RegisterDescriptor d = *this;
        d.adapter = fn;
        return d;
    }

    constexpr RegisterDescriptor limits(int64_t lo, int64_t hi) const {
        RegisterDescriptor d = *this;
        d.has_limits = true;
        d.min_value = lo;
        d.max_value = hi;
        return d;
    }
};

constexpr RegisterDescriptor make_register(Property p, uint16_t addr, uint8_t len,
                                           RegisterType t, uint8_t acc) {
    RegisterDescriptor d{};
    d.property = p;
    d.address = addr;
    d.length = len;
    d.type = t;
    d.access_mask = acc;
    return d;
}

constexpr RegisterDescriptor reg_u16(Property p, uint16_t a, uint8_t acc)   { return make_register(p, a, 1, RegisterType::U16, acc); }
constexpr RegisterDescriptor reg_i16(Property p, uint16_t a, uint8_t acc)   { return make_register(p, a, 1, RegisterType::I16, acc); }
constexpr RegisterDescriptor reg_u32(Property p, uint16_t a, uint8_t acc)   { return make_register(p, a, 2, RegisterType::U32, acc); }
constexpr RegisterDescriptor reg_float(Property p, uint16_t a, uint8_t acc) { return make_register(p, a, 2, RegisterType::Float, acc); }
constexpr RegisterDescriptor reg_date(Property p, uint16_t a, uint8_t acc)  { return make_register(p, a, 2, RegisterType::Date, acc); }
constexpr RegisterDescriptor reg_datetime(Property p, uint16_t a, uint8_t acc) {
    return make_register(p, a, 2, RegisterType::DateTime, acc);
}
constexpr RegisterDescriptor reg_string(Property p, uint16_t a, uint8_t words, uint8_t acc) {
    return make_register(p, a, words, RegisterType::String, acc);
}

/// Non-owning view over a constexpr descriptor array.
struct RegisterTable {
    const RegisterDescriptor* data{nullptr};
    std::size_t               size{0};

    const RegisterDescriptor* begin() const { return data; }
    const RegisterDescriptor* end()   const { return data + size; }
};

template <std::size_t N>
constexpr RegisterTable make_table(const RegisterDescriptor (&arr)[N]) {
    return RegisterTable{arr, N};
}

/**
 * @brief Decode @p count words into the raw payload for @p d (no adapter).
 * @return false with a Decode error when the word count does not match or
 *         the payload is malformed (bad UTF-8, impossible date).
 */
bool decode_raw(const RegisterDescriptor& d, const uint16_t* words, std::size_t count,
                Payload& out, Error& err);

/// decode_raw() followed by the descriptor's adapter, if any.
bool decode_value(const RegisterDescriptor& d, const uint16_t* words, std::size_t count,
                  Payload& out, Error& err);

/**
 * @brief Encode @p value into d.length words.
 * @return false with InvalidArgument when the payload type does not fit the
 *         register type, or the value is out of range / outside the limits.
 */
bool encode_value(const RegisterDescriptor& d, const Payload& value, Words& out, Error& err);

/// False with InvalidArgument when two descriptors share an address or overlap.
bool validate_table(const RegisterTable& table, Error& err);

// ---- common result adapters ----
bool adapt_known_date(const Payload& raw, Payload& out);
bool adapt_known_datetime(const Payload& raw, Payload& out);
bool adapt_battery(const Payload& raw, Payload& out);
bool adapt_fault(const Payload& raw, Payload& out);
bool adapt_heater(const Payload& raw, Payload& out);
bool adapt_temperature(const Payload& raw, Payload& out);
bool adapt_bypass_position(const Payload& raw, Payload& out);

} // namespace ventilink
