#pragma once
/**
 * @page vl-values ventilink Values
 * @file values.hpp
 * @brief Decoded register payloads and the optional freshness record.
 *
 * @details
 * PURPOSE
 * -------
 * A register read produces a Value<T>: the decoded payload plus, for
 * registers that carry a status word, a Freshness record that says how old
 * the gateway's copy is and where it came from. Freshness is std::nullopt
 * whenever no status read was made (batch reads, registers without status).
 *
 * WHAT LIVES HERE
 * ---------------
 * - Freshness, ValueSource and the status flag bits.
 * - Calendar types (Date, DateTime) with an explicit "unknown" sentinel.
 * - Small domain records produced by result adapters (battery, fault,
 *   heater, temperature, bypass position).
 * - Payload: the closed variant every generic path (get, fetch) carries.
 *   std::monostate is the "absent" payload used by aggregate fetches.
 *
 * DESIGN NOTES
 * ------------
 * - All integer registers decode to int64_t so U16/I16/U32 share one
 *   alternative; typed accessors narrow them to enums where that helps.
 * - Text is an etl::string sized for the longest string register (10 words,
 *   20 bytes) with headroom, so no heap allocation happens per value.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <etl/string.h>

namespace ventilink {

#ifndef VENTILINK_TEXT_MAX
#define VENTILINK_TEXT_MAX 64
#endif

using Text = etl::string<VENTILINK_TEXT_MAX>;

enum class ValueSource : uint8_t { Unknown = 0, Radio = 1, Wire = 2 };

/// Status flag bits as they appear after shifting the status word right by 8.
namespace value_flags {
constexpr uint8_t VALID         = 0x01;
constexpr uint8_t ERROR         = 0x02;
constexpr uint8_t READ_PENDING  = 0x04;
constexpr uint8_t WRITE_PENDING = 0x08;
constexpr uint8_t NEW_VALUE     = 0x40;
} // namespace value_flags

struct Freshness {
    std::chrono::seconds age{0};
    ValueSource          source{ValueSource::Unknown};
    uint8_t              flags{0};

    bool has(uint8_t flag) const { return (flags & flag) != 0; }
};

inline bool operator==(const Freshness& a, const Freshness& b) {
    return a.age == b.age && a.source == b.source && a.flags == b.flags;
}

/// Calendar date; {0,0,0} is the "unknown" sentinel (0xFFFFFFFF on the wire).
struct Date {
    uint16_t year{0};
    uint8_t  month{0};
    uint8_t  day{0};

    static constexpr Date unknown() { return Date{}; }
    bool known() const { return month != 0; }
};

inline bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

/// UNIX timestamp in UTC; 0xFFFFFFFF is "unknown".
struct DateTime {
    static constexpr uint32_t UNKNOWN = 0xFFFFFFFFu;
    uint32_t timestamp{UNKNOWN};

    static constexpr DateTime unknown() { return DateTime{}; }
    bool known() const { return timestamp != UNKNOWN; }
};

inline bool operator==(const DateTime& a, const DateTime& b) { return a.timestamp == b.timestamp; }

struct BatteryStatus {
    bool available{false};
    bool low{false};
};

inline bool operator==(const BatteryStatus& a, const BatteryStatus& b) {
    return a.available == b.available && a.low == b.low;
}

struct FaultStatus {
    bool available{false};
    bool fault{false};
};

inline bool operator==(const FaultStatus& a, const FaultStatus& b) {
    return a.available == b.available && a.fault == b.fault;
}

struct HeaterState {
    static constexpr uint16_t UNAVAILABLE = 0xEF;
    uint16_t level{0};
    bool     available{false};
};

inline bool operator==(const HeaterState& a, const HeaterState& b) {
    return a.level == b.level && a.available == b.available;
}

enum class SensorStatus : uint8_t { Ok = 0, Unavailable = 1, Error = 2 };

struct Temperature {
    float        celsius{0.0f};
    SensorStatus status{SensorStatus::Unavailable};
};

inline bool operator==(const Temperature& a, const Temperature& b) {
    // NaN readings compare equal when both are unavailable
    return a.status == b.status && (a.status == SensorStatus::Unavailable || a.celsius == b.celsius);
}

struct BypassPosition {
    uint16_t position{0};
    bool     error{false};
};

inline bool operator==(const BypassPosition& a, const BypassPosition& b) {
    return a.position == b.position && a.error == b.error;
}

using Payload = std::variant<std::monostate,
                             int64_t,
                             float,
                             Text,
                             Date,
                             DateTime,
                             BatteryStatus,
                             FaultStatus,
                             HeaterState,
                             Temperature,
                             BypassPosition>;

template <typename T>
struct Value {
    T                        value{};
    std::optional<Freshness> freshness;
};

using AnyValue = Value<Payload>;

inline bool is_absent(const AnyValue& v) { return std::holds_alternative<std::monostate>(v.value); }

/// Integer view of a payload; false when it does not hold an integer.
bool as_integer(const Payload& p, int64_t& out);

/// Human-readable rendering ("21.5", "2024-03-07", "available low=0", "-").
std::string to_string(const Payload& p);

const char* source_name(ValueSource s);

/// "YYYY-MM-DD", or "unknown".
std::string format_date(const Date& d);

/// ISO-8601 UTC ("2024-03-07T12:00:00Z"), or "unknown".
std::string format_datetime(const DateTime& dt);

} // namespace ventilink
