// ============================================================================
// values.cpp — implementation for ventilink/values.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/values.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>

namespace ventilink {

bool as_integer(const Payload& p, int64_t& out) {
    if (const auto* v = std::get_if<int64_t>(&p)) {
        out = *v;
        return true;
    }
    return false;
}

const char* source_name(ValueSource s) {
    switch (s) {
        case ValueSource::Unknown: return "unknown";
        case ValueSource::Radio:   return "rf";
        case ValueSource::Wire:    return "modbus";
    }
    return "?";
}

std::string format_date(const Date& d) {
    if (!d.known()) return "unknown";
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u", unsigned(d.year), unsigned(d.month), unsigned(d.day));
    return buf;
}

std::string format_datetime(const DateTime& dt) {
    if (!dt.known()) return "unknown";
    std::time_t t = static_cast<std::time_t>(dt.timestamp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

static const char* sensor_status_name(SensorStatus s) {
    switch (s) {
        case SensorStatus::Ok:          return "ok";
        case SensorStatus::Unavailable: return "unavailable";
        case SensorStatus::Error:       return "error";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// to_string()
// -----------
// One visitor branch per payload alternative. Floats print with %g so
// setpoints like 21.5 stay short.
// ---------------------------------------------------------------------------
std::string to_string(const Payload& p) {
    struct Printer {
        std::string operator()(std::monostate) const { return "-"; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(float v) const {
            if (std::isnan(v)) return "nan";
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%g", double(v));
            return buf;
        }
        std::string operator()(const Text& v) const { return std::string(v.c_str(), v.size()); }
        std::string operator()(const Date& v) const { return format_date(v); }
        std::string operator()(const DateTime& v) const { return format_datetime(v); }
        std::string operator()(const BatteryStatus& v) const {
            if (!v.available) return "unavailable";
            return v.low ? "low" : "ok";
        }
        std::string operator()(const FaultStatus& v) const {
            if (!v.available) return "unavailable";
            return v.fault ? "fault" : "ok";
        }
        std::string operator()(const HeaterState& v) const {
            if (!v.available) return "unavailable";
            return std::to_string(v.level);
        }
        std::string operator()(const Temperature& v) const {
            if (v.status != SensorStatus::Ok) return sensor_status_name(v.status);
            return (*this)(v.celsius);
        }
        std::string operator()(const BypassPosition& v) const {
            std::string s = std::to_string(v.position);
            if (v.error) s += " (error)";
            return s;
        }
    };
    return std::visit(Printer{}, p);
}

} // namespace ventilink
