// ============================================================================
// register.cpp — implementation for ventilink/register.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/register.hpp"
#include "ventilink/status.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace ventilink {

// ---------- word helpers ----------
// U32 and float registers put the low word at the lower address.

static uint32_t join_u32(const uint16_t* w) {
    return uint32_t(w[0]) | (uint32_t(w[1]) << 16);
}

static void split_u32(uint32_t v, Words& out) {
    out.push_back(uint16_t(v & 0xFFFF));
    out.push_back(uint16_t(v >> 16));
}

static float bits_to_float(uint32_t bits) {
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

static uint32_t float_to_bits(float f) {
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    return bits;
}

static bool is_leap(unsigned y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

static bool valid_date(unsigned y, unsigned m, unsigned d) {
    static const uint8_t dim[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (y == 0 || m < 1 || m > 12 || d < 1) return false;
    unsigned last = dim[m - 1] + ((m == 2 && is_leap(y)) ? 1 : 0);
    return d <= last;
}

// ---------------------------------------------------------------------------
// valid_utf8()
// ------------
// Structural UTF-8 check: lead byte class, continuation bytes, no overlongs
// for 2-byte sequences, no surrogates, nothing above U+10FFFF.
// ---------------------------------------------------------------------------
static bool valid_utf8(const uint8_t* s, std::size_t n) {
    std::size_t i = 0;
    while (i < n) {
        uint8_t c = s[i];
        std::size_t extra;
        uint32_t cp;
        if (c < 0x80)            { ++i; continue; }
        else if ((c >> 5) == 0x6) { extra = 1; cp = c & 0x1F; if (c < 0xC2) return false; }
        else if ((c >> 4) == 0xE) { extra = 2; cp = c & 0x0F; }
        else if ((c >> 3) == 0x1E){ extra = 3; cp = c & 0x07; }
        else return false;

        if (i + extra >= n) return false;   // truncated sequence
        for (std::size_t k = 1; k <= extra; ++k) {
            uint8_t cc = s[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (extra == 2 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
        if (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
        i += extra + 1;
    }
    return true;
}

// -------- decode --------

bool decode_raw(const RegisterDescriptor& d, const uint16_t* words, std::size_t count,
                Payload& out, Error& err) {
    if (count != d.length) {
        return fail(err, ErrorKind::Decode,
                    "word_count:" + property_name(d.property) + " want=" + std::to_string(d.length) +
                    " got=" + std::to_string(count));
    }

    switch (d.type) {
        case RegisterType::U16:
            out = int64_t(words[0]);
            return true;

        case RegisterType::I16:
            out = int64_t(int16_t(words[0]));
            return true;

        case RegisterType::U32:
            out = int64_t(join_u32(words));
            return true;

        case RegisterType::Float:
            out = bits_to_float(join_u32(words));
            return true;

        case RegisterType::String: {
            uint8_t bytes[2 * 255];
            std::size_t n = 0;
            for (std::size_t i = 0; i < count; ++i) {
                bytes[n++] = uint8_t(words[i] >> 8);
                bytes[n++] = uint8_t(words[i] & 0xFF);
            }
            while (n > 0 && bytes[n - 1] == 0) --n;   // strip NUL padding
            if (!valid_utf8(bytes, n))
                return fail(err, ErrorKind::Decode, "bad_utf8:" + property_name(d.property));
            Text t;
            if (n > t.capacity())
                return fail(err, ErrorKind::Decode, "string_overflow:" + property_name(d.property));
            t.assign(reinterpret_cast<const char*>(bytes), n);
            out = t;
            return true;
        }

        case RegisterType::Date: {
            uint32_t v = join_u32(words);
            if (v == 0xFFFFFFFFu) { out = Date::unknown(); return true; }
            Date date;
            date.day   = uint8_t(v >> 24);
            date.month = uint8_t((v >> 16) & 0xFF);
            date.year  = uint16_t(v & 0xFFFF);
            if (!valid_date(date.year, date.month, date.day))
                return fail(err, ErrorKind::Decode, "bad_date:" + property_name(d.property));
            out = date;
            return true;
        }

        case RegisterType::DateTime: {
            DateTime dt;
            dt.timestamp = join_u32(words);
            out = dt;
            return true;
        }
    }
    return fail(err, ErrorKind::Decode, "unknown_type:" + property_name(d.property));
}

bool decode_value(const RegisterDescriptor& d, const uint16_t* words, std::size_t count,
                  Payload& out, Error& err) {
    Payload raw;
    if (!decode_raw(d, words, count, raw, err)) return false;
    if (!d.adapter) {
        out = std::move(raw);
        return true;
    }
    if (!d.adapter(raw, out))
        return fail(err, ErrorKind::Decode, "adapter_rejected:" + property_name(d.property));
    return true;
}

// -------- encode --------

static bool encode_integer(const RegisterDescriptor& d, const Payload& value,
                           int64_t lo, int64_t hi, int64_t& out, Error& err) {
    if (!as_integer(value, out))
        return fail(err, ErrorKind::InvalidArgument, "type_mismatch:" + property_name(d.property));
    if (d.has_limits) {
        lo = std::max(lo, d.min_value);
        hi = std::min(hi, d.max_value);
    }
    if (out < lo || out > hi) {
        return fail(err, ErrorKind::InvalidArgument,
                    "out_of_range:" + property_name(d.property) + "(" + std::to_string(lo) + ".." +
                    std::to_string(hi) + ")");
    }
    return true;
}

bool encode_value(const RegisterDescriptor& d, const Payload& value, Words& out, Error& err) {
    out.clear();
    int64_t iv = 0;

    switch (d.type) {
        case RegisterType::U16:
            if (!encode_integer(d, value, 0, 0xFFFF, iv, err)) return false;
            out.push_back(uint16_t(iv));
            return true;

        case RegisterType::I16:
            if (!encode_integer(d, value, -32768, 32767, iv, err)) return false;
            out.push_back(uint16_t(int16_t(iv)));
            return true;

        case RegisterType::U32:
            if (!encode_integer(d, value, 0, 0xFFFFFFFFll, iv, err)) return false;
            split_u32(uint32_t(iv), out);
            return true;

        case RegisterType::Float: {
            float f;
            if (const auto* pf = std::get_if<float>(&value)) f = *pf;
            else if (as_integer(value, iv)) f = float(iv);
            else return fail(err, ErrorKind::InvalidArgument, "type_mismatch:" + property_name(d.property));
            if (d.has_limits && !std::isnan(f) && (f < float(d.min_value) || f > float(d.max_value)))
                return fail(err, ErrorKind::InvalidArgument, "out_of_range:" + property_name(d.property));
            split_u32(float_to_bits(f), out);
            return true;
        }

        case RegisterType::String: {
            const auto* t = std::get_if<Text>(&value);
            if (!t) return fail(err, ErrorKind::InvalidArgument, "type_mismatch:" + property_name(d.property));
            if (t->size() > std::size_t(d.length) * 2)
                return fail(err, ErrorKind::InvalidArgument, "string_too_long:" + property_name(d.property));
            for (std::size_t i = 0; i < d.length; ++i) {
                std::size_t b = i * 2;
                uint8_t hi = b < t->size() ? uint8_t((*t)[b]) : 0;
                uint8_t lo = b + 1 < t->size() ? uint8_t((*t)[b + 1]) : 0;
                out.push_back(uint16_t((hi << 8) | lo));
            }
            return true;
        }

        case RegisterType::Date: {
            const auto* date = std::get_if<Date>(&value);
            if (!date) return fail(err, ErrorKind::InvalidArgument, "type_mismatch:" + property_name(d.property));
            if (!date->known()) { split_u32(0xFFFFFFFFu, out); return true; }
            if (!valid_date(date->year, date->month, date->day))
                return fail(err, ErrorKind::InvalidArgument, "bad_date:" + property_name(d.property));
            uint32_t v = (uint32_t(date->day) << 24) | (uint32_t(date->month) << 16) | date->year;
            split_u32(v, out);
            return true;
        }

        case RegisterType::DateTime: {
            const auto* dt = std::get_if<DateTime>(&value);
            if (!dt) return fail(err, ErrorKind::InvalidArgument, "type_mismatch:" + property_name(d.property));
            split_u32(dt->timestamp, out);
            return true;
        }
    }
    return fail(err, ErrorKind::InvalidArgument, "unknown_type:" + property_name(d.property));
}

bool validate_table(const RegisterTable& table, Error& err) {
    for (std::size_t i = 0; i < table.size; ++i) {
        const auto& a = table.data[i];
        if (a.has_status() && uint32_t(a.address) + STATUS_OFFSET > 0xFFFF)
            return fail(err, ErrorKind::InvalidArgument, "status_address_overflow:" + property_name(a.property));
        for (std::size_t j = i + 1; j < table.size; ++j) {
            const auto& b = table.data[j];
            bool overlap = a.address < b.address + b.length && b.address < a.address + a.length;
            if (overlap) {
                return fail(err, ErrorKind::InvalidArgument,
                            "overlapping_registers:" + std::to_string(a.address) + "," +
                            std::to_string(b.address));
            }
            if (a.property == b.property)
                return fail(err, ErrorKind::InvalidArgument, "duplicate_property:" + property_name(a.property));
        }
    }
    return true;
}

// -------- adapters --------

bool adapt_known_date(const Payload& raw, Payload& out) {
    const auto* d = std::get_if<Date>(&raw);
    if (!d || !d->known()) return false;
    out = *d;
    return true;
}

bool adapt_known_datetime(const Payload& raw, Payload& out) {
    const auto* d = std::get_if<DateTime>(&raw);
    if (!d || !d->known()) return false;
    out = *d;
    return true;
}

bool adapt_battery(const Payload& raw, Payload& out) {
    int64_t v;
    if (!as_integer(raw, v)) return false;
    BatteryStatus s;
    s.available = v != 0xFFFF;
    s.low = s.available && v != 0;
    out = s;
    return true;
}

bool adapt_fault(const Payload& raw, Payload& out) {
    int64_t v;
    if (!as_integer(raw, v)) return false;
    FaultStatus s;
    s.available = v != 0xFFFF;
    s.fault = v != 0;
    out = s;
    return true;
}

bool adapt_heater(const Payload& raw, Payload& out) {
    int64_t v;
    if (!as_integer(raw, v)) return false;
    HeaterState h;
    h.level = uint16_t(v);
    h.available = v != HeaterState::UNAVAILABLE;
    out = h;
    return true;
}

bool adapt_temperature(const Payload& raw, Payload& out) {
    const auto* f = std::get_if<float>(&raw);
    if (!f) return false;
    Temperature t;
    t.celsius = *f;
    if (std::isnan(*f))     t.status = SensorStatus::Unavailable;
    else if (*f < -273.0f)  t.status = SensorStatus::Error;
    else                    t.status = SensorStatus::Ok;
    out = t;
    return true;
}

bool adapt_bypass_position(const Payload& raw, Payload& out) {
    int64_t v;
    if (!as_integer(raw, v)) return false;
    BypassPosition b;
    b.position = uint16_t(v);
    b.error = v > 120;
    out = b;
    return true;
}

} // namespace ventilink
