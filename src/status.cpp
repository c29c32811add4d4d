// ============================================================================
// status.cpp — implementation for ventilink/status.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/status.hpp"

namespace ventilink {

Freshness decode_status(uint16_t word) {
    Freshness f;

    long age = word & STATUS_AGE_MASK;
    if (word & STATUS_HOURS_BIT) age *= 3600;
    f.age = std::chrono::seconds(age);

    f.flags = uint8_t((word >> 8) & STATUS_FLAGS_MASK);

    // source 3 is reserved; report it as unknown
    switch ((word >> 12) & STATUS_SOURCE_MASK) {
        case 1:  f.source = ValueSource::Radio; break;
        case 2:  f.source = ValueSource::Wire;  break;
        default: f.source = ValueSource::Unknown; break;
    }
    return f;
}

} // namespace ventilink
