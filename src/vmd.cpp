// ============================================================================
// vmd.cpp — implementation for ventilink/vmd.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/vmd.hpp"

#include <algorithm>
#include <cctype>

namespace ventilink {

static constexpr uint8_t R_S  = access::READ | access::STATUS;
static constexpr uint8_t W    = access::WRITE;
static constexpr uint8_t W_S  = access::WRITE | access::STATUS;
static constexpr uint8_t RW_S = access::READ | access::WRITE | access::STATUS;

static constexpr RegisterDescriptor kVmdRegisters[] = {
    reg_u16(Property::CurrentVentilationSpeed,   41000, R_S),
    reg_u16(Property::FanSpeedExhaust,           41001, R_S),
    reg_u16(Property::FanSpeedSupply,            41002, R_S),
    reg_u16(Property::ErrorCode,                 41003, R_S),
    reg_u16(Property::OverrideRemainingTime,     41004, R_S),
    reg_float(Property::TemperatureIndoor,       41005, R_S).adapt(adapt_temperature),
    reg_float(Property::TemperatureOutdoor,      41007, R_S).adapt(adapt_temperature),
    reg_float(Property::TemperatureExhaust,      41009, R_S).adapt(adapt_temperature),
    reg_float(Property::TemperatureSupply,       41011, R_S).adapt(adapt_temperature),
    reg_u16(Property::Preheater,                 41013, R_S).adapt(adapt_heater),
    reg_u16(Property::FilterDirty,               41014, R_S),
    reg_u16(Property::Defrost,                   41015, R_S),
    reg_u16(Property::BypassPosition,            41016, R_S).adapt(adapt_bypass_position),
    reg_u16(Property::HumidityIndoor,            41017, R_S),
    reg_u16(Property::HumidityOutdoor,           41018, R_S),
    reg_float(Property::FlowInlet,               41019, R_S),
    reg_float(Property::FlowOutlet,              41021, R_S),
    reg_u16(Property::AirQuality,                41023, R_S),
    reg_u16(Property::AirQualityBasis,           41024, R_S),
    reg_u16(Property::Co2Level,                  41025, R_S),
    reg_u16(Property::Postheater,                41026, R_S).adapt(adapt_heater),
    reg_u16(Property::Capabilities,              41027, R_S),
    reg_u16(Property::FilterRemainingDays,       41040, R_S),
    reg_u16(Property::FilterDuration,            41041, R_S),
    reg_u16(Property::FilterRemainingPercent,    41042, R_S),
    reg_u16(Property::FanRpmExhaust,             41043, R_S),
    reg_u16(Property::FanRpmSupply,              41044, R_S),
    reg_u16(Property::BypassMode,                41050, R_S),
    reg_u16(Property::BypassStatus,              41051, R_S),
    reg_u16(Property::RequestedVentilationSpeed, 41500, RW_S),
    reg_u16(Property::OverrideTimeSpeedLow,      41501, W).limits(0, MAX_OVERRIDE_MINUTES),
    reg_u16(Property::OverrideTimeSpeedMid,      41502, W).limits(0, MAX_OVERRIDE_MINUTES),
    reg_u16(Property::OverrideTimeSpeedHigh,     41503, W).limits(0, MAX_OVERRIDE_MINUTES),
    reg_u16(Property::RequestedBypassMode,       41550, RW_S),
    reg_u16(Property::FilterReset,               42000, W_S),
    reg_u16(Property::FanSpeedAwaySupply,        42001, RW_S).limits(0, 40),
    reg_u16(Property::FanSpeedAwayExhaust,       42002, RW_S).limits(0, 40),
    reg_u16(Property::FanSpeedLowSupply,         42003, RW_S).limits(0, 80),
    reg_u16(Property::FanSpeedLowExhaust,        42004, RW_S).limits(0, 80),
    reg_u16(Property::FanSpeedMidSupply,         42005, RW_S).limits(0, 100),
    reg_u16(Property::FanSpeedMidExhaust,        42006, RW_S).limits(0, 100),
    reg_u16(Property::FanSpeedHighSupply,        42007, RW_S).limits(0, 100),
    reg_u16(Property::FanSpeedHighExhaust,       42008, RW_S).limits(0, 100),
    reg_float(Property::FrostProtectionPreheaterSetpoint, 42009, RW_S),
    reg_float(Property::PreheaterSetpoint,                42011, RW_S),
    reg_float(Property::FreeVentilationHeatingSetpoint,   42013, RW_S),
    reg_float(Property::FreeVentilationCoolingOffset,     42015, RW_S),
};

RegisterTable vmd02rps78_register_table() { return make_table(kVmdRegisters); }

Vmd02rps78::Vmd02rps78(Client& client, uint8_t address) : Device(client, address) {
    add_registers(vmd02rps78_register_table());
}

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------
const char* ventilation_speed_name(VentilationSpeed s) {
    switch (s) {
        case VentilationSpeed::Off:          return "off";
        case VentilationSpeed::Low:          return "low";
        case VentilationSpeed::Mid:          return "mid";
        case VentilationSpeed::High:         return "high";
        case VentilationSpeed::OverrideLow:  return "override_low";
        case VentilationSpeed::OverrideMid:  return "override_mid";
        case VentilationSpeed::OverrideHigh: return "override_high";
        case VentilationSpeed::Away:         return "away";
        case VentilationSpeed::Boost:        return "boost";
        case VentilationSpeed::Auto:         return "auto";
    }
    return "unknown";
}

const char* requested_speed_name(RequestedVentilationSpeed s) {
    switch (s) {
        case RequestedVentilationSpeed::Off:   return "off";
        case RequestedVentilationSpeed::Away:  return "away";
        case RequestedVentilationSpeed::Low:   return "low";
        case RequestedVentilationSpeed::Mid:   return "mid";
        case RequestedVentilationSpeed::High:  return "high";
        case RequestedVentilationSpeed::Auto:  return "auto";
        case RequestedVentilationSpeed::Boost: return "boost";
    }
    return "unknown";
}

const char* bypass_mode_name(BypassMode m) {
    switch (m) {
        case BypassMode::Closed:  return "closed";
        case BypassMode::Open:    return "open";
        case BypassMode::Unknown: return "unknown";
        case BypassMode::Auto:    return "auto";
    }
    return "unknown";
}

const char* vmd_error_name(VmdErrorCode c) {
    switch (c) {
        case VmdErrorCode::NoError:              return "no_error";
        case VmdErrorCode::NonSpecificFault:     return "non_specific_fault";
        case VmdErrorCode::EmergencyStop:        return "emergency_stop";
        case VmdErrorCode::Fan1Error:            return "fan_1_error";
        case VmdErrorCode::X22SensorError:       return "x22_sensor_error";
        case VmdErrorCode::X23SensorError:       return "x23_sensor_error";
        case VmdErrorCode::X21SensorError:       return "x21_sensor_error";
        case VmdErrorCode::X20SensorError:       return "x20_sensor_error";
        case VmdErrorCode::Fan2Error:            return "fan_2_error";
        case VmdErrorCode::BindingModeActive:    return "binding_mode_active";
        case VmdErrorCode::IdentificationActive: return "identification_active";
    }
    return "unknown";
}

bool requested_speed_from_name(const std::string& name, RequestedVentilationSpeed& out) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return char(std::tolower(c)); });
    static constexpr RequestedVentilationSpeed all[] = {
        RequestedVentilationSpeed::Off,  RequestedVentilationSpeed::Away, RequestedVentilationSpeed::Low,
        RequestedVentilationSpeed::Mid,  RequestedVentilationSpeed::High, RequestedVentilationSpeed::Auto,
        RequestedVentilationSpeed::Boost,
    };
    for (auto s : all) {
        if (key == requested_speed_name(s)) { out = s; return true; }
    }
    return false;
}

// Integer register narrowed to an enum; freshness carried over.
template <typename E>
static bool get_enum(Device& dev, Property p, Value<E>& out, Error& err) {
    Value<int64_t> raw;
    if (!dev.get_as(p, raw, err)) return false;
    out.value = static_cast<E>(raw.value);
    out.freshness = raw.freshness;
    return true;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
bool Vmd02rps78::ventilation_speed(Value<VentilationSpeed>& out, Error& err) {
    return get_enum(*this, Property::CurrentVentilationSpeed, out, err);
}

bool Vmd02rps78::set_ventilation_speed(RequestedVentilationSpeed speed, Error& err) {
    return set(Property::RequestedVentilationSpeed, int64_t(speed), err);
}

bool Vmd02rps78::set_override(RequestedVentilationSpeed speed, uint16_t minutes, Error& err) {
    switch (speed) {
        case RequestedVentilationSpeed::Low:  return set(Property::OverrideTimeSpeedLow, int64_t(minutes), err);
        case RequestedVentilationSpeed::Mid:  return set(Property::OverrideTimeSpeedMid, int64_t(minutes), err);
        case RequestedVentilationSpeed::High: return set(Property::OverrideTimeSpeedHigh, int64_t(minutes), err);
        default:
            return fail(err, ErrorKind::InvalidArgument,
                        std::string("override_speed:") + requested_speed_name(speed));
    }
}

// Supply/exhaust register pair for one preset.
static bool preset_properties(RequestedVentilationSpeed preset, Property& supply, Property& exhaust) {
    switch (preset) {
        case RequestedVentilationSpeed::Away:
            supply = Property::FanSpeedAwaySupply; exhaust = Property::FanSpeedAwayExhaust; return true;
        case RequestedVentilationSpeed::Low:
            supply = Property::FanSpeedLowSupply;  exhaust = Property::FanSpeedLowExhaust;  return true;
        case RequestedVentilationSpeed::Mid:
            supply = Property::FanSpeedMidSupply;  exhaust = Property::FanSpeedMidExhaust;  return true;
        case RequestedVentilationSpeed::High:
            supply = Property::FanSpeedHighSupply; exhaust = Property::FanSpeedHighExhaust; return true;
        default:
            return false;
    }
}

bool Vmd02rps78::preset_fan_speeds(RequestedVentilationSpeed preset, PresetFanSpeeds& out, Error& err) {
    Property supply, exhaust;
    if (!preset_properties(preset, supply, exhaust))
        return fail(err, ErrorKind::InvalidArgument, std::string("preset:") + requested_speed_name(preset));
    if (!get_as(supply, out.supply, err)) return false;
    return get_as(exhaust, out.exhaust, err);
}

bool Vmd02rps78::set_preset_fan_speeds(RequestedVentilationSpeed preset, uint16_t supply,
                                       uint16_t exhaust, Error& err) {
    Property ps, pe;
    if (!preset_properties(preset, ps, pe))
        return fail(err, ErrorKind::InvalidArgument, std::string("preset:") + requested_speed_name(preset));
    if (!set(ps, int64_t(supply), err)) return false;
    return set(pe, int64_t(exhaust), err);
}

bool Vmd02rps78::bypass_mode(Value<BypassMode>& out, Error& err) {
    Value<int64_t> raw;
    if (!get_as(Property::BypassMode, raw, err)) return false;
    switch (raw.value) {
        case 0: case 100: case 255:
            out.value = static_cast<BypassMode>(raw.value);
            break;
        default:
            out.value = BypassMode::Unknown;
            break;
    }
    out.freshness = raw.freshness;
    return true;
}

bool Vmd02rps78::set_bypass_mode(BypassMode mode, Error& err) {
    if (mode == BypassMode::Unknown) return fail(err, ErrorKind::InvalidArgument, "bypass_mode:unknown");
    return set(Property::RequestedBypassMode, int64_t(mode), err);
}

bool Vmd02rps78::error_code(Value<VmdErrorCode>& out, Error& err) {
    return get_enum(*this, Property::ErrorCode, out, err);
}

bool Vmd02rps78::capabilities(Value<uint16_t>& out, Error& err) {
    return get_enum(*this, Property::Capabilities, out, err);
}

bool Vmd02rps78::filter_remaining(Value<int64_t>& out, Error& err) {
    Value<int64_t> days, duration;
    if (!get_as(Property::FilterRemainingDays, days, err)) return false;
    if (!get_as(Property::FilterDuration, duration, err)) return false;
    if (duration.value <= 0) return fail(err, ErrorKind::Decode, "filter_duration:0");
    out.value = std::clamp<int64_t>(days.value * 100 / duration.value, 0, 100);
    out.freshness = days.freshness;
    return true;
}

} // namespace ventilink
