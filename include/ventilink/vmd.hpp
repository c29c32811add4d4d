#pragma once
/**
 * @page vl-vmd ventilink VMD-02RPS78
 * @file vmd.hpp
 * @brief Heat recovery ventilation unit (VMD-02RPS78) reached through the gateway.
 *
 * @details
 * WHAT THIS DOES
 * --------------
 * Adds the controller register block (41000..42016) to the common table and
 * turns raw words into named values where the raw code alone is unhelpful:
 * ventilation speed presets, error codes, bypass mode, capability flags.
 * Temperatures, heaters and bypass position come out of result adapters, so
 * fetch() returns the same typed records as the accessors below.
 *
 * Override timers and preset fan speeds carry write limits; out-of-range
 * values fail with InvalidArgument before any request goes out.
 */

#include <cstdint>
#include <string>

#include "ventilink/device.hpp"

namespace ventilink {

/// Active speed as reported by the unit (41000).
enum class VentilationSpeed : uint16_t {
    Off          = 0,
    Low          = 1,
    Mid          = 2,
    High         = 3,
    OverrideLow  = 11,
    OverrideMid  = 12,
    OverrideHigh = 13,
    Away         = 21,
    Boost        = 23,
    Auto         = 24,
};

/// Speed a caller may request (41500); also the key for presets and overrides.
enum class RequestedVentilationSpeed : uint16_t {
    Off   = 0,
    Away  = 1,
    Low   = 2,
    Mid   = 3,
    High  = 4,
    Auto  = 5,
    Boost = 7,
};

enum class BypassMode : uint16_t {
    Closed  = 0,
    Open    = 100,
    Unknown = 239,
    Auto    = 255,
};

enum class VmdErrorCode : uint16_t {
    NoError              = 0,
    NonSpecificFault     = 1,
    EmergencyStop        = 2,
    Fan1Error            = 3,
    X22SensorError       = 4,
    X23SensorError       = 5,
    X21SensorError       = 6,
    X20SensorError       = 7,
    Fan2Error            = 8,
    BindingModeActive    = 254,
    IdentificationActive = 255,
};

namespace vmd_capability {
constexpr uint16_t PRE_HEATER    = 0x0001;
constexpr uint16_t POST_HEATER   = 0x0002;
constexpr uint16_t RESERVED      = 0x0004;
constexpr uint16_t NIGHT_MODE    = 0x0008;
constexpr uint16_t SPEED_10      = 0x0010;
constexpr uint16_t SPEED_9       = 0x0020;
constexpr uint16_t SPEED_8       = 0x0040;
constexpr uint16_t SPEED_7       = 0x0080;
constexpr uint16_t SPEED_6       = 0x0100;
constexpr uint16_t SPEED_5       = 0x0200;
constexpr uint16_t SPEED_4       = 0x0400;
constexpr uint16_t AUTO_MODE     = 0x0800;
constexpr uint16_t BOOST_MODE    = 0x1000;
constexpr uint16_t TIMER         = 0x2000;
constexpr uint16_t UNKNOWN       = 0x4000;
constexpr uint16_t OFF           = 0x8000;
} // namespace vmd_capability

/// Longest override accepted by the timer registers, in minutes.
constexpr uint16_t MAX_OVERRIDE_MINUTES = 18 * 60;

struct PresetFanSpeeds {
    Value<int64_t> supply;
    Value<int64_t> exhaust;
};

const char* ventilation_speed_name(VentilationSpeed s);
const char* requested_speed_name(RequestedVentilationSpeed s);
const char* bypass_mode_name(BypassMode m);
const char* vmd_error_name(VmdErrorCode c);

/// "low", "Mid", "boost" ... -> RequestedVentilationSpeed; false when unknown.
bool requested_speed_from_name(const std::string& name, RequestedVentilationSpeed& out);

class Vmd02rps78 : public Device {
public:
    Vmd02rps78(Client& client, uint8_t address);

    ProductId product() const override { return ProductId::VMD_02RPS78; }

    bool ventilation_speed(Value<VentilationSpeed>& out, Error& err);
    bool set_ventilation_speed(RequestedVentilationSpeed speed, Error& err);

    /// Run @p speed (Low, Mid or High only) for @p minutes, then fall back.
    bool set_override(RequestedVentilationSpeed speed, uint16_t minutes, Error& err);
    bool override_remaining_time(Value<int64_t>& out, Error& err) {
        return get_as(Property::OverrideRemainingTime, out, err);
    }

    /// Presets exist for Away, Low, Mid and High.
    bool preset_fan_speeds(RequestedVentilationSpeed preset, PresetFanSpeeds& out, Error& err);
    bool set_preset_fan_speeds(RequestedVentilationSpeed preset, uint16_t supply, uint16_t exhaust, Error& err);

    bool indoor_temperature(Value<Temperature>& out, Error& err)  { return get_as(Property::TemperatureIndoor, out, err); }
    bool outdoor_temperature(Value<Temperature>& out, Error& err) { return get_as(Property::TemperatureOutdoor, out, err); }
    bool exhaust_temperature(Value<Temperature>& out, Error& err) { return get_as(Property::TemperatureExhaust, out, err); }
    bool supply_temperature(Value<Temperature>& out, Error& err)  { return get_as(Property::TemperatureSupply, out, err); }

    bool preheater(Value<HeaterState>& out, Error& err)  { return get_as(Property::Preheater, out, err); }
    bool postheater(Value<HeaterState>& out, Error& err) { return get_as(Property::Postheater, out, err); }

    bool bypass_position(Value<BypassPosition>& out, Error& err) { return get_as(Property::BypassPosition, out, err); }

    /// Unlisted raw codes come back as BypassMode::Unknown.
    bool bypass_mode(Value<BypassMode>& out, Error& err);
    bool set_bypass_mode(BypassMode mode, Error& err);

    bool error_code(Value<VmdErrorCode>& out, Error& err);

    /// Raw capability word; test bits with vmd_capability::*.
    bool capabilities(Value<uint16_t>& out, Error& err);

    bool filter_reset(Error& err) { return set(Property::FilterReset, int64_t(0), err); }

    /// Remaining filter life in percent, from remaining days over the configured duration.
    bool filter_remaining(Value<int64_t>& out, Error& err);
};

RegisterTable vmd02rps78_register_table();

} // namespace ventilink
