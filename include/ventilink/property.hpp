#pragma once
/**
 * @file property.hpp
 * @brief Logical property identifiers used instead of raw register addresses.
 *
 * One flat enum covers every product; each device type's register table says
 * which of them it actually supports. Names map 1:1 to the snake_case strings
 * the CLI and JSON output use (property_name / property_from_name).
 */

#include <cstdint>
#include <string>

namespace ventilink {

enum class Property : uint16_t {
    // ---- every device ----
    RfAddress,
    ProductId,
    SoftwareVersion,
    OemNumber,
    RfCapabilities,
    ManufactureDate,
    SoftwareBuildDate,
    ProductName,
    ReceivedProductId,
    RfLastSeen,
    RfCommStatus,
    BatteryStatus,
    FaultStatus,
    RfStatsIndex,
    RfStatsLength,
    RfStatsDevice,
    RfStatsAverage,
    RfStatsStddev,
    RfStatsMin,
    RfStatsMax,
    RfStatsMissed,
    RfStatsReceived,
    RfStatsAge,
    FaultHistoryIndex,
    FaultHistoryLength,
    FaultHistoryTimestamp,
    FaultHistoryFaultCode,
    FaultHistoryStatusInfo,
    FaultHistoryCommStatus,

    // ---- gateway ----
    CustomerProductId,
    UtcTime,
    LocalTime,
    Uptime,
    DaylightSavingType,
    TimezoneOffset,
    OemCode,
    ModbusEvents,
    ResetDevice,
    CustomerNodeId,
    SerialParity,
    SerialStopBits,
    SerialBaudrate,
    ModbusDeviceId,
    RfMessagesCurrentHour,
    RfMessagesLastHour,
    RfLoadCurrentHour,
    RfLoadLastHour,
    BindingProductId,
    BindingProductSerial,
    BindingCommand,
    CreateNode,
    FirstAddressToAssign,
    RemoveNode,
    ActualBindingStatus,
    NumberOfNodes,
    NodeAddress1,   // NodeAddress1 .. NodeAddress1 + 31 are the 32 slot registers
    NodeAddress32 = NodeAddress1 + 31,

    // ---- ventilation controllers and remotes ----
    CurrentVentilationSpeed,
    FanSpeedExhaust,
    FanSpeedSupply,
    ErrorCode,
    OverrideRemainingTime,
    TemperatureIndoor,
    TemperatureOutdoor,
    TemperatureExhaust,
    TemperatureSupply,
    Preheater,
    FilterDirty,
    Defrost,
    BypassPosition,
    HumidityIndoor,
    HumidityOutdoor,
    FlowInlet,
    FlowOutlet,
    AirQuality,
    AirQualityBasis,
    Co2Level,
    Postheater,
    Capabilities,
    FilterRemainingDays,
    FilterDuration,
    FilterRemainingPercent,
    FanRpmExhaust,
    FanRpmSupply,
    BypassMode,
    BypassStatus,
    RequestedVentilationSpeed,
    OverrideTimeSpeedLow,
    OverrideTimeSpeedMid,
    OverrideTimeSpeedHigh,
    RequestedBypassMode,
    FilterReset,
    FanSpeedAwaySupply,
    FanSpeedAwayExhaust,
    FanSpeedLowSupply,
    FanSpeedLowExhaust,
    FanSpeedMidSupply,
    FanSpeedMidExhaust,
    FanSpeedHighSupply,
    FanSpeedHighExhaust,
    FrostProtectionPreheaterSetpoint,
    PreheaterSetpoint,
    FreeVentilationHeatingSetpoint,
    FreeVentilationCoolingOffset,

    Count_
};

constexpr std::size_t MAX_BOUND_NODES = 32;

/// Slot property for 0-based bound-node slot @p index (0..31).
constexpr Property node_slot_property(std::size_t index) {
    return static_cast<Property>(static_cast<uint16_t>(Property::NodeAddress1) + index);
}

/// snake_case name, e.g. "rf_address", "node_address_7".
std::string property_name(Property p);

/// Reverse of property_name(); case-insensitive. False when unknown.
bool property_from_name(const std::string& name, Property& out);

} // namespace ventilink
