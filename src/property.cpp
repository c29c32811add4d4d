// ============================================================================
// property.cpp — implementation for ventilink/property.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/property.hpp"

#include <cctype>

namespace ventilink {

// ---------------------------------------------------------------------------
// fixed_name()
// ------------
// Explicit switch over every named property. Slot registers are formatted
// separately in property_name() since they share one naming pattern.
// ---------------------------------------------------------------------------
static const char* fixed_name(Property p) {
    switch (p) {
        case Property::RfAddress:                        return "rf_address";
        case Property::ProductId:                        return "product_id";
        case Property::SoftwareVersion:                  return "software_version";
        case Property::OemNumber:                        return "oem_number";
        case Property::RfCapabilities:                   return "rf_capabilities";
        case Property::ManufactureDate:                  return "manufacture_date";
        case Property::SoftwareBuildDate:                return "software_build_date";
        case Property::ProductName:                      return "product_name";
        case Property::ReceivedProductId:                return "received_product_id";
        case Property::RfLastSeen:                       return "rf_last_seen";
        case Property::RfCommStatus:                     return "rf_comm_status";
        case Property::BatteryStatus:                    return "battery_status";
        case Property::FaultStatus:                      return "fault_status";
        case Property::RfStatsIndex:                     return "rf_stats_index";
        case Property::RfStatsLength:                    return "rf_stats_length";
        case Property::RfStatsDevice:                    return "rf_stats_device";
        case Property::RfStatsAverage:                   return "rf_stats_average";
        case Property::RfStatsStddev:                    return "rf_stats_stddev";
        case Property::RfStatsMin:                       return "rf_stats_min";
        case Property::RfStatsMax:                       return "rf_stats_max";
        case Property::RfStatsMissed:                    return "rf_stats_missed";
        case Property::RfStatsReceived:                  return "rf_stats_received";
        case Property::RfStatsAge:                       return "rf_stats_age";
        case Property::FaultHistoryIndex:                return "fault_history_index";
        case Property::FaultHistoryLength:               return "fault_history_length";
        case Property::FaultHistoryTimestamp:            return "fault_history_timestamp";
        case Property::FaultHistoryFaultCode:            return "fault_history_fault_code";
        case Property::FaultHistoryStatusInfo:           return "fault_history_status_info";
        case Property::FaultHistoryCommStatus:           return "fault_history_comm_status";
        case Property::CustomerProductId:                return "customer_product_id";
        case Property::UtcTime:                          return "utc_time";
        case Property::LocalTime:                        return "local_time";
        case Property::Uptime:                           return "uptime";
        case Property::DaylightSavingType:               return "daylight_saving_type";
        case Property::TimezoneOffset:                   return "timezone_offset";
        case Property::OemCode:                          return "oem_code";
        case Property::ModbusEvents:                     return "modbus_events";
        case Property::ResetDevice:                      return "reset_device";
        case Property::CustomerNodeId:                   return "customer_node_id";
        case Property::SerialParity:                     return "serial_parity";
        case Property::SerialStopBits:                   return "serial_stop_bits";
        case Property::SerialBaudrate:                   return "serial_baudrate";
        case Property::ModbusDeviceId:                   return "modbus_device_id";
        case Property::RfMessagesCurrentHour:            return "rf_messages_current_hour";
        case Property::RfMessagesLastHour:               return "rf_messages_last_hour";
        case Property::RfLoadCurrentHour:                return "rf_load_current_hour";
        case Property::RfLoadLastHour:                   return "rf_load_last_hour";
        case Property::BindingProductId:                 return "binding_product_id";
        case Property::BindingProductSerial:             return "binding_product_serial";
        case Property::BindingCommand:                   return "binding_command";
        case Property::CreateNode:                       return "create_node";
        case Property::FirstAddressToAssign:             return "first_address_to_assign";
        case Property::RemoveNode:                       return "remove_node";
        case Property::ActualBindingStatus:              return "actual_binding_status";
        case Property::NumberOfNodes:                    return "number_of_nodes";
        case Property::CurrentVentilationSpeed:          return "current_ventilation_speed";
        case Property::FanSpeedExhaust:                  return "fan_speed_exhaust";
        case Property::FanSpeedSupply:                   return "fan_speed_supply";
        case Property::ErrorCode:                        return "error_code";
        case Property::OverrideRemainingTime:            return "override_remaining_time";
        case Property::TemperatureIndoor:                return "temperature_indoor";
        case Property::TemperatureOutdoor:               return "temperature_outdoor";
        case Property::TemperatureExhaust:               return "temperature_exhaust";
        case Property::TemperatureSupply:                return "temperature_supply";
        case Property::Preheater:                        return "preheater";
        case Property::FilterDirty:                      return "filter_dirty";
        case Property::Defrost:                          return "defrost";
        case Property::BypassPosition:                   return "bypass_position";
        case Property::HumidityIndoor:                   return "humidity_indoor";
        case Property::HumidityOutdoor:                  return "humidity_outdoor";
        case Property::FlowInlet:                        return "flow_inlet";
        case Property::FlowOutlet:                       return "flow_outlet";
        case Property::AirQuality:                       return "air_quality";
        case Property::AirQualityBasis:                  return "air_quality_basis";
        case Property::Co2Level:                         return "co2_level";
        case Property::Postheater:                       return "postheater";
        case Property::Capabilities:                     return "capabilities";
        case Property::FilterRemainingDays:              return "filter_remaining_days";
        case Property::FilterDuration:                   return "filter_duration";
        case Property::FilterRemainingPercent:           return "filter_remaining_percent";
        case Property::FanRpmExhaust:                    return "fan_rpm_exhaust";
        case Property::FanRpmSupply:                     return "fan_rpm_supply";
        case Property::BypassMode:                       return "bypass_mode";
        case Property::BypassStatus:                     return "bypass_status";
        case Property::RequestedVentilationSpeed:        return "requested_ventilation_speed";
        case Property::OverrideTimeSpeedLow:             return "override_time_speed_low";
        case Property::OverrideTimeSpeedMid:             return "override_time_speed_mid";
        case Property::OverrideTimeSpeedHigh:            return "override_time_speed_high";
        case Property::RequestedBypassMode:              return "requested_bypass_mode";
        case Property::FilterReset:                      return "filter_reset";
        case Property::FanSpeedAwaySupply:               return "fan_speed_away_supply";
        case Property::FanSpeedAwayExhaust:              return "fan_speed_away_exhaust";
        case Property::FanSpeedLowSupply:                return "fan_speed_low_supply";
        case Property::FanSpeedLowExhaust:               return "fan_speed_low_exhaust";
        case Property::FanSpeedMidSupply:                return "fan_speed_mid_supply";
        case Property::FanSpeedMidExhaust:               return "fan_speed_mid_exhaust";
        case Property::FanSpeedHighSupply:               return "fan_speed_high_supply";
        case Property::FanSpeedHighExhaust:              return "fan_speed_high_exhaust";
        case Property::FrostProtectionPreheaterSetpoint: return "frost_protection_preheater_setpoint";
        case Property::PreheaterSetpoint:                return "preheater_setpoint";
        case Property::FreeVentilationHeatingSetpoint:   return "free_ventilation_heating_setpoint";
        case Property::FreeVentilationCoolingOffset:     return "free_ventilation_cooling_offset";
        default:                                         return nullptr;
    }
}

static bool is_slot(Property p) {
    return p >= Property::NodeAddress1 && p <= Property::NodeAddress32;
}

std::string property_name(Property p) {
    if (is_slot(p)) {
        auto index = static_cast<uint16_t>(p) - static_cast<uint16_t>(Property::NodeAddress1);
        return "node_address_" + std::to_string(index + 1);
    }
    const char* n = fixed_name(p);
    return n ? n : "unknown";
}

bool property_from_name(const std::string& raw, Property& out) {
    std::string name = raw;
    for (auto& c : name) {
        c = (char)std::tolower((unsigned char)c);
        if (c == '-') c = '_';
    }

    // Linear scan; the vocabulary is small and fixed.
    const auto count = static_cast<uint16_t>(Property::Count_);
    for (uint16_t i = 0; i < count; ++i) {
        Property p = static_cast<Property>(i);
        if (property_name(p) == name) { out = p; return true; }
    }
    return false;
}

} // namespace ventilink
