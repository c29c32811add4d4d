/**
 * @page vl-settings ventilink Settings
 * @file settings.hpp
 * @brief Connection settings persisted as JSON under the XDG config directory.
 *
 * @details
 * FILE
 * ----
 * $XDG_CONFIG_HOME/ventilink/settings.json, falling back to
 * ~/.config/ventilink/settings.json:
 * @code
 *   {
 *     "transport": "tcp",
 *     "tcp": { "host": "192.168.0.207", "port": 502 },
 *     "rtu": { "device": "/dev/ttyACM0", "baud": 19200, "parity": "E", "stop_bits": 1 },
 *     "timeout_ms": 1000,
 *     "min_command_delay_ms": 10,
 *     "gateway_address": 207
 *   }
 * @endcode
 * Missing keys keep their defaults and unknown keys are ignored. A key that
 * is present with the wrong type or an out-of-range value fails the load
 * with InvalidArgument naming the key. A missing file is not an error.
 *
 * Saving writes a temp file next to the target and renames it over, so a
 * crash mid-write never leaves a truncated settings file.
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "modbus_rtu.hpp"
#include "modbus_tcp.hpp"
#include "ventilink/error.hpp"
#include "ventilink/products.hpp"
#include "ventilink/transport/channel.hpp"

namespace ventilink {

enum class TransportKind { Tcp, Rtu };

struct Settings {
    TransportKind transport{TransportKind::Tcp};
    std::string   tcp_host{"192.168.0.207"};
    uint16_t      tcp_port{502};
    std::string   serial_device{"/dev/ttyACM0"};
    int           baud{19200};
    char          parity{'E'};
    int           stop_bits{1};
    int           timeout_ms{1000};
    int           min_command_delay_ms{10};
    uint8_t       gateway_address{DEFAULT_GATEWAY_ADDRESS};
};

const char* transport_kind_name(TransportKind k);
bool transport_kind_from_name(const std::string& name, TransportKind& out);

std::filesystem::path default_settings_path();

nlohmann::json settings_to_json(const Settings& s);

/// Overlay the keys present in @p j onto @p s.
bool settings_from_json(const nlohmann::json& j, Settings& s, Error& err);

bool load_settings(const std::filesystem::path& path, Settings& s, Error& err);
bool save_settings(const std::filesystem::path& path, const Settings& s, Error& err);

/// Channel for the configured transport (not yet connected).
std::unique_ptr<transport::IChannel> make_channel(const Settings& s);

} // namespace ventilink
