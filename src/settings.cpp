// ============================================================================
// settings.cpp — implementation for settings.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "settings.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace ventilink {

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* transport_kind_name(TransportKind k) {
    return k == TransportKind::Rtu ? "rtu" : "tcp";
}

bool transport_kind_from_name(const std::string& name, TransportKind& out) {
    if (name == "tcp") { out = TransportKind::Tcp; return true; }
    if (name == "rtu") { out = TransportKind::Rtu; return true; }
    return false;
}

fs::path default_settings_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home ? home : ".") / ".config";
    return base / "ventilink" / "settings.json";
}

json settings_to_json(const Settings& s) {
    json j;
    j["transport"] = transport_kind_name(s.transport);
    j["tcp"] = {{"host", s.tcp_host}, {"port", s.tcp_port}};
    j["rtu"] = {{"device", s.serial_device},
                {"baud", s.baud},
                {"parity", std::string(1, s.parity)},
                {"stop_bits", s.stop_bits}};
    j["timeout_ms"] = s.timeout_ms;
    j["min_command_delay_ms"] = s.min_command_delay_ms;
    j["gateway_address"] = s.gateway_address;
    return j;
}

// ---------------------------------------------------------------------------
// Typed key readers: absent keeps the default, present-but-wrong fails.
// ---------------------------------------------------------------------------
static bool read_int(const json& obj, const char* key, int64_t lo, int64_t hi, int64_t& out, Error& err) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number_integer()) return fail(err, ErrorKind::InvalidArgument, std::string("settings_type:") + key);
    int64_t v = it->get<int64_t>();
    if (v < lo || v > hi) return fail(err, ErrorKind::InvalidArgument, std::string("settings_range:") + key);
    out = v;
    return true;
}

static bool read_string(const json& obj, const char* key, std::string& out, Error& err) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_string()) return fail(err, ErrorKind::InvalidArgument, std::string("settings_type:") + key);
    out = it->get<std::string>();
    return true;
}

bool settings_from_json(const json& j, Settings& s, Error& err) {
    if (!j.is_object()) return fail(err, ErrorKind::InvalidArgument, "settings_not_an_object");

    Settings n = s;
    std::string text;
    int64_t v = 0;

    text = transport_kind_name(n.transport);
    if (!read_string(j, "transport", text, err)) return false;
    if (!transport_kind_from_name(text, n.transport))
        return fail(err, ErrorKind::InvalidArgument, "settings_value:transport=" + text);

    if (auto it = j.find("tcp"); it != j.end()) {
        if (!it->is_object()) return fail(err, ErrorKind::InvalidArgument, "settings_type:tcp");
        if (!read_string(*it, "host", n.tcp_host, err)) return false;
        v = n.tcp_port;
        if (!read_int(*it, "port", 1, 65535, v, err)) return false;
        n.tcp_port = uint16_t(v);
    }

    if (auto it = j.find("rtu"); it != j.end()) {
        if (!it->is_object()) return fail(err, ErrorKind::InvalidArgument, "settings_type:rtu");
        if (!read_string(*it, "device", n.serial_device, err)) return false;
        v = n.baud;
        if (!read_int(*it, "baud", 300, 230400, v, err)) return false;
        n.baud = int(v);
        text = std::string(1, n.parity);
        if (!read_string(*it, "parity", text, err)) return false;
        if (text != "N" && text != "E" && text != "O")
            return fail(err, ErrorKind::InvalidArgument, "settings_value:parity=" + text);
        n.parity = text[0];
        v = n.stop_bits;
        if (!read_int(*it, "stop_bits", 1, 2, v, err)) return false;
        n.stop_bits = int(v);
    }

    v = n.timeout_ms;
    if (!read_int(j, "timeout_ms", 1, 60000, v, err)) return false;
    n.timeout_ms = int(v);
    v = n.min_command_delay_ms;
    if (!read_int(j, "min_command_delay_ms", 0, 10000, v, err)) return false;
    n.min_command_delay_ms = int(v);
    v = n.gateway_address;
    if (!read_int(j, "gateway_address", 1, 247, v, err)) return false;
    n.gateway_address = uint8_t(v);

    s = n;
    return true;
}

bool load_settings(const fs::path& path, Settings& s, Error& err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return true;

    std::ifstream in(path);
    if (!in) return fail(err, ErrorKind::InvalidArgument, "settings_unreadable:" + path.string());

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) return fail(err, ErrorKind::InvalidArgument, "settings_parse:" + path.string());
    return settings_from_json(j, s, err);
}

bool save_settings(const fs::path& path, const Settings& s, Error& err) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) return fail(err, ErrorKind::InvalidArgument, "settings_mkdir:" + ec.message());

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return fail(err, ErrorKind::InvalidArgument, "settings_write:" + tmp.string());
        out << settings_to_json(s).dump(2) << "\n";
        out.flush();
        if (!out) return fail(err, ErrorKind::InvalidArgument, "settings_write:" + tmp.string());
    }
    fs::rename(tmp, path, ec);
    if (ec) return fail(err, ErrorKind::InvalidArgument, "settings_rename:" + ec.message());
    return true;
}

std::unique_ptr<transport::IChannel> make_channel(const Settings& s) {
    if (s.transport == TransportKind::Rtu) {
        RtuConfig cfg;
        cfg.device = s.serial_device;
        cfg.baud = s.baud;
        cfg.parity = s.parity;
        cfg.stop_bits = s.stop_bits;
        cfg.timeout_ms = s.timeout_ms;
        return std::make_unique<ModbusRtuChannel>(cfg);
    }
    TcpConfig cfg;
    cfg.host = s.tcp_host;
    cfg.port = s.tcp_port;
    cfg.timeout_ms = s.timeout_ms;
    return std::make_unique<ModbusTcpChannel>(cfg);
}

} // namespace ventilink
