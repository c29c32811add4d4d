/**
 * @file main.cpp
 * @brief ventilink-cli — one-shot command-line access to a ventilation gateway.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); connection options override the saved settings
 *    for this run, --save persists them (XDG config, settings.json).
 *  - Build one Client + Bridge, run exactly one action, print the result.
 *  - Pretty output for people, --format json for scripts.
 *
 * Actions (one per run):
 *  --get <property> | --set <property> <value> | --fetch [--with-status]
 *  --fetch-all [--with-status]
 *  --nodes | --node <address> | --bind <address> --product <p> [--serial N]
 *  --bind-accessory <controller> <address> --product <p> | --unbind <address>
 *  --bind-status
 * --get/--set/--fetch act on the gateway unless --node selects a bound node.
 *
 * Exit codes:
 *  0 ok, 1 transport failure, 2 usage/argument error, 3 device error, 4 not found.
 */

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "settings.hpp"
#include "ventilink/binding.hpp"
#include "ventilink/bridge.hpp"
#include "ventilink/client.hpp"
#include "ventilink/log.hpp"
#include "ventilink/node_directory.hpp"

using json = nlohmann::json;
using namespace ventilink;

enum ExitCode : int {
  EXIT_OK        = 0,
  EXIT_TRANSPORT = 1,
  EXIT_USAGE     = 2,
  EXIT_DEVICE    = 3,
  EXIT_NOT_FOUND = 4,
};

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static int exit_code_for(const Error& e) {
  switch (e.kind) {
    case ErrorKind::Connection:
    case ErrorKind::ConnectionInterrupted: return EXIT_TRANSPORT;
    case ErrorKind::InvalidArgument:
    case ErrorKind::PropertyNotSupported:  return EXIT_USAGE;
    case ErrorKind::NotFound:              return EXIT_NOT_FOUND;
    default:                               return EXIT_DEVICE;
  }
}

static int report(const Error& e, const Ansi& ansi) {
  std::cerr << ansi.red("status=error") << " " << describe(e) << "\n";
  return exit_code_for(e);
}

static int usage_error(const std::string& reason, const Ansi& ansi) {
  std::cerr << ansi.red("status=error") << " kind=usage reason=" << reason << "\n";
  return EXIT_USAGE;
}

static bool parse_int(const std::string& s, int64_t& out) {
  try {
    std::size_t used = 0;
    long long v = std::stoll(s, &used, 0);
    if (used != s.size()) return false;
    out = v;
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

// "VMD-02RPS78", "vmd_02rps78" or a raw id such as 0x1C892.
static const ProductInfo* parse_product(const std::string& s) {
  if (const ProductInfo* p = find_product_by_name(s)) return p;
  int64_t raw = 0;
  if (parse_int(s, raw) && raw >= 0 && raw <= 0xFFFFFFFFll) return find_product(uint32_t(raw));
  return nullptr;
}

// Text from the command line -> payload of the register's declared type.
static bool parse_payload(const RegisterDescriptor& d, const std::string& text, Payload& out) {
  switch (d.type) {
    case RegisterType::U16:
    case RegisterType::I16:
    case RegisterType::U32: {
      int64_t v = 0;
      if (!parse_int(text, v)) return false;
      out = v;
      return true;
    }
    case RegisterType::Float: {
      try {
        std::size_t used = 0;
        float f = std::stof(text, &used);
        if (used != text.size()) return false;
        out = f;
        return true;
      } catch (const std::invalid_argument&) {
        return false;
      } catch (const std::out_of_range&) {
        return false;
      }
    }
    case RegisterType::String: {
      if (text.size() > std::size_t(d.length) * 2) return false;
      out = Text(text.c_str());
      return true;
    }
    case RegisterType::Date: {
      if (text == "unknown") { out = Date::unknown(); return true; }
      unsigned y = 0, m = 0, dd = 0;
      if (std::sscanf(text.c_str(), "%u-%u-%u", &y, &m, &dd) != 3) return false;
      out = Date{uint16_t(y), uint8_t(m), uint8_t(dd)};
      return true;
    }
    case RegisterType::DateTime: {
      if (text == "now") { out = DateTime{uint32_t(std::time(nullptr))}; return true; }
      if (text == "unknown") { out = DateTime::unknown(); return true; }
      int64_t v = 0;
      if (!parse_int(text, v) || v < 0 || v > 0xFFFFFFFFll) return false;
      out = DateTime{uint32_t(v)};
      return true;
    }
  }
  return false;
}

// ---------- JSON rendering ----------

struct PayloadToJson {
  json operator()(std::monostate) const { return nullptr; }
  json operator()(int64_t v) const { return v; }
  json operator()(float v) const { return std::isnan(v) ? json(nullptr) : json(v); }
  json operator()(const Text& t) const { return std::string(t.c_str()); }
  json operator()(const Date& d) const { return format_date(d); }
  json operator()(const DateTime& t) const { return format_datetime(t); }
  json operator()(const BatteryStatus& b) const { return {{"available", b.available}, {"low", b.low}}; }
  json operator()(const FaultStatus& f) const { return {{"available", f.available}, {"fault", f.fault}}; }
  json operator()(const HeaterState& h) const { return {{"level", h.level}, {"available", h.available}}; }
  json operator()(const Temperature& t) const {
    const char* st = t.status == SensorStatus::Ok ? "ok" : t.status == SensorStatus::Error ? "error" : "unavailable";
    return {{"celsius", t.status == SensorStatus::Ok ? json(t.celsius) : json(nullptr)}, {"status", st}};
  }
  json operator()(const BypassPosition& b) const { return {{"position", b.position}, {"error", b.error}}; }
};

static json value_to_json(const AnyValue& v) {
  json j;
  j["value"] = std::visit(PayloadToJson{}, v.value);
  if (v.freshness) {
    j["age_s"] = v.freshness->age.count();
    j["source"] = source_name(v.freshness->source);
    j["flags"] = v.freshness->flags;
  }
  return j;
}

static json map_to_json(const ValueMap& m) {
  json j = json::object();
  for (const auto& kv : m) j[property_name(kv.first)] = value_to_json(kv.second);
  return j;
}

// ---------- pretty rendering ----------

static std::string value_to_text(const AnyValue& v, const Ansi& ansi) {
  std::string s = to_string(v.value);
  if (v.freshness) {
    char flags[8];
    std::snprintf(flags, sizeof(flags), "0x%02X", v.freshness->flags);
    s += ansi.dim(" (age=" + std::to_string(v.freshness->age.count()) + "s source=" +
                  source_name(v.freshness->source) + " flags=" + flags + ")");
  }
  return s;
}

static void print_map_pretty(const ValueMap& m, const Ansi& ansi) {
  for (const auto& kv : m) {
    std::string name = property_name(kv.first);
    name.resize(std::max<std::size_t>(name.size(), 34), ' ');
    std::cout << "  " << name << " " << value_to_text(kv.second, ansi) << "\n";
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  // connection options (override settings.json for this run)
  std::string opt_settings;
  std::string opt_transport;
  std::string opt_host;
  std::optional<uint16_t> opt_port;
  std::string opt_device;
  std::optional<int> opt_baud;
  std::string opt_parity;
  std::optional<int> opt_stop_bits;
  std::optional<int> opt_timeout_ms;
  std::optional<int> opt_delay_ms;
  std::optional<int> opt_gateway;
  bool opt_save = false;

  // output
  std::string opt_format = "pretty";
  bool opt_no_color = false;
  bool opt_verbose = false;
  bool opt_debug = false;

  // actions
  std::string opt_get;
  std::vector<std::string> opt_set;
  bool opt_fetch = false;
  bool opt_fetch_all = false;
  bool opt_with_status = false;
  bool opt_nodes = false;
  std::optional<int> opt_node;
  std::optional<int> opt_bind;
  std::vector<int> opt_bind_accessory;
  std::string opt_product;
  std::optional<int64_t> opt_serial;
  std::optional<int> opt_unbind;
  bool opt_bind_status = false;

  CLI::App app{"ventilink-cli: ventilation gateway register access"};

  app.add_option("--settings", opt_settings, "Settings file (default: XDG config)");
  app.add_option("--transport", opt_transport, "tcp|rtu")->check(CLI::IsMember({"tcp", "rtu"}));
  app.add_option("--host", opt_host, "Modbus TCP host");
  app.add_option("--port", opt_port, "Modbus TCP port");
  app.add_option("--device", opt_device, "Serial device for RTU");
  app.add_option("--baud", opt_baud, "Serial baud rate");
  app.add_option("--parity", opt_parity, "Serial parity N|E|O")->check(CLI::IsMember({"N", "E", "O"}));
  app.add_option("--stop-bits", opt_stop_bits, "Serial stop bits")->check(CLI::Range(1, 2));
  app.add_option("--timeout-ms", opt_timeout_ms, "Response timeout in ms")->check(CLI::Range(1, 60000));
  app.add_option("--delay-ms", opt_delay_ms, "Minimum delay between commands in ms")->check(CLI::Range(0, 10000));
  app.add_option("--gateway", opt_gateway, "Gateway device address")->check(CLI::Range(1, 247));
  app.add_flag("--save", opt_save, "Persist the connection options given on this run");

  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("--verbose,-v", opt_verbose, "Log at info level");
  app.add_flag("--debug", opt_debug, "Log at debug level");

  app.add_option("--get", opt_get, "Read one property");
  app.add_option("--set", opt_set, "Write one property: --set <property> <value>")->expected(2);
  app.add_flag("--fetch", opt_fetch, "Read every property");
  app.add_flag("--fetch-all", opt_fetch_all, "Read every property of the gateway and all bound nodes");
  app.add_flag("--with-status", opt_with_status, "With --fetch/--fetch-all: per-register reads with freshness");
  app.add_flag("--nodes", opt_nodes, "List bound nodes");
  app.add_option("--node", opt_node, "Target a bound node (or print its model)")->check(CLI::Range(1, 247));
  app.add_option("--bind", opt_bind, "Bind a controller at <address>")->check(CLI::Range(1, 247));
  app.add_option("--bind-accessory", opt_bind_accessory, "Bind an accessory: <controller> <address>")->expected(2);
  app.add_option("--product", opt_product, "Product name or id for --bind / --bind-accessory");
  app.add_option("--serial", opt_serial, "Product serial for --bind");
  app.add_option("--unbind", opt_unbind, "Remove the node at <address>")->check(CLI::Range(1, 247));
  app.add_flag("--bind-status", opt_bind_status, "Show the gateway binding status");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";
  const bool as_json = opt_format == "json";

  if (opt_debug)        set_log_level(LogLevel::Debug);
  else if (opt_verbose) set_log_level(LogLevel::Info);

  const int actions = int(!opt_get.empty()) + int(!opt_set.empty()) + int(opt_fetch) + int(opt_fetch_all) + int(opt_nodes) +
                      int(bool(opt_bind)) + int(!opt_bind_accessory.empty()) + int(bool(opt_unbind)) +
                      int(opt_bind_status);
  if (actions > 1) return usage_error("one_action_per_run", ansi);
  if (opt_with_status && !opt_fetch && !opt_fetch_all) return usage_error("with_status_needs_fetch", ansi);
  if (opt_fetch_all && opt_node) return usage_error("fetch_all_covers_every_node", ansi);
  if (opt_serial && !opt_bind) return usage_error("serial_needs_bind", ansi);

  // ---- settings ----
  Error err;
  Settings settings;
  const std::filesystem::path settings_path =
      opt_settings.empty() ? default_settings_path() : std::filesystem::path(opt_settings);
  if (!load_settings(settings_path, settings, err)) return report(err, ansi);

  if (!opt_transport.empty() && !transport_kind_from_name(opt_transport, settings.transport))
    return usage_error("transport:" + opt_transport, ansi);
  if (!opt_host.empty())      settings.tcp_host = opt_host;
  if (opt_port)               settings.tcp_port = *opt_port;
  if (!opt_device.empty())    settings.serial_device = opt_device;
  if (opt_baud)               settings.baud = *opt_baud;
  if (!opt_parity.empty())    settings.parity = opt_parity[0];
  if (opt_stop_bits)          settings.stop_bits = *opt_stop_bits;
  if (opt_timeout_ms)         settings.timeout_ms = *opt_timeout_ms;
  if (opt_delay_ms)           settings.min_command_delay_ms = *opt_delay_ms;
  if (opt_gateway)            settings.gateway_address = uint8_t(*opt_gateway);

  if (opt_save) {
    if (!save_settings(settings_path, settings, err)) return report(err, ansi);
    if (!as_json) std::cout << ansi.dim("saved " + settings_path.string()) << "\n";
    if (actions == 0 && !opt_node) return EXIT_OK;
  }

  if (actions == 0 && !opt_node) {
    std::cout << app.help();
    return EXIT_USAGE;
  }

  // ---- stack ----
  Client client(make_channel(settings), std::chrono::milliseconds(settings.min_command_delay_ms));
  Bridge bridge(client, settings.gateway_address);
  NodeDirectory directory(bridge);
  BindingController binding(bridge);

  if (!client.connect(err)) return report(err, ansi);

  // ---- binding actions ----
  if (opt_bind || !opt_bind_accessory.empty()) {
    const ProductInfo* product = parse_product(opt_product);
    if (!product) return usage_error("unknown_product:" + opt_product, ansi);

    bool ok = false;
    if (opt_bind) {
      std::optional<uint32_t> serial;
      if (opt_serial) {
        if (*opt_serial < 0 || *opt_serial > 0xFFFFFFFFll) return usage_error("serial_out_of_range", ansi);
        serial = uint32_t(*opt_serial);
      }
      ok = binding.bind_controller(uint8_t(*opt_bind), product->id, serial, err);
    } else {
      const int ctrl = opt_bind_accessory[0];
      const int addr = opt_bind_accessory[1];
      if (ctrl < 0 || ctrl > 255 || addr < 0 || addr > 255) return usage_error("address_out_of_range", ansi);
      ok = binding.bind_accessory(uint8_t(ctrl), uint8_t(addr), product->id, err);
    }
    if (!ok) return report(err, ansi);
    if (as_json) std::cout << json{{"status", "ok"}, {"product", product->name}}.dump(2) << "\n";
    else         std::cout << "status=ok binding started for " << product->name << "\n";
    return EXIT_OK;
  }

  if (opt_unbind) {
    if (!binding.unbind(uint8_t(*opt_unbind), err)) return report(err, ansi);
    if (as_json) std::cout << json{{"status", "ok"}}.dump(2) << "\n";
    else         std::cout << "status=ok\n";
    return EXIT_OK;
  }

  if (opt_bind_status) {
    BindingStatus st = binding.bind_status();
    if (as_json) std::cout << json{{"binding_status", binding_status_name(st)}, {"code", int(st)}}.dump(2) << "\n";
    else         std::cout << binding_status_name(st) << " (" << int(st) << ")\n";
    return EXIT_OK;
  }

  // ---- directory ----
  if (opt_nodes) {
    NodeList nodes;
    if (!directory.nodes(nodes, err)) return report(err, ansi);
    if (as_json) {
      json arr = json::array();
      for (const auto& n : nodes) {
        const ProductInfo* p = find_product(static_cast<uint32_t>(n.product));
        arr.push_back({{"address", n.address}, {"product", p ? p->name : "?"}, {"rf_address", n.rf_address}});
      }
      std::cout << arr.dump(2) << "\n";
    } else {
      std::cout << ansi.bold(std::to_string(nodes.size()) + " bound node(s)") << "\n";
      for (const auto& n : nodes) {
        const ProductInfo* p = find_product(static_cast<uint32_t>(n.product));
        char rf[16];
        std::snprintf(rf, sizeof(rf), "0x%08X", n.rf_address);
        std::cout << "  " << int(n.address) << "  " << (p ? p->name : "?") << "  rf=" << rf << "\n";
      }
    }
    return EXIT_OK;
  }

  if (opt_fetch_all) {
    FetchAllResult all;
    if (!fetch_all(directory, all, err, opt_with_status)) return report(err, ansi);
    if (as_json) {
      json j = json::object();
      for (const auto& kv : all) j[std::to_string(kv.first)] = map_to_json(kv.second);
      std::cout << j.dump(2) << "\n";
    } else {
      for (const auto& kv : all) {
        std::cout << ansi.bold("device " + std::to_string(kv.first)) << "\n";
        print_map_pretty(kv.second, ansi);
      }
    }
    return EXIT_OK;
  }

  // ---- target device ----
  std::unique_ptr<Device> node;
  Device* target = &bridge;
  if (opt_node) {
    if (!directory.node(uint8_t(*opt_node), node, err)) return report(err, ansi);
    target = node.get();
  }
  const ProductInfo* target_info = find_product(static_cast<uint32_t>(target->product()));
  const std::string target_name = target_info ? target_info->name : "?";

  if (actions == 0) {
    if (as_json) {
      std::cout << json{{"address", target->address()}, {"product", target_name}}.dump(2) << "\n";
    } else {
      std::cout << target_name << "@" << int(target->address())
                << (target_info ? std::string("  ") + target_info->description : std::string()) << "\n";
    }
    return EXIT_OK;
  }

  if (!opt_get.empty()) {
    Property p;
    if (!property_from_name(opt_get, p)) return usage_error("unknown_property:" + opt_get, ansi);
    AnyValue v;
    if (!target->get(p, v, err)) return report(err, ansi);
    if (as_json) std::cout << json{{property_name(p), value_to_json(v)}}.dump(2) << "\n";
    else         std::cout << property_name(p) << " = " << value_to_text(v, ansi) << "\n";
    return EXIT_OK;
  }

  if (!opt_set.empty()) {
    Property p;
    if (!property_from_name(opt_set[0], p)) return usage_error("unknown_property:" + opt_set[0], ansi);
    const RegisterDescriptor* d = target->find(p);
    if (!d) return usage_error("property_not_supported:" + opt_set[0], ansi);
    Payload value;
    if (!parse_payload(*d, opt_set[1], value)) return usage_error("bad_value:" + opt_set[1], ansi);
    if (!target->set(p, value, err)) return report(err, ansi);
    if (as_json) std::cout << json{{"status", "ok"}}.dump(2) << "\n";
    else         std::cout << "status=ok\n";
    return EXIT_OK;
  }

  if (opt_fetch) {
    ValueMap values;
    if (!target->fetch(values, err, true, opt_with_status)) return report(err, ansi);
    if (as_json) {
      std::cout << map_to_json(values).dump(2) << "\n";
    } else {
      std::cout << ansi.bold(target_name + "@" + std::to_string(target->address())) << "\n";
      print_map_pretty(values, ansi);
    }
    return EXIT_OK;
  }

  return EXIT_OK;
}
