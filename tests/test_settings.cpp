#include <doctest/doctest.h>
#include "settings.hpp"

#include <chrono>
#include <fstream>
#include <string>

using namespace ventilink;
namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
    fs::path path;
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("ventilink-test-" + std::to_string(stamp));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

TEST_CASE("Missing settings file keeps the defaults") {
    TempDir dir;
    Settings s;
    Error err;
    REQUIRE(load_settings(dir.path / "absent.json", s, err));
    CHECK(s.transport == TransportKind::Tcp);
    CHECK(s.tcp_port == 502);
    CHECK(s.gateway_address == DEFAULT_GATEWAY_ADDRESS);
    CHECK(s.min_command_delay_ms == 10);
}

TEST_CASE("Settings survive a save and load") {
    TempDir dir;
    const fs::path file = dir.path / "nested" / "settings.json";

    Settings s;
    s.transport = TransportKind::Rtu;
    s.serial_device = "/dev/ttyUSB3";
    s.baud = 9600;
    s.parity = 'N';
    s.stop_bits = 2;
    s.timeout_ms = 250;
    s.min_command_delay_ms = 40;
    s.gateway_address = 100;

    Error err;
    REQUIRE(save_settings(file, s, err));
    CHECK_FALSE(fs::exists(file.string() + ".tmp"));

    Settings back;
    REQUIRE(load_settings(file, back, err));
    CHECK(back.transport == TransportKind::Rtu);
    CHECK(back.serial_device == "/dev/ttyUSB3");
    CHECK(back.baud == 9600);
    CHECK(back.parity == 'N');
    CHECK(back.stop_bits == 2);
    CHECK(back.timeout_ms == 250);
    CHECK(back.min_command_delay_ms == 40);
    CHECK(back.gateway_address == 100);
}

TEST_CASE("Partial JSON overlays only the keys present") {
    Settings s;
    Error err;
    REQUIRE(settings_from_json(nlohmann::json::parse(R"({"tcp": {"host": "10.0.0.5"}, "extra": true})"), s, err));
    CHECK(s.tcp_host == "10.0.0.5");
    CHECK(s.tcp_port == 502);
    CHECK(s.transport == TransportKind::Tcp);
}

TEST_CASE("Wrong types and out-of-range values are rejected and leave settings untouched") {
    Settings s;
    Error err;

    CHECK_FALSE(settings_from_json(nlohmann::json::parse(R"({"timeout_ms": "fast"})"), s, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK(err.reason == "settings_type:timeout_ms");

    err.clear();
    CHECK_FALSE(settings_from_json(
        nlohmann::json::parse(R"({"tcp": {"host": "10.0.0.9"}, "gateway_address": 0})"), s, err));
    CHECK(err.reason == "settings_range:gateway_address");
    CHECK(s.tcp_host == "192.168.0.207");

    err.clear();
    CHECK_FALSE(settings_from_json(nlohmann::json::parse(R"({"transport": "udp"})"), s, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);

    err.clear();
    CHECK_FALSE(settings_from_json(nlohmann::json::parse(R"({"rtu": {"parity": "X"}})"), s, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);

    err.clear();
    CHECK_FALSE(settings_from_json(nlohmann::json::parse("[1, 2]"), s, err));
    CHECK(err.reason == "settings_not_an_object");
}

TEST_CASE("Unparseable settings file is an error") {
    TempDir dir;
    const fs::path file = dir.path / "settings.json";
    {
        std::ofstream out(file);
        out << "{ not json";
    }
    Settings s;
    Error err;
    CHECK_FALSE(load_settings(file, s, err));
    CHECK(err.kind == ErrorKind::InvalidArgument);
    CHECK(err.reason.rfind("settings_parse:", 0) == 0);
}

TEST_CASE("Channel follows the configured transport") {
    Settings s;
    CHECK(std::string(make_channel(s)->name()) == "tcp");
    s.transport = TransportKind::Rtu;
    auto ch = make_channel(s);
    CHECK(std::string(ch->name()) == "rtu");
    CHECK_FALSE(ch->connected());
}
