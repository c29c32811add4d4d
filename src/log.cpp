// ============================================================================
// log.cpp — implementation for ventilink/log.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "ventilink/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace ventilink {

static std::atomic<LogLevel> g_level{LogLevel::Warn};
static std::mutex            g_out_mu;   // keeps lines from interleaving

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "?";
}

void set_log_level(LogLevel level) { g_level.store(level); }

LogLevel log_level() { return g_level.load(); }

void log_line(LogLevel level, const std::string& fields) {
    if (level == LogLevel::Off || level < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_out_mu);
    std::cerr << "level=" << level_name(level) << ' ' << fields << '\n';
}

} // namespace ventilink
