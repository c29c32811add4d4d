#pragma once
/**
 * @file log.hpp
 * @brief key=value diagnostic lines on stderr with a process-wide threshold.
 *
 * Every line looks like the rest of the tooling output:
 *   level=warn event=node_skip slot=3 device=45 reason=unknown_product
 * so logs and CLI status lines can be filtered with the same grep.
 */

#include <string>

namespace ventilink {

enum class LogLevel : unsigned char { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void     set_log_level(LogLevel level);
LogLevel log_level();

/// Write "level=<lvl> <fields>" to std::cerr when @p level passes the threshold.
void log_line(LogLevel level, const std::string& fields);

inline void log_debug(const std::string& f) { log_line(LogLevel::Debug, f); }
inline void log_info (const std::string& f) { log_line(LogLevel::Info,  f); }
inline void log_warn (const std::string& f) { log_line(LogLevel::Warn,  f); }
inline void log_error(const std::string& f) { log_line(LogLevel::Error, f); }

} // namespace ventilink
