#pragma once

#include <string>

namespace emby_fast {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

bool parse_log_level(const std::string &s, LogLevel &out);
void set_log_level(LogLevel level);
LogLevel log_level();

// Writes "[TAG] message" as one line. Warn and Error go to stderr.
void log_line(LogLevel level, const std::string &tag, const std::string &msg);

inline void log_debug(const std::string &msg) {
  log_line(LogLevel::Debug, "DEBUG", msg);
}
inline void log_info(const std::string &msg) {
  log_line(LogLevel::Info, "INFO", msg);
}
inline void log_warn(const std::string &msg) {
  log_line(LogLevel::Warn, "WARN", msg);
}
inline void log_error(const std::string &msg) {
  log_line(LogLevel::Error, "ERROR", msg);
}

std::string redact(const std::string &secret);

} // namespace emby_fast
