#include "emby_fast/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace emby_fast {
namespace {
std::atomic<int> current_level{static_cast<int>(LogLevel::Info)};
std::mutex log_mu;
} // namespace

bool parse_log_level(const std::string &s, LogLevel &out) {
  if (s == "debug")
    out = LogLevel::Debug;
  else if (s == "info")
    out = LogLevel::Info;
  else if (s == "warn")
    out = LogLevel::Warn;
  else if (s == "error")
    out = LogLevel::Error;
  else
    return false;
  return true;
}

void set_log_level(LogLevel level) {
  current_level.store(static_cast<int>(level));
}

LogLevel log_level() { return static_cast<LogLevel>(current_level.load()); }

void log_line(LogLevel level, const std::string &tag, const std::string &msg) {
  if (static_cast<int>(level) < current_level.load())
    return;
  std::lock_guard<std::mutex> lk(log_mu);
  auto &out = level >= LogLevel::Warn ? std::cerr : std::cout;
  out << "[" << tag << "] " << msg << "\n";
  out.flush();
}

std::string redact(const std::string &secret) {
  return secret.empty() ? "NOT SET" : "***";
}

} // namespace emby_fast
