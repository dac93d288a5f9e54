#include "failsafe/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace failsafe {
namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mu;
} // namespace

void set_log_level(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

const char *to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  case LogLevel::Off:
    return "off";
  }
  return "unknown";
}

void log(LogLevel level, const std::string &component,
         const std::string &message) {
  if (level == LogLevel::Off || static_cast<int>(level) < g_level.load())
    return;
  const std::string line =
      std::string("[") + to_string(level) + "] " + component + ": " + message +
      "\n";
  std::lock_guard<std::mutex> lock(g_log_mu);
  std::cerr << line;
}

} // namespace failsafe
