#pragma once

#include <string>

namespace failsafe {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_log_level(LogLevel level);
LogLevel log_level();
const char *to_string(LogLevel level);

void log(LogLevel level, const std::string &component,
         const std::string &message);

} // namespace failsafe
