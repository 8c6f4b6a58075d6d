#pragma once

#include <string>
#include <string_view>

namespace cowork::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

[[nodiscard]] LogLevel log_level_from_string(std::string_view value);
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

/// Writes `[LEVEL] message` to stderr when `level` passes the process threshold.
void log_line(LogLevel level, const std::string &message);

void log_debug(const std::string &message);
void log_info(const std::string &message);
void log_warn(const std::string &message);
void log_error(const std::string &message);

} // namespace cowork::observability
