#include "cowork/observability/log.hpp"

#include "cowork/common/fs.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace cowork::observability {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_write_mutex;

const char *level_tag(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Off:
    break;
  }
  return "";
}

} // namespace

LogLevel log_level_from_string(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "debug" || normalized == "trace") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  if (normalized == "off" || normalized == "none") {
    return LogLevel::Off;
  }
  return LogLevel::Info;
}

void set_log_level(LogLevel level) { g_level.store(level); }

LogLevel log_level() { return g_level.load(); }

void log_line(LogLevel level, const std::string &message) {
  if (level == LogLevel::Off || static_cast<int>(level) < static_cast<int>(g_level.load())) {
    return;
  }
  std::lock_guard<std::mutex> lock(g_write_mutex);
  std::cerr << "[" << level_tag(level) << "] " << message << "\n";
}

void log_debug(const std::string &message) { log_line(LogLevel::Debug, message); }
void log_info(const std::string &message) { log_line(LogLevel::Info, message); }
void log_warn(const std::string &message) { log_line(LogLevel::Warn, message); }
void log_error(const std::string &message) { log_line(LogLevel::Error, message); }

} // namespace cowork::observability
