#pragma once

// sortie/log.hpp: Leveled diagnostic logging.
//
// Default sink: stderr, one line per record:
//   [sortie][warn][sandbox] message
// SORTIE_LOG_FORMAT=json switches to one JSON object per line.
// SORTIE_LOG_LEVEL=debug|info|warn|error sets the threshold (default info).
//
// INVARIANT: log_message() never throws and never blocks on anything but
// a short stderr write.

#include <cstdint>
#include <string>

namespace sortie {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);

struct LogRecord {
  LogLevel level{LogLevel::info};
  std::string component;
  std::string message;
  std::uint64_t timestamp_ms{0};
};

using LogHook = void (*)(const LogRecord&);

// Replaces the stderr sink. Pass nullptr to restore it.
void set_log_hook(LogHook hook);
void set_log_level(LogLevel level);
LogLevel log_level();

void log_message(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& component, const std::string& message) {
  log_message(LogLevel::debug, component, message);
}
inline void log_info(const std::string& component, const std::string& message) {
  log_message(LogLevel::info, component, message);
}
inline void log_warn(const std::string& component, const std::string& message) {
  log_message(LogLevel::warn, component, message);
}
inline void log_error(const std::string& component, const std::string& message) {
  log_message(LogLevel::error, component, message);
}

}  // namespace sortie
