#include "sortie/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "sortie/jsonlite.hpp"
#include "sortie/types.hpp"

namespace sortie {

namespace {

LogLevel level_from_env() {
  const char* v = std::getenv("SORTIE_LOG_LEVEL");
  if (!v) return LogLevel::info;
  if (std::strcmp(v, "debug") == 0) return LogLevel::debug;
  if (std::strcmp(v, "warn") == 0) return LogLevel::warn;
  if (std::strcmp(v, "error") == 0) return LogLevel::error;
  return LogLevel::info;
}

bool json_format_from_env() {
  const char* v = std::getenv("SORTIE_LOG_FORMAT");
  return v && std::strcmp(v, "json") == 0;
}

std::atomic<LogHook> g_log_hook{nullptr};
std::atomic<int> g_log_level{static_cast<int>(level_from_env())};

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

void set_log_hook(LogHook hook) { g_log_hook.store(hook, std::memory_order_release); }

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() { return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed)); }

void log_message(LogLevel level, const std::string& component, const std::string& message) {
  if (static_cast<int>(level) < g_log_level.load(std::memory_order_relaxed)) return;

  LogRecord rec{level, component, message, now_unix_ms()};
  if (LogHook hook = g_log_hook.load(std::memory_order_acquire)) {
    hook(rec);
    return;
  }

  std::string line;
  static const bool json = json_format_from_env();
  if (json) {
    jsonlite::Object o;
    o["ts_ms"] = jsonlite::Value{rec.timestamp_ms};
    o["level"] = to_string(level);
    o["component"] = component;
    o["message"] = message;
    line = jsonlite::to_json(jsonlite::Value{std::move(o)});
  } else {
    line.reserve(message.size() + component.size() + 24);
    line += "[sortie][";
    line += to_string(level);
    line += "][";
    line += component;
    line += "] ";
    line += message;
  }
  line += '\n';
  std::fwrite(line.data(), 1, line.size(), stderr);
}

}  // namespace sortie
