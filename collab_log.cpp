// collab_log.cpp
#include "collab_log.hpp"

#include <cstdio>

namespace collab {

namespace {

LogLevel g_level = LogLevel::Info;
LogSink g_sink;

} // namespace

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

void set_log_sink(LogSink sink) { g_sink = std::move(sink); }

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

void log(LogLevel level, const std::string &message) {
  if (level == LogLevel::Off || static_cast<int>(level) < static_cast<int>(g_level)) {
    return;
  }
  if (g_sink) {
    g_sink(level, message);
    return;
  }
  std::fprintf(stderr, "collab-sync [%s]: %s\n", to_string(level), message.c_str());
}

} // namespace collab
