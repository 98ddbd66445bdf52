// collab_log.hpp
#ifndef COLLAB_LOG_HPP
#define COLLAB_LOG_HPP

#include <functional>
#include <string>

namespace collab {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Receives every message at or above the current threshold instead of stderr.
using LogSink = std::function<void(LogLevel level, const std::string &message)>;

/// Sets the minimum level that gets written. Default: Info.
void set_log_level(LogLevel level);
LogLevel log_level();

/// Replaces the stderr writer. Pass an empty function to restore stderr.
void set_log_sink(LogSink sink);

const char *to_string(LogLevel level);

void log(LogLevel level, const std::string &message);

inline void log_debug(const std::string &message) { log(LogLevel::Debug, message); }
inline void log_info(const std::string &message) { log(LogLevel::Info, message); }
inline void log_warn(const std::string &message) { log(LogLevel::Warn, message); }
inline void log_error(const std::string &message) { log(LogLevel::Error, message); }

} // namespace collab

#endif // COLLAB_LOG_HPP
