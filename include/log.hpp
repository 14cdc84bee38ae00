#pragma once
#include <sstream>
#include <string>

enum class LogLevel { Error = 0, Warn, Info, Debug, Trace };

// Process-wide log sink. Writes "[component] message" to stderr and,
// when set, to a log file.
void log_set_level(LogLevel level);
void log_set_file(const std::string& path, LogLevel level = LogLevel::Info);
bool log_enabled(LogLevel level);
void log_write(LogLevel level, const std::string& component, const std::string& msg);

LogLevel level_from_verbosity(int verbosity, bool quiet);

// Message parts are streamed together only when the level is enabled.
template <typename... Parts>
void log_at(LogLevel level, const std::string& component, const Parts&... parts) {
  if (!log_enabled(level)) return;
  std::ostringstream ss;
  (ss << ... << parts);
  log_write(level, component, ss.str());
}

template <typename... Parts>
void log_error(const std::string& c, const Parts&... p) { log_at(LogLevel::Error, c, p...); }
template <typename... Parts>
void log_warn(const std::string& c, const Parts&... p) { log_at(LogLevel::Warn, c, p...); }
template <typename... Parts>
void log_info(const std::string& c, const Parts&... p) { log_at(LogLevel::Info, c, p...); }
template <typename... Parts>
void log_debug(const std::string& c, const Parts&... p) { log_at(LogLevel::Debug, c, p...); }
template <typename... Parts>
void log_trace(const std::string& c, const Parts&... p) { log_at(LogLevel::Trace, c, p...); }
