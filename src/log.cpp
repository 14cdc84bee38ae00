#include "log.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace {
std::mutex mu;
LogLevel stderr_level = LogLevel::Warn;
LogLevel file_level = LogLevel::Info;
std::unique_ptr<std::ofstream> file;

const char* level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Trace: return "TRACE";
  }
  return "?";
}
}

void log_set_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(mu);
  stderr_level = level;
}

void log_set_file(const std::string& path, LogLevel level) {
  auto f = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
  if (!*f) throw std::runtime_error("log: unable to create log file " + path);
  std::lock_guard<std::mutex> lock(mu);
  file = std::move(f);
  file_level = level;
}

bool log_enabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(mu);
  return level <= stderr_level || (file && level <= file_level);
}

void log_write(LogLevel level, const std::string& component, const std::string& msg) {
  std::lock_guard<std::mutex> lock(mu);
  if (level <= stderr_level) {
    std::cerr << level_name(level) << " [" << component << "] " << msg << "\n";
  }
  if (file && level <= file_level) {
    *file << level_name(level) << " [" << component << "] " << msg << "\n";
    file->flush();
  }
}

LogLevel level_from_verbosity(int verbosity, bool quiet) {
  switch (verbosity) {
    case 0: return quiet ? LogLevel::Error : LogLevel::Warn;
    case 1: return LogLevel::Info;
    case 2: return LogLevel::Debug;
    default: return LogLevel::Trace;
  }
}
