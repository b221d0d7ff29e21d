#include "evstream/logging/console_logger.hpp"

#include <iostream>

namespace evstream {

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "UNKNOWN";
}

ConsoleLogger::ConsoleLogger(LogLevel min_level) : min_level_(min_level) {}

// -----------------------------------------------------------------------------
// log(): filter by level, then write one line under the mutex
// -----------------------------------------------------------------------------
void ConsoleLogger::log(LogLevel level, std::string_view component,
                        std::string_view message) {
  if (level < min_level_) {
    return;
  }
  std::ostream& out = level >= LogLevel::Warn ? std::cerr : std::cout;

  std::lock_guard lock(mutex_);
  out << '[' << component << "] ";
  if (level >= LogLevel::Warn) {
    out << to_string(level) << ' ';
  }
  out << message << '\n';
}

}  // namespace evstream
