#pragma once

#include <string>
#include <string_view>

namespace evstream {

enum class LogLevel { Debug, Info, Warn, Error };

const char* to_string(LogLevel level);

// -----------------------------------------------------------------------------
// ILogger: injected log sink
// -----------------------------------------------------------------------------
//
// @brief  Abstract destination for diagnostic messages from the writer, the
//         event service and the query server.
//
// @details
// Components receive an ILogger& at construction instead of reaching for a
// process-wide logger. Two writers in the same test binary can therefore log
// to two different sinks, and tests can capture and assert on log output.
//
// Messages follow the convention "<what_happened> key=value key=value", e.g.
//   event_file_rotated old_file=... new_file=... size_bytes=1048721
// `component` is the short name of the emitting class ("EventWriter").
//
// Thread-safety contract:
//   log() may be called concurrently from the caller's thread and from the
//   writer's consumer thread. Implementations must synchronize internally.
//
// Ownership:
//   Components hold a reference; the logger must outlive them.
// -----------------------------------------------------------------------------
class ILogger {
 public:
  virtual ~ILogger() = default;

  virtual void log(LogLevel level, std::string_view component,
                   std::string_view message) = 0;

  void debug(std::string_view component, std::string_view message) {
    log(LogLevel::Debug, component, message);
  }
  void info(std::string_view component, std::string_view message) {
    log(LogLevel::Info, component, message);
  }
  void warn(std::string_view component, std::string_view message) {
    log(LogLevel::Warn, component, message);
  }
  void error(std::string_view component, std::string_view message) {
    log(LogLevel::Error, component, message);
  }
};

}  // namespace evstream
