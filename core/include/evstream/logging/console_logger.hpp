#pragma once

#include "evstream/logging/i_logger.hpp"

#include <mutex>

namespace evstream {

// -----------------------------------------------------------------------------
// ConsoleLogger: ILogger writing to the process's standard streams
// -----------------------------------------------------------------------------
// Lines look like "[EventWriter] event_writer_started ...". Debug and Info go
// to std::cout, Warn and Error to std::cerr. Messages below `min_level` are
// discarded. A mutex keeps lines from interleaving when the consumer thread
// and the caller log at the same time.
// -----------------------------------------------------------------------------
class ConsoleLogger final : public ILogger {
 public:
  explicit ConsoleLogger(LogLevel min_level = LogLevel::Info);

  void log(LogLevel level, std::string_view component,
           std::string_view message) override;

  LogLevel min_level() const { return min_level_; }

 private:
  LogLevel min_level_;
  std::mutex mutex_;
};

}  // namespace evstream
