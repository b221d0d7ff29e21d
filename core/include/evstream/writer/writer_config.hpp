#pragma once

#include "evstream/events/verbosity.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace evstream {

// -----------------------------------------------------------------------------
// WriteMode
// -----------------------------------------------------------------------------
//   Concurrent: emit() enqueues; one background thread writes. Never blocks
//                the caller; drops on a full queue.
//   Direct    : emit() writes, fsyncs and rotates before returning. No thread,
//                no queue, nothing to drain on stop().
// -----------------------------------------------------------------------------
enum class WriteMode { Concurrent, Direct };

const char* to_string(WriteMode mode);

// Case-insensitive. "concurrent" / "async" and "direct" / "sync".
std::optional<WriteMode> parse_write_mode(std::string_view name);

inline constexpr std::uintmax_t kDefaultMaxFileSize = 500ULL * 1024 * 1024;
inline constexpr std::size_t kDefaultMaxQueueSize = 10000;

// -----------------------------------------------------------------------------
// EventWriterConfig: settings for one EventWriter
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct copied into the writer at construction.
//
// @details
// `output_dir` is the simulation's own directory (normally
// simulation_directory(output_root, simulation_id)); the writer creates it if
// needed and keeps events.jsonl inside it.
//
// `max_queue_size` only matters in Concurrent mode. `max_file_size` is the
// rotation threshold: the size check runs after each write, so a segment can
// exceed it by at most one serialized event.
// -----------------------------------------------------------------------------
struct EventWriterConfig {
  std::filesystem::path output_dir;
  std::string simulation_id;
  VerbosityLevel verbosity{VerbosityLevel::Action};
  WriteMode mode{WriteMode::Concurrent};
  std::size_t max_queue_size{kDefaultMaxQueueSize};
  std::uintmax_t max_file_size{kDefaultMaxFileSize};
};

// -------------------------------------------------------------------------
// writer_config_from_json(j, base)
// -------------------------------------------------------------------------
// @brief  Overlays the keys present in `j` onto `base`.
//
// @details
// Recognized keys: output_dir, simulation_id, verbosity, mode,
// max_queue_size, max_file_size. Missing keys keep the value from `base`;
// unknown keys are ignored.
//
// @throws std::invalid_argument  when `j` is not an object, a key has the
//         wrong JSON type, a verbosity/mode name is unknown, or a size is
//         zero or negative. The message names the offending key.
// -------------------------------------------------------------------------
EventWriterConfig writer_config_from_json(const nlohmann::json& j,
                                          EventWriterConfig base = {});

// Reads a JSON document from `path` and applies writer_config_from_json().
// Throws std::invalid_argument when the file cannot be read or parsed.
EventWriterConfig load_writer_config(const std::filesystem::path& path,
                                     EventWriterConfig base = {});

}  // namespace evstream
