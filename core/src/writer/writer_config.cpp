#include "evstream/writer/writer_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

namespace evstream {

namespace {

std::string lowercase(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::invalid_argument bad_key(const char* key, const std::string& why) {
  return std::invalid_argument(std::string("writer config '") + key +
                               "': " + why);
}

std::string string_key(const nlohmann::json& j, const char* key) {
  const auto& value = j.at(key);
  if (!value.is_string()) {
    throw bad_key(key, "expected a string");
  }
  return value.get<std::string>();
}

// Positive integer; rejects negatives, zero, floats and strings.
std::uint64_t positive_key(const nlohmann::json& j, const char* key) {
  const auto& value = j.at(key);
  if (value.is_number_unsigned()) {
    auto n = value.get<std::uint64_t>();
    if (n > 0) {
      return n;
    }
  } else if (value.is_number_integer()) {
    auto n = value.get<std::int64_t>();
    if (n > 0) {
      return static_cast<std::uint64_t>(n);
    }
  } else {
    throw bad_key(key, "expected an integer");
  }
  throw bad_key(key, "must be positive");
}

}  // namespace

const char* to_string(WriteMode mode) {
  switch (mode) {
    case WriteMode::Concurrent: return "concurrent";
    case WriteMode::Direct:     return "direct";
  }
  return "unknown";
}

std::optional<WriteMode> parse_write_mode(std::string_view name) {
  std::string lower = lowercase(name);
  if (lower == "concurrent" || lower == "async") {
    return WriteMode::Concurrent;
  }
  if (lower == "direct" || lower == "sync") {
    return WriteMode::Direct;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// writer_config_from_json(): overlay present keys onto base
// -----------------------------------------------------------------------------
EventWriterConfig writer_config_from_json(const nlohmann::json& j,
                                          EventWriterConfig base) {
  if (!j.is_object()) {
    throw std::invalid_argument("writer config: expected a JSON object");
  }

  if (j.contains("output_dir")) {
    base.output_dir = string_key(j, "output_dir");
  }
  if (j.contains("simulation_id")) {
    base.simulation_id = string_key(j, "simulation_id");
  }
  if (j.contains("verbosity")) {
    std::string name = string_key(j, "verbosity");
    auto level = parse_verbosity(name);
    if (!level) {
      throw bad_key("verbosity", "unknown level '" + name + "'");
    }
    base.verbosity = *level;
  }
  if (j.contains("mode")) {
    std::string name = string_key(j, "mode");
    auto mode = parse_write_mode(name);
    if (!mode) {
      throw bad_key("mode", "unknown mode '" + name + "'");
    }
    base.mode = *mode;
  }
  if (j.contains("max_queue_size")) {
    base.max_queue_size =
        static_cast<std::size_t>(positive_key(j, "max_queue_size"));
  }
  if (j.contains("max_file_size")) {
    base.max_file_size = positive_key(j, "max_file_size");
  }
  return base;
}

EventWriterConfig load_writer_config(const std::filesystem::path& path,
                                     EventWriterConfig base) {
  std::ifstream in(path);
  if (!in) {
    throw std::invalid_argument("writer config: cannot open " + path.string());
  }
  nlohmann::json j = nlohmann::json::parse(in, nullptr,
                                           /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    throw std::invalid_argument("writer config: invalid JSON in " +
                                path.string());
  }
  return writer_config_from_json(j, std::move(base));
}

}  // namespace evstream
