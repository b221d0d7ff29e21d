#include "evstream/storage/segment_layout.hpp"

#include "evstream/time/time_utils.hpp"

#include <algorithm>
#include <system_error>

namespace evstream {

namespace {

constexpr std::string_view kRotatedPrefix = "events_";
constexpr std::string_view kSuffix = ".jsonl";

// Shape of a rotation stamp: D = digit, anything else must match literally.
constexpr std::string_view kStampShape = "DDDD-DD-DD_DD-DD-DD-DDDDDD";

}  // namespace

std::string rotated_segment_name(std::int64_t epoch_us) {
  std::string name(kRotatedPrefix);
  name += format_rotation_stamp(epoch_us);
  name += kSuffix;
  return name;
}

bool is_current_segment_name(std::string_view filename) {
  return filename == kCurrentSegmentName;
}

bool is_rotated_segment_name(std::string_view filename) {
  if (filename.size() !=
      kRotatedPrefix.size() + kStampShape.size() + kSuffix.size()) {
    return false;
  }
  if (filename.substr(0, kRotatedPrefix.size()) != kRotatedPrefix ||
      filename.substr(filename.size() - kSuffix.size()) != kSuffix) {
    return false;
  }
  std::string_view stamp = filename.substr(kRotatedPrefix.size(),
                                           kStampShape.size());
  for (std::size_t i = 0; i < kStampShape.size(); ++i) {
    char expected = kStampShape[i];
    char actual = stamp[i];
    if (expected == 'D') {
      if (actual < '0' || actual > '9') {
        return false;
      }
    } else if (actual != expected) {
      return false;
    }
  }
  return true;
}

std::filesystem::path simulation_directory(
    const std::filesystem::path& output_root,
    const std::string& simulation_id) {
  return output_root / simulation_id;
}

// -----------------------------------------------------------------------------
// list_segments(): error_code overloads only, so a directory that vanishes
// mid-scan ends the listing instead of throwing
// -----------------------------------------------------------------------------
std::vector<std::filesystem::path> list_segments(
    const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> rotated;
  std::filesystem::path current;

  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return {};
  }
  for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }
    std::string name = it->path().filename().string();
    if (is_current_segment_name(name)) {
      current = it->path();
    } else if (is_rotated_segment_name(name)) {
      rotated.push_back(it->path());
    }
  }

  std::sort(rotated.begin(), rotated.end(),
            [](const std::filesystem::path& a, const std::filesystem::path& b) {
              return a.filename().string() < b.filename().string();
            });
  if (!current.empty()) {
    rotated.push_back(std::move(current));
  }
  return rotated;
}

}  // namespace evstream
