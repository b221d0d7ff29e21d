#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace evstream {

// -----------------------------------------------------------------------------
// Segment layout
// -----------------------------------------------------------------------------
//
// @brief  Naming rules for the files that make up one simulation's log.
//
// @details
//   output_root/
//     <simulation_id>/
//       events.jsonl                                   current segment
//       events_2025-01-01_12-00-00-123456.jsonl        rotated (older)
//       events_2025-01-01_12-05-10-000042.jsonl        rotated (older)
//
// The current segment is always the most recently active one. Rotated
// segments carry the UTC time of their rotation with microsecond precision,
// so their names sort in rotation order.
//
// Shared by EventWriter (which creates and renames segments) and EventService
// (which discovers them). Nothing here throws: discovery failures yield an
// empty list.
// -----------------------------------------------------------------------------

inline constexpr std::string_view kCurrentSegmentName = "events.jsonl";

// "events_<YYYY-MM-DD_HH-MM-SS-ffffff>.jsonl" for the given epoch time.
std::string rotated_segment_name(std::int64_t epoch_us);

bool is_current_segment_name(std::string_view filename);
bool is_rotated_segment_name(std::string_view filename);

inline bool is_segment_name(std::string_view filename) {
  return is_current_segment_name(filename) || is_rotated_segment_name(filename);
}

// output_root / simulation_id.
std::filesystem::path simulation_directory(
    const std::filesystem::path& output_root, const std::string& simulation_id);

// -------------------------------------------------------------------------
// list_segments(dir)
// -------------------------------------------------------------------------
// @brief  Regular files in `dir` whose names match the segment pattern,
//         oldest first: rotated segments by name, then the current segment.
//
// @return Empty when `dir` does not exist, is not a directory, or cannot be
//         listed.
// -------------------------------------------------------------------------
std::vector<std::filesystem::path> list_segments(
    const std::filesystem::path& dir);

}  // namespace evstream
