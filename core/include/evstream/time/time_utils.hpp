#pragma once

#include "evstream/events/event_types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace evstream {

// -----------------------------------------------------------------------------
// Time conversion and formatting utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between Timestamp
//         (std::chrono::system_clock::time_point), epoch microseconds and the
//         two text forms used on disk.
//
// @details
// Text forms:
//   - ISO-8601 UTC, microsecond precision, explicit offset:
//       2025-01-01T12:00:00.123456+00:00
//     Used for the `timestamp` field of every serialized event.
//   - Rotation stamp embedded in rotated segment names:
//       2025-01-01_12-00-00-123456
//
// All conversions are UTC and use the proleptic Gregorian calendar; no
// timezone database or C library global state (gmtime) is involved.
//
// Thread-safety: Stateless: safe to call from any thread.
// -----------------------------------------------------------------------------

inline Timestamp us_to_timestamp(std::int64_t us) {
  return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
      std::chrono::microseconds{us})};
}

inline std::int64_t timestamp_to_us(Timestamp tp) {
  return std::chrono::floor<std::chrono::microseconds>(tp.time_since_epoch())
      .count();
}

// Drops sub-microsecond precision. Builders apply this at construction so a
// serialized timestamp parses back to an identical value.
inline Timestamp truncate_to_micros(Timestamp tp) {
  return us_to_timestamp(timestamp_to_us(tp));
}

// -------------------------------------------------------------------------
// format_iso8601
// -------------------------------------------------------------------------
// @brief  Formats tp as "YYYY-MM-DDTHH:MM:SS.ffffff+00:00". The fractional
//         part is always six digits so equal-length strings sort in time
//         order.
// -------------------------------------------------------------------------
std::string format_iso8601(Timestamp tp);

// -------------------------------------------------------------------------
// parse_iso8601
// -------------------------------------------------------------------------
// @brief  Parses an ISO-8601 date-time.
//
// @return The instant, or std::nullopt when the text is not a valid
//         date-time.
//
// @details
// Accepts 'T' or ' ' between date and time, an optional fraction of 1 to 9
// digits (truncated to microseconds), and an optional zone suffix: 'Z',
// '+HH:MM' or '-HH:MM'. A missing suffix is read as UTC.
// -------------------------------------------------------------------------
std::optional<Timestamp> parse_iso8601(std::string_view text);

// Formats epoch microseconds as "YYYY-MM-DD_HH-MM-SS-ffffff" (UTC).
std::string format_rotation_stamp(std::int64_t epoch_us);

}  // namespace evstream
