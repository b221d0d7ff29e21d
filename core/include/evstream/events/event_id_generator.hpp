#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace evstream {

// -----------------------------------------------------------------------------
// EventIdGenerator: time-ordered, lexicographically sortable event ids
// -----------------------------------------------------------------------------
//
// @brief  Produces ULIDs: 26 characters of Crockford base32 encoding a
//         48-bit millisecond timestamp followed by 80 random bits.
//
// @details
// Ids sort lexicographically in creation-time order across milliseconds.
// Within a single millisecond the generator increments the random part of
// the previous id instead of drawing a new one, so ids from one generator
// are strictly increasing even when the clock does not move (or moves
// backwards: the last timestamp is reused until the clock catches up).
//
// Why not a plain counter (compare OrderIdGenerator-style sequence ids):
// event ids must stay unique across process restarts that append to the same
// simulation log, and must sort by time when read back by another process.
//
// Thread model:
//   next_id() is safe to call concurrently; a mutex guards the monotonic
//   state. generate_event_id() uses one generator per thread and never
//   contends.
// -----------------------------------------------------------------------------
class EventIdGenerator {
 public:
  EventIdGenerator();

  // Seeds the random part deterministically (tests).
  explicit EventIdGenerator(std::uint64_t seed);

  EventIdGenerator(const EventIdGenerator&) = delete;
  EventIdGenerator& operator=(const EventIdGenerator&) = delete;
  EventIdGenerator(EventIdGenerator&&) = delete;
  EventIdGenerator& operator=(EventIdGenerator&&) = delete;

  // Id stamped with the current wall-clock millisecond.
  std::string next_id();

  // Id stamped with `epoch_ms` (clamped to 48 bits).
  std::string next_id(std::int64_t epoch_ms);

  static constexpr std::size_t kIdLength = 26;

 private:
  void draw_random();

  std::mutex mutex_;
  std::mt19937_64 rng_;
  std::int64_t last_ms_{-1};
  // 80-bit random part: high 16 bits and low 64 bits.
  std::uint16_t random_hi_{0};
  std::uint64_t random_lo_{0};
};

// Id from a thread-local generator. Used by the event builders.
std::string generate_event_id();

}  // namespace evstream
