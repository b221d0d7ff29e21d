#include "evstream/events/event_id_generator.hpp"

#include <chrono>

namespace evstream {

namespace {

constexpr char kCrockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr std::int64_t kMaxTimestampMs = (std::int64_t{1} << 48) - 1;

std::int64_t wall_clock_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

EventIdGenerator::EventIdGenerator() : rng_(std::random_device{}()) {}

EventIdGenerator::EventIdGenerator(std::uint64_t seed) : rng_(seed) {}

std::string EventIdGenerator::next_id() { return next_id(wall_clock_ms()); }

// -----------------------------------------------------------------------------
// next_id(epoch_ms): choose timestamp and random part, then encode
// -----------------------------------------------------------------------------
std::string EventIdGenerator::next_id(std::int64_t epoch_ms) {
  if (epoch_ms < 0) {
    epoch_ms = 0;
  } else if (epoch_ms > kMaxTimestampMs) {
    epoch_ms = kMaxTimestampMs;
  }

  std::int64_t ms = 0;
  std::uint16_t hi = 0;
  std::uint64_t lo = 0;
  {
    std::lock_guard lock(mutex_);
    if (epoch_ms > last_ms_) {
      last_ms_ = epoch_ms;
      draw_random();
    } else {
      // Same (or earlier) millisecond: increment the 80-bit random part.
      if (++random_lo_ == 0) {
        ++random_hi_;
        if (random_hi_ == 0 && last_ms_ < kMaxTimestampMs) {
          // The random space for this millisecond is exhausted; borrow the
          // next one.
          ++last_ms_;
          draw_random();
        }
      }
    }
    ms = last_ms_;
    hi = random_hi_;
    lo = random_lo_;
  }

  std::string id(kIdLength, '0');

  // 48-bit timestamp → 10 characters (the top 2 bits of the first character
  // are always zero).
  auto time_bits = static_cast<std::uint64_t>(ms);
  for (int i = 9; i >= 0; --i) {
    id[static_cast<std::size_t>(i)] = kCrockford[time_bits & 0x1F];
    time_bits >>= 5;
  }

  // 80-bit random part → 16 characters, least significant 5 bits last.
  for (int i = 25; i >= 10; --i) {
    id[static_cast<std::size_t>(i)] = kCrockford[lo & 0x1F];
    lo = (lo >> 5) | (static_cast<std::uint64_t>(hi & 0x1F) << 59);
    hi = static_cast<std::uint16_t>(hi >> 5);
  }
  return id;
}

// Caller holds mutex_.
void EventIdGenerator::draw_random() {
  random_lo_ = rng_();
  random_hi_ = static_cast<std::uint16_t>(rng_());
}

std::string generate_event_id() {
  thread_local EventIdGenerator generator;
  return generator.next_id();
}

}  // namespace evstream
