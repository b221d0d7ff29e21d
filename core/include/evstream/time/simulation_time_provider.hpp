#pragma once

#include "evstream/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace evstream {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly by its owner
//         rather than read from the system clock.
//
// @details
// Lets tests and replays pin the writer's notion of "now": freeze it to
// force several rotations into the same microsecond, or set it to a known
// date to check rotated segment names.
//
// Internal storage is a std::atomic<int64_t>; reads and writes are lock-free
// on 64-bit platforms and visible across threads without a mutex. The writer
// consumer thread reads while the test thread writes.
//
// Monotonicity is NOT enforced: being able to set arbitrary times is the
// point of this class.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // Starts the clock at the given epoch microseconds.
  explicit SimulationTimeProvider(std::int64_t start_us);

  std::int64_t now_us() const override;

  // -------------------------------------------------------------------------
  // set_time(new_time_us) / advance_by(delta_us)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock. After the call every thread reading now_us()
  //         sees the new value (seq_cst store).
  // -------------------------------------------------------------------------
  void set_time(std::int64_t new_time_us);
  void advance_by(std::int64_t delta_us);

 private:
  std::atomic<std::int64_t> current_time_us_{0};
};

}  // namespace evstream
