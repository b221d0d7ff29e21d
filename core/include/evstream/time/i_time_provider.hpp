#pragma once

#include <cstdint>

namespace evstream {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// The EventWriter stamps rotated segment names with the current time. Tests
// need that time to be controllable (two rotations in the same microsecond,
// a known rotation date), so the writer receives a provider instead of
// calling the system clock directly:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the caller.
//
// Resolution is microseconds since the Unix epoch, the same resolution used
// by event timestamps and rotated segment names.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference or pointer; they do NOT own the
//   provider. The provider must outlive every component that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_us()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as microseconds since
  //         1970-01-01 00:00:00 UTC.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_us() const = 0;
};

}  // namespace evstream
