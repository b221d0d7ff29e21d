#pragma once

#include "evstream/time/i_time_provider.hpp"

namespace evstream {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Used by the EventWriter unless a caller injects another provider.
// std::chrono::system_clock::now() is safe to call from any thread, so no
// internal state or locking is needed.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_us() const override;
};

}  // namespace evstream
