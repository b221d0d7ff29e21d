#include "evstream/time/simulation_time_provider.hpp"

namespace evstream {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_us)
    : current_time_us_(start_us) {}

std::int64_t SimulationTimeProvider::now_us() const {
  return current_time_us_.load();
}

void SimulationTimeProvider::set_time(std::int64_t new_time_us) {
  current_time_us_.store(new_time_us);
}

// fetch_add keeps concurrent advances from losing an increment.
void SimulationTimeProvider::advance_by(std::int64_t delta_us) {
  current_time_us_.fetch_add(delta_us);
}

}  // namespace evstream
