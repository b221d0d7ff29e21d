#include "evstream/service/event_filter.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace evstream {

void EventFilter::validate() const {
  if (limit < 1 || limit > kMaxLimit) {
    throw std::invalid_argument("event filter: limit must be in [1, " +
                                std::to_string(kMaxLimit) + "], got " +
                                std::to_string(limit));
  }
  if (turn_start && *turn_start < 0) {
    throw std::invalid_argument("event filter: turn_start must be >= 0");
  }
  if (turn_end && *turn_end < 0) {
    throw std::invalid_argument("event filter: turn_end must be >= 0");
  }
}

bool EventFilter::matches(const Event& event) const {
  if (start_timestamp && event.timestamp < *start_timestamp) {
    return false;
  }
  if (end_timestamp && event.timestamp > *end_timestamp) {
    return false;
  }

  if (!event_types.empty() &&
      std::find(event_types.begin(), event_types.end(), event.event_type) ==
          event_types.end()) {
    return false;
  }

  if (!agent_ids.empty()) {
    if (!event.agent_id ||
        std::find(agent_ids.begin(), agent_ids.end(), *event.agent_id) ==
            agent_ids.end()) {
      return false;
    }
  }

  if (turn_start && event.turn_number < *turn_start) {
    return false;
  }
  if (turn_end && event.turn_number > *turn_end) {
    return false;
  }
  return true;
}

}  // namespace evstream
