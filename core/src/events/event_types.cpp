#include "evstream/events/event_types.hpp"

namespace evstream {

const char* to_string(EventType type) {
  switch (type) {
    case EventType::Milestone: return "MILESTONE";
    case EventType::Decision:  return "DECISION";
    case EventType::Action:    return "ACTION";
    case EventType::State:     return "STATE";
    case EventType::Detail:    return "DETAIL";
    case EventType::System:    return "SYSTEM";
  }
  return "UNKNOWN";
}

std::optional<EventType> parse_event_type(std::string_view name) {
  for (EventType type : kAllEventTypes) {
    if (name == to_string(type)) {
      return type;
    }
  }
  // Logs written before the STATE rename used "ENV" for the same variant.
  if (name == "ENV") {
    return EventType::State;
  }
  return std::nullopt;
}

bool operator==(const Event& lhs, const Event& rhs) {
  return lhs.event_id == rhs.event_id && lhs.timestamp == rhs.timestamp &&
         lhs.simulation_id == rhs.simulation_id &&
         lhs.turn_number == rhs.turn_number &&
         lhs.event_type == rhs.event_type && lhs.agent_id == rhs.agent_id &&
         lhs.description == rhs.description &&
         lhs.caused_by == rhs.caused_by && lhs.details == rhs.details;
}

bool operator!=(const Event& lhs, const Event& rhs) { return !(lhs == rhs); }

}  // namespace evstream
