#include "evstream/events/event_json.hpp"

#include "evstream/time/time_utils.hpp"

#include <utility>

namespace evstream {

// -----------------------------------------------------------------------------
// to_json(): fixed field order mirrors the documented record layout
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Event& event) {
  j = nlohmann::json::object();
  j["event_id"] = event.event_id;
  j["timestamp"] = format_iso8601(event.timestamp);
  j["turn_number"] = event.turn_number;
  j["simulation_id"] = event.simulation_id;
  j["event_type"] = to_string(event.event_type);
  j["agent_id"] = event.agent_id ? nlohmann::json(*event.agent_id)
                                 : nlohmann::json(nullptr);
  j["description"] = event.description ? nlohmann::json(*event.description)
                                       : nlohmann::json(nullptr);
  j["caused_by"] = event.caused_by;
  j["details"] = event.details.is_null() ? nlohmann::json::object()
                                         : event.details;
}

std::string serialize_event(const Event& event) {
  nlohmann::json j = event;
  return j.dump();
}

// -----------------------------------------------------------------------------
// event_from_json(): validate field types without throwing
// -----------------------------------------------------------------------------
std::optional<Event> event_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  auto string_field = [&j](const char* key) -> const std::string* {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
      return nullptr;
    }
    return it->get_ptr<const std::string*>();
  };

  // Optional string: absent or null → nullopt; any other non-string → error.
  auto nullable_string = [&j](const char* key,
                              std::optional<std::string>& out) -> bool {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
      out.reset();
      return true;
    }
    if (!it->is_string()) {
      return false;
    }
    out = it->get<std::string>();
    return true;
  };

  const std::string* event_id = string_field("event_id");
  const std::string* timestamp = string_field("timestamp");
  const std::string* simulation_id = string_field("simulation_id");
  const std::string* event_type = string_field("event_type");
  if (event_id == nullptr || timestamp == nullptr ||
      simulation_id == nullptr || event_type == nullptr) {
    return std::nullopt;
  }

  auto turn = j.find("turn_number");
  if (turn == j.end() || !turn->is_number_integer()) {
    return std::nullopt;
  }

  std::optional<EventType> type = parse_event_type(*event_type);
  std::optional<Timestamp> ts = parse_iso8601(*timestamp);
  if (!type || !ts) {
    return std::nullopt;
  }

  Event event;
  event.event_id = *event_id;
  event.timestamp = *ts;
  event.simulation_id = *simulation_id;
  event.turn_number = turn->get<std::int64_t>();
  event.event_type = *type;

  if (!nullable_string("agent_id", event.agent_id) ||
      !nullable_string("description", event.description)) {
    return std::nullopt;
  }

  auto caused_by = j.find("caused_by");
  if (caused_by != j.end() && !caused_by->is_null()) {
    if (!caused_by->is_array()) {
      return std::nullopt;
    }
    for (const auto& parent : *caused_by) {
      if (!parent.is_string()) {
        return std::nullopt;
      }
      event.caused_by.push_back(parent.get<std::string>());
    }
  }

  auto details = j.find("details");
  if (details != j.end() && !details->is_null()) {
    if (!details->is_object()) {
      return std::nullopt;
    }
    event.details = *details;
  }
  return event;
}

std::optional<Event> parse_event_line(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  if (line.empty()) {
    return std::nullopt;
  }
  // allow_exceptions = false: a parse error yields a "discarded" value.
  nlohmann::json j = nlohmann::json::parse(line.begin(), line.end(), nullptr,
                                           /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return std::nullopt;
  }
  return event_from_json(j);
}

}  // namespace evstream
