#include "evstream/events/event_builder.hpp"

#include "evstream/events/event_id_generator.hpp"
#include "evstream/time/time_utils.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace evstream {

namespace {

void require(const std::string& value, const char* field,
             EventType event_type) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(to_string(event_type)) +
                                " event requires " + field);
  }
}

// Envelope common to every variant: id, time, provenance and causal links.
Event make_envelope(EventType event_type, const std::string& simulation_id,
                    std::int64_t turn_number,
                    std::optional<std::string> description,
                    std::vector<std::string> caused_by) {
  require(simulation_id, "simulation_id", event_type);

  Event event;
  event.event_id = generate_event_id();
  event.timestamp = truncate_to_micros(std::chrono::system_clock::now());
  event.simulation_id = simulation_id;
  event.turn_number = turn_number;
  event.event_type = event_type;
  event.description = std::move(description);
  event.caused_by = std::move(caused_by);
  return event;
}

}  // namespace

Event create_milestone_event(const std::string& simulation_id,
                             std::int64_t turn_number,
                             const std::string& milestone_type,
                             std::optional<std::string> description,
                             std::vector<std::string> caused_by) {
  Event event = make_envelope(EventType::Milestone, simulation_id, turn_number,
                              std::move(description), std::move(caused_by));
  event.details["milestone_type"] = milestone_type;
  return event;
}

Event create_decision_event(const std::string& simulation_id,
                            std::int64_t turn_number,
                            const std::string& agent_id,
                            const std::string& decision_type,
                            nlohmann::json old_value,
                            nlohmann::json new_value,
                            std::optional<std::string> description,
                            std::vector<std::string> caused_by) {
  require(agent_id, "agent_id", EventType::Decision);
  Event event = make_envelope(EventType::Decision, simulation_id, turn_number,
                              std::move(description), std::move(caused_by));
  event.agent_id = agent_id;
  event.details["decision_type"] = decision_type;
  if (!old_value.is_null()) {
    event.details["old_value"] = std::move(old_value);
  }
  if (!new_value.is_null()) {
    event.details["new_value"] = std::move(new_value);
  }
  return event;
}

Event create_action_event(const std::string& simulation_id,
                          std::int64_t turn_number,
                          const std::string& agent_id,
                          const std::string& action_type,
                          nlohmann::json action_payload,
                          std::optional<std::string> description,
                          std::vector<std::string> caused_by) {
  require(agent_id, "agent_id", EventType::Action);
  Event event = make_envelope(EventType::Action, simulation_id, turn_number,
                              std::move(description), std::move(caused_by));
  event.agent_id = agent_id;
  event.details["action_type"] = action_type;
  event.details["action_payload"] = std::move(action_payload);
  return event;
}

Event create_state_event(const std::string& simulation_id,
                         std::int64_t turn_number,
                         const std::string& variable_name,
                         nlohmann::json old_value,
                         nlohmann::json new_value,
                         std::optional<std::string> agent_id,
                         const std::string& scope,
                         std::optional<std::string> description,
                         std::vector<std::string> caused_by) {
  Event event = make_envelope(EventType::State, simulation_id, turn_number,
                              std::move(description), std::move(caused_by));
  if (agent_id && !agent_id->empty()) {
    event.agent_id = std::move(agent_id);
  }
  event.details["variable_name"] = variable_name;
  event.details["old_value"] = std::move(old_value);
  event.details["new_value"] = std::move(new_value);
  event.details["scope"] = scope;
  return event;
}

Event create_detail_event(const std::string& simulation_id,
                          std::int64_t turn_number,
                          const std::string& calculation_type,
                          nlohmann::json intermediate_values,
                          std::optional<std::string> description,
                          std::vector<std::string> caused_by) {
  Event event = make_envelope(EventType::Detail, simulation_id, turn_number,
                              std::move(description), std::move(caused_by));
  event.details["calculation_type"] = calculation_type;
  event.details["intermediate_values"] = std::move(intermediate_values);
  return event;
}

Event create_system_event(const std::string& simulation_id,
                          std::int64_t turn_number,
                          const std::string& status,
                          std::optional<std::string> error_type,
                          std::optional<int> retry_count,
                          std::optional<std::string> description,
                          std::vector<std::string> caused_by,
                          const nlohmann::json& extra_details) {
  if (!extra_details.is_null() && !extra_details.is_object()) {
    throw std::invalid_argument("SYSTEM event extra_details must be an object");
  }
  Event event = make_envelope(EventType::System, simulation_id, turn_number,
                              std::move(description), std::move(caused_by));
  event.details["status"] = status;
  if (error_type && !error_type->empty()) {
    event.details["error_type"] = *error_type;
  }
  if (retry_count) {
    event.details["retry_count"] = *retry_count;
  }
  if (extra_details.is_object()) {
    for (auto it = extra_details.begin(); it != extra_details.end(); ++it) {
      if (!event.details.contains(it.key())) {
        event.details[it.key()] = it.value();
      }
    }
  }
  return event;
}

}  // namespace evstream
