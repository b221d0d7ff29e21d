#pragma once

#include "evstream/events/event_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evstream {

// -----------------------------------------------------------------------------
// Event builders
// -----------------------------------------------------------------------------
//
// @brief  One constructor function per event variant.
//
// @details
// Every builder stamps a fresh event_id (ULID) and the current UTC time
// (truncated to microseconds), copies the envelope fields and writes the
// variant payload into `details`:
//
//   MILESTONE  milestone_type
//   DECISION   decision_type, old_value?, new_value?
//   ACTION     action_type, action_payload
//   STATE      variable_name, old_value, new_value, scope
//   DETAIL     calculation_type, intermediate_values
//   SYSTEM     status, error_type?, retry_count?, extra keys
//
// (? = omitted when null/empty.)
//
// Validation is limited to required-field presence: an empty simulation_id,
// or an empty agent_id for DECISION and ACTION, throws
// std::invalid_argument. Payload values are caller-supplied and opaque.
//
// Side-effects: none beyond object creation; no I/O.
// Thread-safety: safe to call from any thread (ids come from a thread-local
// generator).
// -----------------------------------------------------------------------------

Event create_milestone_event(const std::string& simulation_id,
                             std::int64_t turn_number,
                             const std::string& milestone_type,
                             std::optional<std::string> description = std::nullopt,
                             std::vector<std::string> caused_by = {});

Event create_decision_event(const std::string& simulation_id,
                            std::int64_t turn_number,
                            const std::string& agent_id,
                            const std::string& decision_type,
                            nlohmann::json old_value = nullptr,
                            nlohmann::json new_value = nullptr,
                            std::optional<std::string> description = std::nullopt,
                            std::vector<std::string> caused_by = {});

Event create_action_event(const std::string& simulation_id,
                          std::int64_t turn_number,
                          const std::string& agent_id,
                          const std::string& action_type,
                          nlohmann::json action_payload,
                          std::optional<std::string> description = std::nullopt,
                          std::vector<std::string> caused_by = {});

// `agent_id` is set for agent-scoped variables (scope "agent"); leave it
// empty for global ones.
Event create_state_event(const std::string& simulation_id,
                         std::int64_t turn_number,
                         const std::string& variable_name,
                         nlohmann::json old_value,
                         nlohmann::json new_value,
                         std::optional<std::string> agent_id = std::nullopt,
                         const std::string& scope = "global",
                         std::optional<std::string> description = std::nullopt,
                         std::vector<std::string> caused_by = {});

Event create_detail_event(const std::string& simulation_id,
                          std::int64_t turn_number,
                          const std::string& calculation_type,
                          nlohmann::json intermediate_values,
                          std::optional<std::string> description = std::nullopt,
                          std::vector<std::string> caused_by = {});

// `extra_details` must be a JSON object (or null); its keys are merged into
// details after the fixed keys and may not override them.
Event create_system_event(const std::string& simulation_id,
                          std::int64_t turn_number,
                          const std::string& status,
                          std::optional<std::string> error_type = std::nullopt,
                          std::optional<int> retry_count = std::nullopt,
                          std::optional<std::string> description = std::nullopt,
                          std::vector<std::string> caused_by = {},
                          const nlohmann::json& extra_details = nullptr);

}  // namespace evstream
