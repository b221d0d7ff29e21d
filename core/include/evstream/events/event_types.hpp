#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evstream {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock instant in UTC. Events carry microsecond resolution; builders
// truncate to microseconds so the ISO-8601 text form round-trips exactly.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// EventType
// -----------------------------------------------------------------------------
// Discriminator for the six event variants. The set is closed: adding a
// variant means updating the verbosity table, the name conversions and the
// builders, and the compiler flags every switch that misses it.
// -----------------------------------------------------------------------------
enum class EventType {
  Milestone,  // Turn boundaries, phase transitions
  Decision,   // Agent strategic decisions and policy changes
  Action,     // Individual agent actions and transactions
  State,      // State variable transitions
  Detail,     // Granular calculations and intermediate values
  System      // Simulation lifecycle, errors, retries
};

inline constexpr EventType kAllEventTypes[] = {
    EventType::Milestone, EventType::Decision, EventType::Action,
    EventType::State,     EventType::Detail,   EventType::System};

// Canonical upper-case wire name ("MILESTONE", ...).
const char* to_string(EventType type);

// Parses a wire name. Accepts the legacy name "ENV" as State. Returns
// std::nullopt for anything else; matching is exact (wire names are
// upper-case by contract).
std::optional<EventType> parse_event_type(std::string_view name);

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Responsibility: One record of the event log. The envelope fields are shared
// by every variant; `event_type` selects the variant and `details` carries the
// variant payload as an open JSON object (see event_builder.hpp for the keys
// each variant writes).
//
// Why a discriminator plus an open payload instead of one struct per variant:
// the writer and the read side treat payloads as opaque, and the log must be
// able to carry payload keys written by newer producers. The closed set of
// variants lives in EventType; the payload shape is the producer's contract.
//
// Invariants (producer contract, not enforced here):
//   - event_id is unique within a simulation.
//   - caused_by entries refer to events of the same simulation with a
//     timestamp <= this event's timestamp.
// -----------------------------------------------------------------------------
struct Event {
  std::string event_id;
  Timestamp timestamp{};
  std::string simulation_id;
  std::int64_t turn_number{0};
  EventType event_type{EventType::System};
  std::optional<std::string> agent_id;
  std::optional<std::string> description;
  std::vector<std::string> caused_by;
  nlohmann::json details = nlohmann::json::object();
};

bool operator==(const Event& lhs, const Event& rhs);
bool operator!=(const Event& lhs, const Event& rhs);

}  // namespace evstream
