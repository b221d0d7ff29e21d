#pragma once

#include "evstream/events/event_types.hpp"

#include <optional>
#include <string_view>

namespace evstream {

// -----------------------------------------------------------------------------
// VerbosityLevel
// -----------------------------------------------------------------------------
// Total order MILESTONE < DECISION < ACTION < STATE < DETAIL. Each level keeps
// every event type kept by the levels below it. Enumerator values encode the
// order, so levels compare with the built-in relational operators.
// -----------------------------------------------------------------------------
enum class VerbosityLevel {
  Milestone = 0,
  Decision = 1,
  Action = 2,
  State = 3,
  Detail = 4
};

inline constexpr VerbosityLevel kAllVerbosityLevels[] = {
    VerbosityLevel::Milestone, VerbosityLevel::Decision,
    VerbosityLevel::Action, VerbosityLevel::State, VerbosityLevel::Detail};

const char* to_string(VerbosityLevel level);

// Case-insensitive ("action", "ACTION"). std::nullopt for unknown names.
std::optional<VerbosityLevel> parse_verbosity(std::string_view name);

// -------------------------------------------------------------------------
// minimum_verbosity_for(type)
// -------------------------------------------------------------------------
// @brief  Lowest verbosity at which events of `type` are persisted.
//
// @details
// MILESTONE→MILESTONE, DECISION→DECISION, ACTION→ACTION, STATE→STATE,
// DETAIL→DETAIL. SYSTEM events are DETAIL-tier.
// -------------------------------------------------------------------------
VerbosityLevel minimum_verbosity_for(EventType type);

// True iff `verbosity >= minimum_verbosity_for(type)`. Pure; total over all
// six event types and five levels.
inline bool should_log(EventType type, VerbosityLevel verbosity) {
  return verbosity >= minimum_verbosity_for(type);
}

}  // namespace evstream
