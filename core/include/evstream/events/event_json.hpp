#pragma once

#include "evstream/events/event_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace evstream {

// -----------------------------------------------------------------------------
// Event <-> JSON
// -----------------------------------------------------------------------------
//
// @brief  The JSONL record format shared by the writer and the read side.
//
// @details
// One event is one JSON object with the fields
//   event_id, timestamp, turn_number, simulation_id, event_type,
//   agent_id (nullable), description (nullable), caused_by (array),
//   details (object)
// `timestamp` is ISO-8601 UTC with microseconds (see time_utils.hpp).
//
// Writing is strict: serialize_event() throws nlohmann::json::exception
// when a payload string is not valid UTF-8. The writer catches it and
// counts the event as lost.
//
// Reading is tolerant: event_from_json() and parse_event_line() return
// std::nullopt for anything that is not a well-formed event instead of
// throwing, so a scan over a log skips bad lines and keeps going. They
// also accept the legacy forms written by older producers: event_type
// "ENV" (read as STATE) and `null` for caused_by and details.
// -----------------------------------------------------------------------------

// ADL hook so nlohmann::json j = event; works.
void to_json(nlohmann::json& j, const Event& event);

// Serialized object without the trailing newline.
std::string serialize_event(const Event& event);

std::optional<Event> event_from_json(const nlohmann::json& j);

// Parses one line of a segment file. A trailing '\r' or '\n' is ignored.
std::optional<Event> parse_event_line(std::string_view line);

}  // namespace evstream
