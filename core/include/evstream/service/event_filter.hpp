#pragma once

#include "evstream/events/event_types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace evstream {

// -----------------------------------------------------------------------------
// EventFilter: query object for EventService::get_filtered_events()
// -----------------------------------------------------------------------------
//
// @brief  Conjunction of optional predicates plus a pagination window.
//
// @details
// An event matches when it satisfies every predicate that is set:
//   event_types       event_type is one of them (empty = any type)
//   agent_ids         agent_id is present and one of them (empty = any)
//   turn_start/end    inclusive turn range
//   start/end_timestamp  inclusive time range
//
// Pagination is applied after sorting: [offset, offset + limit).
//
// validate() enforces the caller contract: 1 <= limit <= kMaxLimit and
// non-negative turn bounds. It throws std::invalid_argument; matches() never
// throws.
// -----------------------------------------------------------------------------
struct EventFilter {
  static constexpr std::size_t kDefaultLimit = 1000;
  static constexpr std::size_t kMaxLimit = 10000;

  std::vector<EventType> event_types;
  std::vector<std::string> agent_ids;
  std::optional<std::int64_t> turn_start;
  std::optional<std::int64_t> turn_end;
  std::optional<Timestamp> start_timestamp;
  std::optional<Timestamp> end_timestamp;
  std::size_t limit{kDefaultLimit};
  std::size_t offset{0};

  void validate() const;

  bool matches(const Event& event) const;
};

}  // namespace evstream
