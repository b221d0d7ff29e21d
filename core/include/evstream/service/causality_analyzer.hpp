#pragma once

#include "evstream/events/event_types.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace evstream {

// -----------------------------------------------------------------------------
// CausalityGraph
// -----------------------------------------------------------------------------
//
// @brief  Forward and reverse adjacency over `caused_by` links, built in one
//         pass over a simulation's events.
//
// @details
// Two maps are built:
//   lookup_    event_id → the event (first occurrence wins; ids are expected
//              to be unique, and this matches EventService::get_event_by_id)
//   children_  parent event_id → events whose caused_by names that parent, in
//              scan order, each child listed once per parent
//
// Traversals are deliberately asymmetric:
//   upstream(id, depth)  all ancestors reachable within `depth` hops
//                        ("what led to this")
//   downstream(id)       immediate children only ("what did this directly
//                        cause")
//
// The graph does not assume acyclicity. Cycles and self references are
// producer bugs, but upstream() uses a visited set so they cannot loop, and
// the walk uses an explicit stack so deep chains cannot exhaust the call
// stack. References to ids that are not in the log are ignored.
//
// Thread model: immutable after construction; const methods are safe to call
// concurrently.
// -----------------------------------------------------------------------------
class CausalityGraph {
 public:
  explicit CausalityGraph(std::vector<Event> events);

  // nullptr when no event has this id.
  const Event* find(const std::string& event_id) const;

  // -------------------------------------------------------------------------
  // upstream(event_id, depth)
  // -------------------------------------------------------------------------
  // @brief  De-duplicated ancestors of `event_id` reachable within `depth`
  //         hops, excluding the event itself.
  //
  // @details
  // Depth-first, pre-order: a parent is listed before its own ancestors, and
  // parents of one event keep their caused_by order. depth = 1 returns the
  // direct parents. depth <= 0 or an unknown id returns an empty list.
  // -------------------------------------------------------------------------
  std::vector<Event> upstream(const std::string& event_id, int depth) const;

  // Events that list `event_id` in caused_by (one hop).
  std::vector<Event> downstream(const std::string& event_id) const;

  std::size_t size() const { return events_.size(); }

 private:
  std::vector<Event> events_;
  std::unordered_map<std::string, std::size_t> lookup_;
  std::unordered_map<std::string, std::vector<std::size_t>> children_;
};

}  // namespace evstream
