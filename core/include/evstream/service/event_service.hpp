#pragma once

#include "evstream/events/event_types.hpp"
#include "evstream/logging/i_logger.hpp"
#include "evstream/service/event_filter.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace evstream {

struct SimulationSummary {
  std::string id;
  std::string name;                     // id up to the first '-'
  std::optional<Timestamp> start_time;  // first event of the oldest segment
  std::size_t event_count{0};           // lines across all segments
};

struct EventPage {
  std::vector<Event> events;
  std::size_t total{0};  // matches before pagination
  bool has_more{false};
};

struct CausalityChain {
  Event event;
  std::vector<Event> upstream;
  std::vector<Event> downstream;
};

// -----------------------------------------------------------------------------
// EventService: read side of the event log
// -----------------------------------------------------------------------------
//
// @brief  Answers queries over the segments under `output_root` by scanning
//         them on demand.
//
// @details
// Every query walks the simulation's segments oldest first and parses each
// line independently. Lines that do not parse as an event (a torn final
// line, a corrupted record) and files that cannot be opened are skipped
// and logged at debug level; they never fail the query.
//
// There is no index and no cache. A query sees whatever is on disk when it
// runs, including segments a live writer is still appending to.
//
// A simulation id that does not name a directory under `output_root`
// (including ids containing path separators or "..") yields empty results.
//
// Thread model: stateless apart from configuration; const methods are safe
// to call concurrently.
// -----------------------------------------------------------------------------
class EventService {
 public:
  static constexpr int kDefaultCausalityDepth = 5;

  EventService(std::filesystem::path output_root, ILogger& logger);

  const std::filesystem::path& output_root() const { return output_root_; }

  // Subdirectories of output_root holding at least one segment, by id.
  std::vector<SimulationSummary> list_simulations() const;

  // -------------------------------------------------------------------------
  // get_filtered_events(simulation_id, filter)
  // -------------------------------------------------------------------------
  // @brief  Matching events sorted by (timestamp, event_id), then the
  //         [offset, offset + limit) window.
  //
  // @throws std::invalid_argument when filter.validate() fails.
  // -------------------------------------------------------------------------
  EventPage get_filtered_events(const std::string& simulation_id,
                                const EventFilter& filter) const;

  // First event with this id in segment order.
  std::optional<Event> get_event_by_id(const std::string& simulation_id,
                                       const std::string& event_id) const;

  // -------------------------------------------------------------------------
  // get_causality_chain(simulation_id, event_id, depth)
  // -------------------------------------------------------------------------
  // @brief  The event, its ancestors within `depth` hops, and the events it
  //         directly caused. std::nullopt when the event does not exist.
  //
  // @throws std::invalid_argument when depth < 1.
  // -------------------------------------------------------------------------
  std::optional<CausalityChain> get_causality_chain(
      const std::string& simulation_id, const std::string& event_id,
      int depth = kDefaultCausalityDepth) const;

 private:
  std::vector<std::filesystem::path> segments_for(
      const std::string& simulation_id) const;

  std::vector<Event> load_events(const std::string& simulation_id) const;

  std::filesystem::path output_root_;
  ILogger& logger_;
};

}  // namespace evstream
