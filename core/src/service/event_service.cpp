#include "evstream/service/event_service.hpp"

#include "evstream/events/event_json.hpp"
#include "evstream/service/causality_analyzer.hpp"
#include "evstream/storage/segment_layout.hpp"
#include "evstream/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace evstream {

namespace {

constexpr const char* kComponent = "EventService";

bool is_safe_simulation_id(const std::string& id) {
  return !id.empty() && id != "." && id != ".." &&
         id.find('/') == std::string::npos &&
         id.find('\\') == std::string::npos;
}

// Calls on_event(Event&&) for each parseable line of each segment, oldest
// first. Stops early when on_event returns false.
template <typename Fn>
void for_each_event(const std::vector<std::filesystem::path>& segments,
                    ILogger& logger, Fn&& on_event) {
  for (const auto& segment : segments) {
    std::ifstream in(segment);
    if (!in) {
      logger.debug(kComponent,
                   "segment_unreadable file=" + segment.string());
      continue;
    }

    std::size_t skipped = 0;
    std::string line;
    while (std::getline(in, line)) {
      std::optional<Event> event = parse_event_line(line);
      if (!event) {
        ++skipped;
        continue;
      }
      if (!on_event(std::move(*event))) {
        return;
      }
    }
    if (skipped != 0) {
      logger.debug(kComponent, "segment_lines_skipped file=" +
                                   segment.string() +
                                   " count=" + std::to_string(skipped));
    }
  }
}

std::optional<Timestamp> first_timestamp(const std::filesystem::path& segment) {
  std::ifstream in(segment);
  std::string line;
  if (!in || !std::getline(in, line)) {
    return std::nullopt;
  }
  const auto j = nlohmann::json::parse(line, nullptr, false);
  if (!j.is_object()) {
    return std::nullopt;
  }
  auto it = j.find("timestamp");
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return parse_iso8601(it->get<std::string>());
}

std::size_t count_lines(const std::filesystem::path& segment) {
  std::ifstream in(segment);
  std::size_t count = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++count;
  }
  return count;
}

}  // namespace

EventService::EventService(std::filesystem::path output_root, ILogger& logger)
    : output_root_(std::move(output_root)), logger_(logger) {}

std::vector<SimulationSummary> EventService::list_simulations() const {
  std::vector<SimulationSummary> result;

  std::error_code ec;
  std::filesystem::directory_iterator it(output_root_, ec);
  if (ec) {
    logger_.debug(kComponent, "output_root_unreadable path=" +
                                  output_root_.string() +
                                  " error=" + ec.message());
    return result;
  }

  for (const auto& entry : it) {
    std::error_code type_ec;
    if (!entry.is_directory(type_ec)) {
      continue;
    }
    const auto segments = list_segments(entry.path());
    if (segments.empty()) {
      continue;
    }

    SimulationSummary summary;
    summary.id = entry.path().filename().string();
    summary.name = summary.id.substr(0, summary.id.find('-'));
    summary.start_time = first_timestamp(segments.front());
    for (const auto& segment : segments) {
      summary.event_count += count_lines(segment);
    }
    result.push_back(std::move(summary));
  }

  std::sort(result.begin(), result.end(),
            [](const SimulationSummary& a, const SimulationSummary& b) {
              return a.id < b.id;
            });
  return result;
}

EventPage EventService::get_filtered_events(const std::string& simulation_id,
                                            const EventFilter& filter) const {
  filter.validate();

  std::vector<Event> matched;
  for_each_event(segments_for(simulation_id), logger_, [&](Event&& event) {
    if (filter.matches(event)) {
      matched.push_back(std::move(event));
    }
    return true;
  });

  std::stable_sort(matched.begin(), matched.end(),
                   [](const Event& a, const Event& b) {
                     if (a.timestamp != b.timestamp) {
                       return a.timestamp < b.timestamp;
                     }
                     return a.event_id < b.event_id;
                   });

  EventPage page;
  page.total = matched.size();
  if (filter.offset < matched.size()) {
    const std::size_t end =
        std::min(matched.size(), filter.offset + filter.limit);
    page.events.assign(
        std::make_move_iterator(matched.begin() + filter.offset),
        std::make_move_iterator(matched.begin() + end));
    page.has_more = end < matched.size();
  }
  return page;
}

std::optional<Event> EventService::get_event_by_id(
    const std::string& simulation_id, const std::string& event_id) const {
  std::optional<Event> found;
  for_each_event(segments_for(simulation_id), logger_, [&](Event&& event) {
    if (event.event_id != event_id) {
      return true;
    }
    found = std::move(event);
    return false;
  });
  return found;
}

std::optional<CausalityChain> EventService::get_causality_chain(
    const std::string& simulation_id, const std::string& event_id,
    int depth) const {
  if (depth < 1) {
    throw std::invalid_argument("causality depth must be >= 1, got " +
                                std::to_string(depth));
  }

  const CausalityGraph graph(load_events(simulation_id));
  const Event* target = graph.find(event_id);
  if (target == nullptr) {
    return std::nullopt;
  }

  CausalityChain chain;
  chain.event = *target;
  chain.upstream = graph.upstream(event_id, depth);
  chain.downstream = graph.downstream(event_id);
  return chain;
}

std::vector<std::filesystem::path> EventService::segments_for(
    const std::string& simulation_id) const {
  if (!is_safe_simulation_id(simulation_id)) {
    return {};
  }
  return list_segments(simulation_directory(output_root_, simulation_id));
}

std::vector<Event> EventService::load_events(
    const std::string& simulation_id) const {
  std::vector<Event> events;
  for_each_event(segments_for(simulation_id), logger_, [&](Event&& event) {
    events.push_back(std::move(event));
    return true;
  });
  return events;
}

}  // namespace evstream
