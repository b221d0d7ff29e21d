#include "evstream/network/query_handler.hpp"

#include "evstream/events/event_json.hpp"
#include "evstream/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace evstream {

namespace {

// Request problems that map to a specific status code.
class QueryError : public std::runtime_error {
 public:
  QueryError(int code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  int code() const { return code_; }

 private:
  int code_;
};

nlohmann::json error_response(int code, const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["code"] = code;
  j["error"] = message;
  return j;
}

const nlohmann::json* find_key(const nlohmann::json& request,
                               const char* key) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::string require_string(const nlohmann::json& request, const char* key) {
  const nlohmann::json* value = find_key(request, key);
  if (value == nullptr || !value->is_string() ||
      value->get_ref<const std::string&>().empty()) {
    throw std::invalid_argument(std::string("'") + key +
                                "' must be a non-empty string");
  }
  return value->get<std::string>();
}

std::int64_t read_integer(const nlohmann::json& value, const char* key) {
  if (!value.is_number_integer()) {
    throw std::invalid_argument(std::string("'") + key +
                                "' must be an integer");
  }
  return value.get<std::int64_t>();
}

std::vector<std::string> read_string_list(const nlohmann::json& value,
                                          const char* key) {
  if (!value.is_array()) {
    throw std::invalid_argument(std::string("'") + key +
                                "' must be an array of strings");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& item : value) {
    if (!item.is_string()) {
      throw std::invalid_argument(std::string("'") + key +
                                  "' must be an array of strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

Timestamp read_timestamp(const nlohmann::json& value, const char* key) {
  if (value.is_string()) {
    if (auto ts = parse_iso8601(value.get_ref<const std::string&>())) {
      return *ts;
    }
  }
  throw std::invalid_argument(std::string("'") + key +
                              "' must be an ISO-8601 timestamp");
}

nlohmann::json summary_to_json(const SimulationSummary& summary) {
  nlohmann::json j;
  j["id"] = summary.id;
  j["name"] = summary.name;
  j["start_time"] = summary.start_time
                        ? nlohmann::json(format_iso8601(*summary.start_time))
                        : nlohmann::json(nullptr);
  j["event_count"] = summary.event_count;
  return j;
}

nlohmann::json events_to_json(const std::vector<Event>& events) {
  nlohmann::json arr = nlohmann::json::array();
  for (const Event& event : events) {
    arr.push_back(nlohmann::json(event));
  }
  return arr;
}

}  // namespace

EventFilter filter_from_json(const nlohmann::json& request) {
  EventFilter filter;

  if (const auto* v = find_key(request, "event_types")) {
    for (std::string name : read_string_list(*v, "event_types")) {
      std::transform(name.begin(), name.end(), name.begin(),
                     [](unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                     });
      auto type = parse_event_type(name);
      if (!type) {
        throw std::invalid_argument("'event_types' contains unknown type '" +
                                    name + "'");
      }
      filter.event_types.push_back(*type);
    }
  }
  if (const auto* v = find_key(request, "agent_ids")) {
    filter.agent_ids = read_string_list(*v, "agent_ids");
  }
  if (const auto* v = find_key(request, "turn_start")) {
    filter.turn_start = read_integer(*v, "turn_start");
  }
  if (const auto* v = find_key(request, "turn_end")) {
    filter.turn_end = read_integer(*v, "turn_end");
  }
  if (const auto* v = find_key(request, "start_timestamp")) {
    filter.start_timestamp = read_timestamp(*v, "start_timestamp");
  }
  if (const auto* v = find_key(request, "end_timestamp")) {
    filter.end_timestamp = read_timestamp(*v, "end_timestamp");
  }
  if (const auto* v = find_key(request, "limit")) {
    const std::int64_t limit = read_integer(*v, "limit");
    if (limit < 1) {
      throw std::invalid_argument("'limit' must be >= 1");
    }
    filter.limit = static_cast<std::size_t>(limit);
  }
  if (const auto* v = find_key(request, "offset")) {
    const std::int64_t offset = read_integer(*v, "offset");
    if (offset < 0) {
      throw std::invalid_argument("'offset' must be >= 0");
    }
    filter.offset = static_cast<std::size_t>(offset);
  }

  filter.validate();
  return filter;
}

QueryHandler::QueryHandler(const EventService& service) : service_(service) {}

std::string QueryHandler::handle(const std::string& request) const {
  const auto parsed = nlohmann::json::parse(request, nullptr, false);
  if (parsed.is_discarded()) {
    return error_response(400, "request is not valid JSON").dump();
  }
  return handle(parsed).dump();
}

// -----------------------------------------------------------------------------
// handle(): dispatch on "command" and map exceptions to status codes
// -----------------------------------------------------------------------------
nlohmann::json QueryHandler::handle(const nlohmann::json& request) const {
  try {
    if (!request.is_object()) {
      return error_response(400, "request must be a JSON object");
    }
    const std::string command = require_string(request, "command");

    if (command == "list_simulations") {
      return list_simulations();
    }
    if (command == "get_events") {
      return get_events(request);
    }
    if (command == "get_event") {
      return get_event(request);
    }
    if (command == "get_causality") {
      return get_causality(request);
    }
    return error_response(400, "unknown command: " + command);
  } catch (const QueryError& e) {
    return error_response(e.code(), e.what());
  } catch (const std::invalid_argument& e) {
    return error_response(400, e.what());
  } catch (const nlohmann::json::exception& e) {
    return error_response(400, e.what());
  } catch (const std::exception& e) {
    return error_response(500, e.what());
  }
}

nlohmann::json QueryHandler::list_simulations() const {
  nlohmann::json sims = nlohmann::json::array();
  for (const auto& summary : service_.list_simulations()) {
    sims.push_back(summary_to_json(summary));
  }

  nlohmann::json response;
  response["status"] = "ok";
  response["simulations"] = std::move(sims);
  return response;
}

nlohmann::json QueryHandler::get_events(const nlohmann::json& request) const {
  const std::string simulation_id = require_string(request, "simulation_id");
  const EventFilter filter = filter_from_json(request);
  const EventPage page = service_.get_filtered_events(simulation_id, filter);

  nlohmann::json response;
  response["status"] = "ok";
  response["simulation_id"] = simulation_id;
  response["events"] = events_to_json(page.events);
  response["total"] = page.total;
  response["has_more"] = page.has_more;
  response["limit"] = filter.limit;
  response["offset"] = filter.offset;
  return response;
}

nlohmann::json QueryHandler::get_event(const nlohmann::json& request) const {
  const std::string simulation_id = require_string(request, "simulation_id");
  const std::string event_id = require_string(request, "event_id");

  auto event = service_.get_event_by_id(simulation_id, event_id);
  if (!event) {
    throw QueryError(404, "event not found: " + event_id);
  }

  nlohmann::json response;
  response["status"] = "ok";
  response["event"] = *event;
  return response;
}

nlohmann::json QueryHandler::get_causality(
    const nlohmann::json& request) const {
  const std::string simulation_id = require_string(request, "simulation_id");
  const std::string event_id = require_string(request, "event_id");

  int depth = EventService::kDefaultCausalityDepth;
  if (const auto* v = find_key(request, "depth")) {
    const std::int64_t requested = read_integer(*v, "depth");
    if (requested < kMinCausalityDepth || requested > kMaxCausalityDepth) {
      throw std::invalid_argument("'depth' must be in [" +
                                  std::to_string(kMinCausalityDepth) + ", " +
                                  std::to_string(kMaxCausalityDepth) + "]");
    }
    depth = static_cast<int>(requested);
  }

  auto chain = service_.get_causality_chain(simulation_id, event_id, depth);
  if (!chain) {
    throw QueryError(404, "event not found: " + event_id);
  }

  nlohmann::json response;
  response["status"] = "ok";
  response["event"] = chain->event;
  response["upstream"] = events_to_json(chain->upstream);
  response["downstream"] = events_to_json(chain->downstream);
  response["depth"] = depth;
  return response;
}

}  // namespace evstream
