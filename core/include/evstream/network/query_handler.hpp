#pragma once

#include "evstream/service/event_filter.hpp"
#include "evstream/service/event_service.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace evstream {

// -----------------------------------------------------------------------------
// QueryHandler: JSON command front end for EventService
// -----------------------------------------------------------------------------
//
// @brief  Turns one request document into one response document.
//
// @details
// Requests are JSON objects with a "command" key:
//
//   {"command":"list_simulations"}
//   {"command":"get_events","simulation_id":"...",
//    "event_types":["ACTION"],"agent_ids":["a1"],"turn_start":0,
//    "turn_end":10,"start_timestamp":"...","end_timestamp":"...",
//    "limit":100,"offset":0}
//   {"command":"get_event","simulation_id":"...","event_id":"..."}
//   {"command":"get_causality","simulation_id":"...","event_id":"...",
//    "depth":5}
//
// Every filter key of get_events is optional. Successful responses carry
// "status":"ok"; failures carry
//
//   {"status":"error","code":400|404|500,"error":"<message>"}
//
// 400 covers malformed JSON, unknown commands, missing or mistyped keys and
// out-of-range values; 404 covers an unknown event id. handle() never
// throws, so a bad request cannot take down the server loop.
//
// Thread model: const and stateless; shares the EventService by reference.
// -----------------------------------------------------------------------------
class QueryHandler {
 public:
  static constexpr int kMinCausalityDepth = 1;
  static constexpr int kMaxCausalityDepth = 20;

  explicit QueryHandler(const EventService& service);

  // Raw request text → serialized response.
  std::string handle(const std::string& request) const;

  // Parsed request → response document. Error responses are returned, not
  // thrown.
  nlohmann::json handle(const nlohmann::json& request) const;

 private:
  nlohmann::json list_simulations() const;
  nlohmann::json get_events(const nlohmann::json& request) const;
  nlohmann::json get_event(const nlohmann::json& request) const;
  nlohmann::json get_causality(const nlohmann::json& request) const;

  const EventService& service_;
};

// Builds an EventFilter from the get_events keys of `request`.
// @throws std::invalid_argument naming the offending key.
EventFilter filter_from_json(const nlohmann::json& request);

}  // namespace evstream
