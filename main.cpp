// -----------------------------------------------------------------------------
// evstream_demo: a toy economy that records itself through the event log.
//
//   1) Build an EventWriterConfig (defaults, optionally overlaid by a JSON
//      config file) and start an EventWriter for a fresh simulation id.
//   2) Run a few turns of a three-agent economy. Every turn emits a
//      turn_start milestone, per-agent detail/decision/action/state events
//      linked through caused_by, and a turn_end milestone caused by the
//      turn's state changes.
//   3) Stop the writer (drains the queue).
//   4) Read the log back through EventService and print a summary plus the
//      causal history of the final turn_end.
//
// Usage: evstream_demo [output_root] [config.json]
// -----------------------------------------------------------------------------

#include "evstream/events/event_builder.hpp"
#include "evstream/events/verbosity.hpp"
#include "evstream/logging/console_logger.hpp"
#include "evstream/service/event_service.hpp"
#include "evstream/storage/segment_layout.hpp"
#include "evstream/time/live_time_provider.hpp"
#include "evstream/time/time_utils.hpp"
#include "evstream/writer/event_writer.hpp"
#include "evstream/writer/writer_config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kTurns = 5;
constexpr std::uint32_t kSeed = 42;

struct Agent {
  std::string id;
  std::int64_t wealth;
};

// Runs the economy and returns the id of the last turn_end milestone.
std::string run_economy(evstream::EventWriter& writer,
                        const std::string& sim) {
  std::vector<Agent> agents = {{"alice", 100}, {"bob", 100}, {"carol", 100}};
  std::mt19937 rng(kSeed);

  auto started = evstream::create_system_event(
      sim, 0, "started", std::nullopt, std::nullopt, "simulation started", {},
      {{"agents", agents.size()}, {"turns", kTurns}});
  writer.emit(started);

  std::string last_turn_end;
  for (int turn = 1; turn <= kTurns; ++turn) {
    auto turn_start = evstream::create_milestone_event(
        sim, turn, "turn_start", "turn " + std::to_string(turn) + " begins",
        {started.event_id});
    writer.emit(turn_start);

    std::vector<std::string> state_changes;
    for (std::size_t i = 0; i < agents.size(); ++i) {
      Agent& buyer = agents[i];
      Agent& seller = agents[(i + 1) % agents.size()];

      const std::int64_t budget = buyer.wealth / 4;
      std::uniform_int_distribution<std::int64_t> pick(0, std::max<std::int64_t>(budget, 0));
      const std::int64_t price = pick(rng);

      auto utility = evstream::create_detail_event(
          sim, turn, "trade_utility",
          {{"agent", buyer.id}, {"budget", budget}, {"price", price}},
          std::nullopt, {turn_start.event_id});
      writer.emit(utility);

      auto decision = evstream::create_decision_event(
          sim, turn, buyer.id, "buy_from", nullptr, seller.id,
          buyer.id + " decides to buy from " + seller.id,
          {utility.event_id});
      writer.emit(decision);

      auto action = evstream::create_action_event(
          sim, turn, buyer.id, "transfer",
          {{"to", seller.id}, {"amount", price}}, std::nullopt,
          {decision.event_id});
      writer.emit(action);

      const std::int64_t buyer_old = buyer.wealth;
      const std::int64_t seller_old = seller.wealth;
      buyer.wealth -= price;
      seller.wealth += price;

      auto buyer_state = evstream::create_state_event(
          sim, turn, "wealth", buyer_old, buyer.wealth, buyer.id, "agent",
          std::nullopt, {action.event_id});
      auto seller_state = evstream::create_state_event(
          sim, turn, "wealth", seller_old, seller.wealth, seller.id, "agent",
          std::nullopt, {action.event_id});
      writer.emit(buyer_state);
      writer.emit(seller_state);
      state_changes.push_back(buyer_state.event_id);
      state_changes.push_back(seller_state.event_id);
    }

    auto turn_end = evstream::create_milestone_event(
        sim, turn, "turn_end", "turn " + std::to_string(turn) + " ends",
        state_changes);
    writer.emit(turn_end);
    last_turn_end = turn_end.event_id;
  }

  nlohmann::json final_wealth = nlohmann::json::object();
  for (const Agent& agent : agents) {
    final_wealth[agent.id] = agent.wealth;
  }
  writer.emit(evstream::create_system_event(
      sim, kTurns, "completed", std::nullopt, std::nullopt,
      "simulation completed", {last_turn_end},
      {{"final_wealth", final_wealth}}));
  return last_turn_end;
}

void print_summary(const evstream::EventService& service,
                   const std::string& sim, const std::string& last_turn_end) {
  for (const auto& summary : service.list_simulations()) {
    if (summary.id != sim) {
      continue;
    }
    std::cout << "[main] simulation id=" << summary.id
              << " name=" << summary.name
              << " events=" << summary.event_count << " start="
              << (summary.start_time
                      ? evstream::format_iso8601(*summary.start_time)
                      : std::string("-"))
              << "\n";
  }

  for (evstream::EventType type : evstream::kAllEventTypes) {
    evstream::EventFilter filter;
    filter.event_types = {type};
    filter.limit = 1;
    const auto page = service.get_filtered_events(sim, filter);
    std::cout << "[main]   " << evstream::to_string(type) << ": "
              << page.total << "\n";
  }

  const auto chain = service.get_causality_chain(sim, last_turn_end, 3);
  if (!chain) {
    std::cout << "[main] final turn_end not found (filtered by verbosity?)\n";
    return;
  }
  std::cout << "[main] causes of final turn_end (depth 3): "
            << chain->upstream.size() << " upstream, "
            << chain->downstream.size() << " downstream\n";
  for (const auto& event : chain->upstream) {
    std::cout << "[main]   <- " << evstream::to_string(event.event_type)
              << " " << event.agent_id.value_or("-") << " "
              << event.details.dump() << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  const std::filesystem::path output_root =
      argc > 1 ? std::filesystem::path(argv[1])
               : std::filesystem::path("simulations");

  evstream::ConsoleLogger logger;

  evstream::EventWriterConfig config;
  config.verbosity = evstream::VerbosityLevel::Detail;
  if (argc > 2) {
    try {
      config = evstream::load_writer_config(argv[2], config);
    } catch (const std::invalid_argument& e) {
      std::cerr << "[main] invalid config: " << e.what() << "\n";
      return 1;
    }
  }

  evstream::LiveTimeProvider clock;
  if (config.simulation_id.empty()) {
    config.simulation_id =
        "economy-" + evstream::format_rotation_stamp(clock.now_us());
  }
  if (config.output_dir.empty()) {
    config.output_dir =
        evstream::simulation_directory(output_root, config.simulation_id);
  }

  std::string last_turn_end;
  {
    evstream::EventWriter writer(config, logger, &clock);
    writer.start();
    try {
      last_turn_end = run_economy(writer, config.simulation_id);
    } catch (const std::exception& e) {
      std::cerr << "[main] simulation failed: " << e.what() << "\n";
      writer.stop();
      return 1;
    }
    writer.stop();

    std::cout << "[main] written=" << writer.written_count()
              << " dropped=" << writer.dropped_count()
              << " failed=" << writer.failed_count()
              << " file=" << writer.current_file().string() << "\n";
  }

  evstream::EventService service(config.output_dir.parent_path(), logger);
  print_summary(service, config.simulation_id, last_turn_end);
  return 0;
}
