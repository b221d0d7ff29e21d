#include "evstream/service/causality_analyzer.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace evstream {

CausalityGraph::CausalityGraph(std::vector<Event> events)
    : events_(std::move(events)) {
  lookup_.reserve(events_.size());
  for (std::size_t i = 0; i < events_.size(); ++i) {
    const Event& event = events_[i];
    lookup_.emplace(event.event_id, i);  // keeps the first occurrence

    for (const std::string& parent : event.caused_by) {
      std::vector<std::size_t>& kids = children_[parent];
      if (kids.empty() || kids.back() != i) {
        kids.push_back(i);
      }
    }
  }
}

const Event* CausalityGraph::find(const std::string& event_id) const {
  auto it = lookup_.find(event_id);
  return it == lookup_.end() ? nullptr : &events_[it->second];
}

// -----------------------------------------------------------------------------
// upstream(): iterative DFS
// -----------------------------------------------------------------------------
// Stack entries are (id, hops from the target). Expanding an entry pushes its
// parents in reverse so they pop in caused_by order, which reproduces the
// pre-order of the recursive formulation.
// -----------------------------------------------------------------------------
std::vector<Event> CausalityGraph::upstream(const std::string& event_id,
                                            int depth) const {
  std::vector<Event> ancestors;
  if (depth <= 0 || find(event_id) == nullptr) {
    return ancestors;
  }

  std::unordered_set<std::string> expanded;
  std::unordered_set<std::string> listed;
  std::vector<std::pair<std::string, int>> stack;

  auto expand = [&](const std::string& id, int hops) {
    if (hops >= depth || !expanded.insert(id).second) {
      return;
    }
    const Event* event = find(id);
    if (event == nullptr) {
      return;
    }
    for (auto it = event->caused_by.rbegin(); it != event->caused_by.rend();
         ++it) {
      stack.emplace_back(*it, hops + 1);
    }
  };

  expand(event_id, 0);
  while (!stack.empty()) {
    auto [id, hops] = std::move(stack.back());
    stack.pop_back();

    if (id == event_id || listed.count(id) != 0) {
      continue;
    }
    const Event* parent = find(id);
    if (parent == nullptr) {
      continue;  // dangling reference
    }
    listed.insert(id);
    ancestors.push_back(*parent);
    expand(id, hops);
  }
  return ancestors;
}

std::vector<Event> CausalityGraph::downstream(
    const std::string& event_id) const {
  std::vector<Event> result;
  auto it = children_.find(event_id);
  if (it == children_.end()) {
    return result;
  }
  result.reserve(it->second.size());
  for (std::size_t index : it->second) {
    result.push_back(events_[index]);
  }
  return result;
}

}  // namespace evstream
