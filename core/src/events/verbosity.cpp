#include "evstream/events/verbosity.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace evstream {

const char* to_string(VerbosityLevel level) {
  switch (level) {
    case VerbosityLevel::Milestone: return "MILESTONE";
    case VerbosityLevel::Decision:  return "DECISION";
    case VerbosityLevel::Action:    return "ACTION";
    case VerbosityLevel::State:     return "STATE";
    case VerbosityLevel::Detail:    return "DETAIL";
  }
  return "UNKNOWN";
}

std::optional<VerbosityLevel> parse_verbosity(std::string_view name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  for (VerbosityLevel level : kAllVerbosityLevels) {
    if (upper == to_string(level)) {
      return level;
    }
  }
  return std::nullopt;
}

VerbosityLevel minimum_verbosity_for(EventType type) {
  switch (type) {
    case EventType::Milestone: return VerbosityLevel::Milestone;
    case EventType::Decision:  return VerbosityLevel::Decision;
    case EventType::Action:    return VerbosityLevel::Action;
    case EventType::State:     return VerbosityLevel::State;
    case EventType::Detail:    return VerbosityLevel::Detail;
    case EventType::System:    return VerbosityLevel::Detail;
  }
  // Unreachable for valid enumerators. Out-of-range values get the most
  // restrictive tier.
  return VerbosityLevel::Detail;
}

}  // namespace evstream
