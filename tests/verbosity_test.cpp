// =============================================================================
// verbosity_test.cpp
// =============================================================================
// Unit tests for the verbosity policy (evstream/events/verbosity.hpp).
//
// Validates:
//   - The level → admitted event types table
//   - SYSTEM events need DETAIL verbosity
//   - Monotonicity: raising verbosity never hides a type
//   - Name parsing and printing
// =============================================================================

#include "evstream/events/verbosity.hpp"

#include <gtest/gtest.h>

#include <set>

using evstream::EventType;
using evstream::VerbosityLevel;
using evstream::should_log;

namespace {

std::set<EventType> admitted(VerbosityLevel level) {
  std::set<EventType> out;
  for (EventType type : evstream::kAllEventTypes) {
    if (should_log(type, level)) {
      out.insert(type);
    }
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Each level admits exactly the documented set of event types.
// -----------------------------------------------------------------------------
TEST(VerbosityTest, AdmittedTypesPerLevel) {
  EXPECT_EQ(admitted(VerbosityLevel::Milestone),
            (std::set<EventType>{EventType::Milestone}));
  EXPECT_EQ(admitted(VerbosityLevel::Decision),
            (std::set<EventType>{EventType::Milestone, EventType::Decision}));
  EXPECT_EQ(admitted(VerbosityLevel::Action),
            (std::set<EventType>{EventType::Milestone, EventType::Decision,
                                 EventType::Action}));
  EXPECT_EQ(admitted(VerbosityLevel::State),
            (std::set<EventType>{EventType::Milestone, EventType::Decision,
                                 EventType::Action, EventType::State}));
  EXPECT_EQ(admitted(VerbosityLevel::Detail),
            (std::set<EventType>{EventType::Milestone, EventType::Decision,
                                 EventType::Action, EventType::State,
                                 EventType::Detail, EventType::System}));
}

// -----------------------------------------------------------------------------
// 2. SYSTEM events are DETAIL-tier: invisible at STATE, visible at DETAIL.
// Why: Lifecycle chatter must not leak into coarse logs.
// -----------------------------------------------------------------------------
TEST(VerbosityTest, SystemEventsRequireDetail) {
  EXPECT_EQ(evstream::minimum_verbosity_for(EventType::System),
            VerbosityLevel::Detail);
  EXPECT_FALSE(should_log(EventType::System, VerbosityLevel::State));
  EXPECT_TRUE(should_log(EventType::System, VerbosityLevel::Detail));
}

// -----------------------------------------------------------------------------
// 3. If a type is logged at level L, it is logged at every level above L.
// -----------------------------------------------------------------------------
TEST(VerbosityTest, MonotonicInLevel) {
  for (EventType type : evstream::kAllEventTypes) {
    bool seen = false;
    for (VerbosityLevel level : evstream::kAllVerbosityLevels) {
      const bool logged = should_log(type, level);
      if (seen) {
        EXPECT_TRUE(logged) << evstream::to_string(type) << " hidden at "
                            << evstream::to_string(level);
      }
      seen = seen || logged;
    }
    EXPECT_TRUE(seen) << evstream::to_string(type) << " never logged";
  }
}

// -----------------------------------------------------------------------------
// 4. Names round-trip and parse case-insensitively; unknown names fail.
// -----------------------------------------------------------------------------
TEST(VerbosityTest, ParseNames) {
  for (VerbosityLevel level : evstream::kAllVerbosityLevels) {
    EXPECT_EQ(evstream::parse_verbosity(evstream::to_string(level)), level);
  }
  EXPECT_EQ(evstream::parse_verbosity("detail"), VerbosityLevel::Detail);
  EXPECT_EQ(evstream::parse_verbosity("Action"), VerbosityLevel::Action);
  EXPECT_FALSE(evstream::parse_verbosity("verbose").has_value());
  EXPECT_FALSE(evstream::parse_verbosity("").has_value());
}
