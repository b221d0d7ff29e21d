// =============================================================================
// event_writer_test.cpp
// =============================================================================
// Tests for evstream::EventWriter against a real temporary directory.
//
// Validates:
//   - Direct mode: each emit is on disk before emit() returns
//   - Verbosity filtering happens before any accounting
//   - Concurrent mode: everything emitted is written by stop()
//   - Rotation: size bound per segment, unique names under a frozen clock,
//     no lines lost across segments
//   - Overload: drop-on-full accounting and drop logging
//   - Lifecycle: stop without start, idempotent start/stop, emit after stop
//   - Shutdown: an unbounded stop() drains everything; a zero deadline with a
//     live consumer returns promptly and still balances the counters
//   - Failure degradation: a write error is logged and counted, and the
//     writer recovers on the next event
//   - A rotation that throws does not take the consumer thread down
//   - emit() stays cheap in concurrent mode
//
// Threading model:
//   Concurrent-mode tests always call stop() (or destroy the writer) before
//   asserting on disk state, so the consumer thread has been joined.
// =============================================================================

#include "evstream/events/event_builder.hpp"
#include "evstream/events/event_json.hpp"
#include "evstream/storage/segment_layout.hpp"
#include "evstream/time/i_time_provider.hpp"
#include "evstream/time/simulation_time_provider.hpp"
#include "evstream/writer/event_writer.hpp"

#include "support/recording_logger.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using evstream::EventWriter;
using evstream::EventWriterConfig;
using evstream::VerbosityLevel;
using evstream::WriteMode;
using evstream::testing::read_lines;

namespace {

constexpr const char* kSim = "writer-test";

evstream::Event action(int turn) {
  return evstream::create_action_event(kSim, turn, "agent-1", "trade",
                                       {{"qty", turn}});
}

// A clock that is never available; any rotation attempt throws.
class FailingClock : public evstream::ITimeProvider {
 public:
  std::int64_t now_us() const override {
    throw std::runtime_error("clock unavailable");
  }
};

}  // namespace

// =============================================================================
// Fixture: fresh temp directory and recording logger per test.
// =============================================================================
class EventWriterTest : public ::testing::Test {
 protected:
  EventWriterConfig config(WriteMode mode) const {
    EventWriterConfig c;
    c.output_dir = evstream::simulation_directory(root.path(), kSim);
    c.simulation_id = kSim;
    c.mode = mode;
    c.verbosity = VerbosityLevel::Detail;
    return c;
  }

  std::filesystem::path current_file() const {
    return evstream::simulation_directory(root.path(), kSim) /
           std::string(evstream::kCurrentSegmentName);
  }

  // Every line of every segment, oldest segment first.
  std::vector<std::string> all_lines() const {
    std::vector<std::string> lines;
    for (const auto& seg : evstream::list_segments(
             evstream::simulation_directory(root.path(), kSim))) {
      auto part = read_lines(seg);
      lines.insert(lines.end(), part.begin(), part.end());
    }
    return lines;
  }

  evstream::testing::TempDir root{"evstream_writer_test"};
  evstream::testing::RecordingLogger logger;
};

// -----------------------------------------------------------------------------
// 1. Direct mode: the line is in the file as soon as emit() returns, and the
//    line parses back to the emitted event.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, DirectModeWritesImmediately) {
  EventWriter writer(config(WriteMode::Direct), logger);
  writer.start();

  auto e = action(1);
  writer.emit(e);

  auto lines = read_lines(current_file());
  ASSERT_EQ(lines.size(), 1u);
  auto back = evstream::parse_event_line(lines[0]);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, e);
  EXPECT_EQ(writer.written_count(), 1u);
  EXPECT_EQ(writer.current_size(), lines[0].size() + 1);

  writer.emit(action(2));
  EXPECT_EQ(read_lines(current_file()).size(), 2u);
}

// -----------------------------------------------------------------------------
// 2. Events below the verbosity threshold are discarded silently: not
//    written, not dropped, not failed.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, FilteredEventsAreNotCounted) {
  auto c = config(WriteMode::Direct);
  c.verbosity = VerbosityLevel::Milestone;
  EventWriter writer(c, logger);
  writer.start();

  writer.emit(action(1));
  writer.emit(evstream::create_system_event(kSim, 1, "started"));
  writer.emit(evstream::create_milestone_event(kSim, 1, "turn_start"));

  EXPECT_EQ(writer.written_count(), 1u);
  EXPECT_EQ(writer.dropped_count(), 0u);
  EXPECT_EQ(writer.failed_count(), 0u);
  EXPECT_EQ(read_lines(current_file()).size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Concurrent mode: all emitted events are on disk after stop(), in emit
//    order for a single producer.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, ConcurrentEventsAreEventuallyWritten) {
  constexpr int kCount = 1000;
  std::vector<std::string> ids;
  {
    EventWriter writer(config(WriteMode::Concurrent), logger);
    writer.start();
    for (int i = 0; i < kCount; ++i) {
      auto e = action(i);
      ids.push_back(e.event_id);
      writer.emit(std::move(e));
    }
    writer.stop();
    EXPECT_EQ(writer.written_count(), static_cast<std::uint64_t>(kCount));
    EXPECT_EQ(writer.dropped_count(), 0u);
  }

  auto lines = read_lines(current_file());
  ASSERT_EQ(lines.size(), static_cast<std::size_t>(kCount));
  for (int i = 0; i < kCount; ++i) {
    auto e = evstream::parse_event_line(lines[i]);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->event_id, ids[i]);
  }
  EXPECT_EQ(logger.count("event_writer_stopped"), 1u);
}

// -----------------------------------------------------------------------------
// 4. Rotation with a frozen clock: every rotation produces a distinct name,
//    and no segment exceeds max_file_size by more than one event.
//
// How: The SimulationTimeProvider never advances, so every rotation asks for
//      the same stamp and must bump it to stay unique.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, RotationNamesUniqueAndSizeBounded) {
  constexpr std::uintmax_t kMaxSize = 2048;
  constexpr int kCount = 200;

  evstream::SimulationTimeProvider frozen(1'735'732'800'000'000);
  auto c = config(WriteMode::Direct);
  c.max_file_size = kMaxSize;

  std::size_t longest_line = 0;
  {
    EventWriter writer(c, logger, &frozen);
    writer.start();
    for (int i = 0; i < kCount; ++i) {
      auto e = action(i);
      longest_line =
          std::max(longest_line, evstream::serialize_event(e).size() + 1);
      writer.emit(std::move(e));
    }
    writer.stop();
    EXPECT_EQ(writer.written_count(), static_cast<std::uint64_t>(kCount));
  }

  const auto segments = evstream::list_segments(
      evstream::simulation_directory(root.path(), kSim));
  ASSERT_GT(segments.size(), 2u);

  std::set<std::string> names;
  for (const auto& seg : segments) {
    names.insert(seg.filename().string());
    EXPECT_LE(std::filesystem::file_size(seg), kMaxSize + longest_line)
        << seg;
  }
  EXPECT_EQ(names.size(), segments.size());
  EXPECT_EQ(logger.count("event_file_rotated"), segments.size() - 1);
  EXPECT_EQ(all_lines().size(), static_cast<std::size_t>(kCount));

  // The first rotation uses the clock's stamp as is.
  EXPECT_EQ(segments.front().filename().string(),
            "events_2025-01-01_12-00-00-000000.jsonl");
}

// -----------------------------------------------------------------------------
// 5. Rotation in concurrent mode loses nothing.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, ConcurrentRotationKeepsEveryEvent) {
  constexpr int kCount = 500;
  auto c = config(WriteMode::Concurrent);
  c.max_file_size = 4096;

  {
    EventWriter writer(c, logger);
    writer.start();
    for (int i = 0; i < kCount; ++i) {
      writer.emit(action(i));
    }
    writer.stop();
  }

  EXPECT_GT(evstream::list_segments(
                evstream::simulation_directory(root.path(), kSim))
                .size(),
            1u);
  EXPECT_EQ(all_lines().size(), static_cast<std::size_t>(kCount));
}

// -----------------------------------------------------------------------------
// 6. Drop-on-full accounting: written + dropped == accepted.
//
// How: Events emitted before start() wait in the queue, so with capacity 10
//      the first 10 are queued and the remaining 90 are dropped
//      deterministically.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, DropAccountingWhenQueueFull) {
  auto c = config(WriteMode::Concurrent);
  c.max_queue_size = 10;
  EventWriter writer(c, logger);

  for (int i = 0; i < 100; ++i) {
    writer.emit(action(i));
  }
  EXPECT_EQ(writer.dropped_count(), 90u);
  EXPECT_EQ(writer.pending_count(), 10u);

  writer.start();
  writer.stop();

  EXPECT_EQ(writer.written_count(), 10u);
  EXPECT_EQ(writer.written_count() + writer.dropped_count() +
                writer.failed_count(),
            100u);
  // Logged on the first drop only (90 < 100).
  EXPECT_EQ(logger.count("event_dropped"), 1u);
  EXPECT_EQ(read_lines(current_file()).size(), 10u);
}

// -----------------------------------------------------------------------------
// 7. Under many producers racing a small queue, every accepted event is
//    accounted for exactly once.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, ConcurrentProducersAccountingBalances) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 2000;
  auto c = config(WriteMode::Concurrent);
  c.max_queue_size = 64;

  EventWriter writer(c, logger);
  writer.start();
  std::vector<std::thread> producers;
  for (int t = 0; t < kThreads; ++t) {
    producers.emplace_back([&writer] {
      for (int i = 0; i < kPerThread; ++i) {
        writer.emit(action(i));
      }
    });
  }
  for (auto& t : producers) t.join();
  writer.stop();

  EXPECT_EQ(writer.written_count() + writer.dropped_count() +
                writer.failed_count(),
            static_cast<std::uint64_t>(kThreads * kPerThread));
  EXPECT_EQ(read_lines(current_file()).size(), writer.written_count());
}

// -----------------------------------------------------------------------------
// 8. stop() without start(): no thread was ever running; queued events are
//    counted as dropped and nothing is written.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, StopWithoutStartDropsQueued) {
  EventWriter writer(config(WriteMode::Concurrent), logger);
  for (int i = 0; i < 5; ++i) {
    writer.emit(action(i));
  }

  const auto before = std::chrono::steady_clock::now();
  writer.stop(std::chrono::milliseconds(5000));
  EXPECT_LT(std::chrono::steady_clock::now() - before,
            std::chrono::seconds(1));

  EXPECT_EQ(writer.written_count(), 0u);
  EXPECT_EQ(writer.dropped_count(), 5u);
  EXPECT_FALSE(std::filesystem::exists(current_file()));
  EXPECT_EQ(logger.count("event_writer_timeout"), 1u);
}

// -----------------------------------------------------------------------------
// 9. start() and stop() are idempotent; a stopped writer does not restart
//    and counts later emits as dropped.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, LifecycleIsIdempotentAndTerminal) {
  EventWriter writer(config(WriteMode::Concurrent), logger);
  writer.start();
  writer.start();
  writer.emit(action(1));
  writer.stop();
  writer.stop();

  EXPECT_EQ(logger.count("event_writer_started"), 1u);
  EXPECT_EQ(logger.count("event_writer_stopped"), 1u);
  EXPECT_EQ(writer.written_count(), 1u);

  writer.start();
  writer.emit(action(2));
  EXPECT_EQ(writer.dropped_count(), 1u);
  EXPECT_EQ(writer.written_count(), 1u);
  EXPECT_EQ(logger.count("event_writer_started"), 1u);
}

// -----------------------------------------------------------------------------
// 10. A write failure is logged and counted, and the writer keeps working.
//
// How: A directory squats on the events.jsonl path so open() fails with
//      EISDIR. Removing it lets the next emit succeed.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, WriteFailureDegradesAndRecovers) {
  std::filesystem::create_directories(current_file());

  EventWriter writer(config(WriteMode::Direct), logger);
  writer.start();
  writer.emit(action(1));

  EXPECT_EQ(writer.failed_count(), 1u);
  EXPECT_EQ(writer.written_count(), 0u);
  EXPECT_EQ(logger.count("event_file_write_failed"), 1u);
  EXPECT_GE(logger.count(evstream::LogLevel::Error), 1u);

  std::filesystem::remove(current_file());
  writer.emit(action(2));

  EXPECT_EQ(writer.written_count(), 1u);
  EXPECT_EQ(read_lines(current_file()).size(), 1u);
}

// -----------------------------------------------------------------------------
// 11. A payload that cannot be serialized is lost alone.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, SerializationFailureIsCounted) {
  EventWriter writer(config(WriteMode::Direct), logger);
  writer.start();

  writer.emit(evstream::create_detail_event(
      kSim, 0, "calc", {{"bad", std::string("\xc3\x28")}}));
  writer.emit(action(1));

  EXPECT_EQ(writer.failed_count(), 1u);
  EXPECT_EQ(writer.written_count(), 1u);
  EXPECT_EQ(logger.count("event_serialize_failed"), 1u);
  EXPECT_EQ(read_lines(current_file()).size(), 1u);
}

// -----------------------------------------------------------------------------
// 12. Appending to an existing log picks up its size for rotation.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, ExistingFileSizeIsCounted) {
  evstream::testing::write_lines(current_file(),
                                 {evstream::serialize_event(action(0))});
  const auto existing = std::filesystem::file_size(current_file());

  EventWriter writer(config(WriteMode::Direct), logger);
  writer.start();
  writer.emit(action(1));

  EXPECT_GT(writer.current_size(), existing);
  EXPECT_EQ(writer.current_size(), std::filesystem::file_size(current_file()));
  EXPECT_EQ(read_lines(current_file()).size(), 2u);
}

// -----------------------------------------------------------------------------
// 13. emit() in concurrent mode does no I/O: 10 000 emits average well
//     under a millisecond each.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, ConcurrentEmitIsNonBlocking) {
  constexpr int kCount = 10000;
  std::vector<evstream::Event> events;
  events.reserve(kCount);
  for (int i = 0; i < kCount; ++i) {
    events.push_back(action(i));
  }

  EventWriter writer(config(WriteMode::Concurrent), logger);
  writer.start();

  const auto begin = std::chrono::steady_clock::now();
  for (auto& e : events) {
    writer.emit(std::move(e));
  }
  const auto elapsed = std::chrono::steady_clock::now() - begin;
  writer.stop();

  EXPECT_LT(elapsed / kCount, std::chrono::milliseconds(1));
  EXPECT_EQ(writer.written_count() + writer.dropped_count(),
            static_cast<std::uint64_t>(kCount));
}

// -----------------------------------------------------------------------------
// 14. Rotated names come from the injected clock, in UTC.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, RotationNamesFollowInjectedClock) {
  evstream::SimulationTimeProvider clock;
  clock.set_time(1'735'732'800'000'000);  // 2025-01-01T12:00:00Z

  auto c = config(WriteMode::Direct);
  c.max_file_size = 1;  // rotate after every event
  EventWriter writer(c, logger, &clock);
  writer.start();

  writer.emit(action(1));
  clock.advance_by(2'500'000);
  writer.emit(action(2));
  writer.stop();

  const auto dir = evstream::simulation_directory(root.path(), kSim);
  EXPECT_TRUE(std::filesystem::exists(
      dir / "events_2025-01-01_12-00-00-000000.jsonl"));
  EXPECT_TRUE(std::filesystem::exists(
      dir / "events_2025-01-01_12-00-02-500000.jsonl"));
  EXPECT_EQ(all_lines().size(), 2u);
}

// -----------------------------------------------------------------------------
// 15. stop(milliseconds::max()) means "wait for the full drain".
//
// Why: now() + milliseconds::max() does not fit in a steady_clock time point.
//      The deadline must saturate instead of wrapping into the past, which
//      would turn every queued event into a drop.
// How: Queue a batch large enough that the consumer is still busy when
//      stop() is called.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, StopWithMaxTimeoutDrainsEverything) {
  constexpr int kCount = 2000;
  auto c = config(WriteMode::Concurrent);
  c.max_queue_size = kCount;
  EventWriter writer(c, logger);
  writer.start();

  for (int i = 0; i < kCount; ++i) {
    writer.emit(action(i));
  }
  writer.stop(std::chrono::milliseconds::max());

  EXPECT_EQ(writer.written_count(), static_cast<std::uint64_t>(kCount));
  EXPECT_EQ(writer.dropped_count(), 0u);
  EXPECT_EQ(writer.failed_count(), 0u);
  EXPECT_EQ(logger.count("event_writer_timeout"), 0u);
  EXPECT_EQ(all_lines().size(), static_cast<std::size_t>(kCount));
}

// -----------------------------------------------------------------------------
// 16. A drain deadline that expires while the consumer is running.
//
// Why: stop() must be bounded even when the queue is full of work. Whatever
//      the consumer did not reach is dropped, and the counters still add up
//      to what was accepted.
// How: 10 000 events into a queue that holds them all, then stop(0). The
//      one write in progress at the deadline finishes before the join, so the
//      bound only has to cover a single write.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, ZeroTimeoutStopWithLiveConsumerIsBounded) {
  constexpr int kCount = 10000;
  auto c = config(WriteMode::Concurrent);
  c.max_queue_size = kCount;
  EventWriter writer(c, logger);
  writer.start();

  for (int i = 0; i < kCount; ++i) {
    writer.emit(action(i));
  }

  const auto begin = std::chrono::steady_clock::now();
  writer.stop(std::chrono::milliseconds(0));
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, std::chrono::seconds(2));
  EXPECT_EQ(writer.written_count() + writer.dropped_count() +
                writer.failed_count(),
            static_cast<std::uint64_t>(kCount));
  EXPECT_EQ(writer.pending_count(), 0u);
  EXPECT_EQ(all_lines().size(), writer.written_count());
  if (writer.dropped_count() > 0) {
    EXPECT_EQ(logger.count("event_writer_timeout"), 1u);
  }

  // Nothing is accepted after the deadline cut the drain short.
  writer.emit(action(kCount));
  EXPECT_EQ(all_lines().size(), writer.written_count());
}

// -----------------------------------------------------------------------------
// 17. An unexpected exception during rotation is contained.
//
// Why: Only std::system_error and JSON errors are expected from the write
//      path. Anything else escaping on the consumer thread would terminate
//      the process.
// How: The injected clock throws std::runtime_error, and every event
//      crosses the one-byte size limit, so each write triggers a failing
//      rotation. All events stay in the current segment.
// -----------------------------------------------------------------------------
TEST_F(EventWriterTest, RotationExceptionDoesNotStopConsumer) {
  FailingClock clock;
  auto c = config(WriteMode::Concurrent);
  c.max_file_size = 1;
  EventWriter writer(c, logger, &clock);
  writer.start();

  for (int i = 0; i < 3; ++i) {
    writer.emit(action(i));
  }
  writer.stop();

  EXPECT_EQ(writer.written_count(), 3u);
  EXPECT_EQ(writer.failed_count(), 0u);
  EXPECT_EQ(writer.dropped_count(), 0u);
  EXPECT_EQ(logger.count("event_file_rotation_failed"), 3u);
  EXPECT_EQ(evstream::list_segments(
                evstream::simulation_directory(root.path(), kSim))
                .size(),
            1u);
  EXPECT_EQ(read_lines(current_file()).size(), 3u);
}
