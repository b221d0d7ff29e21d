// =============================================================================
// writer_config_test.cpp
// =============================================================================
// Unit tests for EventWriterConfig parsing (evstream/writer/writer_config.hpp).
// =============================================================================

#include "evstream/storage/segment_layout.hpp"
#include "evstream/writer/writer_config.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>

using evstream::EventWriterConfig;
using evstream::VerbosityLevel;
using evstream::WriteMode;

// -----------------------------------------------------------------------------
// 1. Defaults: ACTION, concurrent, 10 000-event queue, 500 MiB segments.
// -----------------------------------------------------------------------------
TEST(WriterConfigTest, Defaults) {
  EventWriterConfig c;
  EXPECT_EQ(c.verbosity, VerbosityLevel::Action);
  EXPECT_EQ(c.mode, WriteMode::Concurrent);
  EXPECT_EQ(c.max_queue_size, 10000u);
  EXPECT_EQ(c.max_file_size, 500ULL * 1024 * 1024);
}

// -----------------------------------------------------------------------------
// 2. Present keys overlay the base; names are case-insensitive; aliases for
//    the modes are accepted.
// -----------------------------------------------------------------------------
TEST(WriterConfigTest, OverlaysKeys) {
  auto c = evstream::writer_config_from_json(
      {{"output_dir", "/tmp/out/sim-1"},
       {"simulation_id", "sim-1"},
       {"verbosity", "detail"},
       {"mode", "SYNC"},
       {"max_queue_size", 64},
       {"max_file_size", 4096}});
  EXPECT_EQ(c.output_dir.string(), "/tmp/out/sim-1");
  EXPECT_EQ(c.simulation_id, "sim-1");
  EXPECT_EQ(c.verbosity, VerbosityLevel::Detail);
  EXPECT_EQ(c.mode, WriteMode::Direct);
  EXPECT_EQ(c.max_queue_size, 64u);
  EXPECT_EQ(c.max_file_size, 4096u);

  EventWriterConfig base;
  base.simulation_id = "kept";
  auto partial = evstream::writer_config_from_json({{"mode", "async"}}, base);
  EXPECT_EQ(partial.simulation_id, "kept");
  EXPECT_EQ(partial.mode, WriteMode::Concurrent);
  EXPECT_EQ(partial.verbosity, VerbosityLevel::Action);
}

// -----------------------------------------------------------------------------
// 3. Bad values are rejected with a message naming the key.
// -----------------------------------------------------------------------------
TEST(WriterConfigTest, RejectsBadValues) {
  auto expect_key_error = [](const nlohmann::json& j, const std::string& key) {
    try {
      evstream::writer_config_from_json(j);
      ADD_FAILURE() << "no exception for " << j.dump();
    } catch (const std::invalid_argument& e) {
      EXPECT_NE(std::string(e.what()).find(key), std::string::npos)
          << e.what();
    }
  };

  expect_key_error({{"verbosity", "chatty"}}, "verbosity");
  expect_key_error({{"mode", "batch"}}, "mode");
  expect_key_error({{"max_queue_size", 0}}, "max_queue_size");
  expect_key_error({{"max_file_size", -1}}, "max_file_size");
  expect_key_error({{"max_file_size", "big"}}, "max_file_size");
  expect_key_error({{"simulation_id", 7}}, "simulation_id");

  EXPECT_THROW(evstream::writer_config_from_json(nlohmann::json::array()),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 4. load_writer_config() reads a file; unreadable or invalid files throw.
// -----------------------------------------------------------------------------
TEST(WriterConfigTest, LoadsFromFile) {
  evstream::testing::TempDir dir("evstream_config_test");
  const auto path = dir.path() / "writer.json";
  {
    std::ofstream out(path);
    out << R"({"verbosity":"STATE","max_file_size":1048576})";
  }

  auto c = evstream::load_writer_config(path);
  EXPECT_EQ(c.verbosity, VerbosityLevel::State);
  EXPECT_EQ(c.max_file_size, 1048576u);

  EXPECT_THROW(evstream::load_writer_config(dir.path() / "missing.json"),
               std::invalid_argument);

  const auto broken = dir.path() / "broken.json";
  {
    std::ofstream out(broken);
    out << "{not json";
  }
  EXPECT_THROW(evstream::load_writer_config(broken), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 5. Layout helpers: simulation directory and segment names.
// -----------------------------------------------------------------------------
TEST(SegmentLayoutTest, NamesAndDiscovery) {
  EXPECT_EQ(evstream::simulation_directory("/data", "sim-1").string(),
            "/data/sim-1");
  EXPECT_EQ(evstream::rotated_segment_name(1'735'732'800'123'456),
            "events_2025-01-01_12-00-00-123456.jsonl");

  EXPECT_TRUE(evstream::is_segment_name("events.jsonl"));
  EXPECT_TRUE(
      evstream::is_segment_name("events_2025-01-01_12-00-00-123456.jsonl"));
  EXPECT_FALSE(evstream::is_segment_name("events_latest.jsonl"));
  EXPECT_FALSE(evstream::is_segment_name("events.jsonl.bak"));
  EXPECT_FALSE(evstream::is_segment_name("notes.txt"));

  evstream::testing::TempDir dir("evstream_layout_test");
  for (const char* name :
       {"events.jsonl", "events_2025-01-02_00-00-00-000000.jsonl",
        "events_2025-01-01_00-00-00-000000.jsonl", "notes.txt"}) {
    std::ofstream(dir.path() / name) << "\n";
  }
  std::filesystem::create_directories(dir.path() /
                                      "events_2025-01-03_00-00-00-000000.jsonl");

  auto segments = evstream::list_segments(dir.path());
  ASSERT_EQ(segments.size(), 3u);
  EXPECT_EQ(segments[0].filename().string(), "events_2025-01-01_00-00-00-000000.jsonl");
  EXPECT_EQ(segments[1].filename().string(), "events_2025-01-02_00-00-00-000000.jsonl");
  EXPECT_EQ(segments[2].filename().string(), "events.jsonl");

  EXPECT_TRUE(evstream::list_segments(dir.path() / "nope").empty());
}
