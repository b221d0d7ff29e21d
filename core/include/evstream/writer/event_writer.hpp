#pragma once

#include "evstream/concurrent/bounded_queue.hpp"
#include "evstream/events/event_types.hpp"
#include "evstream/logging/i_logger.hpp"
#include "evstream/storage/append_file.hpp"
#include "evstream/time/i_time_provider.hpp"
#include "evstream/time/live_time_provider.hpp"
#include "evstream/writer/writer_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <thread>

namespace evstream {

// -----------------------------------------------------------------------------
// EventWriter
// -----------------------------------------------------------------------------
//
// @brief  Producer-facing sink of one simulation's event log. Filters events
//         by verbosity, serializes them as JSONL into
//         <output_dir>/events.jsonl and rotates that file when it grows past
//         max_file_size.
//
// @details
// Lifecycle: construct → start() → emit()* → stop(timeout). stop() is
// terminal; a stopped writer does not restart and drops (and counts) later
// emits.
//
// Two modes (EventWriterConfig::mode):
//
//   Concurrent (default)
//     emit() does a non-blocking push into a BoundedQueue. When the queue is
//     full the event is dropped and counted. start() spawns exactly one
//     consumer thread that pops, serializes, appends and rotates. stop()
//     waits up to `timeout` for the queue to drain, then closes the queue,
//     joins the thread and counts whatever was left as dropped. Events
//     emitted before start() wait in the queue.
//
//   Direct
//     emit() serializes, appends, fsyncs and rotates before returning. start()
//     and stop() do no I/O work.
//
// Rotation: after each successful append, if current_size() exceeds
// max_file_size the current file is renamed to
// events_<UTC stamp with microseconds>.jsonl and a fresh events.jsonl is
// opened. If the stamped name already exists the stamp is advanced one
// microsecond at a time until it is free. Because the check runs after the
// write, a segment may exceed the threshold by at most one event.
//
// Across a rotation boundary in concurrent mode, events from different
// emitting threads may land on either side of the boundary in an order that
// differs from their timestamps. Readers sort by (timestamp, event_id) and do
// not rely on file order.
//
// Error handling: start(), emit() and stop() never throw. Serialization and
// I/O failures (and any other std::exception raised while writing) are logged
// at ERROR and the event is lost; the writer keeps going and retries the file
// on the next event. A failed rotation is logged and the event that triggered
// it stays written.
//
// Accounting: every event that passes the verbosity filter ends up either
// written (written_count()), lost to a write failure (failed_count()) or
// dropped (dropped_count()).
//
// Thread model: emit() may be called from any thread. start() and stop() may
// be called from any thread; they serialize on an internal mutex. Only one
// thread touches the file at a time (the consumer in concurrent mode, the
// emitting thread under io_mutex_ in direct mode), so no file locking is
// needed.
// -----------------------------------------------------------------------------
class EventWriter {
 public:
  static constexpr std::chrono::milliseconds kDefaultStopTimeout{10000};

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config         Copied. output_dir is created if missing (failure
  //                        is logged; writes retry creating it).
  // @param  logger         Must outlive the writer.
  // @param  time_provider  Clock used for rotation stamps. nullptr means the
  //                        wall clock. Must outlive the writer.
  //
  // No thread is spawned until start().
  // -------------------------------------------------------------------------
  EventWriter(EventWriterConfig config, ILogger& logger,
              const ITimeProvider* time_provider = nullptr);

  // Calls stop(kDefaultStopTimeout).
  ~EventWriter();

  EventWriter(const EventWriter&) = delete;
  EventWriter& operator=(const EventWriter&) = delete;
  EventWriter(EventWriter&&) = delete;
  EventWriter& operator=(EventWriter&&) = delete;

  // Idempotent. Concurrent mode: spawns the consumer thread once. Direct
  // mode: no-op. Never throws.
  void start();

  // -------------------------------------------------------------------------
  // emit(event)
  // -------------------------------------------------------------------------
  // @brief  Submits one event.
  //
  // @details
  // Events below the verbosity threshold are discarded silently and are not
  // counted. Otherwise see the mode descriptions above. Never throws and, in
  // concurrent mode, never waits on I/O.
  // -------------------------------------------------------------------------
  void emit(Event event);

  // -------------------------------------------------------------------------
  // stop(timeout)
  // -------------------------------------------------------------------------
  // @brief  Drains (concurrent mode) and closes the writer. Idempotent.
  //
  // @details
  // Returns within roughly `timeout` plus the time of the one write that may
  // be in progress. Events still queued at the deadline are counted as
  // dropped. Logs the final counts. Never throws.
  // A timeout of milliseconds::max() waits for the full drain. Zero or a
  // negative timeout does not wait.
  // -------------------------------------------------------------------------
  void stop(std::chrono::milliseconds timeout = kDefaultStopTimeout);

  const std::filesystem::path& output_dir() const { return config_.output_dir; }
  const std::string& simulation_id() const { return config_.simulation_id; }
  VerbosityLevel verbosity() const { return config_.verbosity; }
  WriteMode mode() const { return config_.mode; }
  std::uintmax_t max_file_size() const { return config_.max_file_size; }
  std::size_t max_queue_size() const { return config_.max_queue_size; }
  const std::filesystem::path& current_file() const { return current_file_; }

  // Size of the current segment in bytes: its size when opened plus every
  // line appended since.
  std::uintmax_t current_size() const { return current_size_.load(); }

  std::uint64_t dropped_count() const { return dropped_count_.load(); }
  std::uint64_t written_count() const { return written_count_.load(); }
  std::uint64_t failed_count() const { return failed_count_.load(); }

  // Events accepted into the queue and not yet written (concurrent mode).
  std::size_t pending_count() const { return queue_.size(); }

 private:
  enum class State { Created, Running, Stopped };

  // Consumer thread body: pop → write → task_done until the queue closes.
  void run();

  // Serialize + append (+ fsync in direct mode) + rotation check. Catches and
  // logs every failure. Caller holds io_mutex_.
  void write_event(const Event& event);

  // Opens the current segment if it is not open, recreating output_dir if it
  // disappeared. Throws std::system_error. Caller holds io_mutex_.
  void ensure_open();

  // Renames the current segment and opens a fresh one. Caller holds
  // io_mutex_.
  void rotate();

  void record_drop(const Event& event);

  EventWriterConfig config_;
  ILogger& logger_;
  LiveTimeProvider live_clock_;
  const ITimeProvider& clock_;
  std::filesystem::path current_file_;

  BoundedQueue<Event> queue_;

  // Guards file_ and the rotation sequence.
  std::mutex io_mutex_;
  AppendFile file_;

  std::atomic<std::uintmax_t> current_size_{0};
  std::atomic<std::uint64_t> dropped_count_{0};
  std::atomic<std::uint64_t> written_count_{0};
  std::atomic<std::uint64_t> failed_count_{0};

  // Serializes start() and stop().
  std::mutex lifecycle_mutex_;
  std::atomic<State> state_{State::Created};
  std::thread thread_;
};

}  // namespace evstream
