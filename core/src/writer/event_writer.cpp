#include "evstream/writer/event_writer.hpp"

#include "evstream/events/event_json.hpp"
#include "evstream/events/verbosity.hpp"
#include "evstream/storage/segment_layout.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <sstream>
#include <system_error>
#include <utility>

namespace evstream {

namespace {

constexpr const char* kComponent = "EventWriter";

// Overload drops are logged on the first occurrence and then every N.
constexpr std::uint64_t kDropLogInterval = 100;

// now + timeout, saturated at time_point::max() so that
// milliseconds::max() means "no deadline" instead of overflowing.
std::chrono::steady_clock::time_point drain_deadline(
    std::chrono::milliseconds timeout) {
  using Clock = std::chrono::steady_clock;
  const Clock::time_point now = Clock::now();
  if (timeout <= std::chrono::milliseconds::zero()) {
    return now;
  }
  const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::time_point::max() - now);
  if (timeout >= headroom) {
    return Clock::time_point::max();
  }
  return now + timeout;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: resolve paths and create the output directory
// -----------------------------------------------------------------------------
EventWriter::EventWriter(EventWriterConfig config, ILogger& logger,
                         const ITimeProvider* time_provider)
    : config_(std::move(config)),
      logger_(logger),
      clock_(time_provider != nullptr ? *time_provider : live_clock_),
      current_file_(config_.output_dir / kCurrentSegmentName),
      queue_(config_.max_queue_size) {
  std::error_code ec;
  std::filesystem::create_directories(config_.output_dir, ec);
  if (ec) {
    std::ostringstream msg;
    msg << "event_dir_create_failed output_dir=" << config_.output_dir.string()
        << " error=" << ec.message();
    logger_.error(kComponent, msg.str());
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop so the consumer never outlives the writer
// -----------------------------------------------------------------------------
EventWriter::~EventWriter() { stop(kDefaultStopTimeout); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventWriter::start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (state_.load() != State::Created) {
    return;
  }
  state_.store(State::Running);

  if (config_.mode == WriteMode::Concurrent) {
    try {
      thread_ = std::thread([this] { run(); });
    } catch (const std::system_error& e) {
      // Without a consumer the queue only fills up; stop() will account for
      // everything left in it.
      std::ostringstream msg;
      msg << "event_writer_start_failed error=" << e.what();
      logger_.error(kComponent, msg.str());
      return;
    }
  }

  std::ostringstream msg;
  msg << "event_writer_started output_dir=" << config_.output_dir.string()
      << " simulation_id=" << config_.simulation_id
      << " verbosity=" << to_string(config_.verbosity)
      << " mode=" << to_string(config_.mode);
  logger_.info(kComponent, msg.str());
}

// -----------------------------------------------------------------------------
// emit(): verbosity filter, then enqueue or write
// -----------------------------------------------------------------------------
void EventWriter::emit(Event event) {
  if (!should_log(event.event_type, config_.verbosity)) {
    return;
  }

  if (state_.load() == State::Stopped) {
    record_drop(event);
    return;
  }

  if (config_.mode == WriteMode::Direct) {
    std::lock_guard lock(io_mutex_);
    write_event(event);
    return;
  }

  if (!queue_.try_push(std::move(event))) {
    record_drop(event);
  }
}

// -----------------------------------------------------------------------------
// stop(): drain with deadline, close, join, account for leftovers
// -----------------------------------------------------------------------------
void EventWriter::stop(std::chrono::milliseconds timeout) {
  std::lock_guard lock(lifecycle_mutex_);
  if (state_.exchange(State::Stopped) == State::Stopped) {
    return;
  }

  if (config_.mode == WriteMode::Concurrent) {
    bool drained = true;
    if (thread_.joinable()) {
      drained = queue_.wait_drained_until(drain_deadline(timeout));
    }

    // Wakes the consumer if it is idle in pop(); a write in progress
    // finishes first.
    queue_.close();
    if (thread_.joinable()) {
      thread_.join();
    }

    std::size_t remaining = queue_.drain_remaining();
    dropped_count_.fetch_add(remaining);
    if (!drained || remaining > 0) {
      std::ostringstream msg;
      msg << "event_writer_timeout remaining_events=" << remaining
          << " timeout_ms=" << timeout.count();
      logger_.warn(kComponent, msg.str());
    }
  }

  {
    std::lock_guard io_lock(io_mutex_);
    file_.close();
  }

  std::ostringstream msg;
  msg << "event_writer_stopped total_written=" << written_count_.load()
      << " total_failed=" << failed_count_.load()
      << " total_dropped=" << dropped_count_.load();
  logger_.info(kComponent, msg.str());
}

// -----------------------------------------------------------------------------
// run(): consumer loop. pop() sleeps on a condition variable until an event
// arrives or stop() closes the queue.
// -----------------------------------------------------------------------------
void EventWriter::run() {
  while (std::optional<Event> event = queue_.pop()) {
    {
      std::lock_guard lock(io_mutex_);
      write_event(*event);
    }
    queue_.task_done();
  }
}

// -----------------------------------------------------------------------------
// write_event(): one JSONL line, then the post-write rotation check
// -----------------------------------------------------------------------------
void EventWriter::write_event(const Event& event) {
  try {
    std::string line = serialize_event(event);
    line.push_back('\n');

    ensure_open();
    file_.write_all(line);
    if (config_.mode == WriteMode::Direct) {
      file_.sync();
    }
    current_size_.fetch_add(line.size());
    written_count_.fetch_add(1);
  } catch (const nlohmann::json::exception& e) {
    failed_count_.fetch_add(1);
    std::ostringstream msg;
    msg << "event_serialize_failed event_id=" << event.event_id
        << " error=" << e.what();
    logger_.error(kComponent, msg.str());
    return;
  } catch (const std::system_error& e) {
    failed_count_.fetch_add(1);
    // Drop the descriptor so the next event reopens the path from scratch.
    file_.close();
    std::ostringstream msg;
    msg << "event_file_write_failed file=" << current_file_.string()
        << " event_id=" << event.event_id << " error=" << e.what();
    logger_.error(kComponent, msg.str());
    return;
  } catch (const std::exception& e) {
    failed_count_.fetch_add(1);
    file_.close();
    std::ostringstream msg;
    msg << "event_write_error event_id=" << event.event_id
        << " error=" << e.what();
    logger_.error(kComponent, msg.str());
    return;
  }

  if (current_size_.load() > config_.max_file_size) {
    try {
      rotate();
    } catch (const std::exception& e) {
      // The event is already on disk. The next write reopens the current
      // segment, which is still over the limit, and rotation is retried.
      file_.close();
      std::ostringstream msg;
      msg << "event_file_rotation_failed file=" << current_file_.string()
          << " error=" << e.what();
      logger_.error(kComponent, msg.str());
    }
  }
}

void EventWriter::ensure_open() {
  if (file_.is_open()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(config_.output_dir, ec);
  file_.open(current_file_);
  current_size_.store(file_.size());
}

// -----------------------------------------------------------------------------
// rotate(): rename current segment to a unique stamped name, start fresh
// -----------------------------------------------------------------------------
void EventWriter::rotate() {
  file_.close();
  std::uintmax_t rotated_size = current_size_.load();

  std::int64_t stamp = clock_.now_us();
  std::filesystem::path rotated = config_.output_dir / rotated_segment_name(stamp);
  std::error_code ec;
  while (std::filesystem::exists(rotated, ec)) {
    ++stamp;
    rotated = config_.output_dir / rotated_segment_name(stamp);
  }

  std::filesystem::rename(current_file_, rotated, ec);
  if (ec) {
    std::ostringstream msg;
    msg << "event_file_rotation_failed file=" << current_file_.string()
        << " target=" << rotated.string() << " error=" << ec.message();
    logger_.error(kComponent, msg.str());
  } else {
    std::ostringstream msg;
    msg << "event_file_rotated old_file=" << current_file_.string()
        << " new_file=" << rotated.string() << " size_bytes=" << rotated_size;
    logger_.info(kComponent, msg.str());
  }

  current_size_.store(0);

  // The canonical path always names the active segment, so create it now
  // rather than on the next write.
  try {
    file_.open(current_file_);
  } catch (const std::system_error& e) {
    std::ostringstream msg;
    msg << "event_file_open_failed file=" << current_file_.string()
        << " error=" << e.what();
    logger_.error(kComponent, msg.str());
  }
}

void EventWriter::record_drop(const Event& event) {
  std::uint64_t total = dropped_count_.fetch_add(1) + 1;
  if (total == 1 || total % kDropLogInterval == 0) {
    std::ostringstream msg;
    msg << "event_dropped event_id=" << event.event_id
        << " total_dropped=" << total;
    logger_.info(kComponent, msg.str());
  }
}

}  // namespace evstream
