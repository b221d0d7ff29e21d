#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace evstream {

// -----------------------------------------------------------------------------
// BoundedQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO with a fixed capacity that many threads push into and
// one consumer thread pops from. Producers never block: try_push() either
// enqueues or reports that the queue is full (or closed). The consumer blocks
// in pop() until an item arrives or the queue is closed.
//
// Why in architecture: The EventWriter's concurrent mode hands events from the
// simulation loop to the writer thread through this queue. A full queue drops
// the new item; emit() never waits on disk I/O.
//
// Completion tracking: every successfully pushed item is "unfinished" until
// the consumer calls task_done() for it. wait_drained_until() lets a shutdown
// path wait (with a deadline) for the consumer to finish everything that was
// queued, including the item it is currently processing.
//
// Thread model: All methods are thread-safe. Intended for many producers and
// a single consumer; FIFO order is preserved for that consumer.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

  // Non-copyable, non-movable: owns a mutex and condition variables.
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  // -------------------------------------------------------------------------
  // try_push(value)
  // -------------------------------------------------------------------------
  // What: Moves value into the queue if it holds fewer than capacity() items
  // and has not been closed. Wakes the consumer.
  // Output: true if enqueued; false if full or closed, in which case value is
  // left untouched so the caller can still inspect it.
  // Never blocks beyond the short critical section.
  // -------------------------------------------------------------------------
  bool try_push(T&& value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_ || queue_.size() >= capacity_) {
        return false;
      }
      queue_.push_back(std::move(value));
      ++unfinished_;
    }
    not_empty_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting until one is available.
  // Returns std::nullopt as soon as the queue is closed, even if items remain
  // (they are left for drain_remaining()). The wait sleeps on a condition
  // variable; there is no polling.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (closed_) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Non-blocking variant of pop(). std::nullopt when empty or closed.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (closed_ || queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // task_done()
  // -------------------------------------------------------------------------
  // What: Marks one popped item as fully processed. When the unfinished count
  // reaches zero, waiters in wait_drained_until() are woken.
  // -------------------------------------------------------------------------
  void task_done() {
    bool drained = false;
    {
      std::lock_guard lock(mutex_);
      if (unfinished_ > 0) {
        --unfinished_;
      }
      drained = unfinished_ == 0;
    }
    if (drained) {
      drained_.notify_all();
    }
  }

  // -------------------------------------------------------------------------
  // wait_drained_until(deadline)
  // -------------------------------------------------------------------------
  // What: Blocks until every pushed item has been task_done()'d or the
  // deadline passes.
  // Output: true if drained, false on timeout. A deadline of
  // time_point::max() waits without a timeout.
  // -------------------------------------------------------------------------
  template <typename Clock, typename Duration>
  bool wait_drained_until(
      const std::chrono::time_point<Clock, Duration>& deadline) {
    std::unique_lock lock(mutex_);
    auto is_drained = [this] { return unfinished_ == 0; };
    if (deadline == std::chrono::time_point<Clock, Duration>::max()) {
      drained_.wait(lock, is_drained);
      return true;
    }
    return drained_.wait_until(lock, deadline, is_drained);
  }

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // What: Rejects further pushes and releases a consumer blocked in pop().
  // Idempotent.
  // -------------------------------------------------------------------------
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
  }

  // -------------------------------------------------------------------------
  // drain_remaining()
  // -------------------------------------------------------------------------
  // What: Discards every item still queued and returns how many there were.
  // Their unfinished marks are cleared as well, so the count is the exact
  // number of accepted items that were never processed.
  // -------------------------------------------------------------------------
  std::size_t drain_remaining() {
    std::size_t discarded = 0;
    {
      std::lock_guard lock(mutex_);
      discarded = queue_.size();
      queue_.clear();
      unfinished_ = unfinished_ >= discarded ? unfinished_ - discarded : 0;
    }
    drained_.notify_all();
    return discarded;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;

  // Protects queue_, unfinished_ and closed_.
  mutable std::mutex mutex_;

  // Signalled on push and on close.
  std::condition_variable not_empty_;

  // Signalled when unfinished_ drops to zero.
  std::condition_variable drained_;

  std::deque<T> queue_;
  std::size_t unfinished_{0};
  bool closed_{false};
};

}  // namespace evstream
