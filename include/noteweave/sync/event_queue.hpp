#pragma once

#include "noteweave/sync/change_event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace noteweave::sync {

/// Bounded per-project event queue. A push into a full queue drops the event
/// and latches the overflow flag; the consumer answers with a full rescan.
class EventQueue {
public:
  explicit EventQueue(std::size_t capacity);

  [[nodiscard]] bool push(ChangeEvent event);
  /// Waits up to `timeout` for the first event, then drains the rest.
  [[nodiscard]] std::vector<ChangeEvent> pop_batch(std::chrono::milliseconds timeout);
  /// True once after an overflow; clears the flag.
  [[nodiscard]] bool take_overflow();
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool empty() const;
  void clear();
  /// Wakes any waiting consumer.
  void close();
  /// Lets pop_batch block again after close().
  void reopen();

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ChangeEvent> queue_;
  bool overflow_ = false;
  bool closed_ = false;
};

} // namespace noteweave::sync
