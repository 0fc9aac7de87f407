#include "noteweave/sync/event_queue.hpp"

namespace noteweave::sync {

EventQueue::EventQueue(const std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool EventQueue::push(ChangeEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.size() >= capacity_) {
    overflow_ = true;
    cv_.notify_one();
    return false;
  }
  queue_.push_back(std::move(event));
  cv_.notify_one();
  return true;
}

std::vector<ChangeEvent> EventQueue::pop_batch(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || overflow_ || closed_; });

  std::vector<ChangeEvent> out;
  out.reserve(queue_.size());
  while (!queue_.empty()) {
    out.push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  return out;
}

bool EventQueue::take_overflow() {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool overflowed = overflow_;
  overflow_ = false;
  return overflowed;
}

std::size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool EventQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

void EventQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.clear();
}

void EventQueue::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  cv_.notify_all();
}

void EventQueue::reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = false;
}

} // namespace noteweave::sync
