#include "noteweave/observability/multi_observer.hpp"

namespace noteweave::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (!observer) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  children_.push_back(std::move(observer));
}

std::size_t MultiObserver::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return children_.size();
}

void MultiObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &child : children_) {
    child->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &child : children_) {
    child->record_metric(metric);
  }
}

void MultiObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &child : children_) {
    child->flush();
  }
}

} // namespace noteweave::observability
