#pragma once

#include "noteweave/observability/observer.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace noteweave::observability {

/// Forwards to every child in insertion order. Safe to call from several
/// sync workers at once.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<IObserver>> children_;
};

} // namespace noteweave::observability
