#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace noteweave::observability {

struct SyncStartEvent {
  std::string project;
  bool full_scan = false;
};

struct SyncEndEvent {
  std::string project;
  std::chrono::milliseconds duration{0};
  std::uint64_t created = 0;
  std::uint64_t modified = 0;
  std::uint64_t deleted = 0;
  std::uint64_t moved = 0;
};

struct FileSyncedEvent {
  std::string project;
  std::string path;
  std::string action;
};

struct ParseWarningEvent {
  std::string project;
  std::string path;
  std::size_t line = 0;
  std::string message;
};

struct StateChangeEvent {
  std::string project;
  std::string from;
  std::string to;
};

struct WatchOverflowEvent {
  std::string project;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SyncStartEvent, SyncEndEvent, FileSyncedEvent, ParseWarningEvent,
                 StateChangeEvent, WatchOverflowEvent, ErrorEvent>;

struct QueueDepthMetric {
  std::string project;
  std::uint64_t depth = 0;
};

struct SyncDurationMetric {
  std::string project;
  std::chrono::milliseconds duration{0};
};

struct IndexedEntitiesMetric {
  std::string project;
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<QueueDepthMetric, SyncDurationMetric, IndexedEntitiesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace noteweave::observability
