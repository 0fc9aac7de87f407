#include "noteweave/observability/global.hpp"

#include <mutex>

namespace noteweave::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_sync_start(const std::string &project, const bool full_scan) {
  record_event(SyncStartEvent{.project = project, .full_scan = full_scan});
}

void record_file_synced(const std::string &project, const std::string &path,
                        const std::string &action) {
  record_event(FileSyncedEvent{.project = project, .path = path, .action = action});
}

void record_parse_warning(const std::string &project, const std::string &path,
                          const std::size_t line, const std::string &message) {
  record_event(
      ParseWarningEvent{.project = project, .path = path, .line = line, .message = message});
}

void record_state_change(const std::string &project, const std::string &from,
                         const std::string &to) {
  record_event(StateChangeEvent{.project = project, .from = from, .to = to});
}

void record_watch_overflow(const std::string &project, const std::string &reason) {
  record_event(WatchOverflowEvent{.project = project, .reason = reason});
}

void record_queue_depth(const std::string &project, const std::uint64_t depth) {
  record_metric(QueueDepthMetric{.project = project, .depth = depth});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace noteweave::observability
