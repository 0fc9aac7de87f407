#include "noteweave/observability/log_observer.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/common/time.hpp"

#include <iostream>
#include <type_traits>

namespace noteweave::observability {

namespace {

std::string_view level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string &text) {
  const std::string level = common::to_lower(common::trim(text));
  if (level == "debug") {
    return LogLevel::Debug;
  }
  if (level == "info") {
    return LogLevel::Info;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const LogLevel min_level) : min_level_(min_level) {}

void LogObserver::write(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << common::now_rfc3339() << " [" << level_name(level) << "] " << message << "\n";
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SyncStartEvent>) {
          write(LogLevel::Info, "sync.start project=" + evt.project +
                                    " full_scan=" + (evt.full_scan ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, SyncEndEvent>) {
          write(LogLevel::Info, "sync.end project=" + evt.project +
                                    " duration_ms=" + std::to_string(evt.duration.count()) +
                                    " created=" + std::to_string(evt.created) +
                                    " modified=" + std::to_string(evt.modified) +
                                    " deleted=" + std::to_string(evt.deleted) +
                                    " moved=" + std::to_string(evt.moved));
        } else if constexpr (std::is_same_v<T, FileSyncedEvent>) {
          write(LogLevel::Debug, "sync.file project=" + evt.project + " action=" + evt.action +
                                     " path=" + evt.path);
        } else if constexpr (std::is_same_v<T, ParseWarningEvent>) {
          write(LogLevel::Warn,
                "parse " + evt.path + ":" + std::to_string(evt.line) + " " + evt.message);
        } else if constexpr (std::is_same_v<T, StateChangeEvent>) {
          write(LogLevel::Info,
                "sync.state project=" + evt.project + " " + evt.from + " -> " + evt.to);
        } else if constexpr (std::is_same_v<T, WatchOverflowEvent>) {
          write(LogLevel::Warn, "watch.overflow project=" + evt.project + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          write(LogLevel::Debug,
                "metric.queue_depth project=" + m.project + " value=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, SyncDurationMetric>) {
          write(LogLevel::Debug, "metric.sync_duration_ms project=" + m.project +
                                     " value=" + std::to_string(m.duration.count()));
        } else if constexpr (std::is_same_v<T, IndexedEntitiesMetric>) {
          write(LogLevel::Debug,
                "metric.indexed_entities project=" + m.project + " value=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace noteweave::observability
