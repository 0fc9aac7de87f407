#pragma once

#include "noteweave/observability/observer.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace noteweave::observability {

enum class LogLevel { Debug, Info, Warn, Error };

/// Accepts debug, info, warn/warning and error, case-insensitively.
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &text);

/// One line per event on stderr. Lines below `min_level` are dropped.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void write(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::mutex mutex_;
};

} // namespace noteweave::observability
