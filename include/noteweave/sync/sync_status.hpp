#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace noteweave::sync {

enum class SyncState { Idle, Scanning, Applying, Watching, Error };

[[nodiscard]] std::string_view sync_state_name(SyncState state);

/// Counts for one reconciliation run.
struct SyncReport {
  std::size_t created = 0;
  std::size_t modified = 0;
  std::size_t deleted = 0;
  std::size_t moved = 0;
  std::size_t skipped = 0;
  std::size_t degraded = 0;
  std::size_t failed = 0;

  [[nodiscard]] std::size_t changes() const { return created + modified + deleted + moved; }
};

struct ProjectSyncStatus {
  std::string project;
  SyncState state = SyncState::Idle;
  std::size_t files_total = 0;
  std::size_t files_processed = 0;
  SyncReport last_report;
  std::vector<std::string> failed_paths;
  std::optional<std::string> last_error;
  std::optional<std::string> last_scan_at;
};

/// Thread-safe per-project sync state, read by the service layer while the
/// workers update it.
class SyncStatusTracker {
public:
  void register_project(const std::string &project);
  void remove_project(const std::string &project);

  void set_state(const std::string &project, SyncState state);
  void set_progress(const std::string &project, std::size_t total, std::size_t processed);
  void record_report(const std::string &project, const SyncReport &report);
  void add_failed(const std::string &project, const std::string &path);
  void clear_failed(const std::string &project, const std::string &path);
  void set_error(const std::string &project, const std::string &message);

  [[nodiscard]] std::optional<ProjectSyncStatus> get(const std::string &project) const;
  [[nodiscard]] std::vector<ProjectSyncStatus> all() const;
  /// True when no project is scanning, applying or failed.
  [[nodiscard]] bool is_ready() const;
  [[nodiscard]] std::string summary() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, ProjectSyncStatus> projects_;
};

} // namespace noteweave::sync
