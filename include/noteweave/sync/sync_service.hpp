#pragma once

#include "noteweave/common/result.hpp"
#include "noteweave/config/schema.hpp"
#include "noteweave/markdown/parser.hpp"
#include "noteweave/store/knowledge_store.hpp"
#include "noteweave/sync/event_queue.hpp"
#include "noteweave/sync/file_watcher.hpp"
#include "noteweave/sync/sync_status.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace noteweave::sync {

inline constexpr const char *kFileEntityType = "file";

struct DraftBuild {
  store::EntityDraft draft;
  std::vector<markdown::ParseWarning> warnings;
  bool degraded = false;
};

/// Turns one file's bytes into a store draft. Markdown that is not UTF-8 text
/// and every non-Markdown file become "file" entities without a graph fragment.
[[nodiscard]] DraftBuild build_draft(const std::string &relative_path, const std::string &bytes);

[[nodiscard]] std::string guess_content_type(const std::string &relative_path);

struct FileOutcome {
  // created, modified, deleted, moved, skipped or failed
  std::string action;
  std::optional<store::Entity> entity;
};

/// Reconciles one project. A worker thread runs the initial full scan, then
/// consumes watcher events from a bounded queue. Every apply (scan, event
/// batch, or a service-layer write through the *_locked calls) runs under the
/// project's apply mutex.
class ProjectSyncer {
public:
  ProjectSyncer(store::KnowledgeStore &store, store::Project project, config::SyncConfig config,
                SyncStatusTracker &status);
  ~ProjectSyncer();

  ProjectSyncer(const ProjectSyncer &) = delete;
  ProjectSyncer &operator=(const ProjectSyncer &) = delete;

  void start(bool watch);
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] common::Result<SyncReport> full_scan();
  [[nodiscard]] common::Result<SyncReport> apply_events(const std::vector<ChangeEvent> &events);
  void enqueue(ChangeEvent event);

  /// Leaves ERROR for IDLE and schedules a full rescan. Takes the apply lock.
  [[nodiscard]] common::Status reset();

  // Service-layer writes. The caller holds the lock returned by lock_apply().
  [[nodiscard]] std::unique_lock<std::mutex> lock_apply();
  [[nodiscard]] common::Result<FileOutcome> sync_path_locked(const std::string &relative_path);
  [[nodiscard]] common::Result<FileOutcome> move_path_locked(const std::string &from,
                                                             const std::string &to);
  [[nodiscard]] common::Result<FileOutcome> delete_path_locked(const std::string &relative_path);

  [[nodiscard]] SyncState state() const;
  [[nodiscard]] const store::Project &project() const { return project_; }

private:
  void run_loop(bool watch);
  [[nodiscard]] common::Result<SyncReport> scan_locked();
  [[nodiscard]] common::Result<SyncReport> apply_events_locked(std::vector<ChangeEvent> events);
  [[nodiscard]] std::vector<ChangeEvent> pair_moves(std::vector<ChangeEvent> events);
  [[nodiscard]] common::Result<FileOutcome> apply_file(const std::string &relative,
                                                       SyncReport &report);
  [[nodiscard]] common::Result<FileOutcome> apply_move(const std::string &from,
                                                       const std::string &to, SyncReport &report);
  [[nodiscard]] common::Result<FileOutcome> apply_delete(const std::string &relative,
                                                         SyncReport &report);
  /// Store-level failures halt the project; everything else is per-file.
  common::Status halt_if_fatal(const common::Status &status);
  [[nodiscard]] common::Status halted_error() const;
  void settle_state();

  store::KnowledgeStore &store_;
  store::Project project_;
  std::filesystem::path root_;
  config::SyncConfig config_;
  SyncStatusTracker &status_;
  EventQueue queue_;
  std::mutex apply_mutex_;
  std::unique_ptr<FileWatcher> watcher_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> watching_{false};
  std::atomic<bool> rescan_requested_{false};
  std::atomic<bool> halted_{false};
};

/// Owns one ProjectSyncer per project and the shared status tracker.
class SyncOrchestrator {
public:
  SyncOrchestrator(store::KnowledgeStore &store, config::SyncConfig config);
  ~SyncOrchestrator();

  SyncOrchestrator(const SyncOrchestrator &) = delete;
  SyncOrchestrator &operator=(const SyncOrchestrator &) = delete;

  ProjectSyncer &attach(const store::Project &project);
  void start(const std::string &project);
  void start_all();
  /// Stops the project's worker and forgets it.
  void detach(const std::string &project);
  void stop_all();

  [[nodiscard]] ProjectSyncer *find(const std::string &project);
  [[nodiscard]] SyncStatusTracker &status() { return status_; }
  [[nodiscard]] const config::SyncConfig &config() const { return config_; }

private:
  store::KnowledgeStore &store_;
  config::SyncConfig config_;
  SyncStatusTracker status_;
  std::mutex mutex_;
  std::map<std::string, std::unique_ptr<ProjectSyncer>> syncers_;
};

} // namespace noteweave::sync
