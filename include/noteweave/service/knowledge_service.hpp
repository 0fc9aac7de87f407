#pragma once

#include "noteweave/common/result.hpp"
#include "noteweave/config/schema.hpp"
#include "noteweave/context/context_builder.hpp"
#include "noteweave/store/knowledge_store.hpp"
#include "noteweave/sync/sync_service.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace noteweave::service {

struct WriteRequest {
  std::string title;
  std::string content;
  std::string folder;
  std::vector<std::string> tags;
  std::optional<std::string> entity_type;
  std::optional<std::string> project;
};

struct WriteResult {
  store::Entity entity;
  std::string permalink;
  std::string memory_url;
  bool created = false;
};

struct ReadResult {
  store::Entity entity;
  std::string content;
};

struct SearchRequest {
  store::SearchFilters filters;
  store::Pagination pagination;
  std::optional<std::string> project;
};

struct ContextRequest {
  std::string url;
  std::size_t depth = 1;
  std::optional<std::string> timeframe;
  std::size_t max_related = 10;
  store::Pagination pagination;
  std::optional<std::string> project;
};

/// Entry point for the tool and CLI layers: project provisioning, note
/// writes that go through the file system and are indexed before returning,
/// and the read-side queries.
class KnowledgeService {
public:
  explicit KnowledgeService(config::Config config);
  ~KnowledgeService();

  KnowledgeService(const KnowledgeService &) = delete;
  KnowledgeService &operator=(const KnowledgeService &) = delete;

  /// Loads the config file, applies environment overrides, validates it and
  /// installs the configured observer.
  [[nodiscard]] static common::Result<std::unique_ptr<KnowledgeService>> from_disk();

  /// Opens the store and provisions configured projects. With `run_workers`
  /// each project gets its background scan and watch worker.
  [[nodiscard]] common::Status start(bool run_workers = true);
  void stop();

  // Projects
  [[nodiscard]] common::Result<store::Project> add_project(const std::string &name,
                                                           const std::string &path,
                                                           bool set_default = false);
  /// Forgets the project's index rows. Files on disk are untouched.
  [[nodiscard]] common::Status remove_project(const std::string &name);
  [[nodiscard]] common::Result<std::vector<store::Project>> list_projects();
  [[nodiscard]] common::Status set_default_project(const std::string &name);
  [[nodiscard]] common::Result<store::Project>
  resolve_project(const std::optional<std::string> &name);

  // Notes
  [[nodiscard]] common::Result<WriteResult> write_entity(const WriteRequest &request);
  [[nodiscard]] common::Result<ReadResult> read_entity(const std::string &identifier,
                                                       const std::optional<std::string> &project = {});
  [[nodiscard]] common::Result<store::SearchPage> search(const SearchRequest &request);
  [[nodiscard]] common::Result<context::GraphSnapshot> build_context(const ContextRequest &request);
  [[nodiscard]] common::Result<store::Entity>
  move_entity(const std::string &identifier, const std::string &destination_path,
              const std::optional<std::string> &project = {});
  [[nodiscard]] common::Status delete_entity(const std::string &identifier,
                                             const std::optional<std::string> &project = {});

  // Sync
  [[nodiscard]] common::Result<sync::ProjectSyncStatus>
  sync_status(const std::optional<std::string> &project = {});
  [[nodiscard]] std::string sync_summary();
  [[nodiscard]] common::Result<sync::SyncReport> sync_project(const std::optional<std::string> &project = {});
  /// Rebuilds the project's search index and, if its worker halted on a
  /// store error, returns it to idle with a rescan queued.
  [[nodiscard]] common::Status reset_project(const std::optional<std::string> &project = {});

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] store::KnowledgeStore &store() { return *store_; }

private:
  struct Located {
    store::Project project;
    store::Entity entity;
  };

  [[nodiscard]] common::Result<Located> locate(const std::string &identifier,
                                               const std::optional<std::string> &project);
  [[nodiscard]] common::Result<std::optional<store::Entity>>
  lookup_entity(const store::Project &project, const std::string &reference);
  [[nodiscard]] sync::ProjectSyncer &syncer_for(const store::Project &project);
  [[nodiscard]] bool is_project_name(const std::string &name);

  config::Config config_;
  std::unique_ptr<store::KnowledgeStore> store_;
  std::unique_ptr<sync::SyncOrchestrator> orchestrator_;
  std::unique_ptr<context::ContextBuilder> context_;
  bool run_workers_ = false;
};

} // namespace noteweave::service
