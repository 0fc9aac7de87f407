#pragma once

#include "noteweave/common/result.hpp"
#include "noteweave/store/types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <vector>

namespace noteweave::store {

/// SQLite-backed graph store. One write connection, serialized by a mutex and
/// by IMMEDIATE transactions, and one read connection that WAL lets run
/// alongside writes. Every call is scoped by an explicit project id.
class KnowledgeStore {
public:
  explicit KnowledgeStore(std::filesystem::path db_path);
  ~KnowledgeStore();

  KnowledgeStore(const KnowledgeStore &) = delete;
  KnowledgeStore &operator=(const KnowledgeStore &) = delete;

  [[nodiscard]] common::Status open();
  [[nodiscard]] bool health_check();
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  // Projects
  [[nodiscard]] common::Result<Project> add_project(const std::string &name,
                                                    const std::string &root_path,
                                                    bool set_default);
  [[nodiscard]] common::Status remove_project(ProjectId project_id);
  [[nodiscard]] common::Result<std::vector<Project>> list_projects();
  [[nodiscard]] common::Result<std::optional<Project>> find_project(const std::string &name);
  [[nodiscard]] common::Result<std::optional<Project>> default_project();
  [[nodiscard]] common::Status set_default_project(ProjectId project_id);

  // Writes
  [[nodiscard]] common::Result<UpsertOutcome> upsert_entity(ProjectId project_id,
                                                            const EntityDraft &draft);
  [[nodiscard]] common::Status delete_entity(ProjectId project_id, EntityId entity_id);
  [[nodiscard]] common::Result<bool> delete_entity_by_path(ProjectId project_id,
                                                           const std::string &file_path);
  /// Changes only file_path, plus the permalink when `regenerate_permalink` is set.
  [[nodiscard]] common::Result<Entity> move_entity(ProjectId project_id, EntityId entity_id,
                                                   const std::string &new_file_path,
                                                   bool regenerate_permalink);
  /// Re-links dangling relations whose target now exists. Returns the count.
  [[nodiscard]] common::Result<std::size_t> resolve_relations(ProjectId project_id);
  [[nodiscard]] common::Status rebuild_search_index(ProjectId project_id);

  // Reads
  [[nodiscard]] common::Result<std::optional<Entity>> get_entity(ProjectId project_id,
                                                                 EntityId entity_id);
  [[nodiscard]] common::Result<std::optional<Entity>> find_by_permalink(ProjectId project_id,
                                                                        const std::string &permalink);
  [[nodiscard]] common::Result<std::optional<Entity>> find_by_path(ProjectId project_id,
                                                                   const std::string &file_path);
  /// Link lookup: permalink, then title, then file path, then file path + ".md".
  [[nodiscard]] common::Result<std::optional<Entity>> resolve_link(ProjectId project_id,
                                                                   const std::string &target);
  [[nodiscard]] common::Result<std::vector<Entity>>
  find_by_pattern(ProjectId project_id, const std::string &glob, const Pagination &pagination);
  // Unknown ids yield empty lists; ids owned by another project fail with CrossProject.
  [[nodiscard]] common::Result<std::vector<Observation>> observations_for(ProjectId project_id,
                                                                          EntityId entity_id);
  [[nodiscard]] common::Result<std::vector<Relation>> relations_from(ProjectId project_id,
                                                                     EntityId entity_id);
  [[nodiscard]] common::Result<std::vector<Relation>> relations_to(ProjectId project_id,
                                                                   EntityId entity_id);
  [[nodiscard]] common::Result<std::vector<Relation>> dangling_relations(ProjectId project_id);
  [[nodiscard]] common::Result<std::vector<FileState>> file_states(ProjectId project_id);
  [[nodiscard]] common::Result<std::size_t> count_entities(ProjectId project_id);
  [[nodiscard]] common::Result<SearchPage> search(ProjectId project_id,
                                                  const SearchFilters &filters,
                                                  const Pagination &pagination);

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::optional<Entity>>
  find_one(sqlite3 *db, const char *sql, ProjectId project_id, const std::string &value);
  [[nodiscard]] common::Result<std::optional<Entity>>
  resolve_link_on(sqlite3 *db, ProjectId project_id, const std::string &target);
  [[nodiscard]] common::Status ensure_project(sqlite3 *db, ProjectId project_id);
  [[nodiscard]] common::Status reject_foreign_entity(sqlite3 *db, ProjectId project_id,
                                                     EntityId entity_id);
  [[nodiscard]] common::Status refresh_search_entry(EntityId entity_id);
  [[nodiscard]] common::Result<std::size_t> resolve_inbound(const Entity &entity);
  [[nodiscard]] common::Result<SearchPage> search_like(ProjectId project_id,
                                                       const SearchFilters &filters,
                                                       const Pagination &pagination);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  sqlite3 *read_db_ = nullptr;
  std::mutex write_mutex_;
  std::mutex read_mutex_;
};

} // namespace noteweave::store
