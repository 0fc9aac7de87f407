#pragma once

#include "noteweave/markdown/parser.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace noteweave::store {

using ProjectId = std::int64_t;
using EntityId = std::int64_t;

struct Project {
  ProjectId id = 0;
  std::string name;
  std::string permalink;
  std::string root_path;
  bool is_default = false;
  std::string created_at;
};

struct Entity {
  EntityId id = 0;
  ProjectId project_id = 0;
  std::string title;
  std::string permalink;
  std::string file_path;
  std::string entity_type = markdown::kDefaultEntityType;
  std::string content_type = "text/markdown";
  std::string checksum;
  std::string frontmatter;
  std::vector<std::string> tags;
  std::int64_t mtime = 0;
  std::int64_t size = 0;
  std::string created_at;
  std::string updated_at;
};

struct Observation {
  std::int64_t id = 0;
  EntityId entity_id = 0;
  std::string category = markdown::kDefaultCategory;
  std::string content;
  std::vector<std::string> tags;
  std::optional<std::string> context;
};

struct Relation {
  std::int64_t id = 0;
  ProjectId project_id = 0;
  EntityId from_entity_id = 0;
  std::optional<EntityId> to_entity_id;
  std::string target_title;
  std::string relation_type;
  std::optional<std::string> context;

  [[nodiscard]] bool dangling() const { return !to_entity_id.has_value(); }
};

/// Everything upsert_entity needs to write one file's graph fragment.
struct EntityDraft {
  std::string file_path;
  std::string title;
  // Explicit permalink from frontmatter, if any.
  std::optional<std::string> permalink;
  std::string entity_type = markdown::kDefaultEntityType;
  std::string content_type = "text/markdown";
  std::string checksum;
  std::string frontmatter;
  std::vector<std::string> tags;
  std::string body;
  std::int64_t mtime = 0;
  std::int64_t size = 0;
  std::vector<markdown::ParsedObservation> observations;
  std::vector<markdown::ParsedRelation> relations;
};

struct UpsertOutcome {
  Entity entity;
  bool created = false;
  std::size_t inbound_resolved = 0;
};

/// Indexed state of one file, used to diff a scan against the store.
struct FileState {
  EntityId id = 0;
  std::string file_path;
  std::string checksum;
  std::int64_t mtime = 0;
  std::int64_t size = 0;
};

struct Pagination {
  std::size_t page = 1;
  std::size_t page_size = 10;

  // Page 0 reads as page 1 and page_size 0 as the default of 10.
  [[nodiscard]] std::size_t number() const { return page == 0 ? 1 : page; }
  [[nodiscard]] std::size_t size() const { return page_size == 0 ? 10 : page_size; }
  [[nodiscard]] std::size_t offset() const { return (number() - 1) * size(); }
};

struct SearchFilters {
  std::string text;
  std::vector<std::string> entity_types;
  std::vector<std::string> tags;
  std::optional<std::string> after_date;
  std::optional<std::string> permalink_glob;
  std::optional<std::string> folder;
};

struct SearchResult {
  Entity entity;
  double score = 0.0;
  std::string snippet;
};

struct SearchPage {
  std::vector<SearchResult> results;
  std::size_t page = 1;
  std::size_t page_size = 10;
  bool has_more = false;
};

} // namespace noteweave::store
