#pragma once

#include "noteweave/common/result.hpp"
#include "noteweave/store/knowledge_store.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace noteweave::context {

struct ContextOptions {
  std::size_t depth = 1;
  // Recency filter for related nodes, e.g. "7d" or "2024-01-15".
  std::optional<std::string> timeframe;
  std::size_t max_related = 10;
  store::Pagination pagination;
};

struct ContextObservation {
  store::Observation observation;
  std::string permalink;
};

struct ContextEntity {
  store::Entity entity;
  std::vector<ContextObservation> observations;
};

struct RelatedEntity {
  store::Entity entity;
  std::size_t depth = 1;
  store::EntityId via = 0;
  std::string relation_type;
};

struct ContextEdge {
  store::Relation relation;
  std::string permalink;
  std::string from_permalink;
  std::optional<std::string> to_permalink;
};

struct ContextMetadata {
  std::string reference;
  std::size_t depth = 1;
  std::optional<std::string> timeframe;
  std::size_t primary_count = 0;
  std::size_t related_count = 0;
  bool has_more = false;
  std::string generated_at;
};

struct GraphSnapshot {
  std::vector<ContextEntity> primary;
  std::vector<RelatedEntity> related;
  std::vector<ContextEdge> edges;
  ContextMetadata metadata;
};

/// Synthetic permalink of an observation: <entity>/observations/<category>/<content>.
[[nodiscard]] std::string observation_permalink(const std::string &entity_permalink,
                                                const store::Observation &observation);

/// Synthetic permalink of a relation: <from>/<relation_type>/<to>.
[[nodiscard]] std::string relation_permalink(const std::string &from_permalink,
                                             const store::Relation &relation,
                                             const std::optional<std::string> &to_permalink);

/// Read-only breadth-first walk over the relation graph of one project.
class ContextBuilder {
public:
  explicit ContextBuilder(store::KnowledgeStore &store);

  /// `reference` is a project-relative permalink, title, file path or glob.
  [[nodiscard]] common::Result<GraphSnapshot> build(const store::Project &project,
                                                    const std::string &reference,
                                                    const ContextOptions &options);

  /// Primary matches for a reference, one page at a time.
  [[nodiscard]] common::Result<std::vector<store::Entity>>
  find_primary(const store::Project &project, const std::string &reference,
               const store::Pagination &pagination, bool &has_more);

private:
  store::KnowledgeStore &store_;
};

} // namespace noteweave::context
