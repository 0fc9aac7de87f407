#include "noteweave/context/context_builder.hpp"

#include "noteweave/common/time.hpp"
#include "noteweave/permalink/permalink.hpp"

#include <map>
#include <set>
#include <unordered_map>

namespace noteweave::context {

std::string observation_permalink(const std::string &entity_permalink,
                                  const store::Observation &observation) {
  std::string content = permalink::slugify(observation.content);
  if (content.empty()) {
    content = std::to_string(observation.id);
  }
  return entity_permalink + "/observations/" + permalink::slugify(observation.category) + "/" +
         content;
}

std::string relation_permalink(const std::string &from_permalink, const store::Relation &relation,
                               const std::optional<std::string> &to_permalink) {
  const std::string target =
      to_permalink.has_value() ? *to_permalink : permalink::slugify(relation.target_title);
  return from_permalink + "/" + permalink::slugify(relation.relation_type) + "/" + target;
}

ContextBuilder::ContextBuilder(store::KnowledgeStore &store) : store_(store) {}

common::Result<std::vector<store::Entity>>
ContextBuilder::find_primary(const store::Project &project, const std::string &reference,
                             const store::Pagination &pagination, bool &has_more) {
  has_more = false;
  if (reference.find('*') != std::string::npos) {
    const std::size_t size = pagination.size();
    const store::Pagination exact{.page = pagination.number(), .page_size = size};
    auto page = store_.find_by_pattern(project.id, reference, exact);
    if (!page.ok()) {
      return page;
    }
    const store::Pagination next{.page = exact.page + 1, .page_size = size};
    auto after = store_.find_by_pattern(project.id, reference, next);
    if (!after.ok()) {
      return after;
    }
    has_more = !after.value().empty();
    return page;
  }

  std::vector<store::Entity> found;
  auto resolved = store_.resolve_link(project.id, reference);
  if (!resolved.ok()) {
    return common::Result<std::vector<store::Entity>>::failure(resolved.status());
  }
  if (!resolved.value().has_value()) {
    const std::string slug = permalink::slugify(reference, true);
    if (!slug.empty() && slug != reference) {
      resolved = store_.find_by_permalink(project.id, slug);
      if (!resolved.ok()) {
        return common::Result<std::vector<store::Entity>>::failure(resolved.status());
      }
    }
  }
  if (resolved.value().has_value() && pagination.offset() == 0) {
    found.push_back(*resolved.value());
  }
  return common::Result<std::vector<store::Entity>>::success(std::move(found));
}

common::Result<GraphSnapshot> ContextBuilder::build(const store::Project &project,
                                                    const std::string &reference,
                                                    const ContextOptions &options) {
  std::optional<std::string> cutoff;
  if (options.timeframe.has_value() && !options.timeframe->empty()) {
    auto since = common::parse_timeframe(*options.timeframe);
    if (!since.ok()) {
      return common::Result<GraphSnapshot>::failure(since.status());
    }
    cutoff = common::format_rfc3339(since.value());
  }

  GraphSnapshot snapshot;
  snapshot.metadata.reference = reference;
  snapshot.metadata.depth = options.depth;
  snapshot.metadata.timeframe = options.timeframe;
  snapshot.metadata.generated_at = common::now_rfc3339();

  bool has_more = false;
  auto primaries = find_primary(project, reference, options.pagination, has_more);
  if (!primaries.ok()) {
    return common::Result<GraphSnapshot>::failure(primaries.status());
  }
  snapshot.metadata.has_more = has_more;

  std::unordered_map<store::EntityId, std::string> included;
  std::set<store::EntityId> visited;
  std::vector<store::EntityId> frontier;
  for (const auto &entity : primaries.value()) {
    if (!visited.insert(entity.id).second) {
      continue;
    }
    auto observations = store_.observations_for(project.id, entity.id);
    if (!observations.ok()) {
      return common::Result<GraphSnapshot>::failure(observations.status());
    }
    ContextEntity primary{.entity = entity};
    for (const auto &observation : observations.value()) {
      primary.observations.push_back(ContextObservation{
          .observation = observation,
          .permalink = observation_permalink(entity.permalink, observation)});
    }
    included.emplace(entity.id, entity.permalink);
    frontier.push_back(entity.id);
    snapshot.primary.push_back(std::move(primary));
  }

  std::map<std::int64_t, store::Relation> seen_relations;
  for (std::size_t level = 1; level <= options.depth && !frontier.empty(); ++level) {
    std::vector<store::EntityId> next;
    for (const store::EntityId current : frontier) {
      std::vector<store::Relation> relations;
      for (auto fetch : {&store::KnowledgeStore::relations_from, &store::KnowledgeStore::relations_to}) {
        auto edges = (store_.*fetch)(project.id, current);
        if (!edges.ok()) {
          return common::Result<GraphSnapshot>::failure(edges.status());
        }
        relations.insert(relations.end(), edges.value().begin(), edges.value().end());
      }

      for (const auto &relation : relations) {
        seen_relations.emplace(relation.id, relation);
        if (relation.dangling()) {
          continue;
        }
        const store::EntityId neighbor =
            relation.from_entity_id == current ? *relation.to_entity_id : relation.from_entity_id;
        if (visited.contains(neighbor)) {
          continue;
        }
        if (snapshot.related.size() >= options.max_related) {
          continue;
        }

        auto loaded = store_.get_entity(project.id, neighbor);
        if (!loaded.ok()) {
          return common::Result<GraphSnapshot>::failure(loaded.status());
        }
        visited.insert(neighbor);
        if (!loaded.value().has_value()) {
          continue;
        }
        const store::Entity &entity = *loaded.value();
        // Out-of-window nodes are neither reported nor expanded.
        if (cutoff.has_value() && entity.updated_at < *cutoff) {
          continue;
        }

        included.emplace(entity.id, entity.permalink);
        snapshot.related.push_back(RelatedEntity{.entity = entity,
                                                 .depth = level,
                                                 .via = current,
                                                 .relation_type = relation.relation_type});
        next.push_back(neighbor);
      }
    }
    frontier = std::move(next);
  }

  for (const auto &[id, relation] : seen_relations) {
    const auto from = included.find(relation.from_entity_id);
    if (from == included.end()) {
      continue;
    }
    std::optional<std::string> to_permalink;
    if (relation.to_entity_id.has_value()) {
      const auto to = included.find(*relation.to_entity_id);
      if (to == included.end()) {
        continue;
      }
      to_permalink = to->second;
    }
    snapshot.edges.push_back(ContextEdge{
        .relation = relation,
        .permalink = relation_permalink(from->second, relation, to_permalink),
        .from_permalink = from->second,
        .to_permalink = to_permalink});
  }

  snapshot.metadata.primary_count = snapshot.primary.size();
  snapshot.metadata.related_count = snapshot.related.size();
  return common::Result<GraphSnapshot>::success(std::move(snapshot));
}

} // namespace noteweave::context
