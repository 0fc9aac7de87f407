#include "noteweave/service/knowledge_service.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/config/config.hpp"
#include "noteweave/context/memory_url.hpp"
#include "noteweave/filter/ignore_policy.hpp"
#include "noteweave/markdown/frontmatter.hpp"
#include "noteweave/markdown/parser.hpp"
#include "noteweave/observability/factory.hpp"
#include "noteweave/observability/global.hpp"
#include "noteweave/permalink/permalink.hpp"

#include <algorithm>
#include <filesystem>

namespace noteweave::service {

namespace {

std::string clean_relative(std::string path) {
  path = common::trim(path);
  std::replace(path.begin(), path.end(), '\\', '/');
  while (!path.empty() && path.front() == '/') {
    path.erase(path.begin());
  }
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  return path;
}

common::Status not_found(const std::string &what) {
  return common::Status::error(common::ErrorCode::NotFound, what);
}

} // namespace

KnowledgeService::KnowledgeService(config::Config config) : config_(std::move(config)) {}

KnowledgeService::~KnowledgeService() { stop(); }

common::Result<std::unique_ptr<KnowledgeService>> KnowledgeService::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<std::unique_ptr<KnowledgeService>>::failure(loaded.status());
  }
  config::apply_env_overrides(loaded.value());

  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<KnowledgeService>>::failure(validated.status());
  }

  observability::set_global_observer(observability::create_observer(loaded.value()));
  for (const auto &warning : validated.value()) {
    observability::record_error("config", warning);
  }
  return common::Result<std::unique_ptr<KnowledgeService>>::success(
      std::make_unique<KnowledgeService>(std::move(loaded.value())));
}

common::Status KnowledgeService::start(const bool run_workers) {
  if (store_) {
    return common::Status::success();
  }

  auto store = std::make_unique<store::KnowledgeStore>(
      std::filesystem::path(config::expand_config_path(config_.store_path)));
  if (auto opened = store->open(); !opened.ok()) {
    return opened;
  }
  store_ = std::move(store);
  orchestrator_ = std::make_unique<sync::SyncOrchestrator>(*store_, config_.sync);
  context_ = std::make_unique<context::ContextBuilder>(*store_);
  run_workers_ = run_workers;

  for (const auto &configured : config_.projects) {
    auto existing = store_->find_project(configured.name);
    if (!existing.ok()) {
      return existing.status();
    }
    if (existing.value().has_value()) {
      continue;
    }
    const std::string root = config::expand_config_path(configured.path);
    if (auto dir = common::ensure_dir(root); !dir.ok()) {
      return dir.status();
    }
    auto added = store_->add_project(configured.name, root,
                                     configured.name == config_.default_project);
    if (!added.ok()) {
      return added.status();
    }
  }

  if (!config_.default_project.empty()) {
    auto preferred = store_->find_project(config_.default_project);
    if (!preferred.ok()) {
      return preferred.status();
    }
    if (preferred.value().has_value() && !preferred.value()->is_default) {
      if (auto status = store_->set_default_project(preferred.value()->id); !status.ok()) {
        return status;
      }
    }
  }

  auto projects = store_->list_projects();
  if (!projects.ok()) {
    return projects.status();
  }
  for (const auto &project : projects.value()) {
    orchestrator_->attach(project);
  }
  if (run_workers_) {
    orchestrator_->start_all();
  }
  return common::Status::success();
}

void KnowledgeService::stop() {
  if (orchestrator_) {
    orchestrator_->stop_all();
  }
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

bool KnowledgeService::is_project_name(const std::string &name) {
  auto found = store_->find_project(name);
  return found.ok() && found.value().has_value();
}

sync::ProjectSyncer &KnowledgeService::syncer_for(const store::Project &project) {
  if (auto *existing = orchestrator_->find(project.name); existing != nullptr) {
    return *existing;
  }
  return orchestrator_->attach(project);
}

common::Result<store::Project> KnowledgeService::add_project(const std::string &name,
                                                             const std::string &path,
                                                             const bool set_default) {
  if (!store_) {
    return common::Result<store::Project>::failure(common::ErrorCode::Store, "service not started");
  }
  const std::string root = config::expand_config_path(path);
  if (auto dir = common::ensure_dir(root); !dir.ok()) {
    return common::Result<store::Project>::failure(dir.status());
  }
  auto added = store_->add_project(name, root, set_default);
  if (!added.ok()) {
    return added;
  }
  orchestrator_->attach(added.value());
  if (run_workers_) {
    orchestrator_->start(added.value().name);
  }
  return added;
}

common::Status KnowledgeService::remove_project(const std::string &name) {
  if (!store_) {
    return common::Status::error(common::ErrorCode::Store, "service not started");
  }
  auto found = store_->find_project(name);
  if (!found.ok()) {
    return found.status();
  }
  if (!found.value().has_value()) {
    return not_found("unknown project: " + name);
  }
  orchestrator_->detach(found.value()->name);
  return store_->remove_project(found.value()->id);
}

common::Result<std::vector<store::Project>> KnowledgeService::list_projects() {
  if (!store_) {
    return common::Result<std::vector<store::Project>>::failure(common::ErrorCode::Store,
                                                                "service not started");
  }
  return store_->list_projects();
}

common::Status KnowledgeService::set_default_project(const std::string &name) {
  auto project = resolve_project(name);
  if (!project.ok()) {
    return project.status();
  }
  return store_->set_default_project(project.value().id);
}

common::Result<store::Project>
KnowledgeService::resolve_project(const std::optional<std::string> &name) {
  if (!store_) {
    return common::Result<store::Project>::failure(common::ErrorCode::Store, "service not started");
  }

  if (name.has_value() && !common::trim(*name).empty()) {
    auto found = store_->find_project(*name);
    if (!found.ok()) {
      return common::Result<store::Project>::failure(found.status());
    }
    if (!found.value().has_value()) {
      return common::Result<store::Project>::failure(not_found("unknown project: " + *name));
    }
    return common::Result<store::Project>::success(*found.value());
  }

  auto fallback = store_->default_project();
  if (!fallback.ok()) {
    return common::Result<store::Project>::failure(fallback.status());
  }
  if (!fallback.value().has_value()) {
    return common::Result<store::Project>::failure(not_found("no default project configured"));
  }
  return common::Result<store::Project>::success(*fallback.value());
}

common::Result<std::optional<store::Entity>>
KnowledgeService::lookup_entity(const store::Project &project, const std::string &reference) {
  auto resolved = store_->resolve_link(project.id, reference);
  if (!resolved.ok() || resolved.value().has_value()) {
    return resolved;
  }
  const std::string slug = permalink::slugify(reference, true);
  if (slug.empty() || slug == reference) {
    return resolved;
  }
  return store_->find_by_permalink(project.id, slug);
}

common::Result<KnowledgeService::Located>
KnowledgeService::locate(const std::string &identifier, const std::optional<std::string> &project) {
  std::optional<std::string> project_name = project;
  std::string reference = common::trim(identifier);

  if (common::starts_with(reference, context::kMemoryScheme)) {
    auto url = context::parse_memory_url(
        reference, [this](const std::string &name) { return is_project_name(name); });
    if (!url.ok()) {
      return common::Result<Located>::failure(url.status());
    }
    if (url.value().project.has_value()) {
      project_name = url.value().project;
    }
    reference = url.value().path;
  }
  if (reference.empty()) {
    return common::Result<Located>::failure(common::ErrorCode::InvalidArgument,
                                            "empty entity identifier");
  }

  auto resolved_project = resolve_project(project_name);
  if (!resolved_project.ok()) {
    return common::Result<Located>::failure(resolved_project.status());
  }
  auto entity = lookup_entity(resolved_project.value(), reference);
  if (!entity.ok()) {
    return common::Result<Located>::failure(entity.status());
  }
  if (!entity.value().has_value()) {
    return common::Result<Located>::failure(not_found("entity not found: " + identifier));
  }
  return common::Result<Located>::success(
      Located{.project = resolved_project.value(), .entity = *entity.value()});
}

common::Result<WriteResult> KnowledgeService::write_entity(const WriteRequest &request) {
  const std::string title = common::trim(request.title);
  if (title.empty()) {
    return common::Result<WriteResult>::failure(common::ErrorCode::InvalidArgument,
                                                "title must not be empty");
  }

  auto project = resolve_project(request.project);
  if (!project.ok()) {
    return common::Result<WriteResult>::failure(project.status());
  }
  const std::filesystem::path root = project.value().root_path;

  const std::string folder = clean_relative(request.folder);
  const std::string relative =
      (folder.empty() ? std::string() : folder + "/") + permalink::sanitize_filename(title) + ".md";
  const auto absolute = root / relative;
  if (!common::is_subpath(absolute, root) || !filter::should_index(relative)) {
    return common::Result<WriteResult>::failure(common::ErrorCode::InvalidArgument,
                                                "invalid folder: " + request.folder);
  }

  auto &syncer = syncer_for(project.value());
  auto lock = syncer.lock_apply();

  // Keys already in the file survive the rewrite; keys supplied with the content win.
  markdown::Frontmatter frontmatter;
  std::vector<markdown::ParseWarning> warnings;
  std::error_code ec;
  if (std::filesystem::exists(absolute, ec)) {
    auto current = common::read_file(absolute);
    if (!current.ok()) {
      return common::Result<WriteResult>::failure(current.status());
    }
    const auto split = markdown::split_frontmatter(current.value());
    if (split.frontmatter.has_value()) {
      frontmatter = markdown::parse_frontmatter(*split.frontmatter, split.frontmatter_line, warnings);
    }
  }

  std::string body = request.content;
  const auto supplied = markdown::split_frontmatter(request.content);
  if (supplied.frontmatter.has_value()) {
    const auto extra =
        markdown::parse_frontmatter(*supplied.frontmatter, supplied.frontmatter_line, warnings);
    for (const auto &[key, value] : extra.entries()) {
      frontmatter.set_value(key, value);
    }
    body = supplied.body;
  }

  frontmatter.set_scalar("title", title);
  if (request.entity_type.has_value() && !common::trim(*request.entity_type).empty()) {
    frontmatter.set_scalar("type", common::trim(*request.entity_type));
  } else if (!frontmatter.has("type")) {
    frontmatter.set_scalar("type", markdown::kDefaultEntityType);
  }
  if (!request.tags.empty()) {
    frontmatter.set_list("tags", markdown::normalize_tags(request.tags));
  }

  if (auto parent = common::ensure_dir(absolute.parent_path()); !parent.ok()) {
    return common::Result<WriteResult>::failure(parent.status());
  }
  if (auto written = common::write_file_atomic(absolute, markdown::render_document(frontmatter, body));
      !written.ok()) {
    return common::Result<WriteResult>::failure(written);
  }

  auto synced = syncer.sync_path_locked(relative);
  if (!synced.ok()) {
    return common::Result<WriteResult>::failure(synced.status());
  }
  if (!synced.value().entity.has_value()) {
    return common::Result<WriteResult>::failure(common::ErrorCode::Io,
                                                "note written but not indexed: " + relative);
  }

  WriteResult result;
  result.entity = *synced.value().entity;
  result.permalink = result.entity.permalink;
  result.memory_url = context::memory_url_for(project.value().permalink, result.permalink);
  result.created = synced.value().action == "created";
  return common::Result<WriteResult>::success(std::move(result));
}

common::Result<ReadResult> KnowledgeService::read_entity(const std::string &identifier,
                                                         const std::optional<std::string> &project) {
  auto located = locate(identifier, project);
  if (!located.ok()) {
    return common::Result<ReadResult>::failure(located.status());
  }

  const auto path = std::filesystem::path(located.value().project.root_path) /
                    located.value().entity.file_path;
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<ReadResult>::failure(content.status());
  }
  return common::Result<ReadResult>::success(
      ReadResult{.entity = located.value().entity, .content = std::move(content.value())});
}

common::Result<store::SearchPage> KnowledgeService::search(const SearchRequest &request) {
  auto project = resolve_project(request.project);
  if (!project.ok()) {
    return common::Result<store::SearchPage>::failure(project.status());
  }
  return store_->search(project.value().id, request.filters, request.pagination);
}

common::Result<context::GraphSnapshot> KnowledgeService::build_context(const ContextRequest &request) {
  if (!store_) {
    return common::Result<context::GraphSnapshot>::failure(common::ErrorCode::Store,
                                                           "service not started");
  }
  auto url = context::parse_memory_url(
      request.url, [this](const std::string &name) { return is_project_name(name); });
  if (!url.ok()) {
    return common::Result<context::GraphSnapshot>::failure(url.status());
  }

  auto project =
      resolve_project(url.value().project.has_value() ? url.value().project : request.project);
  if (!project.ok()) {
    return common::Result<context::GraphSnapshot>::failure(project.status());
  }

  context::ContextOptions options{.depth = request.depth,
                                  .timeframe = request.timeframe,
                                  .max_related = request.max_related,
                                  .pagination = request.pagination};
  return context_->build(project.value(), url.value().path, options);
}

common::Result<store::Entity> KnowledgeService::move_entity(const std::string &identifier,
                                                            const std::string &destination_path,
                                                            const std::optional<std::string> &project) {
  auto located = locate(identifier, project);
  if (!located.ok()) {
    return common::Result<store::Entity>::failure(located.status());
  }
  const store::Project &owner = located.value().project;
  const store::Entity &entity = located.value().entity;
  const std::filesystem::path root = owner.root_path;

  std::string destination = clean_relative(destination_path);
  if (destination.empty()) {
    return common::Result<store::Entity>::failure(common::ErrorCode::InvalidArgument,
                                                  "destination path must not be empty");
  }
  if (filter::is_markdown(entity.file_path) && !filter::is_markdown(destination)) {
    destination += ".md";
  }
  if (destination == entity.file_path) {
    return common::Result<store::Entity>::success(entity);
  }

  const auto from = root / entity.file_path;
  const auto to = root / destination;
  if (!common::is_subpath(to, root) || !filter::should_index(destination)) {
    return common::Result<store::Entity>::failure(common::ErrorCode::InvalidArgument,
                                                  "destination outside the project: " +
                                                      destination_path);
  }

  auto &syncer = syncer_for(owner);
  auto lock = syncer.lock_apply();

  std::error_code ec;
  if (std::filesystem::exists(to, ec)) {
    return common::Result<store::Entity>::failure(common::ErrorCode::Conflict,
                                                  "destination already exists: " + destination);
  }
  if (auto parent = common::ensure_dir(to.parent_path()); !parent.ok()) {
    return common::Result<store::Entity>::failure(parent.status());
  }
  std::filesystem::rename(from, to, ec);
  if (ec) {
    return common::Result<store::Entity>::failure(common::ErrorCode::Io,
                                                  "failed to move " + entity.file_path + ": " +
                                                      ec.message());
  }

  auto moved = syncer.move_path_locked(entity.file_path, destination);
  if (!moved.ok()) {
    return common::Result<store::Entity>::failure(moved.status());
  }
  if (!moved.value().entity.has_value()) {
    return common::Result<store::Entity>::failure(common::ErrorCode::Io,
                                                  "moved file not indexed: " + destination);
  }
  return common::Result<store::Entity>::success(*moved.value().entity);
}

common::Status KnowledgeService::delete_entity(const std::string &identifier,
                                               const std::optional<std::string> &project) {
  auto located = locate(identifier, project);
  if (!located.ok()) {
    return located.status();
  }
  const auto path =
      std::filesystem::path(located.value().project.root_path) / located.value().entity.file_path;

  auto &syncer = syncer_for(located.value().project);
  auto lock = syncer.lock_apply();

  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::Io,
                                 "failed to delete " + path.string() + ": " + ec.message());
  }
  auto removed = syncer.delete_path_locked(located.value().entity.file_path);
  if (!removed.ok()) {
    return removed.status();
  }
  return common::Status::success();
}

common::Result<sync::ProjectSyncStatus>
KnowledgeService::sync_status(const std::optional<std::string> &project) {
  auto resolved = resolve_project(project);
  if (!resolved.ok()) {
    return common::Result<sync::ProjectSyncStatus>::failure(resolved.status());
  }
  auto status = orchestrator_->status().get(resolved.value().name);
  if (!status.has_value()) {
    return common::Result<sync::ProjectSyncStatus>::failure(
        not_found("no sync status for project " + resolved.value().name));
  }
  return common::Result<sync::ProjectSyncStatus>::success(std::move(*status));
}

std::string KnowledgeService::sync_summary() {
  if (!orchestrator_) {
    return "not started";
  }
  return orchestrator_->status().summary();
}

common::Result<sync::SyncReport>
KnowledgeService::sync_project(const std::optional<std::string> &project) {
  auto resolved = resolve_project(project);
  if (!resolved.ok()) {
    return common::Result<sync::SyncReport>::failure(resolved.status());
  }
  return syncer_for(resolved.value()).full_scan();
}

common::Status KnowledgeService::reset_project(const std::optional<std::string> &project) {
  auto resolved = resolve_project(project);
  if (!resolved.ok()) {
    return resolved.status();
  }
  auto &syncer = syncer_for(resolved.value());
  {
    auto lock = syncer.lock_apply();
    if (auto rebuilt = store_->rebuild_search_index(resolved.value().id); !rebuilt.ok()) {
      return rebuilt;
    }
  }
  return syncer.reset();
}

} // namespace noteweave::service
