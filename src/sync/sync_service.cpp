#include "noteweave/sync/sync_service.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/common/hash.hpp"
#include "noteweave/filter/ignore_policy.hpp"
#include "noteweave/observability/global.hpp"
#include "noteweave/permalink/permalink.hpp"
#include "noteweave/sync/scanner.hpp"

#include <algorithm>
#include <unordered_map>

namespace noteweave::sync {

namespace {

constexpr const char *kActionCreated = "created";
constexpr const char *kActionModified = "modified";
constexpr const char *kActionDeleted = "deleted";
constexpr const char *kActionMoved = "moved";
constexpr const char *kActionSkipped = "skipped";
constexpr const char *kActionFailed = "failed";

constexpr std::chrono::milliseconds kQueuePoll{100};

FileOutcome outcome(const char *action, std::optional<store::Entity> entity = std::nullopt) {
  return FileOutcome{.action = action, .entity = std::move(entity)};
}

store::EntityDraft file_draft(const std::string &relative_path) {
  const std::string name = std::filesystem::path(relative_path).filename().string();
  store::EntityDraft draft;
  draft.file_path = relative_path;
  draft.title = name;
  draft.permalink = permalink::permalink_for_path(name);
  draft.entity_type = kFileEntityType;
  draft.content_type = guess_content_type(relative_path);
  return draft;
}

} // namespace

std::string guess_content_type(const std::string &relative_path) {
  static const std::unordered_map<std::string, std::string> types = {
      {".md", "text/markdown"},     {".markdown", "text/markdown"},
      {".txt", "text/plain"},       {".csv", "text/csv"},
      {".json", "application/json"}, {".pdf", "application/pdf"},
      {".png", "image/png"},        {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},      {".gif", "image/gif"},
      {".svg", "image/svg+xml"},    {".webp", "image/webp"},
      {".html", "text/html"},       {".yaml", "application/yaml"},
      {".yml", "application/yaml"}, {".zip", "application/zip"},
  };
  const auto ext = common::to_lower(std::filesystem::path(relative_path).extension().string());
  const auto it = types.find(ext);
  return it == types.end() ? "application/octet-stream" : it->second;
}

DraftBuild build_draft(const std::string &relative_path, const std::string &bytes) {
  DraftBuild build;
  if (!filter::is_markdown(relative_path)) {
    build.draft = file_draft(relative_path);
    return build;
  }

  const std::string stem = std::filesystem::path(relative_path).stem().string();
  auto parsed = markdown::parse(bytes, stem);
  if (!parsed.ok()) {
    build.draft = file_draft(relative_path);
    build.degraded = true;
    build.warnings.push_back(markdown::ParseWarning{.line = 0, .message = parsed.error()});
    return build;
  }

  auto &note = parsed.value();
  auto &draft = build.draft;
  draft.file_path = relative_path;
  draft.title = note.title;
  draft.permalink = note.permalink;
  draft.entity_type = note.entity_type;
  draft.content_type = "text/markdown";
  draft.tags = note.tags;
  if (note.has_frontmatter) {
    draft.frontmatter = markdown::render_frontmatter(note.frontmatter);
  }
  draft.body = note.body;
  draft.observations = std::move(note.observations);
  draft.relations = std::move(note.relations);
  build.degraded = note.degraded();
  build.warnings = std::move(note.warnings);
  return build;
}

ProjectSyncer::ProjectSyncer(store::KnowledgeStore &store, store::Project project,
                             config::SyncConfig config, SyncStatusTracker &status)
    : store_(store), project_(std::move(project)),
      root_(common::expand_path(project_.root_path)), config_(config), status_(status),
      queue_(config.queue_capacity) {
  status_.register_project(project_.name);
}

ProjectSyncer::~ProjectSyncer() { stop(); }

void ProjectSyncer::start(const bool watch) {
  if (running_) {
    return;
  }
  running_ = true;
  queue_.reopen();
  thread_ = std::thread([this, watch]() { run_loop(watch); });
}

void ProjectSyncer::stop() {
  running_ = false;
  queue_.close();
  if (thread_.joinable()) {
    thread_.join();
  }
  // The worker owns the watcher until it exits.
  if (watcher_) {
    watcher_->stop();
  }
  watcher_.reset();
  watching_ = false;
}

bool ProjectSyncer::is_running() const { return running_; }

SyncState ProjectSyncer::state() const {
  const auto status = status_.get(project_.name);
  return status.has_value() ? status->state : SyncState::Idle;
}

void ProjectSyncer::enqueue(ChangeEvent event) {
  if (!queue_.push(std::move(event))) {
    observability::record_queue_depth(project_.name, queue_.size());
  }
}

common::Status ProjectSyncer::reset() {
  auto lock = lock_apply();
  if (!halted_) {
    return common::Status::success();
  }
  halted_ = false;
  status_.set_state(project_.name, SyncState::Idle);
  rescan_requested_ = true;
  return common::Status::success();
}

std::unique_lock<std::mutex> ProjectSyncer::lock_apply() {
  return std::unique_lock<std::mutex>(apply_mutex_);
}

void ProjectSyncer::run_loop(const bool watch) {
  if (auto initial = full_scan(); !initial.ok()) {
    observability::record_error("sync", project_.name + ": initial scan failed: " +
                                            initial.error());
  }

  if (watch && running_) {
    watcher_ = std::make_unique<FileWatcher>(
        project_.name, root_,
        WatcherOptions{.debounce = std::chrono::milliseconds(config_.debounce_ms)},
        [this](ChangeEvent event) { enqueue(std::move(event)); });
    if (auto started = watcher_->start(); !started.ok()) {
      observability::record_error("sync", project_.name + ": " + started.error());
      watcher_.reset();
    } else {
      watching_ = true;
    }
  }
  {
    auto lock = lock_apply();
    settle_state();
  }

  while (running_) {
    auto events = queue_.pop_batch(kQueuePoll);
    if (!running_) {
      break;
    }

    if (queue_.take_overflow()) {
      observability::record_watch_overflow(project_.name, "event queue full");
      queue_.clear();
      events.clear();
      rescan_requested_ = true;
    }
    if (halted_) {
      continue;
    }

    if (!events.empty()) {
      observability::record_queue_depth(project_.name, events.size());
      if (auto applied = apply_events(events); !applied.ok()) {
        observability::record_error("sync", project_.name + ": " + applied.error());
      }
    }
    if (rescan_requested_.exchange(false)) {
      if (auto rescanned = full_scan(); !rescanned.ok()) {
        observability::record_error("sync", project_.name + ": rescan failed: " +
                                                rescanned.error());
      }
    }
  }
}

void ProjectSyncer::settle_state() {
  if (halted_) {
    return;
  }
  status_.set_state(project_.name, watching_ ? SyncState::Watching : SyncState::Idle);
}

common::Status ProjectSyncer::halted_error() const {
  return common::Status::error(common::ErrorCode::Store,
                               "sync halted for project " + project_.name + "; reset required");
}

common::Status ProjectSyncer::halt_if_fatal(const common::Status &status) {
  if (status.code() == common::ErrorCode::Store) {
    halted_ = true;
    status_.set_error(project_.name, status.error());
    observability::record_error("sync", project_.name + ": " + status.error());
  }
  return status;
}

common::Result<SyncReport> ProjectSyncer::full_scan() {
  auto lock = lock_apply();
  auto report = scan_locked();
  settle_state();
  return report;
}

common::Result<SyncReport> ProjectSyncer::scan_locked() {
  if (halted_) {
    return common::Result<SyncReport>::failure(halted_error());
  }

  const auto started = std::chrono::steady_clock::now();
  status_.set_state(project_.name, SyncState::Scanning);
  observability::record_sync_start(project_.name, true);

  auto known = store_.file_states(project_.id);
  if (!known.ok()) {
    return common::Result<SyncReport>::failure(halt_if_fatal(known.status()));
  }

  auto scan = scan_directory(root_, known.value());
  if (!scan.ok()) {
    observability::record_error("sync", project_.name + ": " + scan.error());
    return common::Result<SyncReport>::failure(scan.status());
  }

  SyncReport report;
  for (const auto &path : scan.value().failed) {
    ++report.failed;
    status_.add_failed(project_.name, path);
  }

  const ScanDiff diff = diff_scan(scan.value(), known.value());

  struct Step {
    ChangeKind kind;
    std::string path;
    std::string old_path;
  };
  std::vector<Step> steps;
  steps.reserve(diff.moves.size() + diff.deleted.size() + diff.created.size() +
                diff.modified.size());
  for (const auto &move : diff.moves) {
    steps.push_back({ChangeKind::Moved, move.to.path, move.from});
  }
  for (const auto &state : diff.deleted) {
    steps.push_back({ChangeKind::Deleted, state.file_path, {}});
  }
  for (const auto &file : diff.created) {
    steps.push_back({ChangeKind::Created, file.path, {}});
  }
  for (const auto &file : diff.modified) {
    steps.push_back({ChangeKind::Modified, file.path, {}});
  }

  status_.set_state(project_.name, SyncState::Applying);
  status_.set_progress(project_.name, steps.size(), 0);

  const std::size_t batch = std::max<std::size_t>(1, config_.scan_batch_size);
  const auto budget = std::chrono::milliseconds(config_.max_scan_duration_ms);
  std::size_t processed = 0;
  for (const auto &step : steps) {
    common::Result<FileOutcome> applied = common::Result<FileOutcome>::failure("unreachable");
    switch (step.kind) {
    case ChangeKind::Moved:
      applied = apply_move(step.old_path, step.path, report);
      break;
    case ChangeKind::Deleted:
      applied = apply_delete(step.path, report);
      break;
    default:
      applied = apply_file(step.path, report);
      break;
    }
    if (!applied.ok() && halted_) {
      return common::Result<SyncReport>::failure(applied.status());
    }

    ++processed;
    if (processed % batch == 0) {
      status_.set_progress(project_.name, steps.size(), processed);
      if (budget.count() > 0 && std::chrono::steady_clock::now() - started >= budget) {
        // Yield; the remainder is picked up by the queued rescan.
        rescan_requested_ = true;
        break;
      }
    }
  }
  status_.set_progress(project_.name, steps.size(), processed);

  auto resolved = store_.resolve_relations(project_.id);
  if (!resolved.ok()) {
    return common::Result<SyncReport>::failure(halt_if_fatal(resolved.status()));
  }

  const auto duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  status_.record_report(project_.name, report);
  observability::record_event(observability::SyncEndEvent{.project = project_.name,
                                                          .duration = duration,
                                                          .created = report.created,
                                                          .modified = report.modified,
                                                          .deleted = report.deleted,
                                                          .moved = report.moved});
  observability::record_metric(
      observability::SyncDurationMetric{.project = project_.name, .duration = duration});
  if (auto count = store_.count_entities(project_.id); count.ok()) {
    observability::record_metric(
        observability::IndexedEntitiesMetric{.project = project_.name, .count = count.value()});
  }
  return common::Result<SyncReport>::success(report);
}

common::Result<SyncReport> ProjectSyncer::apply_events(const std::vector<ChangeEvent> &events) {
  auto lock = lock_apply();
  auto report = apply_events_locked(events);
  settle_state();
  return report;
}

common::Result<SyncReport> ProjectSyncer::apply_events_locked(std::vector<ChangeEvent> events) {
  if (halted_) {
    return common::Result<SyncReport>::failure(halted_error());
  }

  status_.set_state(project_.name, SyncState::Applying);
  observability::record_sync_start(project_.name, false);

  SyncReport report;
  for (const auto &event : pair_moves(std::move(events))) {
    common::Result<FileOutcome> applied = common::Result<FileOutcome>::failure("unreachable");
    switch (event.kind) {
    case ChangeKind::Rescan:
      rescan_requested_ = true;
      continue;
    case ChangeKind::Moved:
      applied = apply_move(event.old_path, event.path, report);
      break;
    case ChangeKind::Deleted: {
      std::error_code ec;
      applied = std::filesystem::exists(root_ / event.path, ec) ? apply_file(event.path, report)
                                                                 : apply_delete(event.path, report);
      break;
    }
    case ChangeKind::Created:
    case ChangeKind::Modified:
      applied = apply_file(event.path, report);
      break;
    }
    if (!applied.ok() && halted_) {
      return common::Result<SyncReport>::failure(applied.status());
    }
  }

  auto resolved = store_.resolve_relations(project_.id);
  if (!resolved.ok()) {
    return common::Result<SyncReport>::failure(halt_if_fatal(resolved.status()));
  }
  return common::Result<SyncReport>::success(report);
}

// A delete and a create in one batch with identical content are a move that
// the kernel reported as two unrelated events (e.g. across watch roots).
std::vector<ChangeEvent> ProjectSyncer::pair_moves(std::vector<ChangeEvent> events) {
  std::vector<std::size_t> deletions;
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (events[i].kind == ChangeKind::Deleted) {
      deletions.push_back(i);
    }
  }
  if (deletions.empty()) {
    return events;
  }

  std::unordered_map<std::string, std::size_t> deleted_by_checksum;
  for (const std::size_t index : deletions) {
    std::error_code ec;
    if (std::filesystem::exists(root_ / events[index].path, ec)) {
      continue;
    }
    auto indexed = store_.find_by_path(project_.id, events[index].path);
    if (indexed.ok() && indexed.value().has_value()) {
      deleted_by_checksum.emplace(indexed.value()->checksum, index);
    }
  }

  std::vector<bool> dropped(events.size(), false);
  for (auto &event : events) {
    if (event.kind != ChangeKind::Created || deleted_by_checksum.empty()) {
      continue;
    }
    auto known = store_.find_by_path(project_.id, event.path);
    if (!known.ok() || known.value().has_value()) {
      continue;
    }
    auto checksum = common::sha256_file(root_ / event.path);
    if (!checksum.ok()) {
      continue;
    }
    const auto match = deleted_by_checksum.find(checksum.value());
    if (match == deleted_by_checksum.end()) {
      continue;
    }
    event.kind = ChangeKind::Moved;
    event.old_path = events[match->second].path;
    dropped[match->second] = true;
    deleted_by_checksum.erase(match);
  }

  std::vector<ChangeEvent> out;
  out.reserve(events.size());
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (!dropped[i]) {
      out.push_back(std::move(events[i]));
    }
  }
  return out;
}

common::Result<FileOutcome> ProjectSyncer::apply_file(const std::string &relative,
                                                      SyncReport &report) {
  if (!filter::should_index(relative)) {
    ++report.skipped;
    return common::Result<FileOutcome>::success(outcome(kActionSkipped));
  }

  const auto absolute = root_ / relative;
  auto bytes = common::read_file_with_retry(absolute, config_.io_retries,
                                            std::chrono::milliseconds(config_.io_backoff_ms));
  if (!bytes.ok()) {
    if (bytes.code() == common::ErrorCode::NotFound) {
      return apply_delete(relative, report);
    }
    ++report.failed;
    status_.add_failed(project_.name, relative);
    observability::record_error("sync", project_.name + ": " + relative +
                                            " failed pending rescan: " + bytes.error());
    return common::Result<FileOutcome>::success(outcome(kActionFailed));
  }

  const std::string checksum = common::sha256_hex(bytes.value());
  auto existing = store_.find_by_path(project_.id, relative);
  if (!existing.ok()) {
    return common::Result<FileOutcome>::failure(halt_if_fatal(existing.status()));
  }
  if (existing.value().has_value() && existing.value()->checksum == checksum) {
    ++report.skipped;
    status_.clear_failed(project_.name, relative);
    return common::Result<FileOutcome>::success(outcome(kActionSkipped, existing.value()));
  }

  DraftBuild build = build_draft(relative, bytes.value());
  build.draft.checksum = checksum;
  build.draft.mtime = file_mtime(absolute);
  build.draft.size = static_cast<std::int64_t>(bytes.value().size());
  for (const auto &warning : build.warnings) {
    observability::record_parse_warning(project_.name, relative, warning.line, warning.message);
  }

  auto upserted = store_.upsert_entity(project_.id, build.draft);
  if (!upserted.ok()) {
    if (halt_if_fatal(upserted.status()).code() == common::ErrorCode::Store) {
      return common::Result<FileOutcome>::failure(upserted.status());
    }
    ++report.failed;
    status_.add_failed(project_.name, relative);
    observability::record_error("sync", project_.name + ": " + relative + ": " +
                                            upserted.error());
    return common::Result<FileOutcome>::success(outcome(kActionFailed));
  }

  if (build.degraded) {
    ++report.degraded;
  }
  const bool created = upserted.value().created;
  if (created) {
    ++report.created;
  } else {
    ++report.modified;
  }
  status_.clear_failed(project_.name, relative);
  const char *action = created ? kActionCreated : kActionModified;
  observability::record_file_synced(project_.name, relative, action);
  return common::Result<FileOutcome>::success(outcome(action, upserted.value().entity));
}

common::Result<FileOutcome> ProjectSyncer::apply_move(const std::string &from,
                                                      const std::string &to, SyncReport &report) {
  auto source = store_.find_by_path(project_.id, from);
  if (!source.ok()) {
    return common::Result<FileOutcome>::failure(halt_if_fatal(source.status()));
  }
  if (!source.value().has_value()) {
    return apply_file(to, report);
  }
  if (!filter::should_index(to)) {
    return apply_delete(from, report);
  }

  // The move replaced whatever was indexed at the destination.
  auto occupant = store_.find_by_path(project_.id, to);
  if (!occupant.ok()) {
    return common::Result<FileOutcome>::failure(halt_if_fatal(occupant.status()));
  }
  if (occupant.value().has_value()) {
    if (auto removed = store_.delete_entity(project_.id, occupant.value()->id); !removed.ok()) {
      return common::Result<FileOutcome>::failure(halt_if_fatal(removed));
    }
  }

  auto moved = store_.move_entity(project_.id, source.value()->id, to,
                                  config_.update_permalinks_on_move);
  if (!moved.ok()) {
    if (halt_if_fatal(moved.status()).code() == common::ErrorCode::Store) {
      return common::Result<FileOutcome>::failure(moved.status());
    }
    ++report.failed;
    status_.add_failed(project_.name, to);
    return common::Result<FileOutcome>::success(outcome(kActionFailed));
  }
  ++report.moved;
  observability::record_file_synced(project_.name, from + " -> " + to, kActionMoved);

  // Content edited along with the move is applied on top.
  SyncReport content;
  auto refreshed = apply_file(to, content);
  if (!refreshed.ok()) {
    return refreshed;
  }
  report.modified += content.modified;
  report.degraded += content.degraded;
  report.failed += content.failed;
  if (refreshed.value().action == kActionModified) {
    return common::Result<FileOutcome>::success(outcome(kActionMoved, refreshed.value().entity));
  }
  return common::Result<FileOutcome>::success(outcome(kActionMoved, moved.value()));
}

common::Result<FileOutcome> ProjectSyncer::apply_delete(const std::string &relative,
                                                        SyncReport &report) {
  auto removed = store_.delete_entity_by_path(project_.id, relative);
  if (!removed.ok()) {
    return common::Result<FileOutcome>::failure(halt_if_fatal(removed.status()));
  }
  status_.clear_failed(project_.name, relative);
  if (!removed.value()) {
    return common::Result<FileOutcome>::success(outcome(kActionSkipped));
  }
  ++report.deleted;
  observability::record_file_synced(project_.name, relative, kActionDeleted);
  return common::Result<FileOutcome>::success(outcome(kActionDeleted));
}

common::Result<FileOutcome> ProjectSyncer::sync_path_locked(const std::string &relative_path) {
  if (halted_) {
    return common::Result<FileOutcome>::failure(halted_error());
  }
  SyncReport report;
  return apply_file(relative_path, report);
}

common::Result<FileOutcome> ProjectSyncer::move_path_locked(const std::string &from,
                                                            const std::string &to) {
  if (halted_) {
    return common::Result<FileOutcome>::failure(halted_error());
  }
  SyncReport report;
  auto moved = apply_move(from, to, report);
  if (moved.ok() && moved.value().action == kActionFailed) {
    return common::Result<FileOutcome>::failure(common::ErrorCode::Io,
                                                "failed to index moved file " + to);
  }
  return moved;
}

common::Result<FileOutcome> ProjectSyncer::delete_path_locked(const std::string &relative_path) {
  if (halted_) {
    return common::Result<FileOutcome>::failure(halted_error());
  }
  SyncReport report;
  return apply_delete(relative_path, report);
}

SyncOrchestrator::SyncOrchestrator(store::KnowledgeStore &store, config::SyncConfig config)
    : store_(store), config_(config) {}

SyncOrchestrator::~SyncOrchestrator() { stop_all(); }

ProjectSyncer &SyncOrchestrator::attach(const store::Project &project) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = syncers_[project.name];
  if (!slot) {
    slot = std::make_unique<ProjectSyncer>(store_, project, config_, status_);
  }
  return *slot;
}

void SyncOrchestrator::start(const std::string &project) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = syncers_.find(project);
  if (it != syncers_.end()) {
    it->second->start(config_.watch);
  }
}

void SyncOrchestrator::start_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[name, syncer] : syncers_) {
    syncer->start(config_.watch);
  }
}

void SyncOrchestrator::detach(const std::string &project) {
  std::unique_ptr<ProjectSyncer> syncer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = syncers_.find(project);
    if (it == syncers_.end()) {
      return;
    }
    syncer = std::move(it->second);
    syncers_.erase(it);
  }
  // Lets an in-flight apply finish before the worker goes away.
  syncer->stop();
  auto lock = syncer->lock_apply();
  status_.remove_project(project);
}

void SyncOrchestrator::stop_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[name, syncer] : syncers_) {
    syncer->stop();
  }
}

ProjectSyncer *SyncOrchestrator::find(const std::string &project) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = syncers_.find(project);
  return it == syncers_.end() ? nullptr : it->second.get();
}

} // namespace noteweave::sync
