#include "test_framework.hpp"

#include "noteweave/common/hash.hpp"
#include "noteweave/sync/scanner.hpp"
#include "noteweave/sync/sync_service.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <sqlite3.h>
#include <stdexcept>

namespace {

namespace store = noteweave::store;
namespace nsync = noteweave::sync;

struct SyncFixture {
  noteweave::testing::TempWorkspace workspace;
  noteweave::config::Config config = noteweave::testing::test_config(workspace);
  store::KnowledgeStore db{workspace.store_path()};
  store::Project project;
  nsync::SyncStatusTracker tracker;
  std::unique_ptr<nsync::ProjectSyncer> syncer;

  explicit SyncFixture(const std::function<void(noteweave::config::SyncConfig &)> &tune = {}) {
    if (tune) {
      tune(config.sync);
    }
    if (auto status = db.open(); !status.ok()) {
      throw std::runtime_error(status.error());
    }
    auto added = db.add_project("main", workspace.notes().string(), true);
    if (!added.ok()) {
      throw std::runtime_error(added.error());
    }
    project = added.value();
    syncer = std::make_unique<nsync::ProjectSyncer>(db, project, config.sync, tracker);
  }

  nsync::SyncReport scan() {
    auto report = syncer->full_scan();
    if (!report.ok()) {
      throw std::runtime_error(report.error());
    }
    return report.value();
  }

  nsync::SyncReport apply(const std::vector<nsync::ChangeEvent> &events) {
    auto report = syncer->apply_events(events);
    if (!report.ok()) {
      throw std::runtime_error(report.error());
    }
    return report.value();
  }

  std::optional<store::Entity> by_path(const std::string &path) {
    return db.find_by_path(project.id, path).value();
  }
};

nsync::ChangeEvent event(nsync::ChangeKind kind, const std::string &path) {
  return nsync::ChangeEvent{.kind = kind, .path = path};
}

// Runs one statement on a separate connection to the store file.
bool exec_raw(const std::filesystem::path &db_path, const std::string &sql) {
  sqlite3 *raw = nullptr;
  if (sqlite3_open(db_path.c_str(), &raw) != SQLITE_OK) {
    sqlite3_close(raw);
    return false;
  }
  sqlite3_busy_timeout(raw, 5000);
  const bool ok = sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK;
  sqlite3_close(raw);
  return ok;
}

constexpr const char *kBreakObservations = "ALTER TABLE observations RENAME TO observations_parked";
constexpr const char *kRestoreObservations = "ALTER TABLE observations_parked RENAME TO observations";

} // namespace

void register_sync_tests(std::vector<noteweave::tests::TestCase> &tests) {
  using noteweave::tests::require;

  tests.push_back({"scan_directory_skips_ignored_entries", [] {
                     noteweave::testing::TempWorkspace ws;
                     ws.create_note("b.md", "b");
                     ws.create_note("a/c.md", "c");
                     ws.create_note(".obsidian/workspace.md", "hidden");
                     ws.create_note("node_modules/pkg/readme.md", "vendored");
                     ws.create_note("draft.md.swp", "swap");
                     ws.create_note("image.png", "png");

                     const auto scan = nsync::scan_directory(ws.notes(), {});
                     require(scan.ok(), scan.error());
                     std::vector<std::string> paths;
                     for (const auto &file : scan.value().files) {
                       paths.push_back(file.path);
                     }
                     require(paths == std::vector<std::string>({"a/c.md", "b.md", "image.png"}),
                             "unexpected scan result");
                     require(scan.value().files[1].checksum == noteweave::common::sha256_hex("b"),
                             "checksum mismatch");
                   }});

  tests.push_back({"scan_directory_reuses_checksum_for_unchanged_stat", [] {
                     noteweave::testing::TempWorkspace ws;
                     ws.create_note("a.md", "content");
                     const auto first = nsync::scan_directory(ws.notes(), {});
                     require(first.ok(), first.error());
                     const auto &file = first.value().files.at(0);

                     const store::FileState known{.id = 1,
                                                  .file_path = "a.md",
                                                  .checksum = "stored",
                                                  .mtime = file.mtime,
                                                  .size = file.size};
                     const auto second = nsync::scan_directory(ws.notes(), {known});
                     require(second.ok(), second.error());
                     require(second.value().files.at(0).checksum == "stored",
                             "unchanged stat should skip hashing");
                   }});

  tests.push_back({"scan_directory_missing_root_fails", [] {
                     noteweave::testing::TempWorkspace ws;
                     const auto scan = nsync::scan_directory(ws.path() / "absent", {});
                     require(!scan.ok(), "missing root should fail");
                   }});

  tests.push_back({"diff_scan_classifies_changes", [] {
                     nsync::ScanResult scan;
                     scan.files = {{.path = "kept.md", .checksum = "k"},
                                   {.path = "edited.md", .checksum = "new"},
                                   {.path = "renamed.md", .checksum = "r"},
                                   {.path = "fresh.md", .checksum = "f"}};
                     scan.failed = {"locked.md"};
                     const std::vector<store::FileState> known = {
                         {.id = 1, .file_path = "kept.md", .checksum = "k"},
                         {.id = 2, .file_path = "edited.md", .checksum = "old"},
                         {.id = 3, .file_path = "original.md", .checksum = "r"},
                         {.id = 4, .file_path = "gone.md", .checksum = "g"},
                         {.id = 5, .file_path = "locked.md", .checksum = "l"}};

                     const auto diff = nsync::diff_scan(scan, known);
                     require(diff.created.size() == 1 && diff.created[0].path == "fresh.md",
                             "created mismatch");
                     require(diff.modified.size() == 1 && diff.modified[0].path == "edited.md",
                             "modified mismatch");
                     require(diff.moves.size() == 1 && diff.moves[0].entity_id == 3 &&
                                 diff.moves[0].to.path == "renamed.md",
                             "move mismatch");
                     require(diff.deleted.size() == 1 && diff.deleted[0].file_path == "gone.md",
                             "failed paths must not be deleted");
                   }});

  tests.push_back({"event_queue_overflow_latches_flag", [] {
                     nsync::EventQueue queue(2);
                     require(queue.push(event(nsync::ChangeKind::Created, "a.md")), "first push");
                     require(queue.push(event(nsync::ChangeKind::Created, "b.md")), "second push");
                     require(!queue.push(event(nsync::ChangeKind::Created, "c.md")), "full queue drops");
                     require(queue.take_overflow(), "overflow should latch");
                     require(!queue.take_overflow(), "overflow clears once taken");

                     const auto batch = queue.pop_batch(std::chrono::milliseconds(10));
                     require(batch.size() == 2 && batch[0].path == "a.md", "batch keeps order");
                     require(queue.empty(), "batch drains the queue");
                     require(queue.pop_batch(std::chrono::milliseconds(5)).empty(),
                             "empty queue times out");
                   }});

  tests.push_back({"event_queue_reopen_blocks_again", [] {
                     nsync::EventQueue queue(4);
                     queue.close();
                     auto started = std::chrono::steady_clock::now();
                     require(queue.pop_batch(std::chrono::milliseconds(500)).empty(), "closed is empty");
                     require(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(400),
                             "closed queue returns at once");

                     queue.reopen();
                     started = std::chrono::steady_clock::now();
                     require(queue.pop_batch(std::chrono::milliseconds(60)).empty(), "still empty");
                     require(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(50),
                             "reopened queue waits for events");
                   }});

  tests.push_back({"sync_status_error_clears_on_recovery", [] {
                     nsync::SyncStatusTracker tracker;
                     tracker.register_project("main");
                     require(tracker.is_ready(), "idle project is ready");
                     tracker.set_error("main", "disk on fire");
                     auto status = tracker.get("main");
                     require(status.has_value() && status->state == nsync::SyncState::Error,
                             "error state expected");
                     require(status->last_error == std::optional<std::string>("disk on fire"),
                             "error message kept");
                     require(!tracker.is_ready(), "failed project is not ready");
                     require(tracker.summary().find("error=\"disk on fire\"") != std::string::npos,
                             "summary should include the error");

                     tracker.set_state("main", nsync::SyncState::Idle);
                     require(!tracker.get("main")->last_error.has_value(), "recovery clears error");

                     tracker.add_failed("main", "x.md");
                     tracker.add_failed("main", "x.md");
                     require(tracker.get("main")->failed_paths.size() == 1, "failed paths dedupe");
                     tracker.clear_failed("main", "x.md");
                     require(tracker.get("main")->failed_paths.empty(), "failed path cleared");
                   }});

  tests.push_back({"build_draft_classifies_files", [] {
                     const auto note = nsync::build_draft("topics/coffee.md", "# Coffee\n- [tip] grind fresh\n");
                     require(note.draft.entity_type == "note", "markdown becomes a note");
                     require(note.draft.title == "Coffee", "title from heading");
                     require(note.draft.observations.size() == 1, "observation carried over");
                     require(!note.degraded, "clean note is not degraded");

                     const auto image = nsync::build_draft("assets/Diagram.PNG", "\x89PNG");
                     require(image.draft.entity_type == nsync::kFileEntityType, "binary becomes a file");
                     require(image.draft.content_type == "image/png", "content type from extension");
                     require(image.draft.title == "Diagram.PNG", "file title is the file name");
                     require(image.draft.permalink == std::optional<std::string>("diagram-png"),
                             "file permalink folds the extension");

                     const auto broken = nsync::build_draft("bad.md", std::string("\xFF\xFE\0", 3));
                     require(broken.degraded, "undecodable markdown is degraded");
                     require(broken.draft.entity_type == nsync::kFileEntityType,
                             "undecodable markdown is stored as a file");
                   }});

  tests.push_back({"full_scan_is_idempotent", [] {
                     SyncFixture f;
                     f.workspace.create_note("coffee.md", "# Coffee\n- pairs_with [[Tea]]\n");
                     f.workspace.create_note("tea.md", "# Tea\n");
                     const auto first = f.scan();
                     require(first.created == 2, "two files created");

                     const auto second = f.scan();
                     require(second.changes() == 0, "second scan should change nothing");
                     require(f.db.count_entities(f.project.id).value() == 2, "still two entities");
                     require(f.syncer->state() == nsync::SyncState::Idle, "idle after scan");
                   }});

  tests.push_back({"coffee_relates_to_tea_before_tea_exists", [] {
                     SyncFixture f;
                     f.workspace.create_note("coffee.md",
                                             "- [method] Pour over is best #brewing\n"
                                             "- relates_to [[Tea]]\n");
                     const auto first = f.scan();
                     require(first.created == 1, "one file synced");
                     require(f.db.count_entities(f.project.id).value() == 1, "exactly one entity");

                     const auto coffee = f.by_path("coffee.md");
                     require(coffee.has_value() && coffee->permalink == "coffee", "permalink is coffee");

                     const auto observations = f.db.observations_for(f.project.id, coffee->id).value();
                     require(observations.size() == 1, "one observation");
                     require(observations[0].category == "method", "category is method");
                     require(observations[0].tags == std::vector<std::string>({"brewing"}),
                             "tags are {brewing}");

                     auto relations = f.db.relations_from(f.project.id, coffee->id).value();
                     require(relations.size() == 1, "one relation");
                     require(relations[0].relation_type == "relates_to", "relation type kept");
                     require(relations[0].target_title == "Tea", "target title is Tea");
                     require(relations[0].dangling(), "target is null until tea exists");

                     f.workspace.create_note("tea.md", "# Tea\n");
                     const auto second = f.scan();
                     require(second.created == 1 && second.modified == 0, "coffee.md is not re-edited");
                     const auto tea = f.by_path("tea.md");
                     require(tea.has_value(), "tea indexed");
                     relations = f.db.relations_from(f.project.id, coffee->id).value();
                     require(relations.size() == 1 && relations[0].to_entity_id == tea->id,
                             "relation now points at tea");
                     require(relations[0].target_title == "Tea", "link text retained");
                   }});

  tests.push_back({"coffee_and_tea_graph_follows_files", [] {
                     SyncFixture f;
                     f.workspace.create_note("coffee.md",
                                             "---\ntitle: Coffee\ntags: [drinks]\n---\n"
                                             "- [origin] Ethiopia #beans\n- pairs_with [[Tea]]\n");
                     f.workspace.create_note("tea.md", "# Tea\n- [origin] China\n");
                     f.scan();

                     const auto coffee = f.by_path("coffee.md");
                     const auto tea = f.by_path("tea.md");
                     require(coffee.has_value() && tea.has_value(), "both indexed");
                     require(coffee->tags == std::vector<std::string>({"drinks"}), "tags indexed");
                     auto relations = f.db.relations_from(f.project.id, coffee->id).value();
                     require(relations.size() == 1 && relations[0].to_entity_id == tea->id,
                             "pairs_with should resolve regardless of scan order");

                     std::filesystem::remove(f.workspace.notes() / "tea.md");
                     const auto removed = f.scan();
                     require(removed.deleted == 1, "tea deleted");
                     relations = f.db.relations_from(f.project.id, coffee->id).value();
                     require(relations.size() == 1 && relations[0].dangling(),
                             "relation dangles after the target goes away");

                     f.workspace.create_note("tea.md", "# Tea\n");
                     f.scan();
                     relations = f.db.relations_from(f.project.id, coffee->id).value();
                     require(!relations[0].dangling(), "relation resolves again");
                   }});

  tests.push_back({"scan_detects_rename_as_move", [] {
                     SyncFixture f;
                     f.workspace.create_note("inbox/idea.md", "# Idea\nbody text\n");
                     f.scan();
                     const auto before = f.by_path("inbox/idea.md");
                     require(before.has_value(), "indexed before move");

                     std::filesystem::create_directories(f.workspace.notes() / "archive");
                     std::filesystem::rename(f.workspace.notes() / "inbox" / "idea.md",
                                             f.workspace.notes() / "archive" / "idea.md");
                     const auto report = f.scan();
                     require(report.moved == 1 && report.created == 0 && report.deleted == 0,
                             "rename should be a move");
                     const auto after = f.by_path("archive/idea.md");
                     require(after.has_value() && after->id == before->id, "id preserved");
                     require(after->permalink == before->permalink, "permalink preserved");
                   }});

  tests.push_back({"scan_move_regenerates_permalink_when_configured", [] {
                     SyncFixture f([](noteweave::config::SyncConfig &sync) {
                       sync.update_permalinks_on_move = true;
                     });
                     f.workspace.create_note("inbox/idea.md", "# Idea\nbody text\n");
                     f.workspace.create_note("kettle-notes.md", "# Kettle Notes\n");
                     f.scan();
                     const auto before = f.by_path("inbox/idea.md");
                     require(before.has_value() && before->permalink == "idea", "indexed before move");

                     std::filesystem::rename(f.workspace.notes() / "inbox" / "idea.md",
                                             f.workspace.notes() / "Kettle Notes.md");
                     const auto report = f.scan();
                     require(report.moved == 1 && report.created == 0 && report.deleted == 0,
                             "rename should be a move");
                     const auto after = f.by_path("Kettle Notes.md");
                     require(after.has_value() && after->id == before->id, "id preserved");
                     require(after->permalink == "kettle-notes-1",
                             "permalink follows the new file name and avoids collisions");
                   }});

  tests.push_back({"scan_applies_modifications", [] {
                     SyncFixture f;
                     f.workspace.create_note("a.md", "# A\n");
                     f.scan();
                     f.workspace.create_note("a.md", "# A\n- [fact] now with an observation\n");
                     const auto report = f.scan();
                     require(report.modified == 1, "modification expected");
                     const auto entity = f.by_path("a.md");
                     require(f.db.observations_for(f.project.id, entity->id).value().size() == 1,
                             "new observation indexed");
                   }});

  tests.push_back({"scan_counts_degraded_and_skips_ignored", [] {
                     SyncFixture f;
                     f.workspace.create_note("odd.md", "---\nnot a key\n---\n# Odd\n");
                     f.workspace.create_note("blob.md", std::string("\xFF\xFE\x00\x01", 4));
                     f.workspace.create_note(".trash/old.md", "# Old\n");
                     const auto report = f.scan();
                     require(report.created == 2, "two entities created");
                     require(report.degraded == 2, "both files are degraded");
                     require(f.by_path("blob.md")->entity_type == nsync::kFileEntityType,
                             "undecodable markdown stored as a file");
                     require(!f.by_path(".trash/old.md").has_value(), "hidden dirs skipped");
                   }});

  tests.push_back({"apply_events_updates_index", [] {
                     SyncFixture f;
                     f.workspace.create_note("a.md", "# A\n");
                     auto report = f.apply({event(nsync::ChangeKind::Created, "a.md")});
                     require(report.created == 1, "created event indexes the file");

                     f.workspace.create_note("a.md", "# A v2\n");
                     report = f.apply({event(nsync::ChangeKind::Modified, "a.md")});
                     require(report.modified == 1, "modified event updates");
                     require(f.by_path("a.md")->title == "A v2", "title updated");

                     report = f.apply({event(nsync::ChangeKind::Deleted, "a.md")});
                     require(report.deleted == 0, "a delete for a file that still exists is an update");

                     std::filesystem::remove(f.workspace.notes() / "a.md");
                     report = f.apply({event(nsync::ChangeKind::Deleted, "a.md")});
                     require(report.deleted == 1, "delete removes the entity");

                     report = f.apply({event(nsync::ChangeKind::Modified, "ghost.md")});
                     require(report.changes() == 0, "vanished file is a no-op");
                   }});

  tests.push_back({"apply_events_pairs_delete_and_create_into_move", [] {
                     SyncFixture f;
                     f.workspace.create_note("old.md", "# Same\n");
                     f.scan();
                     const auto before = f.by_path("old.md");

                     std::filesystem::rename(f.workspace.notes() / "old.md",
                                             f.workspace.notes() / "new.md");
                     const auto report = f.apply({event(nsync::ChangeKind::Deleted, "old.md"),
                                                  event(nsync::ChangeKind::Created, "new.md")});
                     require(report.moved == 1, "pair should become a move");
                     const auto after = f.by_path("new.md");
                     require(after.has_value() && after->id == before->id, "identity preserved");
                   }});

  tests.push_back({"apply_move_event_replaces_destination", [] {
                     SyncFixture f;
                     f.workspace.create_note("a.md", "# A\n");
                     f.workspace.create_note("b.md", "# B\n");
                     f.scan();
                     const auto a = f.by_path("a.md");

                     std::filesystem::rename(f.workspace.notes() / "a.md", f.workspace.notes() / "b.md");
                     nsync::ChangeEvent moved = event(nsync::ChangeKind::Moved, "b.md");
                     moved.old_path = "a.md";
                     const auto report = f.apply({moved});
                     require(report.moved == 1, "move applied");
                     require(f.db.count_entities(f.project.id).value() == 1, "occupant replaced");
                     require(f.by_path("b.md")->id == a->id, "moved entity keeps its id");
                   }});

  tests.push_back({"scan_records_observer_events", [] {
                     noteweave::testing::ScopedRecorder recorder;
                     SyncFixture f;
                     f.workspace.create_note("a.md", "# A\n");
                     f.scan();

                     const auto events = recorder.recorder().events();
                     const auto end = std::find_if(events.begin(), events.end(), [](const auto &e) {
                       return std::holds_alternative<noteweave::observability::SyncEndEvent>(e);
                     });
                     require(end != events.end(), "sync end event expected");
                     require(std::get<noteweave::observability::SyncEndEvent>(*end).created == 1,
                             "sync end should report one creation");
                     const auto metrics = recorder.recorder().metrics();
                     require(std::any_of(metrics.begin(), metrics.end(), [](const auto &m) {
                               return std::holds_alternative<
                                   noteweave::observability::IndexedEntitiesMetric>(m);
                             }),
                             "indexed entity metric expected");
                   }});

  tests.push_back({"background_worker_runs_initial_scan", [] {
                     SyncFixture f;
                     f.workspace.create_note("a.md", "# A\n");
                     f.workspace.create_note("b.md", "# B\n");
                     f.syncer->start(false);
                     require(f.syncer->is_running(), "worker should run");
                     require(noteweave::testing::wait_until([&f] {
                               return f.db.count_entities(f.project.id).value() == 2 &&
                                      f.syncer->state() == nsync::SyncState::Idle;
                             }),
                             "initial scan should index both files");

                     f.workspace.create_note("c.md", "# C\n");
                     f.syncer->enqueue(event(nsync::ChangeKind::Created, "c.md"));
                     require(noteweave::testing::wait_until(
                                 [&f] { return f.by_path("c.md").has_value(); }),
                             "queued event should be applied");
                     f.syncer->stop();
                     require(!f.syncer->is_running(), "worker should stop");
                   }});

  tests.push_back({"store_failure_halts_project_until_reset", [] {
                     SyncFixture f;
                     f.workspace.create_note("a.md", "# A\n- [fact] kept\n");
                     require(exec_raw(f.workspace.store_path(), kBreakObservations), "break failed");

                     const auto failed = f.syncer->full_scan();
                     require(!failed.ok() && failed.code() == noteweave::common::ErrorCode::Store,
                             "store failure should surface as Store");
                     require(f.syncer->state() == nsync::SyncState::Error, "project should halt");
                     require(f.tracker.get("main")->last_error.has_value(), "error recorded");
                     require(!f.by_path("a.md").has_value(), "failed upsert leaves no rows");

                     require(exec_raw(f.workspace.store_path(), kRestoreObservations),
                             "restore failed");
                     const auto blocked = f.syncer->apply_events({event(nsync::ChangeKind::Created, "a.md")});
                     require(!blocked.ok() && blocked.code() == noteweave::common::ErrorCode::Store,
                             "writes stay halted after the store recovers");
                     require(f.syncer->state() == nsync::SyncState::Error, "still halted");

                     require(f.syncer->reset().ok(), "reset failed");
                     require(f.syncer->state() == nsync::SyncState::Idle, "reset returns to idle");
                     const auto rescanned = f.scan();
                     require(rescanned.created == 1, "scan after reset indexes the file");
                     require(f.db.observations_for(f.project.id, f.by_path("a.md")->id).value().size() == 1,
                             "observation indexed after recovery");
                   }});

  tests.push_back({"worker_rescans_after_reset", [] {
                     SyncFixture f;
                     f.workspace.create_note("a.md", "# A\n- [fact] kept\n");
                     require(exec_raw(f.workspace.store_path(), kBreakObservations), "break failed");
                     f.syncer->start(false);
                     require(noteweave::testing::wait_until(
                                 [&f] { return f.syncer->state() == nsync::SyncState::Error; }),
                             "initial scan should halt the project");

                     require(exec_raw(f.workspace.store_path(), kRestoreObservations),
                             "restore failed");
                     require(f.syncer->reset().ok(), "reset failed");
                     require(noteweave::testing::wait_until([&f] {
                               return f.db.count_entities(f.project.id).value() == 1 &&
                                      f.syncer->state() == nsync::SyncState::Idle;
                             }),
                             "reset should queue a rescan that indexes the file");
                     f.syncer->stop();
                   }});

  tests.push_back({"unreadable_file_is_retried_then_failed", [] {
                     SyncFixture f([](noteweave::config::SyncConfig &sync) {
                       sync.io_retries = 3;
                       sync.io_backoff_ms = 20;
                     });
                     std::filesystem::create_directories(f.workspace.notes() / "stuck.md");

                     const auto started = std::chrono::steady_clock::now();
                     const auto report = f.apply({event(nsync::ChangeKind::Created, "stuck.md")});
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(report.failed == 1 && report.created == 0, "read failure counts as failed");
                     require(elapsed >= std::chrono::milliseconds(140),
                             "reads should back off 20, 40 and 80 ms before giving up");
                     const auto failed_paths = f.tracker.get("main")->failed_paths;
                     require(std::find(failed_paths.begin(), failed_paths.end(), "stuck.md") !=
                                 failed_paths.end(),
                             "path should be marked failed pending rescan");
                     require(!f.by_path("stuck.md").has_value(), "nothing indexed");

                     std::filesystem::remove(f.workspace.notes() / "stuck.md");
                     f.workspace.create_note("stuck.md", "# Stuck\n");
                     const auto retried = f.apply({event(nsync::ChangeKind::Modified, "stuck.md")});
                     require(retried.created == 1, "readable file is indexed");
                     require(f.tracker.get("main")->failed_paths.empty(), "failed mark cleared");
                   }});

  tests.push_back({"scan_yields_when_time_budget_runs_out", [] {
                     SyncFixture f([](noteweave::config::SyncConfig &sync) {
                       sync.max_scan_duration_ms = 1;
                       sync.scan_batch_size = 1;
                     });
                     constexpr std::size_t kNotes = 60;
                     for (std::size_t i = 0; i < kNotes; ++i) {
                       f.workspace.create_note("n" + std::to_string(i) + ".md",
                                               "# Note " + std::to_string(i) + "\n");
                     }

                     const auto first = f.scan();
                     require(first.created >= 1 && first.created < kNotes,
                             "first scan should stop early");
                     const auto progress = f.tracker.get("main");
                     require(progress->files_total == kNotes &&
                                 progress->files_processed < progress->files_total,
                             "progress should show the remainder");

                     for (std::size_t round = 0;
                          round < 2 * kNotes && f.db.count_entities(f.project.id).value() < kNotes;
                          ++round) {
                       f.scan();
                     }
                     require(f.db.count_entities(f.project.id).value() == kNotes,
                             "follow-up scans finish the remainder");
                   }});

  tests.push_back({"reset_waits_for_in_flight_apply", [] {
                     SyncFixture f;
                     auto lock = f.syncer->lock_apply();
                     auto pending = std::async(std::launch::async, [&f] { return f.syncer->reset(); });
                     require(pending.wait_for(std::chrono::milliseconds(100)) ==
                                 std::future_status::timeout,
                             "reset should block while an apply holds the lock");
                     lock.unlock();
                     require(pending.get().ok(), "reset should finish once the apply ends");
                   }});

  tests.push_back({"restarted_worker_applies_events", [] {
                     SyncFixture f;
                     f.syncer->start(false);
                     f.syncer->stop();
                     f.syncer->start(false);
                     require(f.syncer->is_running(), "worker should run again");
                     f.workspace.create_note("late.md", "# Late\n");
                     f.syncer->enqueue(event(nsync::ChangeKind::Created, "late.md"));
                     require(noteweave::testing::wait_until(
                                 [&f] { return f.by_path("late.md").has_value(); }),
                             "restarted worker should apply queued events");
                     f.syncer->stop();
                   }});

  tests.push_back({"orchestrator_attach_and_detach", [] {
                     SyncFixture f;
                     nsync::SyncOrchestrator orchestrator(f.db, f.config.sync);
                     auto &attached = orchestrator.attach(f.project);
                     require(&attached == &orchestrator.attach(f.project), "attach is idempotent");
                     require(orchestrator.find("main") == &attached, "find returns the syncer");
                     require(orchestrator.status().get("main").has_value(), "status registered");

                     orchestrator.detach("main");
                     require(orchestrator.find("main") == nullptr, "detach forgets the syncer");
                     require(!orchestrator.status().get("main").has_value(), "status removed");
                   }});
}
