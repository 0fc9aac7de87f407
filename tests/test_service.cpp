#include "test_framework.hpp"

#include "noteweave/config/config.hpp"
#include "noteweave/service/knowledge_service.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace {

namespace svc = noteweave::service;

struct ServiceFixture {
  noteweave::testing::TempWorkspace workspace;
  std::unique_ptr<svc::KnowledgeService> service;

  ServiceFixture() {
    service = std::make_unique<svc::KnowledgeService>(noteweave::testing::test_config(workspace));
    if (auto status = service->start(false); !status.ok()) {
      throw std::runtime_error(status.error());
    }
  }

  svc::WriteResult write(const std::string &title, const std::string &content,
                         const std::string &folder = "") {
    svc::WriteRequest request;
    request.title = title;
    request.content = content;
    request.folder = folder;
    auto result = service->write_entity(request);
    if (!result.ok()) {
      throw std::runtime_error(result.error());
    }
    return result.value();
  }
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_service_tests(std::vector<noteweave::tests::TestCase> &tests) {
  using noteweave::tests::require;
  using noteweave::common::ErrorCode;

  tests.push_back({"service_requires_start", [] {
                     noteweave::testing::TempWorkspace ws;
                     svc::KnowledgeService service(noteweave::testing::test_config(ws));
                     const auto projects = service.list_projects();
                     require(!projects.ok() && projects.code() == ErrorCode::Store,
                             "queries before start should fail");
                     require(service.sync_summary() == "not started", "summary before start");
                   }});

  tests.push_back({"service_from_disk_loads_config_file", [] {
                     noteweave::testing::TempWorkspace ws;
                     noteweave::testing::ScopedRecorder recorder;
                     const auto config_file = ws.path() / "config.toml";
                     {
                       std::ofstream out(config_file);
                       out << "store_path = \"" << ws.store_path().string() << "\"\n"
                           << "default_project = \"journal\"\n\n"
                           << "[projects]\n"
                           << "journal = \"" << (ws.path() / "journal").string() << "\"\n\n"
                           << "[sync]\nwatch = false\n\n"
                           << "[observability]\nbackend = \"none\"\n";
                     }
                     noteweave::config::set_config_path_override(config_file);
                     auto loaded = svc::KnowledgeService::from_disk();
                     noteweave::config::clear_config_path_override();
                     require(loaded.ok(), loaded.error());

                     auto &service = *loaded.value();
                     require(service.start(false).ok(), "start failed");
                     const auto projects = service.list_projects();
                     require(projects.ok() && projects.value().size() == 1, "one project expected");
                     require(projects.value()[0].name == "journal" && projects.value()[0].is_default,
                             "configured default expected");
                     require(std::filesystem::exists(ws.store_path()), "store should be created");
                     service.stop();
                   }});

  tests.push_back({"service_start_provisions_configured_projects", [] {
                     ServiceFixture f;
                     const auto projects = f.service->list_projects();
                     require(projects.ok(), projects.error());
                     require(projects.value().size() == 1, "one configured project");
                     require(projects.value()[0].name == "main" && projects.value()[0].is_default,
                             "main should be the default");
                     require(std::filesystem::is_directory(f.workspace.notes()),
                             "project root should exist");
                   }});

  tests.push_back({"write_entity_creates_file_and_index", [] {
                     ServiceFixture f;
                     svc::WriteRequest request;
                     request.title = "Coffee Brewing";
                     request.content = "- [tip] Grind fresh\n- pairs_with [[Tea]]\n";
                     request.folder = "drinks";
                     request.tags = {"#coffee"};
                     const auto written = f.service->write_entity(request);
                     require(written.ok(), written.error());
                     require(written.value().created, "first write creates");
                     require(written.value().permalink == "coffee-brewing", "permalink mismatch");
                     require(written.value().memory_url == "memory://main/coffee-brewing",
                             "memory url mismatch");
                     require(written.value().entity.file_path == "drinks/Coffee Brewing.md",
                             "file path mismatch");

                     const std::string text = f.workspace.read_note("drinks/Coffee Brewing.md");
                     require(contains(text, "title: Coffee Brewing"), "title should be written");
                     require(contains(text, "type: note"), "default type should be written");
                     require(contains(text, "  - coffee"), "tags should be normalized");
                     require(contains(text, "- [tip] Grind fresh"), "body should be written");

                     const auto observations =
                         f.service->store().observations_for(written.value().entity.project_id,
                                                            written.value().entity.id);
                     require(observations.ok() && observations.value().size() == 1,
                             "observation should be indexed before returning");
                     const auto relations = f.service->store().relations_from(
                         written.value().entity.project_id, written.value().entity.id);
                     require(relations.ok() && relations.value().size() == 1, "relation indexed");
                   }});

  tests.push_back({"write_entity_merges_existing_frontmatter", [] {
                     ServiceFixture f;
                     f.workspace.create_note("Garden.md",
                                             "---\ntitle: Garden\nowner: sam\n---\nold body\n");
                     require(f.service->sync_project().ok(), "initial sync failed");

                     const auto rewritten =
                         f.write("Garden", "---\nstatus: growing\n---\nnew body\n");
                     require(!rewritten.created, "rewrite updates the entity");
                     const std::string text = f.workspace.read_note("Garden.md");
                     require(contains(text, "owner: sam"), "existing key should survive");
                     require(contains(text, "status: growing"), "supplied key should be added");
                     require(contains(text, "new body") && !contains(text, "old body"),
                             "body should be replaced");
                   }});

  tests.push_back({"write_entity_rejects_bad_input", [] {
                     ServiceFixture f;
                     svc::WriteRequest empty;
                     empty.title = "   ";
                     require(f.service->write_entity(empty).code() == ErrorCode::InvalidArgument,
                             "blank title should be rejected");

                     svc::WriteRequest escape;
                     escape.title = "Outside";
                     escape.folder = "../escape";
                     require(f.service->write_entity(escape).code() == ErrorCode::InvalidArgument,
                             "folders outside the project should be rejected");

                     svc::WriteRequest unknown;
                     unknown.title = "Lost";
                     unknown.project = "nowhere";
                     require(f.service->write_entity(unknown).code() == ErrorCode::NotFound,
                             "unknown project should be reported");
                   }});

  tests.push_back({"read_entity_by_permalink_title_and_url", [] {
                     ServiceFixture f;
                     f.write("Tea Notes", "green and black\n");
                     for (const std::string id :
                          {"tea-notes", "Tea Notes", "Tea Notes.md", "memory://main/tea-notes",
                           "memory://tea-notes"}) {
                       const auto read = f.service->read_entity(id);
                       require(read.ok(), "lookup failed for " + id + ": " + read.error());
                       require(contains(read.value().content, "green and black"),
                               "content mismatch for " + id);
                     }
                     const auto missing = f.service->read_entity("memory://main/nope");
                     require(!missing.ok() && missing.code() == ErrorCode::NotFound,
                             "missing entity should be NotFound");
                     require(f.service->read_entity("memory://a//b").code() == ErrorCode::InvalidArgument,
                             "malformed url should be rejected");
                   }});

  tests.push_back({"service_search_and_context", [] {
                     ServiceFixture f;
                     f.write("Coffee", "- pairs_with [[Tea]]\nstrong and dark\n");
                     f.write("Tea", "- relates_to [[Water]]\n");
                     f.write("Water", "plain\n");

                     svc::SearchRequest search;
                     search.filters.text = "dark";
                     const auto page = f.service->search(search);
                     require(page.ok(), page.error());
                     require(page.value().results.size() == 1, "one search hit expected");
                     require(page.value().results[0].entity.permalink == "coffee", "hit mismatch");

                     svc::ContextRequest request;
                     request.url = "memory://main/coffee";
                     request.depth = 2;
                     const auto snapshot = f.service->build_context(request);
                     require(snapshot.ok(), snapshot.error());
                     require(snapshot.value().primary.size() == 1, "coffee is the primary");
                     require(snapshot.value().related.size() == 2, "tea and water are related");
                   }});

  tests.push_back({"move_entity_keeps_identity", [] {
                     ServiceFixture f;
                     const auto written = f.write("Plan", "draft\n", "inbox");
                     f.write("Other", "x\n", "archive");

                     const auto moved = f.service->move_entity("plan", "archive/plan");
                     require(moved.ok(), moved.error());
                     require(moved.value().id == written.entity.id, "id should survive the move");
                     require(moved.value().file_path == "archive/plan.md", "extension should be kept");
                     require(moved.value().permalink == "plan", "permalink should be stable");
                     require(!std::filesystem::exists(f.workspace.notes() / "inbox" / "Plan.md"),
                             "old file should be gone");
                     require(std::filesystem::exists(f.workspace.notes() / "archive" / "plan.md"),
                             "new file should exist");

                     const auto clash = f.service->move_entity("plan", "archive/Other.md");
                     require(!clash.ok() && clash.code() == ErrorCode::Conflict,
                             "occupied destination should conflict");
                     require(f.service->move_entity("plan", "../out.md").code() ==
                                 ErrorCode::InvalidArgument,
                             "moves outside the project should fail");
                   }});

  tests.push_back({"delete_entity_removes_file_and_rows", [] {
                     ServiceFixture f;
                     const auto written = f.write("Scratch", "temp\n");
                     require(f.service->delete_entity("memory://main/scratch").ok(), "delete failed");
                     require(!std::filesystem::exists(f.workspace.notes() / "Scratch.md"),
                             "file should be removed");
                     require(!f.service->store().get_entity(written.entity.project_id, written.entity.id)
                                  .value()
                                  .has_value(),
                             "entity row should be removed");
                     require(f.service->delete_entity("scratch").code() == ErrorCode::NotFound,
                             "second delete should be NotFound");
                   }});

  tests.push_back({"service_projects_are_isolated", [] {
                     ServiceFixture f;
                     const auto work_root = f.workspace.path() / "work";
                     const auto added = f.service->add_project("work", work_root.string());
                     require(added.ok(), added.error());
                     require(!added.value().is_default, "main stays the default");
                     require(std::filesystem::is_directory(work_root), "root should be created");
                     require(f.service->list_projects().value().size() == 2, "two projects");

                     svc::WriteRequest request;
                     request.title = "Roadmap";
                     request.content = "q3 goals\n";
                     request.project = "work";
                     const auto written = f.service->write_entity(request);
                     require(written.ok(), written.error());
                     require(written.value().memory_url == "memory://work/roadmap", "url mismatch");

                     require(f.service->read_entity("memory://work/roadmap").ok(),
                             "url should select the project");
                     require(f.service->read_entity("roadmap").code() == ErrorCode::NotFound,
                             "default project should not see other projects");
                     require(f.service->read_entity("roadmap", std::string("work")).ok(),
                             "explicit project lookup");

                     require(f.service->set_default_project("work").ok(), "set default failed");
                     require(f.service->read_entity("roadmap").ok(), "new default should apply");

                     require(f.service->remove_project("work").ok(), "remove failed");
                     require(f.service->list_projects().value().size() == 1, "one project left");
                     require(std::filesystem::exists(work_root / "Roadmap.md"),
                             "files survive project removal");
                     require(f.service->remove_project("work").code() == ErrorCode::NotFound,
                             "unknown project removal should fail");
                   }});

  tests.push_back({"service_sync_project_reports_status", [] {
                     ServiceFixture f;
                     f.workspace.create_note("a.md", "# A\n[[B]]\n");
                     f.workspace.create_note("b.md", "# B\n");
                     f.workspace.create_note(".hidden/c.md", "# C\n");

                     const auto report = f.service->sync_project();
                     require(report.ok(), report.error());
                     require(report.value().created == 2, "two notes should be indexed");

                     const auto status = f.service->sync_status();
                     require(status.ok(), status.error());
                     require(status.value().state == noteweave::sync::SyncState::Idle,
                             "project should be idle after the scan");
                     require(status.value().last_report.created == 2, "report should be recorded");
                     require(status.value().last_scan_at.has_value(), "scan time expected");
                     require(contains(f.service->sync_summary(), "main: idle"), "summary mismatch");
                     require(f.service->reset_project().ok(), "reset of a healthy project is a no-op");

                     const auto again = f.service->sync_project();
                     require(again.ok() && again.value().changes() == 0,
                             "second scan should find nothing new");
                   }});
}
