#include "test_framework.hpp"

#include "noteweave/common/hash.hpp"
#include "noteweave/store/knowledge_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <cstdint>
#include <sqlite3.h>
#include <stdexcept>

namespace {

namespace store = noteweave::store;
namespace md = noteweave::markdown;

struct StoreFixture {
  noteweave::testing::TempWorkspace workspace;
  store::KnowledgeStore db{workspace.store_path()};
  store::Project project;

  StoreFixture() {
    if (auto status = db.open(); !status.ok()) {
      throw std::runtime_error(status.error());
    }
    auto added = db.add_project("main", workspace.notes().string(), true);
    if (!added.ok()) {
      throw std::runtime_error(added.error());
    }
    project = added.value();
  }

  store::Entity upsert(const store::EntityDraft &draft) {
    auto outcome = db.upsert_entity(project.id, draft);
    if (!outcome.ok()) {
      throw std::runtime_error(outcome.error());
    }
    return outcome.value().entity;
  }
};

store::EntityDraft note(const std::string &path, const std::string &title,
                        const std::string &body = "",
                        std::vector<md::ParsedRelation> relations = {}) {
  store::EntityDraft draft;
  draft.file_path = path;
  draft.title = title;
  draft.body = body;
  draft.checksum = noteweave::common::sha256_hex(title + body);
  draft.relations = std::move(relations);
  return draft;
}

md::ParsedRelation link(const std::string &type, const std::string &target) {
  return md::ParsedRelation{.relation_type = type, .target = target, .context = std::nullopt};
}

// Runs `sql` on a second connection and returns the first column of the first row.
std::int64_t query_int(const std::filesystem::path &db_path, const std::string &sql) {
  sqlite3 *raw = nullptr;
  if (sqlite3_open(db_path.c_str(), &raw) != SQLITE_OK) {
    sqlite3_close(raw);
    throw std::runtime_error("cannot open " + db_path.string());
  }
  sqlite3_stmt *stmt = nullptr;
  std::int64_t value = -1;
  if (sqlite3_prepare_v2(raw, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
      value = sqlite3_column_int64(stmt, 0);
    } else if (rc == SQLITE_DONE) {
      value = 0;
    }
  }
  sqlite3_finalize(stmt);
  sqlite3_close(raw);
  return value;
}

} // namespace

void register_store_tests(std::vector<noteweave::tests::TestCase> &tests) {
  using noteweave::tests::require;
  using noteweave::common::ErrorCode;

  tests.push_back({"store_first_project_becomes_default", [] {
                     noteweave::testing::TempWorkspace ws;
                     store::KnowledgeStore db(ws.store_path());
                     const auto opened = db.open();
                     require(opened.ok(), opened.error());
                     require(db.health_check(), "health check should pass after open");

                     const auto first = db.add_project("Research", ws.notes().string(), false);
                     require(first.ok(), first.error());
                     require(first.value().is_default, "first project should become default");
                     require(first.value().permalink == "research", "project permalink mismatch");

                     const auto duplicate = db.add_project("RESEARCH", "/elsewhere", false);
                     require(!duplicate.ok() && duplicate.code() == ErrorCode::Conflict,
                             "case-insensitive duplicate should conflict");

                     const auto second = db.add_project("Work", ws.path().string(), true);
                     require(second.ok(), second.error());
                     const auto current = db.default_project();
                     require(current.ok() && current.value().has_value(), "default expected");
                     require(current.value()->name == "Work", "explicit default should win");
                     require(db.list_projects().value().size() == 2, "two projects expected");
                   }});

  tests.push_back({"upsert_assigns_title_permalink_with_suffix", [] {
                     StoreFixture f;
                     const auto first = f.upsert(note("a/notes.md", "Notes"));
                     const auto second = f.upsert(note("b/notes.md", "Notes"));
                     const auto third = f.upsert(note("c/notes.md", "Notes"));
                     require(first.permalink == "notes", "first permalink mismatch");
                     require(second.permalink == "notes-1", "second permalink mismatch");
                     require(third.permalink == "notes-2", "third permalink mismatch");
                     require(f.db.count_entities(f.project.id).value() == 3, "three entities");
                   }});

  tests.push_back({"upsert_update_keeps_id_and_permalink", [] {
                     StoreFixture f;
                     const auto created = f.db.upsert_entity(f.project.id, note("x.md", "Original"));
                     require(created.ok() && created.value().created, "first upsert creates");

                     auto draft = note("x.md", "Renamed Title", "new body");
                     const auto updated = f.db.upsert_entity(f.project.id, draft);
                     require(updated.ok(), updated.error());
                     require(!updated.value().created, "second upsert updates");
                     require(updated.value().entity.id == created.value().entity.id, "id must be stable");
                     require(updated.value().entity.permalink == "original",
                             "permalink must survive a title change");
                     require(updated.value().entity.title == "Renamed Title", "title should update");

                     const auto moved = f.db.move_entity(f.project.id, created.value().entity.id,
                                                         "renamed-title.md", true);
                     require(moved.ok(), moved.error());
                     require(moved.value().permalink == "renamed-title",
                             "regenerating on move should follow the new file name");
                   }});

  tests.push_back({"upsert_adopts_free_explicit_permalink", [] {
                     StoreFixture f;
                     auto draft = note("x.md", "Some Title");
                     draft.permalink = "custom/slug";
                     const auto created = f.upsert(draft);
                     require(created.permalink == "custom/slug", "explicit permalink should be used");

                     auto clash = note("y.md", "Other");
                     clash.permalink = "custom/slug";
                     require(f.upsert(clash).permalink == "custom/slug-1",
                             "taken explicit permalink gets a suffix");
                   }});

  tests.push_back({"forward_reference_resolves_when_target_appears", [] {
                     StoreFixture f;
                     const auto coffee =
                         f.upsert(note("coffee.md", "Coffee", "", {link("pairs_with", "Tea")}));
                     auto outbound = f.db.relations_from(f.project.id, coffee.id);
                     require(outbound.ok() && outbound.value().size() == 1, "one relation expected");
                     require(outbound.value()[0].dangling(), "relation should start dangling");
                     require(f.db.dangling_relations(f.project.id).value().size() == 1,
                             "dangling list should include it");

                     const auto tea = f.db.upsert_entity(f.project.id, note("tea.md", "Tea"));
                     require(tea.ok(), tea.error());
                     require(tea.value().inbound_resolved == 1, "inbound link should resolve");

                     outbound = f.db.relations_from(f.project.id, coffee.id);
                     require(outbound.value()[0].to_entity_id == tea.value().entity.id,
                             "relation should point at tea");
                     const auto inbound = f.db.relations_to(f.project.id, tea.value().entity.id);
                     require(inbound.ok() && inbound.value().size() == 1, "tea sees one inbound");
                   }});

  tests.push_back({"relations_resolve_by_path_and_skip_self", [] {
                     StoreFixture f;
                     const auto target = f.upsert(note("guides/setup.md", "Setup Guide"));
                     const auto source = f.upsert(note("index.md", "Index", "",
                                                       {link("links_to", "guides/setup"),
                                                        link("links_to", "index"),
                                                        link("mentions", "setup guide")}));
                     const auto relations = f.db.relations_from(f.project.id, source.id).value();
                     require(relations.size() == 2, "self reference should be skipped");
                     for (const auto &relation : relations) {
                       require(relation.to_entity_id == target.id, "both should resolve to setup");
                     }
                   }});

  tests.push_back({"delete_cascades_but_leaves_inbound_dangling", [] {
                     StoreFixture f;
                     const auto tea = f.upsert(note("tea.md", "Tea", "", {link("relates_to", "Water")}));
                     f.upsert(note("water.md", "Water"));
                     const auto coffee =
                         f.upsert(note("coffee.md", "Coffee", "", {link("pairs_with", "Tea")}));

                     const auto deleted = f.db.delete_entity(f.project.id, tea.id);
                     require(deleted.ok(), deleted.error());
                     require(!f.db.get_entity(f.project.id, tea.id).value().has_value(),
                             "tea should be gone");

                     const auto inbound = f.db.relations_from(f.project.id, coffee.id).value();
                     require(inbound.size() == 1, "coffee keeps its relation");
                     require(inbound[0].dangling(), "relation to a deleted entity dangles");
                     require(inbound[0].target_title == "Tea", "target text is preserved");
                     require(f.db.relations_from(f.project.id, tea.id).value().empty(), "outbound rows cascade");

                     const auto back = f.db.upsert_entity(f.project.id, note("tea.md", "Tea"));
                     require(back.ok() && back.value().inbound_resolved == 1,
                             "recreated tea picks the dangling link back up");
                   }});

  tests.push_back({"move_preserves_identity", [] {
                     StoreFixture f;
                     const auto entity = f.upsert(note("inbox/idea.md", "Big Idea"));
                     const auto moved = f.db.move_entity(f.project.id, entity.id, "archive/idea.md", false);
                     require(moved.ok(), moved.error());
                     require(moved.value().id == entity.id, "id must survive a move");
                     require(moved.value().permalink == "big-idea", "permalink stable by default");
                     require(!f.db.find_by_path(f.project.id, "inbox/idea.md").value().has_value(),
                             "old path should be free");

                     const auto regenerated =
                         f.db.move_entity(f.project.id, entity.id, "archive/Final Plan.md", true);
                     require(regenerated.ok(), regenerated.error());
                     require(regenerated.value().permalink == "final-plan",
                             "regenerated permalink comes from the new file name");
                   }});

  tests.push_back({"move_onto_indexed_path_conflicts", [] {
                     StoreFixture f;
                     const auto a = f.upsert(note("a.md", "A"));
                     f.upsert(note("b.md", "B"));
                     const auto moved = f.db.move_entity(f.project.id, a.id, "b.md", false);
                     require(!moved.ok() && moved.code() == ErrorCode::Conflict,
                             "occupied destination should conflict");
                   }});

  tests.push_back({"move_resolves_path_style_links", [] {
                     StoreFixture f;
                     const auto index = f.upsert(note("index.md", "Index", "",
                                                      {link("links_to", "archive/tea-notes")}));
                     const auto tea = f.upsert(note("tea-notes-draft.md", "Tea Draft"));
                     require(f.db.relations_from(f.project.id, index.id).value()[0].dangling(), "starts dangling");
                     const auto moved =
                         f.db.move_entity(f.project.id, tea.id, "archive/tea-notes.md", false);
                     require(moved.ok(), moved.error());
                     require(f.db.relations_from(f.project.id, index.id).value()[0].to_entity_id == tea.id,
                             "link to the new path should resolve");
                   }});

  tests.push_back({"cross_project_access_is_rejected", [] {
                     StoreFixture f;
                     const auto other = f.db.add_project("other", f.workspace.path().string(), false);
                     require(other.ok(), other.error());
                     const auto entity = f.upsert(note("secret.md", "Secret"));

                     const auto read = f.db.get_entity(other.value().id, entity.id);
                     require(!read.ok() && read.code() == ErrorCode::CrossProject,
                             "reading another project's entity should fail");
                     const auto removed = f.db.delete_entity(other.value().id, entity.id);
                     require(!removed.ok() && removed.code() == ErrorCode::CrossProject,
                             "deleting another project's entity should fail");
                     require(!f.db.find_by_permalink(other.value().id, "secret").value().has_value(),
                             "lookups are scoped by project");
                   }});

  tests.push_back({"graph_reads_reject_foreign_entity_ids", [] {
                     StoreFixture f;
                     const auto other = f.db.add_project("other", f.workspace.path().string(), false);
                     require(other.ok(), other.error());
                     auto draft = note("secret.md", "Secret", "", {link("hides", "Vault")});
                     draft.observations.push_back(
                         {.category = "fact", .content = "classified", .tags = {}, .context = {}});
                     const auto secret = f.upsert(draft);
                     const auto vault = f.upsert(note("vault.md", "Vault"));
                     const auto foreign = other.value().id;

                     const auto observations = f.db.observations_for(foreign, secret.id);
                     require(!observations.ok() && observations.code() == ErrorCode::CrossProject,
                             "observations of another project's entity should fail");
                     const auto outbound = f.db.relations_from(foreign, secret.id);
                     require(!outbound.ok() && outbound.code() == ErrorCode::CrossProject,
                             "outbound relations of another project's entity should fail");
                     const auto inbound = f.db.relations_to(foreign, vault.id);
                     require(!inbound.ok() && inbound.code() == ErrorCode::CrossProject,
                             "inbound relations of another project's entity should fail");

                     require(f.db.observations_for(f.project.id, secret.id).value().size() == 1,
                             "owner still sees its observations");
                     require(f.db.relations_to(f.project.id, vault.id).value().size() == 1,
                             "owner still sees its relations");
                     require(f.db.relations_from(foreign, secret.id + 1000).value().empty(),
                             "unknown ids yield nothing");
                   }});

  tests.push_back({"observations_keep_order_tags_and_context", [] {
                     StoreFixture f;
                     auto draft = note("o.md", "Obs");
                     draft.observations.push_back({.category = "fact",
                                                   .content = "first #alpha",
                                                   .tags = {"alpha"},
                                                   .context = "ctx"});
                     draft.observations.push_back(
                         {.category = "idea", .content = "second", .tags = {}, .context = std::nullopt});
                     const auto entity = f.upsert(draft);
                     const auto observations = f.db.observations_for(f.project.id, entity.id).value();
                     require(observations.size() == 2, "two observations expected");
                     require(observations[0].category == "fact" && observations[1].category == "idea",
                             "observation order mismatch");
                     require(observations[0].tags == std::vector<std::string>({"alpha"}), "tags mismatch");
                     require(observations[0].context == std::optional<std::string>("ctx"),
                             "context mismatch");

                     draft.observations.pop_back();
                     f.upsert(draft);
                     require(f.db.observations_for(f.project.id, entity.id).value().size() == 1,
                             "upsert replaces observations");
                   }});

  tests.push_back({"search_full_text_and_filters", [] {
                     StoreFixture f;
                     auto coffee = note("coffee.md", "Coffee Brewing", "Pour over gives clarity");
                     coffee.tags = {"coffee"};
                     f.upsert(coffee);
                     auto tea = note("tea.md", "Tea", "Green tea pairs with coffee cake");
                     tea.entity_type = "reference";
                     f.upsert(tea);
                     f.upsert(note("water.md", "Water", "Minerals matter"));

                     store::SearchFilters filters;
                     filters.text = "coffee";
                     const auto all = f.db.search(f.project.id, filters, {});
                     require(all.ok(), all.error());
                     require(all.value().results.size() == 2, "two coffee hits expected");
                     require(all.value().results[0].entity.file_path == "coffee.md",
                             "title and tag hit should rank first");

                     filters.entity_types = {"reference"};
                     const auto typed = f.db.search(f.project.id, filters, {});
                     require(typed.ok() && typed.value().results.size() == 1, "type filter");
                     require(typed.value().results[0].entity.file_path == "tea.md", "tea expected");

                     store::SearchFilters tagged;
                     tagged.tags = {"#coffee"};
                     const auto by_tag = f.db.search(f.project.id, tagged, {});
                     require(by_tag.ok() && by_tag.value().results.size() == 1, "tag filter");
                   }});

  tests.push_back({"search_prefix_and_substring_fallback", [] {
                     StoreFixture f;
                     f.upsert(note("brew.md", "Brewing", "Espresso extraction"));
                     store::SearchFilters filters;
                     filters.text = "extrac";
                     const auto prefix = f.db.search(f.project.id, filters, {});
                     require(prefix.ok() && prefix.value().results.size() == 1, "prefix should match");

                     filters.text = "tractio";
                     const auto inner = f.db.search(f.project.id, filters, {});
                     require(inner.ok() && inner.value().results.size() == 1,
                             "substring should fall back to LIKE");

                     filters.text = "\"unbalanced";
                     const auto odd = f.db.search(f.project.id, filters, {});
                     require(odd.ok(), "quotes in queries must not break search");
                   }});

  tests.push_back({"search_paginates_with_has_more", [] {
                     StoreFixture f;
                     for (int i = 0; i < 5; ++i) {
                       f.upsert(note("n" + std::to_string(i) + ".md", "Note " + std::to_string(i),
                                     "shared term"));
                     }
                     store::SearchFilters filters;
                     filters.text = "shared";
                     const auto first = f.db.search(f.project.id, filters, {.page = 1, .page_size = 2});
                     require(first.ok() && first.value().results.size() == 2, "page size respected");
                     require(first.value().has_more, "more pages expected");
                     const auto last = f.db.search(f.project.id, filters, {.page = 3, .page_size = 2});
                     require(last.ok() && last.value().results.size() == 1, "last page has one");
                     require(!last.value().has_more, "no more after the last page");

                     const auto listing = f.db.search(f.project.id, {}, {.page = 1, .page_size = 10});
                     require(listing.ok() && listing.value().results.size() == 5,
                             "empty query lists everything");
                   }});

  tests.push_back({"find_by_pattern_and_link_lookup", [] {
                     StoreFixture f;
                     f.upsert(note("topics/coffee.md", "Coffee"));
                     f.upsert(note("topics/tea.md", "Tea"));
                     f.upsert(note("daily.md", "Daily"));

                     const auto topics = f.db.find_by_pattern(f.project.id, "topics/*", {});
                     require(topics.ok() && topics.value().size() == 2, "glob over file paths");

                     const auto by_title = f.db.resolve_link(f.project.id, "[[coffee]]");
                     require(by_title.ok() && by_title.value().has_value(), "title lookup");
                     require(by_title.value()->file_path == "topics/coffee.md", "wrong entity");
                     const auto by_path = f.db.resolve_link(f.project.id, "topics/tea");
                     require(by_path.ok() && by_path.value().has_value(), "path without .md");
                     require(!f.db.resolve_link(f.project.id, "nothing").value().has_value(),
                             "unknown target resolves to nothing");
                   }});

  tests.push_back({"zero_page_size_pages_by_default_size", [] {
                     const store::Pagination unset{.page = 0, .page_size = 0};
                     require(unset.number() == 1 && unset.size() == 10 && unset.offset() == 0,
                             "zero fields read as the first page of ten");
                     const store::Pagination second{.page = 2, .page_size = 0};
                     require(second.offset() == 10, "offset must use the default size");

                     StoreFixture f;
                     for (int i = 0; i < 12; ++i) {
                       const std::string name = "n" + std::string(i < 10 ? "0" : "") + std::to_string(i);
                       f.upsert(note("notes/" + name + ".md", "Note " + name, "shared term"));
                     }
                     const auto page = f.db.find_by_pattern(f.project.id, "notes/*", second);
                     require(page.ok() && page.value().size() == 2, "second page holds the rest");
                     require(page.value().front().file_path == "notes/n10.md", "page starts after ten");

                     store::SearchFilters filters;
                     filters.text = "shared";
                     const auto found = f.db.search(f.project.id, filters, second);
                     require(found.ok() && found.value().results.size() == 2, "search agrees");
                     require(found.value().page_size == 10 && !found.value().has_more,
                             "reported page size is the default");
                   }});

  tests.push_back({"remove_project_drops_its_rows", [] {
                     StoreFixture f;
                     f.upsert(note("a.md", "A"));
                     const auto removed = f.db.remove_project(f.project.id);
                     require(removed.ok(), removed.error());
                     require(f.db.count_entities(f.project.id).value() == 0, "entities should cascade");
                     require(!f.db.remove_project(f.project.id).ok(), "second remove is NotFound");
                   }});

  tests.push_back({"rebuild_search_index_restores_rows", [] {
                     StoreFixture f;
                     f.upsert(note("a.md", "Alpha", "first body"));
                     f.upsert(note("b.md", "Beta", "second body"));
                     const auto path = f.workspace.store_path();
                     require(query_int(path, "SELECT count(*) FROM search_index") == 2,
                             "upserts should index both notes");

                     require(query_int(path, "DELETE FROM search_index") == 0, "wipe failed");
                     require(query_int(path, "SELECT count(*) FROM search_index") == 0,
                             "index should be empty after the wipe");

                     const auto rebuilt = f.db.rebuild_search_index(f.project.id);
                     require(rebuilt.ok(), rebuilt.error());
                     require(query_int(path, "SELECT count(*) FROM search_index") == 2,
                             "rebuild should restore every entity");
                     store::SearchFilters filters;
                     filters.text = "second";
                     const auto page = f.db.search(f.project.id, filters, {});
                     require(page.ok() && page.value().results.size() == 1, "rebuilt index searchable");

                     require(!f.db.rebuild_search_index(f.project.id + 100).ok(),
                             "unknown project should fail");
                   }});
}
