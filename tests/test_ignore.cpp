#include "test_framework.hpp"

#include "noteweave/filter/ignore_policy.hpp"

void register_ignore_tests(std::vector<noteweave::tests::TestCase> &tests) {
  using noteweave::tests::require;
  namespace filter = noteweave::filter;

  tests.push_back({"ignore_hidden_and_vcs_entries", [] {
                     require(filter::is_ignored_name(".git", true), ".git should be ignored");
                     require(filter::is_ignored_name(".DS_Store", false), ".DS_Store ignored");
                     require(filter::is_ignored_name(".obsidian", true), "hidden dirs ignored");
                     require(!filter::is_ignored_name("notes", true), "plain dir kept");
                   }});

  tests.push_back({"ignore_build_dirs_only_as_directories", [] {
                     require(filter::is_ignored_name("node_modules", true), "node_modules ignored");
                     require(filter::is_ignored_name("build", true), "build dir ignored");
                     require(!filter::is_ignored_name("build", false),
                             "a file named build is not a directory");
                   }});

  tests.push_back({"ignore_editor_and_temp_files", [] {
                     require(filter::is_ignored_name("note.md~", false), "backup ignored");
                     require(filter::is_ignored_name("#note.md#", false), "emacs autosave ignored");
                     require(filter::is_ignored_name("note.md.swp", false), "swap ignored");
                     require(filter::is_ignored_name("note.md.TMP", false),
                             "extensions compare case-insensitively");
                     require(filter::is_ignored_name("Thumbs.db", false), "Thumbs.db ignored");
                     require(!filter::is_ignored_name("coffee.md", false), "notes kept");
                   }});

  tests.push_back({"should_index_checks_every_component", [] {
                     require(filter::should_index("topics/coffee.md"), "nested note indexed");
                     require(!filter::should_index("node_modules/pkg/readme.md"),
                             "file under ignored dir skipped");
                     require(!filter::should_index("a/.git/b/c.md"), "deep hidden dir skipped");
                     require(filter::should_index("assets/diagram.png"), "non-markdown indexed");
                     require(!filter::should_index(""), "empty path is not indexable");
                   }});

  tests.push_back({"is_markdown_extensions", [] {
                     require(filter::is_markdown("a/b.md"), ".md is markdown");
                     require(filter::is_markdown("b.MARKDOWN"), "case-insensitive extension");
                     require(!filter::is_markdown("b.txt"), ".txt is not markdown");
                   }});
}
