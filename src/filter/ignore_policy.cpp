#include "noteweave/filter/ignore_policy.hpp"

#include "noteweave/common/fs.hpp"

#include <array>
#include <string>

namespace noteweave::filter {

namespace {

constexpr std::array<std::string_view, 12> kIgnoredDirectories = {
    "node_modules", "bower_components", "jspm_packages", "dist",        "build", "target",
    "out",          "__pycache__",      "venv",          "site-packages", "vendor", "coverage"};

constexpr std::array<std::string_view, 4> kIgnoredFiles = {"Thumbs.db", "desktop.ini",
                                                           "ehthumbs.db", "Icon\r"};

constexpr std::array<std::string_view, 11> kIgnoredExtensions = {
    ".tmp", ".temp", ".swp", ".swo", ".swx", ".log", ".pyc", ".pyo", ".class", ".o", ".lock"};

bool ends_with_any(const std::string &name) {
  for (const auto ext : kIgnoredExtensions) {
    if (name.size() > ext.size() && name.ends_with(ext)) {
      return true;
    }
  }
  return false;
}

} // namespace

bool is_ignored_name(const std::string_view name, const bool is_directory) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }

  // Hidden entries cover VCS metadata (.git, .hg), IDE folders and OS litter (.DS_Store).
  if (name.front() == '.') {
    return true;
  }

  if (is_directory) {
    for (const auto dir : kIgnoredDirectories) {
      if (name == dir) {
        return true;
      }
    }
    return false;
  }

  for (const auto file : kIgnoredFiles) {
    if (name == file) {
      return true;
    }
  }

  if (name.back() == '~' || (name.front() == '#' && name.back() == '#')) {
    return true;
  }

  return ends_with_any(common::to_lower(std::string(name)));
}

bool should_index(const std::filesystem::path &relative_path) {
  if (relative_path.empty()) {
    return false;
  }

  const auto filename = relative_path.filename().string();
  const auto parent = relative_path.parent_path();
  for (const auto &component : parent) {
    if (is_ignored_name(component.string(), true)) {
      return false;
    }
  }
  return !is_ignored_name(filename, false);
}

bool is_markdown(const std::filesystem::path &path) {
  const auto ext = common::to_lower(path.extension().string());
  return ext == ".md" || ext == ".markdown";
}

} // namespace noteweave::filter
