#pragma once

#include <filesystem>
#include <string_view>

namespace noteweave::filter {

/// True when a single path component (file or directory name) is excluded.
[[nodiscard]] bool is_ignored_name(std::string_view name, bool is_directory);

/// Classifies a project-relative path. Every component is checked, so a file
/// inside an excluded directory is excluded too.
[[nodiscard]] bool should_index(const std::filesystem::path &relative_path);

[[nodiscard]] bool is_markdown(const std::filesystem::path &path);

} // namespace noteweave::filter
