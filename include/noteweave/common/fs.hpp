#pragma once

#include "noteweave/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace noteweave::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

/// Project-relative path with forward slashes, e.g. "notes/coffee.md".
[[nodiscard]] std::string relative_key(const std::filesystem::path &path,
                                       const std::filesystem::path &root);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Retries transient read failures with exponential backoff starting at `backoff`.
[[nodiscard]] Result<std::string> read_file_with_retry(const std::filesystem::path &path,
                                                       std::uint32_t retries,
                                                       std::chrono::milliseconds backoff);

/// Writes through a ".tmp" sibling and renames it over `path`.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace noteweave::common
