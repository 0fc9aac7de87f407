#pragma once

#include "noteweave/common/result.hpp"

#include <functional>
#include <optional>
#include <string>

namespace noteweave::context {

inline constexpr const char *kMemoryScheme = "memory://";

/// A parsed `memory://[project/]path` reference. `path` has no leading or
/// trailing slash and may contain `*` wildcards.
struct MemoryUrl {
  std::optional<std::string> project;
  std::string path;

  [[nodiscard]] bool is_pattern() const { return path.find('*') != std::string::npos; }
};

/// Strips the scheme and surrounding slashes and rejects malformed paths:
/// empty, embedded schemes, double slashes, and `< > " | ?`.
[[nodiscard]] common::Result<std::string> normalize_memory_path(const std::string &url);

/// Splits off the first segment as the project when `is_project` accepts it
/// and something follows it.
[[nodiscard]] common::Result<MemoryUrl>
parse_memory_url(const std::string &url, const std::function<bool(const std::string &)> &is_project);

[[nodiscard]] std::string memory_url_for(const std::string &project_permalink,
                                         const std::string &entity_permalink);

} // namespace noteweave::context
