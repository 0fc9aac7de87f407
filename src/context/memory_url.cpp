#include "noteweave/context/memory_url.hpp"

#include "noteweave/common/fs.hpp"

namespace noteweave::context {

common::Result<std::string> normalize_memory_path(const std::string &url) {
  std::string path = common::trim(url);
  if (common::starts_with(path, kMemoryScheme)) {
    path = path.substr(std::string(kMemoryScheme).size());
  }

  if (path.find("://") != std::string::npos) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "memory url has an embedded scheme: " + url);
  }
  if (path.find("//") != std::string::npos) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "memory url has an empty segment: " + url);
  }
  if (path.find_first_of("<>\"|?") != std::string::npos) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "memory url has invalid characters: " + url);
  }

  while (!path.empty() && path.front() == '/') {
    path.erase(path.begin());
  }
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  path = common::trim(path);
  if (path.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::InvalidArgument,
                                                "memory url has an empty path");
  }
  return common::Result<std::string>::success(std::move(path));
}

common::Result<MemoryUrl>
parse_memory_url(const std::string &url, const std::function<bool(const std::string &)> &is_project) {
  auto path = normalize_memory_path(url);
  if (!path.ok()) {
    return common::Result<MemoryUrl>::failure(path.status());
  }

  MemoryUrl parsed;
  const std::string &value = path.value();
  const auto slash = value.find('/');
  if (slash != std::string::npos && is_project && is_project(value.substr(0, slash))) {
    parsed.project = value.substr(0, slash);
    parsed.path = value.substr(slash + 1);
  } else {
    parsed.path = value;
  }
  return common::Result<MemoryUrl>::success(std::move(parsed));
}

std::string memory_url_for(const std::string &project_permalink,
                           const std::string &entity_permalink) {
  return std::string(kMemoryScheme) + project_permalink + "/" + entity_permalink;
}

} // namespace noteweave::context
