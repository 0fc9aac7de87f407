#include "noteweave/sync/scanner.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/common/hash.hpp"
#include "noteweave/filter/ignore_policy.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>

namespace noteweave::sync {

std::int64_t file_mtime(const std::filesystem::path &path) {
  std::error_code ec;
  const auto stamp = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return 0;
  }
  return static_cast<std::int64_t>(stamp.time_since_epoch().count());
}

common::Result<ScanResult> scan_directory(const std::filesystem::path &root,
                                          const std::vector<store::FileState> &known) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return common::Result<ScanResult>::failure(common::ErrorCode::NotFound,
                                               "project root is not a directory: " +
                                                   root.string());
  }

  std::unordered_map<std::string, const store::FileState *> by_path;
  for (const auto &state : known) {
    by_path.emplace(state.file_path, &state);
  }

  ScanResult result;
  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return common::Result<ScanResult>::failure(common::ErrorCode::Io,
                                               "failed to walk " + root.string() + ": " +
                                                   ec.message());
  }

  const auto end = std::filesystem::end(it);
  for (; it != end; it.increment(ec)) {
    if (ec) {
      ec.clear();
      continue;
    }
    const auto &entry = *it;
    std::error_code type_ec;
    const bool is_dir = entry.is_directory(type_ec);
    const std::string name = entry.path().filename().string();
    if (filter::is_ignored_name(name, is_dir)) {
      if (is_dir) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (is_dir || !entry.is_regular_file(type_ec)) {
      continue;
    }

    ScannedFile file;
    file.path = common::relative_key(entry.path(), root);
    file.mtime = file_mtime(entry.path());
    file.size = static_cast<std::int64_t>(entry.file_size(type_ec));
    if (type_ec) {
      result.failed.push_back(file.path);
      continue;
    }

    if (const auto found = by_path.find(file.path);
        found != by_path.end() && found->second->mtime == file.mtime &&
        found->second->size == file.size && !found->second->checksum.empty()) {
      file.checksum = found->second->checksum;
    } else {
      auto checksum = common::sha256_file(entry.path());
      if (!checksum.ok()) {
        result.failed.push_back(file.path);
        continue;
      }
      file.checksum = checksum.value();
    }
    result.files.push_back(std::move(file));
  }

  std::sort(result.files.begin(), result.files.end(),
            [](const ScannedFile &a, const ScannedFile &b) { return a.path < b.path; });
  std::sort(result.failed.begin(), result.failed.end());
  return common::Result<ScanResult>::success(std::move(result));
}

ScanDiff diff_scan(const ScanResult &scan, const std::vector<store::FileState> &known) {
  ScanDiff diff;

  std::map<std::string, const store::FileState *> indexed;
  for (const auto &state : known) {
    indexed.emplace(state.file_path, &state);
  }
  const std::set<std::string> failed(scan.failed.begin(), scan.failed.end());

  std::set<std::string> seen;
  std::vector<const ScannedFile *> fresh;
  for (const auto &file : scan.files) {
    seen.insert(file.path);
    const auto found = indexed.find(file.path);
    if (found == indexed.end()) {
      fresh.push_back(&file);
    } else if (found->second->checksum != file.checksum) {
      diff.modified.push_back(file);
    }
  }

  // Each new path can absorb at most one vanished path with the same checksum.
  std::vector<bool> claimed(fresh.size(), false);
  for (const auto &[path, state] : indexed) {
    if (seen.contains(path) || failed.contains(path)) {
      continue;
    }
    bool moved = false;
    for (std::size_t i = 0; i < fresh.size(); ++i) {
      if (!claimed[i] && !state->checksum.empty() && fresh[i]->checksum == state->checksum) {
        claimed[i] = true;
        diff.moves.push_back(MovedFile{.entity_id = state->id, .from = path, .to = *fresh[i]});
        moved = true;
        break;
      }
    }
    if (!moved) {
      diff.deleted.push_back(*state);
    }
  }

  for (std::size_t i = 0; i < fresh.size(); ++i) {
    if (!claimed[i]) {
      diff.created.push_back(*fresh[i]);
    }
  }
  return diff;
}

} // namespace noteweave::sync
