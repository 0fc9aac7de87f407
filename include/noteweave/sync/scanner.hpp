#pragma once

#include "noteweave/common/result.hpp"
#include "noteweave/store/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace noteweave::sync {

struct ScannedFile {
  std::string path;
  std::string checksum;
  std::int64_t mtime = 0;
  std::int64_t size = 0;
};

struct ScanResult {
  // Sorted by path.
  std::vector<ScannedFile> files;
  // Paths that could not be read or hashed.
  std::vector<std::string> failed;
};

struct MovedFile {
  store::EntityId entity_id = 0;
  std::string from;
  ScannedFile to;
};

struct ScanDiff {
  std::vector<ScannedFile> created;
  std::vector<ScannedFile> modified;
  std::vector<store::FileState> deleted;
  std::vector<MovedFile> moves;

  [[nodiscard]] bool empty() const {
    return created.empty() && modified.empty() && deleted.empty() && moves.empty();
  }
};

/// Modification time in file clock ticks, compared for equality only.
[[nodiscard]] std::int64_t file_mtime(const std::filesystem::path &path);

/// Walks `root`, skipping excluded entries without descending into excluded
/// directories. A known file whose mtime and size are unchanged keeps its
/// stored checksum instead of being hashed again.
[[nodiscard]] common::Result<ScanResult> scan_directory(const std::filesystem::path &root,
                                                        const std::vector<store::FileState> &known);

/// Compares a walk with the indexed state. A vanished path whose checksum shows
/// up under a new path is reported as a move rather than a delete plus create.
/// Paths that failed to hash are left out of the deleted set.
[[nodiscard]] ScanDiff diff_scan(const ScanResult &scan, const std::vector<store::FileState> &known);

} // namespace noteweave::sync
