#pragma once

#include <chrono>
#include <string>

namespace noteweave::sync {

enum class ChangeKind { Created, Modified, Deleted, Moved, Rescan };

/// One path-level change. `old_path` is set for moves only; a Rescan carries
/// no path and asks the worker for a full reconciliation.
struct ChangeEvent {
  ChangeKind kind = ChangeKind::Modified;
  std::string path;
  std::string old_path;
  std::chrono::steady_clock::time_point detected_at = std::chrono::steady_clock::now();
};

} // namespace noteweave::sync
