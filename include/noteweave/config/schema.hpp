#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace noteweave::config {

struct ProjectConfig {
  std::string name;
  std::string path;
};

struct SyncConfig {
  bool watch = true;
  std::uint32_t debounce_ms = 500;
  bool update_permalinks_on_move = false;
  std::uint32_t scan_batch_size = 32;
  std::uint32_t max_scan_duration_ms = 0;
  std::uint32_t io_retries = 3;
  std::uint32_t io_backoff_ms = 50;
  std::uint32_t queue_capacity = 1024;
};

struct ObservabilityConfig {
  // Comma list of "log" and "none".
  std::string backend = "log";
  std::string log_level = "info";
};

struct Config {
  std::string store_path = "~/.noteweave/memory.db";
  std::string default_project = "main";
  std::vector<ProjectConfig> projects;
  SyncConfig sync;
  ObservabilityConfig observability;
};

} // namespace noteweave::config
