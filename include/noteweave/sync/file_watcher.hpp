#pragma once

#include "noteweave/common/result.hpp"
#include "noteweave/sync/change_event.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

struct inotify_event;

namespace noteweave::sync {

struct WatcherOptions {
  std::chrono::milliseconds debounce{500};
  std::chrono::milliseconds poll_interval{50};
};

/// Recursive inotify watch over one project root. Raw kernel events are
/// filtered through the ignore policy, coalesced per path until the path has
/// been quiet for the debounce window, and handed to the sink in detection
/// order. A kernel queue overflow or a directory rename becomes a Rescan.
class FileWatcher {
public:
  using Sink = std::function<void(ChangeEvent)>;

  FileWatcher(std::string project, std::filesystem::path root, WatcherOptions options, Sink sink);
  ~FileWatcher();

  FileWatcher(const FileWatcher &) = delete;
  FileWatcher &operator=(const FileWatcher &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::size_t watch_count() const;

private:
  struct Pending {
    ChangeKind kind = ChangeKind::Modified;
    std::string old_path;
    std::uint64_t sequence = 0;
    std::chrono::steady_clock::time_point deadline;
  };

  struct MoveOut {
    std::string path;
    std::chrono::steady_clock::time_point at;
  };

  void run_loop();
  void add_watches(const std::filesystem::path &dir);
  void handle(const inotify_event &event);
  void handle_directory(const inotify_event &event, const std::string &relative);
  void note(const std::string &path, ChangeKind kind, const std::string &old_path = {});
  void emit_now(const std::string &path);
  void emit_rescan();
  void flush(bool force);

  std::string project_;
  std::filesystem::path root_;
  WatcherOptions options_;
  Sink sink_;

  int fd_ = -1;
  mutable std::mutex watches_mutex_;
  std::unordered_map<int, std::string> watches_;

  // Owned by the watcher thread.
  std::map<std::string, Pending> pending_;
  std::unordered_map<std::uint32_t, MoveOut> moves_out_;
  std::uint64_t sequence_ = 0;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace noteweave::sync
