#include "noteweave/sync/file_watcher.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/filter/ignore_policy.hpp"
#include "noteweave/observability/global.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>
#include <vector>

namespace noteweave::sync {

namespace {

constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE |
                                     IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF;

bool is_indexable_dir(const std::filesystem::path &relative) {
  for (const auto &component : relative) {
    if (filter::is_ignored_name(component.string(), true)) {
      return false;
    }
  }
  return true;
}

} // namespace

FileWatcher::FileWatcher(std::string project, std::filesystem::path root, WatcherOptions options,
                         Sink sink)
    : project_(std::move(project)), root_(std::move(root)), options_(options),
      sink_(std::move(sink)) {}

FileWatcher::~FileWatcher() { stop(); }

common::Status FileWatcher::start() {
  if (running_) {
    return common::Status::success();
  }

  fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (fd_ < 0) {
    return common::Status::error(common::ErrorCode::Io,
                                 std::string("inotify_init1 failed: ") + std::strerror(errno));
  }

  add_watches(root_);
  if (watch_count() == 0) {
    ::close(fd_);
    fd_ = -1;
    return common::Status::error(common::ErrorCode::Io, "cannot watch " + root_.string());
  }

  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
  return common::Status::success();
}

void FileWatcher::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  std::lock_guard<std::mutex> lock(watches_mutex_);
  watches_.clear();
}

bool FileWatcher::is_running() const { return running_; }

std::size_t FileWatcher::watch_count() const {
  std::lock_guard<std::mutex> lock(watches_mutex_);
  return watches_.size();
}

void FileWatcher::add_watches(const std::filesystem::path &dir) {
  const int wd = inotify_add_watch(fd_, dir.c_str(), kWatchMask);
  if (wd < 0) {
    observability::record_error("watcher", "inotify_add_watch failed for " + dir.string() + ": " +
                                               std::strerror(errno));
    return;
  }

  std::string relative = common::relative_key(dir, root_);
  if (relative == ".") {
    relative.clear();
  }
  {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    watches_[wd] = relative;
  }

  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(
           dir, std::filesystem::directory_options::skip_permission_denied, ec)) {
    std::error_code type_ec;
    if (!entry.is_directory(type_ec) || entry.is_symlink(type_ec)) {
      continue;
    }
    if (filter::is_ignored_name(entry.path().filename().string(), true)) {
      continue;
    }
    add_watches(entry.path());
  }
}

void FileWatcher::run_loop() {
  alignas(inotify_event) char buffer[64 * 1024];

  while (running_) {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd_, &read_fds);
    timeval timeout{};
    timeout.tv_sec = static_cast<time_t>(options_.poll_interval.count() / 1000);
    timeout.tv_usec = static_cast<suseconds_t>((options_.poll_interval.count() % 1000) * 1000);

    const int ready = select(fd_ + 1, &read_fds, nullptr, nullptr, &timeout);
    if (ready > 0) {
      for (;;) {
        const ssize_t len = ::read(fd_, buffer, sizeof(buffer));
        if (len <= 0) {
          break;
        }
        for (ssize_t offset = 0; offset < len;) {
          const auto *event = reinterpret_cast<const inotify_event *>(buffer + offset);
          handle(*event);
          offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);
        }
      }
    } else if (ready < 0 && errno != EINTR) {
      observability::record_error("watcher", std::string("select failed: ") + std::strerror(errno));
      break;
    }
    flush(false);
  }
  running_ = false;
}

void FileWatcher::handle(const inotify_event &event) {
  if ((event.mask & IN_Q_OVERFLOW) != 0) {
    observability::record_watch_overflow(project_, "kernel event queue overflow");
    pending_.clear();
    moves_out_.clear();
    emit_rescan();
    return;
  }

  std::string dir;
  {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    const auto it = watches_.find(event.wd);
    if (it == watches_.end()) {
      return;
    }
    dir = it->second;
    if ((event.mask & IN_IGNORED) != 0) {
      watches_.erase(it);
      return;
    }
  }

  if (event.len == 0) {
    // The watched directory itself went away; the parent reports the details.
    return;
  }
  const std::string name(event.name);
  const std::string relative = dir.empty() ? name : dir + "/" + name;

  if ((event.mask & IN_ISDIR) != 0) {
    handle_directory(event, relative);
    return;
  }
  if (!filter::should_index(relative)) {
    return;
  }

  if ((event.mask & IN_MOVED_FROM) != 0) {
    moves_out_[event.cookie] = MoveOut{.path = relative, .at = std::chrono::steady_clock::now()};
  } else if ((event.mask & IN_MOVED_TO) != 0) {
    const auto it = moves_out_.find(event.cookie);
    if (it == moves_out_.end()) {
      note(relative, ChangeKind::Created);
      return;
    }
    const std::string from = it->second.path;
    moves_out_.erase(it);
    // A pending edit to the source goes out before the move.
    emit_now(from);
    note(relative, ChangeKind::Moved, from);
  } else if ((event.mask & IN_CREATE) != 0) {
    note(relative, ChangeKind::Created);
  } else if ((event.mask & IN_DELETE) != 0) {
    note(relative, ChangeKind::Deleted);
  } else if ((event.mask & (IN_MODIFY | IN_CLOSE_WRITE)) != 0) {
    note(relative, ChangeKind::Modified);
  }
}

void FileWatcher::handle_directory(const inotify_event &event, const std::string &relative) {
  if (!is_indexable_dir(relative)) {
    return;
  }

  if ((event.mask & IN_CREATE) != 0) {
    add_watches(root_ / relative);
    // Files may land before the watch exists.
    std::error_code ec;
    for (std::filesystem::recursive_directory_iterator it(
             root_ / relative, std::filesystem::directory_options::skip_permission_denied, ec),
         end;
         it != end; it.increment(ec)) {
      if (ec) {
        break;
      }
      std::error_code type_ec;
      if (!it->is_regular_file(type_ec)) {
        continue;
      }
      const std::string file = common::relative_key(it->path(), root_);
      if (filter::should_index(file)) {
        note(file, ChangeKind::Created);
      }
    }
    return;
  }

  if ((event.mask & IN_MOVED_TO) != 0) {
    add_watches(root_ / relative);
  }
  if ((event.mask & (IN_MOVED_TO | IN_MOVED_FROM | IN_DELETE)) != 0) {
    flush(true);
    emit_rescan();
  }
}

void FileWatcher::note(const std::string &path, const ChangeKind kind, const std::string &old_path) {
  const auto now = std::chrono::steady_clock::now();
  auto it = pending_.find(path);
  if (it == pending_.end()) {
    pending_.emplace(path, Pending{.kind = kind,
                                   .old_path = old_path,
                                   .sequence = ++sequence_,
                                   .deadline = now + options_.debounce});
    return;
  }

  Pending &pending = it->second;
  switch (kind) {
  case ChangeKind::Created:
  case ChangeKind::Modified:
    if (pending.kind == ChangeKind::Deleted) {
      pending.kind = ChangeKind::Modified;
    }
    break;
  case ChangeKind::Deleted:
    if (pending.kind == ChangeKind::Moved && !pending.old_path.empty()) {
      // The source of the move still holds the indexed entity.
      const std::string source = pending.old_path;
      pending.old_path.clear();
      pending.kind = ChangeKind::Deleted;
      note(source, ChangeKind::Deleted);
      it = pending_.find(path);
    } else {
      pending.kind = ChangeKind::Deleted;
    }
    break;
  case ChangeKind::Moved:
    pending.kind = ChangeKind::Moved;
    pending.old_path = old_path;
    pending.sequence = ++sequence_;
    break;
  case ChangeKind::Rescan:
    break;
  }
  it->second.deadline = now + options_.debounce;
}

void FileWatcher::emit_now(const std::string &path) {
  const auto it = pending_.find(path);
  if (it == pending_.end()) {
    return;
  }
  ChangeEvent event{.kind = it->second.kind, .path = path, .old_path = it->second.old_path};
  pending_.erase(it);
  sink_(std::move(event));
}

void FileWatcher::emit_rescan() { sink_(ChangeEvent{.kind = ChangeKind::Rescan}); }

void FileWatcher::flush(const bool force) {
  const auto now = std::chrono::steady_clock::now();

  // A move-out without its move-in left the tree.
  for (auto it = moves_out_.begin(); it != moves_out_.end();) {
    if (force || now - it->second.at >= options_.debounce) {
      note(it->second.path, ChangeKind::Deleted);
      it = moves_out_.erase(it);
    } else {
      ++it;
    }
  }

  std::vector<std::pair<std::uint64_t, std::string>> due;
  for (const auto &[path, pending] : pending_) {
    if (force || pending.deadline <= now) {
      due.emplace_back(pending.sequence, path);
    }
  }
  std::sort(due.begin(), due.end());
  for (const auto &[sequence, path] : due) {
    emit_now(path);
  }
}

} // namespace noteweave::sync
