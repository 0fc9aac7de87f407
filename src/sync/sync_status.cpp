#include "noteweave/sync/sync_status.hpp"

#include "noteweave/common/time.hpp"
#include "noteweave/observability/global.hpp"

#include <algorithm>
#include <sstream>

namespace noteweave::sync {

std::string_view sync_state_name(const SyncState state) {
  switch (state) {
  case SyncState::Idle:
    return "idle";
  case SyncState::Scanning:
    return "scanning";
  case SyncState::Applying:
    return "applying";
  case SyncState::Watching:
    return "watching";
  case SyncState::Error:
    return "error";
  }
  return "unknown";
}

void SyncStatusTracker::register_project(const std::string &project) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &status = projects_[project];
  status.project = project;
}

void SyncStatusTracker::remove_project(const std::string &project) {
  std::lock_guard<std::mutex> lock(mutex_);
  projects_.erase(project);
}

void SyncStatusTracker::set_state(const std::string &project, const SyncState state) {
  SyncState previous = SyncState::Idle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &status = projects_[project];
    status.project = project;
    previous = status.state;
    status.state = state;
    if (state != SyncState::Error) {
      status.last_error.reset();
    }
  }
  if (previous != state) {
    observability::record_state_change(project, std::string(sync_state_name(previous)),
                                       std::string(sync_state_name(state)));
  }
}

void SyncStatusTracker::set_progress(const std::string &project, const std::size_t total,
                                     const std::size_t processed) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &status = projects_[project];
  status.files_total = total;
  status.files_processed = processed;
}

void SyncStatusTracker::record_report(const std::string &project, const SyncReport &report) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &status = projects_[project];
  status.last_report = report;
  status.last_scan_at = common::now_rfc3339();
}

void SyncStatusTracker::add_failed(const std::string &project, const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &failed = projects_[project].failed_paths;
  if (std::find(failed.begin(), failed.end(), path) == failed.end()) {
    failed.push_back(path);
  }
}

void SyncStatusTracker::clear_failed(const std::string &project, const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::erase(projects_[project].failed_paths, path);
}

void SyncStatusTracker::set_error(const std::string &project, const std::string &message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    projects_[project].last_error = message;
  }
  set_state(project, SyncState::Error);
}

std::optional<ProjectSyncStatus> SyncStatusTracker::get(const std::string &project) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = projects_.find(project);
  if (it == projects_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ProjectSyncStatus> SyncStatusTracker::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ProjectSyncStatus> out;
  out.reserve(projects_.size());
  for (const auto &[name, status] : projects_) {
    out.push_back(status);
  }
  return out;
}

bool SyncStatusTracker::is_ready() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::all_of(projects_.begin(), projects_.end(), [](const auto &entry) {
    const SyncState state = entry.second.state;
    return state == SyncState::Idle || state == SyncState::Watching;
  });
}

std::string SyncStatusTracker::summary() const {
  const auto statuses = all();
  if (statuses.empty()) {
    return "no projects";
  }

  std::ostringstream out;
  for (const auto &status : statuses) {
    out << status.project << ": " << sync_state_name(status.state);
    if (status.state == SyncState::Scanning || status.state == SyncState::Applying) {
      out << " (" << status.files_processed << "/" << status.files_total << ")";
    }
    const auto &report = status.last_report;
    out << " new=" << report.created << " modified=" << report.modified
        << " deleted=" << report.deleted << " moved=" << report.moved
        << " skipped=" << report.skipped << " degraded=" << report.degraded
        << " failed=" << report.failed;
    if (status.last_error.has_value()) {
      out << " error=\"" << *status.last_error << "\"";
    }
    out << "\n";
  }
  return out.str();
}

} // namespace noteweave::sync
