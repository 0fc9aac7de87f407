#pragma once

#include "noteweave/observability/observer.hpp"

#include <memory>

namespace noteweave::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_sync_start(const std::string &project, bool full_scan);
void record_file_synced(const std::string &project, const std::string &path,
                        const std::string &action);
void record_parse_warning(const std::string &project, const std::string &path, std::size_t line,
                          const std::string &message);
void record_state_change(const std::string &project, const std::string &from,
                         const std::string &to);
void record_watch_overflow(const std::string &project, const std::string &reason);
void record_queue_depth(const std::string &project, std::uint64_t depth);
void record_error(const std::string &component, const std::string &message);

} // namespace noteweave::observability
