#include "noteweave/observability/factory.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/observability/log_observer.hpp"
#include "noteweave/observability/multi_observer.hpp"
#include "noteweave/observability/noop_observer.hpp"

#include <algorithm>
#include <vector>

namespace noteweave::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const std::string &backend, const LogLevel level) {
  if (backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>(level);
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const LogLevel level =
      parse_log_level(config.observability.log_level).value_or(LogLevel::Info);

  // Unknown names degrade to log so sync problems stay visible.
  std::vector<std::string> backends;
  for (const auto &part : common::split(common::to_lower(config.observability.backend), ',')) {
    std::string backend = common::trim(part);
    if (backend.empty()) {
      continue;
    }
    if (backend == "none") {
      backend = "noop";
    } else if (backend != "noop") {
      backend = "log";
    }
    if (std::find(backends.begin(), backends.end(), backend) == backends.end()) {
      backends.push_back(backend);
    }
  }

  if (backends.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (backends.size() == 1) {
    return make_backend(backends.front(), level);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &backend : backends) {
    multi->add(make_backend(backend, level));
  }
  return multi;
}

} // namespace noteweave::observability
