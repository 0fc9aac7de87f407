#pragma once

#include "noteweave/config/schema.hpp"
#include "noteweave/observability/observer.hpp"

#include <memory>

namespace noteweave::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace noteweave::observability
