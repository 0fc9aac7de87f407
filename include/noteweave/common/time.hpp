#pragma once

#include "noteweave/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace noteweave::common {

using TimePoint = std::chrono::system_clock::time_point;

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string format_rfc3339(TimePoint point);
[[nodiscard]] std::optional<TimePoint> parse_rfc3339(const std::string &value);

/// Resolves a relative timeframe ("7d", "24h", "2 weeks", "today", "2024-01-15")
/// to the earliest instant it covers, relative to `now`.
[[nodiscard]] Result<TimePoint> parse_timeframe(const std::string &timeframe,
                                                TimePoint now = std::chrono::system_clock::now());

} // namespace noteweave::common
