#include "noteweave/common/time.hpp"

#include "noteweave/common/fs.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace noteweave::common {

namespace {

std::tm to_utc(const std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

TimePoint start_of_day(const TimePoint point) {
  std::tm tm = to_utc(std::chrono::system_clock::to_time_t(point));
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::optional<std::chrono::seconds> unit_seconds(const std::string &unit) {
  if (unit == "s" || unit == "sec" || unit == "second" || unit == "seconds") {
    return std::chrono::seconds(1);
  }
  if (unit == "m" || unit == "min" || unit == "mins" || unit == "minute" || unit == "minutes") {
    return std::chrono::seconds(60);
  }
  if (unit == "h" || unit == "hr" || unit == "hour" || unit == "hours") {
    return std::chrono::seconds(3600);
  }
  if (unit == "d" || unit == "day" || unit == "days") {
    return std::chrono::seconds(86400);
  }
  if (unit == "w" || unit == "week" || unit == "weeks") {
    return std::chrono::seconds(7 * 86400);
  }
  if (unit == "mo" || unit == "month" || unit == "months") {
    return std::chrono::seconds(30 * 86400);
  }
  return std::nullopt;
}

} // namespace

std::string format_rfc3339(const TimePoint point) {
  const std::tm tm = to_utc(std::chrono::system_clock::to_time_t(point));
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

std::optional<TimePoint> parse_rfc3339(const std::string &value) {
  std::tm tm{};
  std::istringstream in(value);
  if (value.size() >= 19) {
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  } else {
    in >> std::get_time(&tm, "%Y-%m-%d");
  }
  if (in.fail()) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

Result<TimePoint> parse_timeframe(const std::string &timeframe, const TimePoint now) {
  const std::string text = to_lower(trim(timeframe));
  if (text.empty()) {
    return Result<TimePoint>::failure(ErrorCode::InvalidArgument, "empty timeframe");
  }

  if (text == "today") {
    return Result<TimePoint>::success(start_of_day(now));
  }
  if (text == "yesterday") {
    return Result<TimePoint>::success(start_of_day(now - std::chrono::hours(24)));
  }

  static const std::regex relative(R"(^(\d{1,6})\s*([a-z]+)(\s+ago)?$)");
  std::smatch match;
  if (std::regex_match(text, match, relative)) {
    const auto unit = unit_seconds(match[2].str());
    if (!unit.has_value()) {
      return Result<TimePoint>::failure(ErrorCode::InvalidArgument,
                                        "unknown timeframe unit: " + match[2].str());
    }
    const long long count = std::stoll(match[1].str());
    const auto max_count =
        std::chrono::duration_cast<std::chrono::seconds>(TimePoint::duration::max()) / *unit;
    if (count > max_count) {
      return Result<TimePoint>::failure(ErrorCode::InvalidArgument,
                                        "timeframe out of range: " + timeframe);
    }
    const auto span = std::chrono::duration_cast<TimePoint::duration>(*unit * count);
    return Result<TimePoint>::success(now - span);
  }

  if (auto absolute = parse_rfc3339(trim(timeframe)); absolute.has_value()) {
    return Result<TimePoint>::success(*absolute);
  }

  return Result<TimePoint>::failure(ErrorCode::InvalidArgument,
                                    "unrecognized timeframe: " + timeframe);
}

} // namespace noteweave::common
