#include "time_bucket.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace TimeBucket {
namespace {
constexpr uint64_t MS_PER_MINUTE = 60ULL * 1000ULL;
constexpr uint64_t MS_PER_HOUR = 60ULL * MS_PER_MINUTE;
constexpr uint64_t MS_PER_DAY = 24ULL * MS_PER_HOUR;

uint64_t custom_window_ms(const Granularity &granularity) {
  if (granularity.custom_minutes == 0) {
    LOG(LogLevel::WARN, LogComponent::AGGREGATION,
        "Rejected custom window of 0 minutes");
    throw std::invalid_argument("Window size must be positive");
  }
  return static_cast<uint64_t>(granularity.custom_minutes) * MS_PER_MINUTE;
}
} // namespace

std::optional<Granularity> parse_granularity(std::string_view text) {
  std::string value = Utils::to_lower_copy(Utils::trim_copy(text));
  if (value == "hour")
    return Granularity::hour();
  if (value == "day")
    return Granularity::day();
  if (value == "week")
    return Granularity::week();
  if (value == "month")
    return Granularity::month();
  if (value == "year")
    return Granularity::year();

  if (value.size() > 1 && value.back() == 'm') {
    auto minutes = Utils::string_to_number<uint32_t>(
        std::string_view(value).substr(0, value.size() - 1));
    if (minutes)
      return Granularity::minutes(*minutes);
  }
  return std::nullopt;
}

std::string granularity_to_string(const Granularity &granularity) {
  switch (granularity.unit) {
  case GranularityUnit::HOUR:
    return "hour";
  case GranularityUnit::DAY:
    return "day";
  case GranularityUnit::WEEK:
    return "week";
  case GranularityUnit::MONTH:
    return "month";
  case GranularityUnit::YEAR:
    return "year";
  case GranularityUnit::CUSTOM:
    return std::to_string(granularity.custom_minutes) + "m";
  }
  return "day";
}

std::optional<WeekStart> parse_week_start(std::string_view text) {
  std::string value = Utils::to_lower_copy(Utils::trim_copy(text));
  if (value == "monday")
    return WeekStart::MONDAY;
  if (value == "sunday")
    return WeekStart::SUNDAY;
  return std::nullopt;
}

uint64_t period_start(uint64_t timestamp_ms, const Granularity &granularity,
                      WeekStart week_start) {
  switch (granularity.unit) {
  case GranularityUnit::HOUR:
    return timestamp_ms - timestamp_ms % MS_PER_HOUR;
  case GranularityUnit::DAY:
    return timestamp_ms - timestamp_ms % MS_PER_DAY;
  case GranularityUnit::WEEK: {
    uint64_t day_start = timestamp_ms - timestamp_ms % MS_PER_DAY;
    int weekday = Utils::to_utc_datetime(timestamp_ms).weekday; // 0 = Sunday
    int days_back =
        week_start == WeekStart::SUNDAY ? weekday : (weekday + 6) % 7;
    uint64_t offset = static_cast<uint64_t>(days_back) * MS_PER_DAY;
    // Weeks straddling the epoch clamp to it
    return day_start >= offset ? day_start - offset : 0;
  }
  case GranularityUnit::MONTH: {
    auto dt = Utils::to_utc_datetime(timestamp_ms);
    return Utils::from_utc_datetime(dt.year, dt.month, 1);
  }
  case GranularityUnit::YEAR: {
    auto dt = Utils::to_utc_datetime(timestamp_ms);
    return Utils::from_utc_datetime(dt.year, 1, 1);
  }
  case GranularityUnit::CUSTOM: {
    uint64_t window = custom_window_ms(granularity);
    return (timestamp_ms / window) * window;
  }
  }
  return timestamp_ms;
}

uint64_t next_period_start(uint64_t start_ms, const Granularity &granularity) {
  switch (granularity.unit) {
  case GranularityUnit::HOUR:
    return start_ms + MS_PER_HOUR;
  case GranularityUnit::DAY:
    return start_ms + MS_PER_DAY;
  case GranularityUnit::WEEK:
    return start_ms + 7 * MS_PER_DAY;
  case GranularityUnit::MONTH: {
    auto dt = Utils::to_utc_datetime(start_ms);
    return Utils::from_utc_datetime(dt.year, dt.month + 1, 1);
  }
  case GranularityUnit::YEAR: {
    auto dt = Utils::to_utc_datetime(start_ms);
    return Utils::from_utc_datetime(dt.year + 1, 1, 1);
  }
  case GranularityUnit::CUSTOM:
    return start_ms + custom_window_ms(granularity);
  }
  return start_ms + MS_PER_DAY;
}

std::string period_key(uint64_t timestamp_ms, const Granularity &granularity,
                       WeekStart week_start) {
  return Utils::format_iso8601_utc(
      period_start(timestamp_ms, granularity, week_start));
}

} // namespace TimeBucket
