#ifndef TIME_BUCKET_HPP
#define TIME_BUCKET_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace TimeBucket {

enum class GranularityUnit { HOUR, DAY, WEEK, MONTH, YEAR, CUSTOM };

enum class WeekStart { MONDAY, SUNDAY };

struct Granularity {
  GranularityUnit unit = GranularityUnit::DAY;
  // Window width for CUSTOM, ignored otherwise
  uint32_t custom_minutes = 0;

  static Granularity hour() { return {GranularityUnit::HOUR, 0}; }
  static Granularity day() { return {GranularityUnit::DAY, 0}; }
  static Granularity week() { return {GranularityUnit::WEEK, 0}; }
  static Granularity month() { return {GranularityUnit::MONTH, 0}; }
  static Granularity year() { return {GranularityUnit::YEAR, 0}; }
  static Granularity minutes(uint32_t n) {
    return {GranularityUnit::CUSTOM, n};
  }

  bool operator==(const Granularity &other) const {
    return unit == other.unit &&
           (unit != GranularityUnit::CUSTOM ||
            custom_minutes == other.custom_minutes);
  }
  bool operator!=(const Granularity &other) const { return !(*this == other); }
};

// "hour", "day", "week", "month", "year" or "<N>m" (e.g. "15m")
std::optional<Granularity> parse_granularity(std::string_view text);
std::string granularity_to_string(const Granularity &granularity);

std::optional<WeekStart> parse_week_start(std::string_view text);

/**
 * Start of the period containing `timestamp_ms`, all in UTC.
 * Weeks begin at 00:00 on `week_start`; custom windows are aligned to the
 * epoch.
 * @throws std::invalid_argument for a custom window of zero minutes
 */
uint64_t period_start(uint64_t timestamp_ms, const Granularity &granularity,
                      WeekStart week_start = WeekStart::MONDAY);

// Start of the period following the one beginning at `start_ms`
uint64_t next_period_start(uint64_t start_ms, const Granularity &granularity);

// Canonical bucket key, "YYYY-MM-DDTHH:MM:SSZ" of the period start
std::string period_key(uint64_t timestamp_ms, const Granularity &granularity,
                       WeekStart week_start = WeekStart::MONDAY);

} // namespace TimeBucket

#endif // TIME_BUCKET_HPP
