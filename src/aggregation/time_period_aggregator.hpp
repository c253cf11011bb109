#ifndef TIME_PERIOD_AGGREGATOR_HPP
#define TIME_PERIOD_AGGREGATOR_HPP

#include "aggregation/time_bucket.hpp"
#include "core/event_record.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Aggregation {

// Inclusive on both ends
struct TimeRange {
  uint64_t start_ms = 0;
  uint64_t end_ms = 0;

  bool contains(uint64_t timestamp_ms) const {
    return start_ms <= timestamp_ms && timestamp_ms <= end_ms;
  }
};

struct AggregatedBucket {
  std::string period;
  uint64_t page_views = 0;
  uint64_t unique_visitors = 0; // distinct non-empty user ids
  uint64_t sessions = 0;        // distinct session ids

  bool is_zero() const {
    return page_views == 0 && unique_visitors == 0 && sessions == 0;
  }

  bool operator==(const AggregatedBucket &other) const {
    return period == other.period && page_views == other.page_views &&
           unique_visitors == other.unique_visitors &&
           sessions == other.sessions;
  }
};

enum class BucketMetric { PAGE_VIEWS, UNIQUE_VISITORS, SESSIONS };

struct RollingPoint {
  std::string period;
  double value = 0.0;
  double rolling_avg = 0.0;
};

/**
 * Buckets events by period, returning one bucket per period key sorted
 * ascending. With a range, only events inside it are counted.
 * @throws std::invalid_argument for a custom granularity of zero minutes
 */
std::vector<AggregatedBucket>
aggregate(const std::vector<EventRecord> &events,
          const TimeBucket::Granularity &granularity,
          const std::optional<TimeRange> &range = std::nullopt,
          TimeBucket::WeekStart week_start = TimeBucket::WeekStart::MONDAY);

std::vector<AggregatedBucket>
aggregate_by_hour(const std::vector<EventRecord> &events,
                  const std::optional<TimeRange> &range = std::nullopt);
std::vector<AggregatedBucket>
aggregate_by_day(const std::vector<EventRecord> &events,
                 const std::optional<TimeRange> &range = std::nullopt);
std::vector<AggregatedBucket>
aggregate_by_week(const std::vector<EventRecord> &events,
                  const std::optional<TimeRange> &range = std::nullopt,
                  TimeBucket::WeekStart week_start =
                      TimeBucket::WeekStart::MONDAY);
std::vector<AggregatedBucket>
aggregate_by_month(const std::vector<EventRecord> &events,
                   const std::optional<TimeRange> &range = std::nullopt);
std::vector<AggregatedBucket>
aggregate_by_year(const std::vector<EventRecord> &events,
                  const std::optional<TimeRange> &range = std::nullopt);

// @throws std::invalid_argument if window_minutes <= 0
std::vector<AggregatedBucket>
aggregate_by_custom_window(const std::vector<EventRecord> &events,
                           int64_t window_minutes,
                           const std::optional<TimeRange> &range = std::nullopt);

/**
 * Adds a zero bucket for every period between range.start and range.end
 * (inclusive) that has none. Existing buckets are kept untouched, including
 * any outside the range. An empty input stays empty.
 * @throws std::invalid_argument if range.start > range.end
 */
std::vector<AggregatedBucket>
fill_missing_periods(const std::vector<AggregatedBucket> &buckets,
                     const TimeBucket::Granularity &granularity,
                     const TimeRange &range,
                     TimeBucket::WeekStart week_start =
                         TimeBucket::WeekStart::MONDAY);

// Sums buckets sharing a period across datasets
std::vector<AggregatedBucket>
merge(const std::vector<std::vector<AggregatedBucket>> &datasets);

/**
 * Trailing average over up to `window_size` buckets ending at each index,
 * one decimal.
 * @throws std::invalid_argument if window_size <= 0
 */
std::vector<RollingPoint>
rolling_average(const std::vector<AggregatedBucket> &buckets, int window_size,
                BucketMetric metric = BucketMetric::PAGE_VIEWS);

// Percent change, one decimal; 100 when growing from zero, 0 when both zero
double growth_rate(double current, double previous);
double growth_rate(const AggregatedBucket &current,
                   const AggregatedBucket &previous);

// Highest page views first; ties keep their input order
std::vector<AggregatedBucket>
top_periods(const std::vector<AggregatedBucket> &buckets, size_t limit = 10);

uint64_t metric_value(const AggregatedBucket &bucket, BucketMetric metric);

// Bucket start (epoch-aligned) -> events in it, in input order
// @throws std::invalid_argument if bucket_ms == 0
std::map<uint64_t, std::vector<EventRecord>>
group_by_time_bucket(const std::vector<EventRecord> &events,
                     uint64_t bucket_ms);

} // namespace Aggregation

#endif // TIME_PERIOD_AGGREGATOR_HPP
