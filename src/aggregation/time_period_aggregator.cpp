#include "time_period_aggregator.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Aggregation {
namespace {

// Mutable state for one aggregate() call; converted to sorted buckets and
// discarded before returning
class PeriodAccumulator {
public:
  void add(const std::string &period, const EventRecord &event) {
    auto &state = periods_[period];
    state.page_views++;
    if (event.user_id && !event.user_id->empty())
      state.visitors.insert(*event.user_id);
    state.sessions.insert(event.session_id);
  }

  std::vector<AggregatedBucket> to_buckets() const {
    std::vector<AggregatedBucket> buckets;
    buckets.reserve(periods_.size());
    for (const auto &[period, state] : periods_)
      buckets.push_back({period, state.page_views, state.visitors.size(),
                         state.sessions.size()});
    return buckets;
  }

private:
  struct PeriodState {
    uint64_t page_views = 0;
    std::unordered_set<std::string> visitors;
    std::unordered_set<std::string> sessions;
  };
  // Ordered by key, which sorts chronologically
  std::map<std::string, PeriodState> periods_;
};

void sort_by_period(std::vector<AggregatedBucket> &buckets) {
  std::sort(buckets.begin(), buckets.end(),
            [](const AggregatedBucket &a, const AggregatedBucket &b) {
              return a.period < b.period;
            });
}

} // namespace

std::vector<AggregatedBucket>
aggregate(const std::vector<EventRecord> &events,
          const TimeBucket::Granularity &granularity,
          const std::optional<TimeRange> &range,
          TimeBucket::WeekStart week_start) {
  if (granularity.unit == TimeBucket::GranularityUnit::CUSTOM &&
      granularity.custom_minutes == 0) {
    LOG(LogLevel::WARN, LogComponent::AGGREGATION,
        "Rejected custom window of 0 minutes");
    throw std::invalid_argument("Window size must be positive");
  }

  PeriodAccumulator accumulator;
  size_t counted = 0;

  for (const auto &event : events) {
    if (range && !range->contains(event.timestamp_ms))
      continue;
    accumulator.add(
        TimeBucket::period_key(event.timestamp_ms, granularity, week_start),
        event);
    counted++;
  }

  auto buckets = accumulator.to_buckets();
  LOG(LogLevel::DEBUG, LogComponent::AGGREGATION,
      "Aggregated " << counted << " of " << events.size() << " events into "
                    << buckets.size() << " "
                    << TimeBucket::granularity_to_string(granularity)
                    << " buckets");
  return buckets;
}

std::vector<AggregatedBucket>
aggregate_by_hour(const std::vector<EventRecord> &events,
                  const std::optional<TimeRange> &range) {
  return aggregate(events, TimeBucket::Granularity::hour(), range);
}

std::vector<AggregatedBucket>
aggregate_by_day(const std::vector<EventRecord> &events,
                 const std::optional<TimeRange> &range) {
  return aggregate(events, TimeBucket::Granularity::day(), range);
}

std::vector<AggregatedBucket>
aggregate_by_week(const std::vector<EventRecord> &events,
                  const std::optional<TimeRange> &range,
                  TimeBucket::WeekStart week_start) {
  return aggregate(events, TimeBucket::Granularity::week(), range, week_start);
}

std::vector<AggregatedBucket>
aggregate_by_month(const std::vector<EventRecord> &events,
                   const std::optional<TimeRange> &range) {
  return aggregate(events, TimeBucket::Granularity::month(), range);
}

std::vector<AggregatedBucket>
aggregate_by_year(const std::vector<EventRecord> &events,
                  const std::optional<TimeRange> &range) {
  return aggregate(events, TimeBucket::Granularity::year(), range);
}

std::vector<AggregatedBucket>
aggregate_by_custom_window(const std::vector<EventRecord> &events,
                           int64_t window_minutes,
                           const std::optional<TimeRange> &range) {
  if (window_minutes <= 0 || window_minutes > UINT32_MAX) {
    LOG(LogLevel::WARN, LogComponent::AGGREGATION,
        "Rejected custom window of " << window_minutes << " minutes");
    throw std::invalid_argument("Window size must be positive");
  }
  return aggregate(events,
                   TimeBucket::Granularity::minutes(
                       static_cast<uint32_t>(window_minutes)),
                   range);
}

std::vector<AggregatedBucket>
fill_missing_periods(const std::vector<AggregatedBucket> &buckets,
                     const TimeBucket::Granularity &granularity,
                     const TimeRange &range, TimeBucket::WeekStart week_start) {
  if (range.start_ms > range.end_ms) {
    LOG(LogLevel::WARN, LogComponent::AGGREGATION,
        "Rejected inverted fill range " << range.start_ms << " > "
                                        << range.end_ms);
    throw std::invalid_argument("Time range start must not be after its end");
  }
  if (buckets.empty())
    return {};

  std::vector<AggregatedBucket> filled = buckets;
  std::unordered_set<std::string> present;
  for (const auto &bucket : buckets)
    present.insert(bucket.period);

  size_t inserted = 0;
  uint64_t cursor =
      TimeBucket::period_start(range.start_ms, granularity, week_start);
  while (cursor <= range.end_ms) {
    std::string key = Utils::format_iso8601_utc(cursor);
    if (present.insert(key).second) {
      filled.push_back({key, 0, 0, 0});
      inserted++;
    }
    uint64_t next = TimeBucket::next_period_start(cursor, granularity);
    // Past the representable range
    if (next <= cursor)
      break;
    cursor = next;
  }

  sort_by_period(filled);
  LOG(LogLevel::DEBUG, LogComponent::AGGREGATION,
      "Filled " << inserted << " empty periods");
  return filled;
}

std::vector<AggregatedBucket>
merge(const std::vector<std::vector<AggregatedBucket>> &datasets) {
  std::map<std::string, AggregatedBucket> merged;

  for (const auto &dataset : datasets) {
    for (const auto &bucket : dataset) {
      auto [it, inserted] = merged.try_emplace(bucket.period, bucket);
      if (!inserted) {
        it->second.page_views += bucket.page_views;
        it->second.unique_visitors += bucket.unique_visitors;
        it->second.sessions += bucket.sessions;
      }
    }
  }

  std::vector<AggregatedBucket> result;
  result.reserve(merged.size());
  for (auto &entry : merged)
    result.push_back(std::move(entry.second));
  return result;
}

uint64_t metric_value(const AggregatedBucket &bucket, BucketMetric metric) {
  switch (metric) {
  case BucketMetric::PAGE_VIEWS:
    return bucket.page_views;
  case BucketMetric::UNIQUE_VISITORS:
    return bucket.unique_visitors;
  case BucketMetric::SESSIONS:
    return bucket.sessions;
  }
  return bucket.page_views;
}

std::vector<RollingPoint>
rolling_average(const std::vector<AggregatedBucket> &buckets, int window_size,
                BucketMetric metric) {
  if (window_size <= 0) {
    LOG(LogLevel::WARN, LogComponent::AGGREGATION,
        "Rejected rolling window of " << window_size);
    throw std::invalid_argument("Window size must be positive");
  }

  const size_t window = static_cast<size_t>(window_size);
  std::vector<RollingPoint> points;
  points.reserve(buckets.size());

  for (size_t i = 0; i < buckets.size(); ++i) {
    size_t first = i + 1 >= window ? i + 1 - window : 0;
    double sum = 0.0;
    for (size_t j = first; j <= i; ++j)
      sum += static_cast<double>(metric_value(buckets[j], metric));

    double value = static_cast<double>(metric_value(buckets[i], metric));
    points.push_back({buckets[i].period, value,
                      Utils::round_to_decimals(
                          sum / static_cast<double>(i - first + 1), 1)});
  }
  return points;
}

double growth_rate(double current, double previous) {
  if (previous == 0.0)
    return current > 0.0 ? 100.0 : 0.0;
  return Utils::round_to_decimals((current - previous) / previous * 100.0, 1);
}

double growth_rate(const AggregatedBucket &current,
                   const AggregatedBucket &previous) {
  return growth_rate(static_cast<double>(current.page_views),
                     static_cast<double>(previous.page_views));
}

std::vector<AggregatedBucket>
top_periods(const std::vector<AggregatedBucket> &buckets, size_t limit) {
  std::vector<AggregatedBucket> ranked = buckets;
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const AggregatedBucket &a, const AggregatedBucket &b) {
                     return a.page_views > b.page_views;
                   });
  if (ranked.size() > limit)
    ranked.resize(limit);
  return ranked;
}

std::map<uint64_t, std::vector<EventRecord>>
group_by_time_bucket(const std::vector<EventRecord> &events,
                     uint64_t bucket_ms) {
  if (bucket_ms == 0) {
    LOG(LogLevel::WARN, LogComponent::AGGREGATION,
        "Rejected time bucket of 0 ms");
    throw std::invalid_argument("Bucket size must be positive");
  }

  std::map<uint64_t, std::vector<EventRecord>> groups;
  for (const auto &event : events)
    groups[(event.timestamp_ms / bucket_ms) * bucket_ms].push_back(event);
  return groups;
}

} // namespace Aggregation
