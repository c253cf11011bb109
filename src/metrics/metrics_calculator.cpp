#include "metrics_calculator.hpp"
#include "core/logger.hpp"
#include "utils/stats_tracker.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Metrics {
namespace {

double whole_seconds(double seconds) {
  return Utils::round_to_decimals(seconds, 0);
}

std::vector<double> closed_durations(const std::vector<Session> &sessions) {
  std::vector<double> durations;
  for (const auto &session : sessions)
    if (auto duration = session.duration_seconds())
      durations.push_back(*duration);
  return durations;
}

// Middle value, or the mean of the two middle values, of a sorted copy
double median_of(std::vector<double> values) {
  if (values.empty())
    return 0.0;
  std::sort(values.begin(), values.end());
  size_t mid = values.size() / 2;
  if (values.size() % 2 == 0)
    return (values[mid - 1] + values[mid]) / 2.0;
  return values[mid];
}

std::unordered_map<std::string, uint64_t>
sessions_per_user(const std::vector<Session> &sessions) {
  std::unordered_map<std::string, uint64_t> counts;
  for (const auto &session : sessions)
    if (session.user_id && !session.user_id->empty())
      counts[*session.user_id]++;
  return counts;
}

std::vector<std::pair<std::string, uint64_t>>
count_paths(const std::vector<EventRecord> &page_views) {
  std::vector<std::pair<std::string, uint64_t>> counts;
  std::unordered_map<std::string, size_t> index;
  for (const auto &pv : page_views) {
    auto [it, inserted] = index.try_emplace(pv.path, counts.size());
    if (inserted)
      counts.emplace_back(pv.path, 0);
    counts[it->second].second++;
  }
  return counts;
}

} // namespace

const char *trend_to_string(Trend trend) {
  switch (trend) {
  case Trend::UP:
    return "up";
  case Trend::DOWN:
    return "down";
  case Trend::FLAT:
    return "flat";
  }
  return "flat";
}

std::vector<std::pair<std::string, uint64_t>>
DurationBuckets::labelled() const {
  return {{"0-30s", under_30s},
          {"30s-1m", from_30s_to_1m},
          {"1m-3m", from_1m_to_3m},
          {"3m-10m", from_3m_to_10m},
          {"10m+", over_10m}};
}

double bounce_rate(const std::vector<Session> &sessions) {
  if (sessions.empty())
    return 0.0;

  auto bounced = std::count_if(sessions.begin(), sessions.end(),
                               [](const Session &s) { return s.bounced(); });
  return Utils::percentage_of(static_cast<double>(bounced),
                              static_cast<double>(sessions.size()));
}

double average_session_duration(const std::vector<Session> &sessions) {
  auto durations = closed_durations(sessions);
  if (durations.empty())
    return 0.0;
  return whole_seconds(StatsTracker(durations).get_mean());
}

double median_session_duration(const std::vector<Session> &sessions) {
  return whole_seconds(median_of(closed_durations(sessions)));
}

double average_page_views_per_session(const std::vector<Session> &sessions) {
  if (sessions.empty())
    return 0.0;

  size_t total = 0;
  for (const auto &session : sessions)
    total += session.page_views.size();
  return Utils::round_to_decimals(
      static_cast<double>(total) / static_cast<double>(sessions.size()), 1);
}

double conversion_rate(const std::vector<Session> &sessions,
                       const std::vector<TrackedEvent> &conversions) {
  if (sessions.empty())
    return 0.0;

  std::unordered_set<std::string> converted_ids;
  for (const auto &conversion : conversions)
    converted_ids.insert(conversion.session_id);

  auto converted = std::count_if(
      sessions.begin(), sessions.end(),
      [&](const Session &s) { return converted_ids.count(s.id) > 0; });
  return Utils::percentage_of(static_cast<double>(converted),
                              static_cast<double>(sessions.size()));
}

double exit_rate(const std::vector<EventRecord> &page_views,
                 const std::string &path) {
  uint64_t views = 0;
  uint64_t exits = 0;
  for (const auto &pv : page_views) {
    if (pv.path != path)
      continue;
    views++;
    if (pv.exit_page.value_or(false))
      exits++;
  }
  return Utils::percentage_of(static_cast<double>(exits),
                              static_cast<double>(views));
}

double average_time_on_page(const std::vector<EventRecord> &page_views) {
  return time_metrics(page_views).avg_time_on_page;
}

uint64_t unique_visitors(const std::vector<EventRecord> &page_views) {
  std::unordered_set<std::string> users;
  for (const auto &pv : page_views)
    if (pv.user_id && !pv.user_id->empty())
      users.insert(*pv.user_id);
  return users.size();
}

double return_visitor_rate(const std::vector<Session> &sessions) {
  auto ratio = visitor_ratio(sessions);
  return Utils::percentage_of(
      static_cast<double>(ratio.returning_visitors),
      static_cast<double>(ratio.new_visitors + ratio.returning_visitors));
}

VisitorRatio visitor_ratio(const std::vector<Session> &sessions) {
  VisitorRatio ratio;
  for (const auto &[user, count] : sessions_per_user(sessions)) {
    if (count > 1)
      ratio.returning_visitors++;
    else
      ratio.new_visitors++;
  }
  return ratio;
}

MetricsSummary calculate_metrics_summary(
    const std::vector<EventRecord> &page_views,
    const std::vector<Session> &sessions,
    const std::optional<std::vector<TrackedEvent>> &conversions) {
  MetricsSummary summary;
  summary.total_page_views = page_views.size();
  summary.unique_visitors = unique_visitors(page_views);
  summary.total_sessions = sessions.size();
  summary.bounce_rate = bounce_rate(sessions);
  summary.avg_session_duration = average_session_duration(sessions);
  summary.avg_page_views_per_session =
      average_page_views_per_session(sessions);
  if (conversions)
    summary.conversion_rate = conversion_rate(sessions, *conversions);

  LOG(LogLevel::DEBUG, LogComponent::METRICS,
      "Summary over " << summary.total_sessions << " sessions, bounce rate "
                      << summary.bounce_rate);
  return summary;
}

double percentile(const std::vector<double> &values, double p) {
  if (p < 0.0 || p > 100.0 || std::isnan(p)) {
    LOG(LogLevel::WARN, LogComponent::METRICS, "Rejected percentile " << p);
    throw std::invalid_argument("Percentile must be between 0 and 100");
  }
  if (values.empty())
    return 0.0;

  std::vector<double> sorted = values;
  std::sort(sorted.begin(), sorted.end());

  double index = (p / 100.0) * static_cast<double>(sorted.size() - 1);
  size_t lower_index = static_cast<size_t>(std::floor(index));
  size_t upper_index = static_cast<size_t>(std::ceil(index));

  if (lower_index == upper_index)
    return Utils::round_to_decimals(sorted[lower_index], 1);

  double weight = index - static_cast<double>(lower_index);
  return Utils::round_to_decimals(sorted[lower_index] * (1.0 - weight) +
                                      sorted[upper_index] * weight,
                                  1);
}

PerformanceMetrics performance_metrics(const std::vector<double> &values,
                                       const std::string &metric_name) {
  PerformanceMetrics metrics;
  metrics.metric = metric_name;
  if (!values.empty())
    metrics.value =
        Utils::round_to_decimals(StatsTracker(values).get_mean(), 1);
  metrics.percentile50 = percentile(values, 50);
  metrics.percentile75 = percentile(values, 75);
  metrics.percentile95 = percentile(values, 95);
  return metrics;
}

int engagement_score(const Session &session) {
  double score =
      std::min(static_cast<double>(session.page_views.size()) * 5.0, 30.0);

  if (auto duration = session.duration_seconds())
    score += std::min(*duration / 60.0 * 4.0, 40.0);

  if (session.converted.value_or(false))
    score += 30.0;

  return static_cast<int>(std::min(Utils::round_to_decimals(score, 0), 100.0));
}

double session_quality(const std::vector<Session> &sessions) {
  if (sessions.empty())
    return 0.0;

  double total = 0.0;
  for (const auto &session : sessions)
    total += engagement_score(session);
  return Utils::round_to_decimals(total / static_cast<double>(sessions.size()),
                                  1);
}

std::vector<TrendingPage>
trending_pages(const std::vector<EventRecord> &current,
               const std::vector<EventRecord> &previous, double min_growth) {
  std::unordered_map<std::string, uint64_t> previous_counts;
  for (const auto &[path, count] : count_paths(previous))
    previous_counts[path] = count;

  std::vector<TrendingPage> trending;
  for (const auto &[path, count] : count_paths(current)) {
    auto it = previous_counts.find(path);
    uint64_t before = it == previous_counts.end() ? 0 : it->second;

    if (before == 0) {
      trending.push_back({path, count, 0, 100.0});
      continue;
    }
    double growth = Utils::round_to_decimals(
        (static_cast<double>(count) - static_cast<double>(before)) /
            static_cast<double>(before) * 100.0,
        0);
    if (growth >= min_growth)
      trending.push_back({path, count, before, growth});
  }

  std::stable_sort(trending.begin(), trending.end(),
                   [](const TrendingPage &a, const TrendingPage &b) {
                     return a.growth > b.growth;
                   });
  return trending;
}

TimeMetrics time_metrics(const std::vector<EventRecord> &page_views) {
  std::vector<double> durations;
  for (const auto &pv : page_views)
    if (pv.duration_s)
      durations.push_back(*pv.duration_s);

  TimeMetrics metrics;
  if (durations.empty())
    return metrics;

  StatsTracker stats(durations);
  metrics.total_time_on_site = stats.get_sum();
  metrics.avg_time_on_page = whole_seconds(stats.get_mean());
  metrics.median_time_on_page = whole_seconds(median_of(durations));
  return metrics;
}

Comparison comparison(double current, double previous) {
  Comparison result;
  result.change = current - previous;
  if (previous == 0.0)
    result.change_percent = current > 0.0 ? 100.0 : 0.0;
  else
    result.change_percent =
        Utils::round_to_decimals(result.change / previous * 100.0, 1);

  if (result.change > 0)
    result.trend = Trend::UP;
  else if (result.change < 0)
    result.trend = Trend::DOWN;
  return result;
}

std::map<size_t, uint64_t>
pages_per_session_distribution(const std::vector<Session> &sessions) {
  std::map<size_t, uint64_t> distribution;
  for (const auto &session : sessions)
    distribution[session.page_views.size()]++;
  return distribution;
}

DurationBuckets duration_buckets(const std::vector<Session> &sessions) {
  DurationBuckets buckets;
  for (double seconds : closed_durations(sessions)) {
    if (seconds < 30)
      buckets.under_30s++;
    else if (seconds < 60)
      buckets.from_30s_to_1m++;
    else if (seconds < 180)
      buckets.from_1m_to_3m++;
    else if (seconds < 600)
      buckets.from_3m_to_10m++;
    else
      buckets.over_10m++;
  }
  return buckets;
}

AnomalyResult detect_anomalies(const std::vector<double> &values,
                               double threshold) {
  if (threshold < 0.0 || std::isnan(threshold)) {
    LOG(LogLevel::WARN, LogComponent::METRICS,
        "Rejected anomaly threshold " << threshold);
    throw std::invalid_argument("Anomaly threshold must not be negative");
  }

  AnomalyResult result;
  if (values.empty())
    return result;

  StatsTracker stats(values);
  const double mean = stats.get_mean();
  const double std_dev = stats.get_population_stddev();
  // Identical values give a zero deviation
  const double divisor = std::max(std_dev, 1.0);

  for (double value : values)
    if (std::abs(value - mean) / divisor > threshold)
      result.anomalies.push_back(value);

  result.mean = Utils::round_to_decimals(mean, 1);
  result.std_dev = Utils::round_to_decimals(std_dev, 1);

  LOG(LogLevel::DEBUG, LogComponent::METRICS,
      "Found " << result.anomalies.size() << " anomalies in " << values.size()
               << " values (mean " << result.mean << ", stddev "
               << result.std_dev << ")");
  return result;
}

} // namespace Metrics
