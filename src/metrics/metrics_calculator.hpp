#ifndef METRICS_CALCULATOR_HPP
#define METRICS_CALCULATOR_HPP

#include "core/event_record.hpp"
#include "core/session.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Metrics {

struct MetricsSummary {
  uint64_t total_page_views = 0;
  uint64_t unique_visitors = 0;
  uint64_t total_sessions = 0;
  double bounce_rate = 0.0;
  double avg_session_duration = 0.0; // whole seconds
  double avg_page_views_per_session = 0.0;
  std::optional<double> conversion_rate;
};

struct PerformanceMetrics {
  std::string metric;
  double value = 0.0; // mean, one decimal
  double percentile50 = 0.0;
  double percentile75 = 0.0;
  double percentile95 = 0.0;
};

struct TrendingPage {
  std::string path;
  uint64_t current = 0;
  uint64_t previous = 0;
  double growth = 0.0; // whole percent
};

struct VisitorRatio {
  uint64_t new_visitors = 0;
  uint64_t returning_visitors = 0;
};

struct TimeMetrics {
  double avg_time_on_page = 0.0;
  double median_time_on_page = 0.0;
  double total_time_on_site = 0.0;
};

enum class Trend { UP, DOWN, FLAT };

struct Comparison {
  double change = 0.0;
  double change_percent = 0.0;
  Trend trend = Trend::FLAT;
};

struct DurationBuckets {
  uint64_t under_30s = 0;
  uint64_t from_30s_to_1m = 0;
  uint64_t from_1m_to_3m = 0;
  uint64_t from_3m_to_10m = 0;
  uint64_t over_10m = 0;

  // ("0-30s", n), ("30s-1m", n), ... in ascending order
  std::vector<std::pair<std::string, uint64_t>> labelled() const;
};

struct AnomalyResult {
  std::vector<double> anomalies; // input order
  double mean = 0.0;
  double std_dev = 0.0;
};

const char *trend_to_string(Trend trend);

// Percentage of sessions with at most one pageview, one decimal
double bounce_rate(const std::vector<Session> &sessions);

// Over closed sessions only; whole seconds
double average_session_duration(const std::vector<Session> &sessions);
double median_session_duration(const std::vector<Session> &sessions);

double average_page_views_per_session(const std::vector<Session> &sessions);

// Share of sessions named by at least one conversion event
double conversion_rate(const std::vector<Session> &sessions,
                       const std::vector<TrackedEvent> &conversions);

// Share of the pageviews of `path` that were exits
double exit_rate(const std::vector<EventRecord> &page_views,
                 const std::string &path);

double average_time_on_page(const std::vector<EventRecord> &page_views);
uint64_t unique_visitors(const std::vector<EventRecord> &page_views);

// Share of known users with more than one session
double return_visitor_rate(const std::vector<Session> &sessions);
VisitorRatio visitor_ratio(const std::vector<Session> &sessions);

MetricsSummary calculate_metrics_summary(
    const std::vector<EventRecord> &page_views,
    const std::vector<Session> &sessions,
    const std::optional<std::vector<TrackedEvent>> &conversions =
        std::nullopt);

/**
 * Linear-interpolation percentile over a sorted copy of `values`, one
 * decimal. Empty input yields 0.
 * @throws std::invalid_argument if p is outside [0, 100]
 */
double percentile(const std::vector<double> &values, double p);

PerformanceMetrics performance_metrics(const std::vector<double> &values,
                                       const std::string &metric_name);

/**
 * 0-100 score: 5 points per pageview (max 30), 4 per minute of duration
 * (max 40) and 30 for a converted session.
 */
int engagement_score(const Session &session);
double session_quality(const std::vector<Session> &sessions);

std::vector<TrendingPage>
trending_pages(const std::vector<EventRecord> &current,
               const std::vector<EventRecord> &previous,
               double min_growth = 50.0);

TimeMetrics time_metrics(const std::vector<EventRecord> &page_views);

Comparison comparison(double current, double previous);

// Pageview count -> number of sessions with that many
std::map<size_t, uint64_t>
pages_per_session_distribution(const std::vector<Session> &sessions);

DurationBuckets duration_buckets(const std::vector<Session> &sessions);

/**
 * Values whose |value - mean| / max(stddev, 1) exceeds `threshold`, using
 * the population standard deviation.
 * @throws std::invalid_argument if threshold is negative
 */
AnomalyResult detect_anomalies(const std::vector<double> &values,
                               double threshold = 2.0);

} // namespace Metrics

#endif // METRICS_CALCULATOR_HPP
