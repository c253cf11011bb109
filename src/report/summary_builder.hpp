#ifndef SUMMARY_BUILDER_HPP
#define SUMMARY_BUILDER_HPP

#include "aggregation/time_period_aggregator.hpp"
#include "core/config.hpp"
#include "core/event_record.hpp"
#include "core/session.hpp"
#include "metrics/metrics_calculator.hpp"
#include "utils/ranked_counter.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Report {

struct SummaryInput {
  std::vector<EventRecord> page_views;
  std::vector<Session> sessions;
  // Custom events for the events breakdown
  std::vector<TrackedEvent> tracked_events;
  // Conversion events; without them no conversion rate is reported
  std::optional<std::vector<TrackedEvent>> conversions;
  // Window the records were loaded for; enables gap filling
  std::optional<Aggregation::TimeRange> range;
  // Pageviews of the preceding window; enables trending pages
  std::optional<std::vector<EventRecord>> previous_page_views;
};

struct AnalyticsSummary {
  std::string site;
  std::optional<Aggregation::TimeRange> range;
  std::string granularity;

  Metrics::MetricsSummary metrics;
  double median_session_duration = 0.0;
  double return_visitor_rate = 0.0;
  double session_quality = 0.0;
  double mobile_percentage = 0.0;
  double organic_percentage = 0.0;
  // Share of pageviews from browsers below the configured minimum versions
  double outdated_browser_percentage = 0.0;
  uint64_t bot_page_views_excluded = 0;

  // Ranked (label, count) breakdowns, at most top_n entries each
  std::vector<RankedEntry> pages;
  std::vector<RankedEntry> referrers;
  std::vector<RankedEntry> media;
  std::vector<RankedEntry> devices;
  std::vector<RankedEntry> browsers;
  std::vector<RankedEntry> operating_systems;
  std::vector<RankedEntry> countries;
  std::vector<RankedEntry> languages;
  std::vector<RankedEntry> campaigns;
  std::vector<RankedEntry> events;

  // Growth against previous_page_views, at least trending_min_growth percent
  std::vector<Metrics::TrendingPage> trending_pages;

  std::vector<Aggregation::AggregatedBucket> time_series;
  std::vector<Aggregation::RollingPoint> rolling_average;
  Metrics::AnomalyResult page_view_anomalies;
  Metrics::DurationBuckets duration_buckets;
};

/**
 * Runs the classifiers, the time-period aggregator and the metrics
 * calculator over one site's records and assembles the dashboard summary.
 * With exclude_bots set, bot pageviews and sessions made only of bot
 * pageviews are dropped first, from the previous window too. Referrer
 * breakdowns leave out internal and direct traffic.
 */
AnalyticsSummary build_summary(const SummaryInput &input,
                               const Config::AppConfig &config);

// "en-US" -> "en"; nullopt for an empty tag
std::optional<std::string> primary_language(const std::string &tag);

// Path without its query string or fragment
std::string page_path(const std::string &path);

} // namespace Report

#endif // SUMMARY_BUILDER_HPP
