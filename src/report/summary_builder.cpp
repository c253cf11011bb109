#include "summary_builder.hpp"
#include "classify/referrer_parser.hpp"
#include "classify/ua_parser.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Report {
namespace {

bool is_bot_view(const EventRecord &record) {
  return record.user_agent && UAParser::is_bot(*record.user_agent);
}

bool is_bot_session(const Session &session) {
  return !session.page_views.empty() &&
         std::all_of(session.page_views.begin(), session.page_views.end(),
                     is_bot_view);
}

std::vector<EventRecord> without_bots(const std::vector<EventRecord> &views) {
  std::vector<EventRecord> kept;
  std::copy_if(views.begin(), views.end(), std::back_inserter(kept),
               [](const EventRecord &r) { return !is_bot_view(r); });
  return kept;
}

// Copies keyed by page_path, so "/a?x=1" and "/a" count as one page
std::vector<EventRecord> by_page_path(std::vector<EventRecord> views) {
  for (auto &view : views)
    view.path = page_path(view.path);
  return views;
}

std::vector<RankedEntry> top_of(const RankedCounter &counter, int top_n) {
  return counter.top(static_cast<size_t>(std::max(top_n, 1)));
}

} // namespace

std::optional<std::string> primary_language(const std::string &tag) {
  std::string trimmed = Utils::trim_copy(tag);
  std::string primary = trimmed.substr(0, trimmed.find_first_of("-_"));
  if (primary.empty())
    return std::nullopt;
  return Utils::to_lower_copy(primary);
}

std::string page_path(const std::string &path) {
  return path.substr(0, path.find_first_of("?#"));
}

AnalyticsSummary build_summary(const SummaryInput &input,
                               const Config::AppConfig &config) {
  AnalyticsSummary summary;
  summary.site = config.site_host;
  summary.range = input.range;
  summary.granularity =
      TimeBucket::granularity_to_string(config.aggregation.granularity);

  std::vector<EventRecord> page_views;
  std::vector<Session> sessions;
  if (config.classification.exclude_bots) {
    page_views = without_bots(input.page_views);
    std::copy_if(input.sessions.begin(), input.sessions.end(),
                 std::back_inserter(sessions),
                 [](const Session &s) { return !is_bot_session(s); });
    summary.bot_page_views_excluded =
        input.page_views.size() - page_views.size();
  } else {
    page_views = input.page_views;
    sessions = input.sessions;
  }

  RankedCounter pages, referrers, media, devices, browsers, systems, countries,
      languages, campaigns, events;
  std::vector<std::string> user_agents;
  const auto outdated_thresholds =
      UAParser::thresholds_from_config(config.classification);
  uint64_t outdated_views = 0;

  for (const auto &record : page_views) {
    pages.add(page_path(record.path));

    auto source = ReferrerParser::classify(record.referrer.value_or(""),
                                           config.site_host);
    media.add(source.medium);
    if (source.medium != ReferrerParser::Medium::DIRECT &&
        source.medium != ReferrerParser::Medium::INTERNAL)
      referrers.add(ReferrerParser::normalize_source(source.source));

    auto campaign = source.campaign;
    if (!campaign)
      campaign = ReferrerParser::campaign_of(record.path);
    if (campaign)
      campaigns.add(*campaign);

    const std::string user_agent = record.user_agent.value_or("");
    auto device = UAParser::classify(user_agent);
    devices.add(device.device);
    browsers.add(device.browser);
    systems.add(device.os);
    user_agents.push_back(user_agent);
    if (device.browser_version &&
        UAParser::is_outdated(device.browser, *device.browser_version,
                              outdated_thresholds))
      outdated_views++;

    countries.add(record.country.value_or("Unknown"));

    if (record.language)
      if (auto language = primary_language(*record.language))
        languages.add(*language);
  }

  for (const auto &event : input.tracked_events)
    events.add(event.event_type);

  const int top_n = config.metrics.top_n;
  summary.pages = top_of(pages, top_n);
  summary.referrers = top_of(referrers, top_n);
  summary.media = top_of(media, top_n);
  summary.devices = top_of(devices, top_n);
  summary.browsers = top_of(browsers, top_n);
  summary.operating_systems = top_of(systems, top_n);
  summary.countries = top_of(countries, top_n);
  summary.languages = top_of(languages, top_n);
  summary.campaigns = top_of(campaigns, top_n);
  summary.events = top_of(events, top_n);

  summary.mobile_percentage = UAParser::mobile_percentage(user_agents);
  // Same classification as the media breakdown, site host included
  summary.organic_percentage = Utils::percentage_of(
      static_cast<double>(media.count_of(ReferrerParser::Medium::SEARCH)),
      static_cast<double>(media.total()));
  summary.outdated_browser_percentage =
      Utils::percentage_of(static_cast<double>(outdated_views),
                           static_cast<double>(page_views.size()));

  summary.metrics = Metrics::calculate_metrics_summary(page_views, sessions,
                                                       input.conversions);
  summary.median_session_duration = Metrics::median_session_duration(sessions);
  summary.return_visitor_rate = Metrics::return_visitor_rate(sessions);
  summary.session_quality = Metrics::session_quality(sessions);
  summary.duration_buckets = Metrics::duration_buckets(sessions);

  if (input.previous_page_views) {
    auto previous = config.classification.exclude_bots
                        ? without_bots(*input.previous_page_views)
                        : *input.previous_page_views;
    summary.trending_pages = Metrics::trending_pages(
        by_page_path(page_views), by_page_path(std::move(previous)),
        config.metrics.trending_min_growth);
    if (summary.trending_pages.size() > static_cast<size_t>(std::max(top_n, 1)))
      summary.trending_pages.resize(static_cast<size_t>(std::max(top_n, 1)));
  }

  const auto &aggregation = config.aggregation;
  summary.time_series =
      Aggregation::aggregate(page_views, aggregation.granularity, input.range,
                             aggregation.week_start);
  if (input.range && aggregation.fill_missing_periods)
    summary.time_series = Aggregation::fill_missing_periods(
        summary.time_series, aggregation.granularity, *input.range,
        aggregation.week_start);

  summary.rolling_average = Aggregation::rolling_average(
      summary.time_series, aggregation.rolling_window);

  std::vector<double> series;
  series.reserve(summary.time_series.size());
  for (const auto &bucket : summary.time_series)
    series.push_back(static_cast<double>(bucket.page_views));
  summary.page_view_anomalies =
      Metrics::detect_anomalies(series, config.metrics.anomaly_threshold);

  LOG(LogLevel::INFO, LogComponent::REPORT,
      "Built summary for '" << summary.site << "': "
                            << summary.metrics.total_page_views
                            << " pageviews, " << summary.metrics.total_sessions
                            << " sessions, " << summary.time_series.size()
                            << " periods, " << summary.bot_page_views_excluded
                            << " bot pageviews excluded");
  return summary;
}

} // namespace Report
