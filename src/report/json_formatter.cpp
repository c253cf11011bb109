#include "json_formatter.hpp"
#include "utils/utils.hpp"

#include <string>
#include <vector>

nlohmann::json
JsonFormatter::device_info_to_json(const UAParser::DeviceInfo &info) {
  nlohmann::json j;
  j["browser"] = info.browser;
  if (info.browser_version)
    j["browser_version"] = *info.browser_version;
  j["os"] = info.os;
  if (info.os_version)
    j["os_version"] = *info.os_version;
  j["device"] = info.device;
  j["is_bot"] = info.is_bot;
  j["is_mobile"] = info.is_mobile;
  j["is_tablet"] = info.is_tablet;
  j["is_desktop"] = info.is_desktop;
  return j;
}

nlohmann::json JsonFormatter::referrer_info_to_json(
    const ReferrerParser::ReferrerInfo &info) {
  nlohmann::json j;
  j["source"] = info.source;
  j["medium"] = info.medium;
  if (info.campaign)
    j["campaign"] = *info.campaign;
  if (info.search_term)
    j["search_term"] = *info.search_term;
  j["is_internal"] = info.is_internal;
  return j;
}

nlohmann::json
JsonFormatter::ranked_to_json(const std::vector<RankedEntry> &entries) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &entry : entries)
    j.push_back({{"label", entry.label},
                 {"count", entry.count},
                 {"percentage", entry.percentage}});
  return j;
}

nlohmann::json JsonFormatter::buckets_to_json(
    const std::vector<Aggregation::AggregatedBucket> &buckets) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &bucket : buckets)
    j.push_back({{"period", bucket.period},
                 {"page_views", bucket.page_views},
                 {"unique_visitors", bucket.unique_visitors},
                 {"sessions", bucket.sessions}});
  return j;
}

nlohmann::json
JsonFormatter::summary_to_json_object(const Report::AnalyticsSummary &summary) {
  nlohmann::json j;

  j["site"] = summary.site;
  if (summary.range)
    j["range"] = {{"start", Utils::format_iso8601_utc(summary.range->start_ms)},
                  {"end", Utils::format_iso8601_utc(summary.range->end_ms)}};
  j["granularity"] = summary.granularity;

  // === Headline Metrics ===
  const auto &m = summary.metrics;
  nlohmann::json j_metrics = {
      {"page_views", m.total_page_views},
      {"unique_visitors", m.unique_visitors},
      {"sessions", m.total_sessions},
      {"bounce_rate", m.bounce_rate},
      {"avg_session_duration_s", m.avg_session_duration},
      {"median_session_duration_s", summary.median_session_duration},
      {"avg_page_views_per_session", m.avg_page_views_per_session},
      {"return_visitor_rate", summary.return_visitor_rate},
      {"session_quality", summary.session_quality},
      {"mobile_percentage", summary.mobile_percentage},
      {"organic_percentage", summary.organic_percentage},
      {"outdated_browser_percentage", summary.outdated_browser_percentage},
      {"bot_page_views_excluded", summary.bot_page_views_excluded}};
  if (m.conversion_rate)
    j_metrics["conversion_rate"] = *m.conversion_rate;
  j["metrics"] = j_metrics;

  // === Breakdowns ===
  j["breakdowns"] = {
      {"pages", ranked_to_json(summary.pages)},
      {"referrers", ranked_to_json(summary.referrers)},
      {"media", ranked_to_json(summary.media)},
      {"devices", ranked_to_json(summary.devices)},
      {"browsers", ranked_to_json(summary.browsers)},
      {"operating_systems", ranked_to_json(summary.operating_systems)},
      {"countries", ranked_to_json(summary.countries)},
      {"languages", ranked_to_json(summary.languages)},
      {"campaigns", ranked_to_json(summary.campaigns)},
      {"events", ranked_to_json(summary.events)}};

  nlohmann::json j_trending = nlohmann::json::array();
  for (const auto &page : summary.trending_pages)
    j_trending.push_back({{"path", page.path},
                          {"current", page.current},
                          {"previous", page.previous},
                          {"growth", page.growth}});
  j["trending_pages"] = j_trending;

  nlohmann::json j_durations = nlohmann::json::object();
  for (const auto &[label, count] : summary.duration_buckets.labelled())
    j_durations[label] = count;
  j["session_durations"] = j_durations;

  // === Time Series ===
  j["time_series"] = buckets_to_json(summary.time_series);

  nlohmann::json j_rolling = nlohmann::json::array();
  for (const auto &point : summary.rolling_average)
    j_rolling.push_back({{"period", point.period},
                         {"value", point.value},
                         {"rolling_avg", point.rolling_avg}});
  j["rolling_average"] = j_rolling;

  j["page_view_anomalies"] = {
      {"values", summary.page_view_anomalies.anomalies},
      {"mean", summary.page_view_anomalies.mean},
      {"std_dev", summary.page_view_anomalies.std_dev}};

  return j;
}

std::string
JsonFormatter::format_summary_to_json(const Report::AnalyticsSummary &summary,
                                      int indent) {
  // Labels carry raw paths and percent-decoded query values, which need not
  // be valid UTF-8
  return summary_to_json_object(summary).dump(
      indent, ' ', false, nlohmann::json::error_handler_t::replace);
}
