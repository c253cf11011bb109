#include "summary_metrics_exporter.hpp"
#include "core/logger.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

prometheus::Family<prometheus::Gauge> &
register_gauge(prometheus::Registry &registry, const std::string &name,
               const std::string &help) {
  return prometheus::BuildGauge().Name(name).Help(help).Register(registry);
}

} // namespace

SummaryMetricsExporter::SummaryMetricsExporter(
    std::shared_ptr<prometheus::Registry> registry)
    : registry_(std::move(registry)),
      page_views_(register_gauge(*registry_, "webstats_page_views",
                                 "Pageviews in the summarised window")),
      unique_visitors_(
          register_gauge(*registry_, "webstats_unique_visitors",
                         "Distinct identified users in the window")),
      sessions_(register_gauge(*registry_, "webstats_sessions",
                               "Sessions in the summarised window")),
      bounce_rate_(register_gauge(*registry_, "webstats_bounce_rate_percent",
                                  "Share of single-pageview sessions")),
      avg_session_duration_(
          register_gauge(*registry_, "webstats_avg_session_duration_seconds",
                         "Mean duration of closed sessions")),
      conversion_rate_(
          register_gauge(*registry_, "webstats_conversion_rate_percent",
                         "Share of sessions with a conversion event")),
      breakdown_count_(register_gauge(*registry_, "webstats_breakdown_count",
                                      "Count per breakdown label")) {}

std::shared_ptr<prometheus::Registry> SummaryMetricsExporter::get_registry() {
  return registry_;
}

void SummaryMetricsExporter::publish(const Report::AnalyticsSummary &summary) {
  const std::string &site = summary.site;
  const auto &m = summary.metrics;

  remove_site_series(site);

  page_views_.Add({{"site", site}})
      .Set(static_cast<double>(m.total_page_views));
  unique_visitors_.Add({{"site", site}})
      .Set(static_cast<double>(m.unique_visitors));
  sessions_.Add({{"site", site}}).Set(static_cast<double>(m.total_sessions));
  bounce_rate_.Add({{"site", site}}).Set(m.bounce_rate);
  avg_session_duration_.Add({{"site", site}}).Set(m.avg_session_duration);
  if (m.conversion_rate) {
    auto &gauge = conversion_rate_.Add({{"site", site}});
    gauge.Set(*m.conversion_rate);
    conversion_series_[site] = &gauge;
  }

  publish_breakdown(site, "page", summary.pages);
  publish_breakdown(site, "referrer", summary.referrers);
  publish_breakdown(site, "medium", summary.media);
  publish_breakdown(site, "device", summary.devices);
  publish_breakdown(site, "browser", summary.browsers);
  publish_breakdown(site, "os", summary.operating_systems);
  publish_breakdown(site, "country", summary.countries);
  publish_breakdown(site, "language", summary.languages);
  publish_breakdown(site, "campaign", summary.campaigns);
  publish_breakdown(site, "event", summary.events);

  LOG(LogLevel::DEBUG, LogComponent::REPORT,
      "Published summary gauges for '" << site << "'");
}

void SummaryMetricsExporter::publish_breakdown(
    const std::string &site, const std::string &breakdown,
    const std::vector<RankedEntry> &entries) {
  auto &published = breakdown_series_[site];
  for (const auto &entry : entries) {
    auto &gauge = breakdown_count_.Add(
        {{"site", site}, {"breakdown", breakdown}, {"label", entry.label}});
    gauge.Set(static_cast<double>(entry.count));
    published.push_back(&gauge);
  }
}

void SummaryMetricsExporter::remove_site_series(const std::string &site) {
  auto breakdowns = breakdown_series_.find(site);
  if (breakdowns != breakdown_series_.end()) {
    for (auto *gauge : breakdowns->second)
      breakdown_count_.Remove(gauge);
    breakdown_series_.erase(breakdowns);
  }

  auto conversion = conversion_series_.find(site);
  if (conversion != conversion_series_.end()) {
    conversion_rate_.Remove(conversion->second);
    conversion_series_.erase(conversion);
  }
}
