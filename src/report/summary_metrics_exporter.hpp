#ifndef SUMMARY_METRICS_EXPORTER_HPP
#define SUMMARY_METRICS_EXPORTER_HPP

#include "report/summary_builder.hpp"

#include <memory>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Publishes a built summary as Prometheus gauges labelled with the site.
 * The registry is owned by the caller, which serves or collects it.
 */
class SummaryMetricsExporter {
public:
  explicit SummaryMetricsExporter(std::shared_ptr<prometheus::Registry> registry);

  SummaryMetricsExporter(const SummaryMetricsExporter &) = delete;
  SummaryMetricsExporter &operator=(const SummaryMetricsExporter &) = delete;

  // Replaces the gauges of summary.site, dropping breakdown labels and the
  // conversion rate the new summary no longer carries; other sites are left
  // alone
  void publish(const Report::AnalyticsSummary &summary);

  std::shared_ptr<prometheus::Registry> get_registry();

private:
  void publish_breakdown(const std::string &site, const std::string &breakdown,
                         const std::vector<RankedEntry> &entries);
  void remove_site_series(const std::string &site);

  std::shared_ptr<prometheus::Registry> registry_;

  prometheus::Family<prometheus::Gauge> &page_views_;
  prometheus::Family<prometheus::Gauge> &unique_visitors_;
  prometheus::Family<prometheus::Gauge> &sessions_;
  prometheus::Family<prometheus::Gauge> &bounce_rate_;
  prometheus::Family<prometheus::Gauge> &avg_session_duration_;
  prometheus::Family<prometheus::Gauge> &conversion_rate_;
  prometheus::Family<prometheus::Gauge> &breakdown_count_;

  // Series handed out per site by the last publish()
  std::unordered_map<std::string, std::vector<prometheus::Gauge *>>
      breakdown_series_;
  std::unordered_map<std::string, prometheus::Gauge *> conversion_series_;
};

#endif // SUMMARY_METRICS_EXPORTER_HPP
