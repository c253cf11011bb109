#include "report/summary_builder.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr uint64_t MINUTE = 60ULL * 1000ULL;
constexpr uint64_t HOUR = 60 * MINUTE;
// 2024-01-01T10:00:00Z
constexpr uint64_t T0 = 1704103200000ULL;

const char *IPHONE =
    "Mozilla/5.0 (iPhone; CPU iPhone OS 17_0 like Mac OS X) "
    "AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.0 Mobile/15E148 "
    "Safari/604.1";
const char *DESKTOP_CHROME =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
    "like Gecko) Chrome/120.0.0.0 Safari/537.36";
const char *GOOGLEBOT = "Mozilla/5.0 (compatible; Googlebot/2.1; "
                        "+http://www.google.com/bot.html)";

EventRecord page_view(uint64_t ts, const std::string &session,
                      std::optional<std::string> user, const std::string &path,
                      std::optional<std::string> referrer,
                      std::optional<std::string> user_agent,
                      std::optional<std::string> language,
                      std::optional<std::string> country) {
  EventRecord event;
  event.timestamp_ms = ts;
  event.session_id = session;
  event.user_id = std::move(user);
  event.path = path;
  event.referrer = std::move(referrer);
  event.user_agent = std::move(user_agent);
  event.language = std::move(language);
  event.country = std::move(country);
  return event;
}

Session session_of(const std::string &id, std::vector<EventRecord> views,
                   std::optional<uint64_t> duration_ms) {
  Session session;
  session.id = id;
  session.user_id = views.front().user_id;
  session.start_time_ms = views.front().timestamp_ms;
  if (duration_ms)
    session.end_time_ms = session.start_time_ms + *duration_ms;
  session.page_views = std::move(views);
  return session;
}

std::vector<std::string> labels(const std::vector<RankedEntry> &entries) {
  std::vector<std::string> out;
  for (const auto &entry : entries)
    out.push_back(entry.label);
  return out;
}

} // namespace

class SummaryBuilderTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto pv1 = page_view(T0 + 5 * MINUTE, "s1", "u1", "/?utm_campaign=launch",
                         "https://www.google.com/search?q=stats", IPHONE,
                         "en-US", "Germany");
    auto pv2 = page_view(T0 + 20 * MINUTE, "s1", "u1", "/pricing",
                         "https://example.com/", IPHONE, "en-US", "Germany");
    auto pv3 = page_view(T0 + 2 * HOUR + 10 * MINUTE, "s2", "u2",
                         "/pricing#plans", "https://m.facebook.com/",
                         DESKTOP_CHROME, "de-DE", "Germany");
    auto pv4 = page_view(T0 + 2 * HOUR + 30 * MINUTE, "s3", std::nullopt, "/",
                         std::nullopt, GOOGLEBOT, std::nullopt,
                         "United States");
    auto pv5 = page_view(T0 + 2 * HOUR + 40 * MINUTE, "s4", "u3", "/docs",
                         std::nullopt, std::nullopt, std::nullopt, "France");

    input.page_views = {pv1, pv2, pv3, pv4, pv5};
    input.sessions = {session_of("s1", {pv1, pv2}, 900 * 1000),
                      session_of("s2", {pv3}, 10 * 1000),
                      session_of("s3", {pv4}, 1000),
                      session_of("s4", {pv5}, std::nullopt)};
    input.tracked_events = {{"s1", T0, "signup", std::nullopt},
                            {"s2", T0, "download", std::nullopt},
                            {"s1", T0, "download", std::nullopt}};
    input.conversions =
        std::vector<TrackedEvent>{{"s1", T0, "signup", std::nullopt}};
    input.range = Aggregation::TimeRange{T0, T0 + 3 * HOUR - 1};

    config.site_host = "www.example.com";
    config.aggregation.granularity = TimeBucket::Granularity::hour();
    config.aggregation.rolling_window = 2;
    config.metrics.top_n = 3;
  }

  Report::SummaryInput input;
  Config::AppConfig config;
};

TEST_F(SummaryBuilderTest, HeadlineMetricsExcludeBots) {
  auto summary = Report::build_summary(input, config);

  EXPECT_EQ(summary.site, "www.example.com");
  EXPECT_EQ(summary.granularity, "hour");
  EXPECT_EQ(summary.bot_page_views_excluded, 1u);
  EXPECT_EQ(summary.metrics.total_page_views, 4u);
  EXPECT_EQ(summary.metrics.unique_visitors, 3u);
  EXPECT_EQ(summary.metrics.total_sessions, 3u);
  EXPECT_DOUBLE_EQ(summary.metrics.bounce_rate, 66.7);
  EXPECT_DOUBLE_EQ(summary.metrics.avg_session_duration, 455.0);
  ASSERT_TRUE(summary.metrics.conversion_rate.has_value());
  EXPECT_DOUBLE_EQ(*summary.metrics.conversion_rate, 33.3);
  EXPECT_DOUBLE_EQ(summary.mobile_percentage, 50.0);
  EXPECT_DOUBLE_EQ(summary.organic_percentage, 25.0);
  EXPECT_EQ(summary.duration_buckets.over_10m, 1u);
  EXPECT_EQ(summary.duration_buckets.under_30s, 1u);
}

TEST_F(SummaryBuilderTest, Breakdowns) {
  auto summary = Report::build_summary(input, config);

  EXPECT_EQ(labels(summary.pages),
            (std::vector<std::string>{"/pricing", "/", "/docs"}));
  EXPECT_EQ(summary.pages[0].count, 2u);
  EXPECT_DOUBLE_EQ(summary.pages[0].percentage, 50.0);

  // Internal and direct traffic is not a referrer
  EXPECT_EQ(labels(summary.referrers),
            (std::vector<std::string>{"google", "facebook"}));
  EXPECT_EQ(labels(summary.media),
            (std::vector<std::string>{"search", "internal", "social"}));

  EXPECT_EQ(labels(summary.devices),
            (std::vector<std::string>{"Mobile", "Desktop"}));
  EXPECT_EQ(labels(summary.browsers),
            (std::vector<std::string>{"Safari", "Chrome", "Unknown"}));
  EXPECT_EQ(labels(summary.operating_systems)[0], "iOS");
  EXPECT_EQ(labels(summary.countries),
            (std::vector<std::string>{"Germany", "France"}));
  EXPECT_EQ(labels(summary.languages),
            (std::vector<std::string>{"en", "de"}));
  EXPECT_EQ(labels(summary.campaigns), (std::vector<std::string>{"launch"}));
  EXPECT_EQ(labels(summary.events),
            (std::vector<std::string>{"download", "signup"}));
}

TEST_F(SummaryBuilderTest, TimeSeriesIsGapFilled) {
  auto summary = Report::build_summary(input, config);

  ASSERT_EQ(summary.time_series.size(), 3u);
  EXPECT_EQ(summary.time_series[0], (Aggregation::AggregatedBucket{
                                        "2024-01-01T10:00:00Z", 2, 1, 1}));
  EXPECT_TRUE(summary.time_series[1].is_zero());
  EXPECT_EQ(summary.time_series[2], (Aggregation::AggregatedBucket{
                                        "2024-01-01T12:00:00Z", 2, 2, 2}));

  ASSERT_EQ(summary.rolling_average.size(), 3u);
  EXPECT_DOUBLE_EQ(summary.rolling_average[0].rolling_avg, 2.0);
  EXPECT_DOUBLE_EQ(summary.rolling_average[1].rolling_avg, 1.0);
  EXPECT_DOUBLE_EQ(summary.rolling_average[2].rolling_avg, 1.0);
  EXPECT_TRUE(summary.page_view_anomalies.anomalies.empty());
}

TEST_F(SummaryBuilderTest, NoRangeMeansNoGapFilling) {
  input.range.reset();
  auto summary = Report::build_summary(input, config);
  ASSERT_EQ(summary.time_series.size(), 2u);
  EXPECT_FALSE(summary.range.has_value());

  config.aggregation.fill_missing_periods = false;
  input.range = Aggregation::TimeRange{T0, T0 + 3 * HOUR - 1};
  EXPECT_EQ(Report::build_summary(input, config).time_series.size(), 2u);
}

TEST_F(SummaryBuilderTest, BotsKeptWhenExclusionDisabled) {
  config.classification.exclude_bots = false;
  auto summary = Report::build_summary(input, config);

  EXPECT_EQ(summary.bot_page_views_excluded, 0u);
  EXPECT_EQ(summary.metrics.total_page_views, 5u);
  EXPECT_EQ(summary.metrics.total_sessions, 4u);
  EXPECT_EQ(summary.countries.size(), 3u);
}

TEST_F(SummaryBuilderTest, OutdatedBrowsersUseConfiguredMinimums) {
  EXPECT_DOUBLE_EQ(Report::build_summary(input, config)
                       .outdated_browser_percentage,
                   0.0);

  // Chrome 120 on pv3 falls below the raised minimum
  config.classification.outdated_chrome_version = 121;
  EXPECT_DOUBLE_EQ(Report::build_summary(input, config)
                       .outdated_browser_percentage,
                   25.0);
}

TEST_F(SummaryBuilderTest, TrendingPagesAgainstPreviousWindow) {
  EXPECT_TRUE(Report::build_summary(input, config).trending_pages.empty());

  input.previous_page_views = std::vector<EventRecord>{
      page_view(T0 - HOUR, "p1", "u9", "/pricing?ref=nav", std::nullopt,
                DESKTOP_CHROME, std::nullopt, std::nullopt),
      page_view(T0 - HOUR, "p1", "u9", "/docs", std::nullopt, DESKTOP_CHROME,
                std::nullopt, std::nullopt),
      page_view(T0 - HOUR, "p2", std::nullopt, "/", std::nullopt, GOOGLEBOT,
                std::nullopt, std::nullopt)};
  config.metrics.trending_min_growth = 50.0;
  auto summary = Report::build_summary(input, config);

  // "/" only had bot traffic before, "/pricing" doubled, "/docs" is flat
  ASSERT_EQ(summary.trending_pages.size(), 2u);
  EXPECT_EQ(summary.trending_pages[0].path, "/");
  EXPECT_EQ(summary.trending_pages[0].previous, 0u);
  EXPECT_EQ(summary.trending_pages[1].path, "/pricing");
  EXPECT_EQ(summary.trending_pages[1].current, 2u);
  EXPECT_EQ(summary.trending_pages[1].previous, 1u);
  EXPECT_DOUBLE_EQ(summary.trending_pages[1].growth, 100.0);

  config.metrics.trending_min_growth = 150.0;
  summary = Report::build_summary(input, config);
  ASSERT_EQ(summary.trending_pages.size(), 1u);
  EXPECT_EQ(summary.trending_pages[0].path, "/");
}

TEST_F(SummaryBuilderTest, OrganicShareMatchesMediaForSearchLikeHost) {
  // A site host containing a search keyword: its own pages are internal
  config.site_host = "search.bing.com";
  input.page_views = {
      page_view(T0, "s1", "u1", "/", "https://www.google.com/?q=x",
                DESKTOP_CHROME, std::nullopt, std::nullopt),
      page_view(T0 + MINUTE, "s1", "u1", "/a", "https://search.bing.com/",
                DESKTOP_CHROME, std::nullopt, std::nullopt)};
  input.sessions.clear();
  auto summary = Report::build_summary(input, config);

  EXPECT_EQ(labels(summary.media),
            (std::vector<std::string>{"search", "internal"}));
  EXPECT_DOUBLE_EQ(summary.organic_percentage, 50.0);
}

TEST_F(SummaryBuilderTest, NoConversionsMeansNoRate) {
  input.conversions.reset();
  auto summary = Report::build_summary(input, config);
  EXPECT_FALSE(summary.metrics.conversion_rate.has_value());
}

TEST_F(SummaryBuilderTest, EmptyInput) {
  auto summary = Report::build_summary(Report::SummaryInput{}, config);
  EXPECT_EQ(summary.metrics.total_page_views, 0u);
  EXPECT_TRUE(summary.pages.empty());
  EXPECT_TRUE(summary.time_series.empty());
  EXPECT_TRUE(summary.rolling_average.empty());
}

TEST(SummaryHelpersTest, PrimaryLanguage) {
  EXPECT_EQ(Report::primary_language("en-US"), "en");
  EXPECT_EQ(Report::primary_language("PT_br"), "pt");
  EXPECT_EQ(Report::primary_language("fr"), "fr");
  EXPECT_FALSE(Report::primary_language("").has_value());
  EXPECT_FALSE(Report::primary_language("-US").has_value());
}

TEST(SummaryHelpersTest, PagePath) {
  EXPECT_EQ(Report::page_path("/pricing?plan=pro#faq"), "/pricing");
  EXPECT_EQ(Report::page_path("/docs#install"), "/docs");
  EXPECT_EQ(Report::page_path("/"), "/");
}
