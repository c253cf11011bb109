#include "classify/referrer_parser.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using ReferrerParser::Medium::DIRECT;
using ReferrerParser::Medium::INTERNAL;
using ReferrerParser::Medium::REFERRAL;
using ReferrerParser::Medium::SEARCH;
using ReferrerParser::Medium::SOCIAL;

TEST(ReferrerParserTest, GoogleSearchWithTerm) {
  auto info =
      ReferrerParser::classify("https://www.google.com/search?q=analytics");
  EXPECT_EQ(info.source, "google");
  EXPECT_EQ(info.medium, SEARCH);
  EXPECT_EQ(info.search_term, "analytics");
  EXPECT_FALSE(info.is_internal);
  EXPECT_FALSE(info.campaign.has_value());
}

TEST(ReferrerParserTest, SearchTermParameters) {
  EXPECT_EQ(ReferrerParser::classify("https://search.yahoo.com/search?p=widgets")
                .search_term,
            "widgets");
  EXPECT_EQ(ReferrerParser::classify("https://yandex.ru/search/?text=privet")
                .search_term,
            "privet");
  EXPECT_FALSE(
      ReferrerParser::classify("https://www.bing.com/").search_term.has_value());
}

TEST(ReferrerParserTest, DirectTraffic) {
  ReferrerParser::ReferrerInfo direct;
  EXPECT_EQ(ReferrerParser::classify(""), direct);
  EXPECT_EQ(ReferrerParser::classify("not a url"), direct);
  EXPECT_EQ(direct.source, ReferrerParser::DIRECT_SOURCE);
  EXPECT_EQ(direct.medium, DIRECT);
}

TEST(ReferrerParserTest, InternalReferrer) {
  auto info = ReferrerParser::classify("https://www.example.com/pricing",
                                       std::string_view("example.com"));
  EXPECT_EQ(info.medium, INTERNAL);
  EXPECT_EQ(info.source, "example.com");
  EXPECT_TRUE(info.is_internal);

  // Without a current host the same URL is an ordinary referral
  EXPECT_EQ(ReferrerParser::classify("https://www.example.com/pricing").medium,
            REFERRAL);
}

TEST(ReferrerParserTest, InternalTakesPrecedenceOverSearch) {
  auto info = ReferrerParser::classify("https://google.com/?q=self",
                                       std::string_view("www.google.com"));
  EXPECT_EQ(info.medium, INTERNAL);
}

TEST(ReferrerParserTest, SocialNetworks) {
  auto info = ReferrerParser::classify("https://m.facebook.com/story.php");
  EXPECT_EQ(info.source, "facebook");
  EXPECT_EQ(info.medium, SOCIAL);
  EXPECT_TRUE(ReferrerParser::is_social("https://www.reddit.com/r/cpp"));
  EXPECT_FALSE(ReferrerParser::is_search("https://www.reddit.com/r/cpp"));
}

TEST(ReferrerParserTest, UtmTaggedReferral) {
  auto info = ReferrerParser::classify(
      "https://news.example.net/?utm_source=newsletter&utm_medium=email"
      "&utm_campaign=spring%20sale");
  EXPECT_EQ(info.source, "newsletter");
  EXPECT_EQ(info.medium, "email");
  EXPECT_EQ(info.campaign, "spring sale");

  auto untyped =
      ReferrerParser::classify("https://partner.example.net/?utm_source=ally");
  EXPECT_EQ(untyped.medium, REFERRAL);
  EXPECT_FALSE(untyped.campaign.has_value());
}

TEST(ReferrerParserTest, SearchEngineBeatsUtmSource) {
  auto info =
      ReferrerParser::classify("https://www.bing.com/?q=x&utm_source=other");
  EXPECT_EQ(info.source, "bing");
  EXPECT_EQ(info.medium, SEARCH);
}

TEST(ReferrerParserTest, PlainReferral) {
  auto info = ReferrerParser::classify("https://www.blog.example.org/post/1");
  EXPECT_EQ(info.source, "blog.example.org");
  EXPECT_EQ(info.medium, REFERRAL);
}

TEST(ReferrerParserTest, DomainHelpers) {
  EXPECT_EQ(ReferrerParser::extract_domain("https://www.Example.com/a"),
            "example.com");
  EXPECT_FALSE(ReferrerParser::extract_domain("garbage").has_value());
  EXPECT_FALSE(ReferrerParser::extract_domain("").has_value());

  EXPECT_EQ(ReferrerParser::normalize_host("WWW.Example.com"), "example.com");
  EXPECT_EQ(ReferrerParser::normalize_host("www2.example.com"),
            "www2.example.com");

  EXPECT_TRUE(ReferrerParser::is_direct(""));
  EXPECT_FALSE(ReferrerParser::is_direct("https://a.example"));
  EXPECT_TRUE(ReferrerParser::is_valid_referrer("https://a.example/x"));
  EXPECT_FALSE(ReferrerParser::is_valid_referrer("a.example/x"));
}

TEST(ReferrerParserTest, ExtractSearchTermDecodes) {
  EXPECT_EQ(ReferrerParser::extract_search_term(
                "https://duckduckgo.com/?q=c%2B%2B+tips"),
            "c++ tips");
  EXPECT_FALSE(ReferrerParser::extract_search_term("nope").has_value());
}

TEST(ReferrerParserTest, NormalizeSource) {
  EXPECT_EQ(ReferrerParser::normalize_source("fb.com"), "facebook");
  EXPECT_EQ(ReferrerParser::normalize_source("www.facebook.com"), "facebook");
  EXPECT_EQ(ReferrerParser::normalize_source("l.facebook.com"), "facebook");
  EXPECT_EQ(ReferrerParser::normalize_source("t.co"), "twitter");
  EXPECT_EQ(ReferrerParser::normalize_source("google.co.uk"), "google");
  // Suffix matches must fall on a label boundary
  EXPECT_EQ(ReferrerParser::normalize_source("notfb.com"), "notfb.com");
  EXPECT_EQ(ReferrerParser::normalize_source("Example.org"), "Example.org");
}

TEST(ReferrerParserTest, AggregateStats) {
  std::vector<std::string> referrers = {
      "https://www.google.com/search?q=a", "https://www.facebook.com/",
      "https://google.com/search?q=b", ""};

  auto sources = ReferrerParser::source_stats(referrers);
  ASSERT_EQ(sources.size(), 3u);
  EXPECT_EQ(sources[0], (RankedEntry{"google", 2, 50.0}));
  EXPECT_EQ(sources[1], (RankedEntry{"facebook", 1, 25.0}));
  EXPECT_EQ(sources[2], (RankedEntry{"(direct)", 1, 25.0}));

  auto media = ReferrerParser::medium_stats(referrers);
  EXPECT_EQ(media[0], (RankedEntry{"search", 2, 50.0}));

  auto top = ReferrerParser::top_referrers(referrers, 1);
  ASSERT_EQ(top.size(), 1u);
  EXPECT_EQ(top[0].label, "google");

  auto social = ReferrerParser::filter_by_medium(referrers, SOCIAL);
  ASSERT_EQ(social.size(), 1u);
  EXPECT_EQ(social[0], "https://www.facebook.com/");

  EXPECT_DOUBLE_EQ(ReferrerParser::organic_percentage(referrers), 50.0);
  EXPECT_DOUBLE_EQ(ReferrerParser::organic_percentage({}), 0.0);
  EXPECT_TRUE(ReferrerParser::source_stats({}).empty());
}

TEST(ReferrerParserTest, Campaigns) {
  EXPECT_EQ(ReferrerParser::campaign_of("/landing?utm_campaign=launch&x=1"),
            "launch");
  EXPECT_EQ(ReferrerParser::campaign_of(
                "https://shop.example.com/?utm_campaign=black%20friday"),
            "black friday");
  EXPECT_FALSE(ReferrerParser::campaign_of("/plain").has_value());
  EXPECT_FALSE(ReferrerParser::campaign_of("/x?utm_campaign=").has_value());

  auto campaigns = ReferrerParser::campaign_stats(
      {"/a?utm_campaign=launch", "/b", "/c?utm_campaign=launch#top",
       "/d?utm_campaign=promo"});
  ASSERT_EQ(campaigns.size(), 2u);
  EXPECT_EQ(campaigns[0], (RankedEntry{"launch", 2, 66.7}));
  EXPECT_EQ(campaigns[1], (RankedEntry{"promo", 1, 33.3}));
}
