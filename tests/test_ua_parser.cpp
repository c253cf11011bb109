#include "classify/ua_parser.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

const std::string IPHONE_SAFARI =
    "Mozilla/5.0 (iPhone; CPU iPhone OS 17_0 like Mac OS X) "
    "AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.0 Mobile/15E148 "
    "Safari/604.1";
const std::string IPAD_SAFARI =
    "Mozilla/5.0 (iPad; CPU OS 17_2 like Mac OS X) AppleWebKit/605.1.15 "
    "(KHTML, like Gecko) Version/17.2 Mobile/15E148 Safari/604.1";
const std::string WINDOWS_CHROME =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
    "like Gecko) Chrome/120.0.0.0 Safari/537.36";
const std::string WINDOWS_EDGE =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
    "like Gecko) Chrome/120.0.0.0 Safari/537.36 Edg/120.0.2210.91";
const std::string MAC_SAFARI =
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 "
    "(KHTML, like Gecko) Version/17.1 Safari/605.1.15";
const std::string MAC_FIREFOX = "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; "
                                "rv:121.0) Gecko/20100101 Firefox/121.0";
const std::string ANDROID_CHROME =
    "Mozilla/5.0 (Linux; Android 14; Pixel 8) AppleWebKit/537.36 (KHTML, "
    "like Gecko) Chrome/120.0.6099.144 Mobile Safari/537.36";
const std::string LINUX_FIREFOX =
    "Mozilla/5.0 (X11; Linux x86_64; rv:115.0) Gecko/20100101 Firefox/115.0";
const std::string IE11 =
    "Mozilla/5.0 (Windows NT 6.1; Trident/7.0; rv:11.0) like Gecko";
const std::string GOOGLEBOT = "Mozilla/5.0 (compatible; Googlebot/2.1; "
                              "+http://www.google.com/bot.html)";

} // namespace

TEST(UAParserTest, IPhoneSafari) {
  auto info = UAParser::classify(IPHONE_SAFARI);
  EXPECT_EQ(info.browser, "Safari");
  EXPECT_EQ(info.browser_version, "17.0");
  EXPECT_EQ(info.os, "iOS");
  EXPECT_EQ(info.os_version, "17.0");
  EXPECT_EQ(info.device, "Mobile");
  EXPECT_TRUE(info.is_mobile);
  EXPECT_FALSE(info.is_tablet);
  EXPECT_FALSE(info.is_desktop);
  EXPECT_FALSE(info.is_bot);
}

TEST(UAParserTest, IPadIsTablet) {
  auto info = UAParser::classify(IPAD_SAFARI);
  EXPECT_EQ(info.os, "iOS");
  EXPECT_EQ(info.os_version, "17.2");
  EXPECT_EQ(info.device, "Tablet");
  EXPECT_TRUE(info.is_tablet);
  EXPECT_FALSE(info.is_mobile);
}

TEST(UAParserTest, DesktopBrowsers) {
  auto chrome = UAParser::classify(WINDOWS_CHROME);
  EXPECT_EQ(chrome.browser, "Chrome");
  EXPECT_EQ(chrome.browser_version, "120.0.0.0");
  EXPECT_EQ(chrome.os, "Windows");
  EXPECT_EQ(chrome.os_version, "10");
  EXPECT_EQ(chrome.device, "Desktop");
  EXPECT_TRUE(chrome.is_desktop);

  auto firefox = UAParser::classify(LINUX_FIREFOX);
  EXPECT_EQ(firefox.browser, "Firefox");
  EXPECT_EQ(firefox.browser_version, "115.0");
  EXPECT_EQ(firefox.os, "Linux");
  EXPECT_FALSE(firefox.os_version.has_value());
}

TEST(UAParserTest, EdgeWinsOverChrome) {
  auto browser = UAParser::detect_browser(WINDOWS_EDGE);
  EXPECT_EQ(browser.name, "Edge");
  EXPECT_EQ(browser.version, "120.0.2210.91");
}

TEST(UAParserTest, ChromeWinsOverSafari) {
  EXPECT_EQ(UAParser::detect_browser(ANDROID_CHROME).name, "Chrome");
  EXPECT_EQ(UAParser::detect_browser(MAC_SAFARI).name, "Safari");
}

TEST(UAParserTest, AppleOsVersions) {
  auto safari_os = UAParser::detect_os(MAC_SAFARI);
  EXPECT_EQ(safari_os.name, "macOS");
  EXPECT_EQ(safari_os.version, "10.15.7");

  auto firefox_os = UAParser::detect_os(MAC_FIREFOX);
  EXPECT_EQ(firefox_os.name, "macOS");
  EXPECT_EQ(firefox_os.version, "10.15");
}

TEST(UAParserTest, AndroidIsNotLinux) {
  auto info = UAParser::classify(ANDROID_CHROME);
  EXPECT_EQ(info.os, "Android");
  EXPECT_EQ(info.os_version, "14");
  EXPECT_EQ(info.device, "Mobile");
}

TEST(UAParserTest, InternetExplorerAndOpera) {
  auto ie = UAParser::classify(IE11);
  EXPECT_EQ(ie.browser, "Internet Explorer");
  EXPECT_EQ(ie.browser_version, "11.0");
  EXPECT_EQ(ie.os_version, "7");

  auto opera = UAParser::detect_browser(
      "Opera/9.80 (Windows NT 6.2) Presto/2.12.388 Version/12.16");
  EXPECT_EQ(opera.name, "Opera");
  EXPECT_EQ(opera.version, "9.80");

  EXPECT_EQ(UAParser::detect_os("Mozilla/5.0 (X11; CrOS x86_64 14541.0.0)")
                .name,
            "Chrome OS");
}

TEST(UAParserTest, EmptyUserAgent) {
  auto info = UAParser::classify("");
  EXPECT_EQ(info, UAParser::DeviceInfo{});
  EXPECT_EQ(info.browser, "Unknown");
  EXPECT_EQ(info.os, "Unknown");
  EXPECT_EQ(info.device, "Desktop");
  EXPECT_FALSE(info.is_bot);
}

TEST(UAParserTest, BotDetection) {
  EXPECT_TRUE(UAParser::is_bot(GOOGLEBOT));
  EXPECT_TRUE(UAParser::is_bot("curl/8.4.0"));
  EXPECT_TRUE(UAParser::is_bot("python-requests/2.31"));
  EXPECT_TRUE(UAParser::is_bot("Mozilla/5.0 HeadlessChrome/120.0"));
  EXPECT_FALSE(UAParser::is_bot(WINDOWS_CHROME));
  EXPECT_FALSE(UAParser::is_bot(IPHONE_SAFARI));

  // Bot flag is independent of browser detection
  auto info = UAParser::classify(GOOGLEBOT);
  EXPECT_TRUE(info.is_bot);
  EXPECT_EQ(info.browser, "Unknown");
}

TEST(UAParserTest, FilterBots) {
  std::vector<std::string> uas = {WINDOWS_CHROME, GOOGLEBOT, "Wget/1.21",
                                  IPHONE_SAFARI};
  auto humans = UAParser::filter_bots(uas);
  ASSERT_EQ(humans.size(), 2u);
  EXPECT_EQ(humans[0], WINDOWS_CHROME);
  EXPECT_EQ(humans[1], IPHONE_SAFARI);
}

TEST(UAParserTest, RankedStats) {
  std::vector<std::string> uas = {WINDOWS_CHROME, ANDROID_CHROME,
                                  IPHONE_SAFARI, IPAD_SAFARI, MAC_SAFARI};

  auto browsers = UAParser::browser_stats(uas);
  ASSERT_EQ(browsers.size(), 2u);
  EXPECT_EQ(browsers[0], (RankedEntry{"Safari", 3, 60.0}));
  EXPECT_EQ(browsers[1], (RankedEntry{"Chrome", 2, 40.0}));

  auto devices = UAParser::device_stats(uas);
  ASSERT_EQ(devices.size(), 3u);
  EXPECT_EQ(devices[0].label, "Desktop");
  EXPECT_EQ(devices[0].count, 2u);

  auto systems = UAParser::os_stats(uas);
  EXPECT_EQ(systems[0].label, "iOS");

  EXPECT_TRUE(UAParser::browser_stats({}).empty());
}

TEST(UAParserTest, MobilePercentageCountsTablets) {
  std::vector<std::string> uas = {WINDOWS_CHROME, IPHONE_SAFARI, IPAD_SAFARI};
  EXPECT_DOUBLE_EQ(UAParser::mobile_percentage(uas), 66.7);
  EXPECT_DOUBLE_EQ(UAParser::mobile_percentage({}), 0.0);
}

TEST(UAParserTest, OutdatedBrowsers) {
  EXPECT_TRUE(UAParser::is_outdated("Chrome", "99.0.1"));
  EXPECT_FALSE(UAParser::is_outdated("Chrome", "120.0.0.0"));
  EXPECT_TRUE(UAParser::is_outdated("Safari", "14.1"));
  EXPECT_FALSE(UAParser::is_outdated("Safari", "15"));
  EXPECT_FALSE(UAParser::is_outdated("Opera", "10"));
  EXPECT_FALSE(UAParser::is_outdated("Chrome", "unknown"));

  UAParser::OutdatedThresholds strict;
  strict.firefox = 120;
  EXPECT_TRUE(UAParser::is_outdated("Firefox", "115.0", strict));
}

TEST(UAParserTest, ThresholdsFromClassificationConfig) {
  Config::ClassificationConfig config;
  config.outdated_chrome_version = 121;
  config.outdated_safari_version = 17;

  auto thresholds = UAParser::thresholds_from_config(config);
  EXPECT_EQ(thresholds.chrome, 121);
  EXPECT_EQ(thresholds.firefox, 100);
  EXPECT_EQ(thresholds.safari, 17);
  EXPECT_EQ(thresholds.edge, 100);
  EXPECT_TRUE(UAParser::is_outdated("Chrome", "120.0.0.0", thresholds));
  EXPECT_FALSE(UAParser::is_outdated("Safari", "17.0", thresholds));
}

TEST(UAParserTest, NormalizeBrowserName) {
  EXPECT_EQ(UAParser::normalize_browser_name("chrome"), "Chrome");
  EXPECT_EQ(UAParser::normalize_browser_name("IE"), "Internet Explorer");
  EXPECT_EQ(UAParser::normalize_browser_name("Vivaldi"), "Vivaldi");
}

TEST(UAParserTest, GetMajorVersion) {
  EXPECT_EQ(UAParser::get_major_version(WINDOWS_CHROME, "Chrome/"), 120);
  EXPECT_FALSE(UAParser::get_major_version(WINDOWS_CHROME, "Firefox/")
                   .has_value());
  EXPECT_FALSE(UAParser::get_major_version("Chrome/", "Chrome/").has_value());
}
