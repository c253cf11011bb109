#include "ua_parser.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace UAParser {
namespace {

constexpr std::string_view DECIMAL_VERSION_CHARS = "0123456789.";
// Apple platforms write "17_0"; some browsers report "10.15"
constexpr std::string_view APPLE_VERSION_CHARS = "0123456789_.";

const std::vector<std::string_view> BOT_KEYWORDS = {
    "bot",      "crawler",  "spider",    "scraper", "headless", "phantom",
    "selenium", "webdriver", "curl",     "wget",    "http",     "python"};

using VersionExtractor = std::optional<std::string> (*)(std::string_view);

struct BrowserRule {
  const char *name;
  std::vector<std::string_view> markers;
  // Rule is skipped when this substring is present
  std::string_view excluded;
  std::vector<std::string_view> version_markers;
};

struct OsRule {
  const char *name;
  std::vector<std::string_view> markers;
  VersionExtractor version;
};

bool contains_any(std::string_view haystack,
                  const std::vector<std::string_view> &needles) {
  return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) {
    return haystack.find(n) != std::string_view::npos;
  });
}

// Leftmost `marker` occurrence followed by at least one version character,
// returning that run of characters
std::optional<std::string>
extract_version(std::string_view ua,
                const std::vector<std::string_view> &markers,
                std::string_view version_chars) {
  std::optional<size_t> best_pos;
  std::string best;

  for (auto marker : markers) {
    size_t pos = ua.find(marker);
    while (pos != std::string_view::npos) {
      size_t start = pos + marker.size();
      size_t end = ua.find_first_not_of(version_chars, start);
      if (end == std::string_view::npos)
        end = ua.size();
      if (end > start) {
        if (!best_pos || pos < *best_pos) {
          best_pos = pos;
          best = std::string(ua.substr(start, end - start));
        }
        break;
      }
      pos = ua.find(marker, pos + 1);
    }
  }

  if (!best_pos)
    return std::nullopt;
  return best;
}

std::optional<std::string> dotted(std::optional<std::string> version) {
  if (version)
    std::replace(version->begin(), version->end(), '_', '.');
  return version;
}

std::optional<std::string> windows_version(std::string_view ua) {
  static const std::pair<std::string_view, const char *> nt_versions[] = {
      {"windows nt 10.0", "10"},
      {"windows nt 6.3", "8.1"},
      {"windows nt 6.2", "8"},
      {"windows nt 6.1", "7"}};
  for (const auto &[token, name] : nt_versions)
    if (ua.find(token) != std::string_view::npos)
      return std::string(name);
  return std::nullopt;
}

std::optional<std::string> ios_version(std::string_view ua) {
  return dotted(extract_version(ua, {"os "}, APPLE_VERSION_CHARS));
}

std::optional<std::string> macos_version(std::string_view ua) {
  return dotted(extract_version(ua, {"mac os x "}, APPLE_VERSION_CHARS));
}

std::optional<std::string> android_version(std::string_view ua) {
  return extract_version(ua, {"android "}, DECIMAL_VERSION_CHARS);
}

std::optional<std::string> no_version(std::string_view) { return std::nullopt; }

// Order is load-bearing: Chrome UAs also carry "Safari/", Edge UAs "Chrome/"
const std::vector<BrowserRule> &browser_rules() {
  static const std::vector<BrowserRule> rules = {
      {"Edge", {"edg/"}, {}, {"edg/"}},
      {"Chrome", {"chrome/"}, {}, {"chrome/"}},
      {"Firefox", {"firefox/"}, {}, {"firefox/"}},
      {"Safari", {"safari/"}, "chrome", {"version/"}},
      {"Opera", {"opr/", "opera/"}, {}, {"opr/", "opera/"}},
      {"Internet Explorer", {"msie", "trident/"}, {}, {"msie ", "rv:"}}};
  return rules;
}

// iPhone UAs say "like Mac OS X", so iOS must precede macOS; Android UAs say
// "Linux", so Android must precede Linux
const std::vector<OsRule> &os_rules() {
  static const std::vector<OsRule> rules = {
      {"Windows", {"windows"}, windows_version},
      {"iOS", {"iphone", "ipad", "ipod"}, ios_version},
      {"macOS", {"mac os x"}, macos_version},
      {"Android", {"android"}, android_version},
      {"Linux", {"linux"}, no_version},
      {"Chrome OS", {"cros"}, no_version}};
  return rules;
}

NamedVersion browser_of_lower(std::string_view ua) {
  for (const auto &rule : browser_rules()) {
    if (!contains_any(ua, rule.markers))
      continue;
    if (!rule.excluded.empty() && Utils::contains(ua, rule.excluded))
      continue;
    return {rule.name,
            extract_version(ua, rule.version_markers, DECIMAL_VERSION_CHARS)};
  }
  return {};
}

NamedVersion os_of_lower(std::string_view ua) {
  for (const auto &rule : os_rules()) {
    if (contains_any(ua, rule.markers))
      return {rule.name, rule.version(ua)};
  }
  return {};
}

std::string device_of_lower(std::string_view ua) {
  bool mobile = Utils::contains(ua, "mobile");
  if (Utils::contains(ua, "ipad") || (Utils::contains(ua, "tablet") && !mobile))
    return "Tablet";
  if (mobile || Utils::contains(ua, "iphone") || Utils::contains(ua, "ipod"))
    return "Mobile";
  return "Desktop";
}

bool bot_of_lower(std::string_view ua) {
  return contains_any(ua, BOT_KEYWORDS);
}

template <typename Labeler>
std::vector<RankedEntry> stats_by(const std::vector<std::string> &uas,
                                  Labeler labeler) {
  RankedCounter counter;
  for (const auto &ua : uas)
    counter.add(labeler(Utils::to_lower_copy(ua)));
  return counter.ranked();
}

} // namespace

DeviceInfo classify(std::string_view user_agent) {
  DeviceInfo info;
  if (user_agent.empty())
    return info;

  const std::string ua = Utils::to_lower_copy(user_agent);

  info.is_bot = bot_of_lower(ua);

  auto browser = browser_of_lower(ua);
  info.browser = browser.name;
  info.browser_version = browser.version;

  auto os = os_of_lower(ua);
  info.os = os.name;
  info.os_version = os.version;

  info.device = device_of_lower(ua);
  info.is_mobile = info.device == "Mobile";
  info.is_tablet = info.device == "Tablet";
  info.is_desktop = info.device == "Desktop";

  LOG(LogLevel::TRACE, LogComponent::CLASSIFY_UA,
      "Classified UA as " << info.browser << " / " << info.os << " / "
                          << info.device << (info.is_bot ? " (bot)" : ""));
  return info;
}

NamedVersion detect_browser(std::string_view user_agent) {
  return browser_of_lower(Utils::to_lower_copy(user_agent));
}

NamedVersion detect_os(std::string_view user_agent) {
  return os_of_lower(Utils::to_lower_copy(user_agent));
}

std::string detect_device_type(std::string_view user_agent) {
  return device_of_lower(Utils::to_lower_copy(user_agent));
}

bool is_bot(std::string_view user_agent) {
  return bot_of_lower(Utils::to_lower_copy(user_agent));
}

std::vector<RankedEntry> browser_stats(const std::vector<std::string> &uas) {
  return stats_by(uas,
                  [](std::string_view ua) { return browser_of_lower(ua).name; });
}

std::vector<RankedEntry> os_stats(const std::vector<std::string> &uas) {
  return stats_by(uas,
                  [](std::string_view ua) { return os_of_lower(ua).name; });
}

std::vector<RankedEntry> device_stats(const std::vector<std::string> &uas) {
  return stats_by(uas, device_of_lower);
}

double mobile_percentage(const std::vector<std::string> &uas) {
  if (uas.empty())
    return 0.0;

  size_t mobile = std::count_if(uas.begin(), uas.end(), [](const auto &ua) {
    return device_of_lower(Utils::to_lower_copy(ua)) != "Desktop";
  });
  return Utils::percentage_of(static_cast<double>(mobile),
                              static_cast<double>(uas.size()));
}

std::vector<std::string> filter_bots(const std::vector<std::string> &uas) {
  std::vector<std::string> humans;
  std::copy_if(uas.begin(), uas.end(), std::back_inserter(humans),
               [](const std::string &ua) { return !is_bot(ua); });
  LOG(LogLevel::DEBUG, LogComponent::CLASSIFY_UA,
      "Filtered " << (uas.size() - humans.size()) << " bot UAs out of "
                  << uas.size());
  return humans;
}

OutdatedThresholds
thresholds_from_config(const Config::ClassificationConfig &config) {
  OutdatedThresholds thresholds;
  thresholds.chrome = config.outdated_chrome_version;
  thresholds.firefox = config.outdated_firefox_version;
  thresholds.safari = config.outdated_safari_version;
  thresholds.edge = config.outdated_edge_version;
  return thresholds;
}

bool is_outdated(std::string_view browser, std::string_view version,
                 const OutdatedThresholds &thresholds) {
  int minimum = 0;
  if (browser == "Chrome")
    minimum = thresholds.chrome;
  else if (browser == "Firefox")
    minimum = thresholds.firefox;
  else if (browser == "Safari")
    minimum = thresholds.safari;
  else if (browser == "Edge")
    minimum = thresholds.edge;
  else
    return false;

  auto major =
      Utils::string_to_number<int>(version.substr(0, version.find('.')));
  // An unreadable version cannot be compared
  if (!major)
    return false;
  return *major < minimum;
}

std::string normalize_browser_name(std::string_view browser) {
  const std::string lower = Utils::to_lower_copy(browser);
  if (lower == "chrome")
    return "Chrome";
  if (lower == "firefox")
    return "Firefox";
  if (lower == "safari")
    return "Safari";
  if (lower == "edge")
    return "Edge";
  if (lower == "opera")
    return "Opera";
  if (lower == "ie" || lower == "internet explorer")
    return "Internet Explorer";
  return std::string(browser);
}

std::optional<int> get_major_version(std::string_view ua,
                                     std::string_view browser_token) {
  size_t pos = ua.find(browser_token);
  if (pos == std::string_view::npos)
    return std::nullopt;

  size_t version_start = pos + browser_token.length();
  if (version_start >= ua.length())
    return std::nullopt;

  size_t version_end = ua.find_first_not_of("0123456789", version_start);
  if (version_end == std::string_view::npos)
    version_end = ua.length();

  return Utils::string_to_number<int>(
      ua.substr(version_start, version_end - version_start));
}

} // namespace UAParser
