#ifndef UA_PARSER_HPP
#define UA_PARSER_HPP

#include "core/config.hpp"
#include "utils/ranked_counter.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace UAParser {

struct DeviceInfo {
  std::string browser = "Unknown";
  std::optional<std::string> browser_version;
  std::string os = "Unknown";
  std::optional<std::string> os_version;
  std::string device = "Desktop"; // Desktop, Mobile or Tablet
  bool is_bot = false;
  bool is_mobile = false;
  bool is_tablet = false;
  bool is_desktop = true;

  bool operator==(const DeviceInfo &other) const {
    return browser == other.browser &&
           browser_version == other.browser_version && os == other.os &&
           os_version == other.os_version && device == other.device &&
           is_bot == other.is_bot && is_mobile == other.is_mobile &&
           is_tablet == other.is_tablet && is_desktop == other.is_desktop;
  }
};

struct NamedVersion {
  std::string name = "Unknown";
  std::optional<std::string> version;
};

// Minimum major versions below which a browser counts as outdated
struct OutdatedThresholds {
  int chrome = 100;
  int firefox = 100;
  int safari = 15;
  int edge = 100;
};

/**
 * Classifies a user-agent string. An empty string yields the all-"Unknown"
 * desktop result. Bot detection runs independently of browser and OS
 * detection.
 */
DeviceInfo classify(std::string_view user_agent);

// First matching rule wins: Edge, Chrome, Firefox, Safari, Opera, IE
NamedVersion detect_browser(std::string_view user_agent);
// Windows, iOS, macOS, Android, Linux, Chrome OS
NamedVersion detect_os(std::string_view user_agent);
// "Tablet", "Mobile" or "Desktop"
std::string detect_device_type(std::string_view user_agent);
bool is_bot(std::string_view user_agent);

std::vector<RankedEntry> browser_stats(const std::vector<std::string> &uas);
std::vector<RankedEntry> os_stats(const std::vector<std::string> &uas);
std::vector<RankedEntry> device_stats(const std::vector<std::string> &uas);

// Share of Mobile and Tablet devices, one decimal
double mobile_percentage(const std::vector<std::string> &uas);
std::vector<std::string> filter_bots(const std::vector<std::string> &uas);

// Browsers without a threshold are never outdated
OutdatedThresholds
thresholds_from_config(const Config::ClassificationConfig &config);

bool is_outdated(std::string_view browser, std::string_view version,
                 const OutdatedThresholds &thresholds = {});
std::string normalize_browser_name(std::string_view browser);

// Digits immediately following `browser_token`, e.g. "Chrome/" -> 120
std::optional<int> get_major_version(std::string_view ua,
                                     std::string_view browser_token);

} // namespace UAParser

#endif // UA_PARSER_HPP
