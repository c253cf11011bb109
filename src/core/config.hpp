#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "aggregation/time_bucket.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *SITE_HOST = "site_host";

// Classification Settings
constexpr const char *CLS_EXCLUDE_BOTS = "exclude_bots";
constexpr const char *CLS_OUTDATED_CHROME_VERSION = "outdated_chrome_version";
constexpr const char *CLS_OUTDATED_FIREFOX_VERSION = "outdated_firefox_version";
constexpr const char *CLS_OUTDATED_SAFARI_VERSION = "outdated_safari_version";
constexpr const char *CLS_OUTDATED_EDGE_VERSION = "outdated_edge_version";

// Aggregation Settings
constexpr const char *AGG_GRANULARITY = "granularity";
constexpr const char *AGG_WEEK_START = "week_start";
constexpr const char *AGG_FILL_MISSING_PERIODS = "fill_missing_periods";
constexpr const char *AGG_ROLLING_WINDOW = "rolling_window";

// Metrics Settings
constexpr const char *METRICS_ANOMALY_THRESHOLD = "anomaly_threshold";
constexpr const char *METRICS_TOP_N = "top_n";
constexpr const char *METRICS_TRENDING_MIN_GROWTH = "trending_min_growth";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct ClassificationConfig {
  bool exclude_bots = true;
  int outdated_chrome_version = 100;
  int outdated_firefox_version = 100;
  int outdated_safari_version = 15;
  int outdated_edge_version = 100;
};

struct AggregationConfig {
  TimeBucket::Granularity granularity = TimeBucket::Granularity::day();
  TimeBucket::WeekStart week_start = TimeBucket::WeekStart::MONDAY;
  bool fill_missing_periods = true;
  int rolling_window = 7;
};

struct MetricsConfig {
  double anomaly_threshold = 2.0;
  int top_n = 10;
  double trending_min_growth = 50.0;
};

struct AppConfig {
  // Host of the tracked site; referrers from it count as internal
  std::string site_host;

  ClassificationConfig classification;
  AggregationConfig aggregation;
  MetricsConfig metrics;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

LogLevel string_to_log_level(const std::string &level_str_raw);
bool string_to_bool(const std::string &val_str_raw);

// Fills `config` from an INI file; false when the file cannot be opened
bool parse_config_into(const std::string &filepath, AppConfig &config);

// Validation functions for configuration parameters
bool validate_classification_config(const ClassificationConfig &config,
                                    std::vector<std::string> &errors);
bool validate_aggregation_config(const AggregationConfig &config,
                                 std::vector<std::string> &errors);
bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
