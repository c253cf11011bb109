#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO;
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"classify.ua", LogComponent::CLASSIFY_UA},
    {"classify.referrer", LogComponent::CLASSIFY_REFERRER},
    {"geo", LogComponent::GEO},
    {"aggregation", LogComponent::AGGREGATION},
    {"metrics", LogComponent::METRICS},
    {"report", LogComponent::REPORT}};

bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

bool validate_classification_config(const ClassificationConfig &config,
                                    std::vector<std::string> &errors) {
  bool valid = true;

  const std::pair<const char *, int> versions[] = {
      {Keys::CLS_OUTDATED_CHROME_VERSION, config.outdated_chrome_version},
      {Keys::CLS_OUTDATED_FIREFOX_VERSION, config.outdated_firefox_version},
      {Keys::CLS_OUTDATED_SAFARI_VERSION, config.outdated_safari_version},
      {Keys::CLS_OUTDATED_EDGE_VERSION, config.outdated_edge_version}};
  for (const auto &[key, version] : versions) {
    if (version <= 0) {
      errors.push_back(std::string("Classification ") + key +
                       " must be greater than 0");
      valid = false;
    }
  }

  return valid;
}

bool validate_aggregation_config(const AggregationConfig &config,
                                 std::vector<std::string> &errors) {
  bool valid = true;

  if (config.granularity.unit == TimeBucket::GranularityUnit::CUSTOM &&
      config.granularity.custom_minutes == 0) {
    errors.push_back(
        "Aggregation custom granularity must span at least one minute");
    valid = false;
  }

  if (config.rolling_window < 1) {
    errors.push_back("Aggregation rolling_window must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.anomaly_threshold < 0.0) {
    errors.push_back("Metrics anomaly_threshold must not be negative");
    valid = false;
  }

  if (config.top_n < 1) {
    errors.push_back("Metrics top_n must be at least 1");
    valid = false;
  }

  if (!std::isfinite(config.trending_min_growth) ||
      config.trending_min_growth < 0.0) {
    errors.push_back("Metrics trending_min_growth must be a non-negative number");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_classification_config(config.classification, errors)) {
    valid = false;
  }

  if (!validate_aggregation_config(config.aggregation, errors)) {
    valid = false;
  }

  if (!validate_metrics_config(config.metrics, errors)) {
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // Every component starts at WARN, CORE at INFO
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;

  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Attempting to load configuration from " << filepath);
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    if (current_section.empty()) {
      if (key == Keys::SITE_HOST)
        config.site_host = value;
      else
        config.custom_settings[key] = value;

    } else if (current_section == "Classification") {
      if (key == Keys::CLS_EXCLUDE_BOTS)
        config.classification.exclude_bots = string_to_bool(value);
      else if (key == Keys::CLS_OUTDATED_CHROME_VERSION)
        config.classification.outdated_chrome_version =
            Utils::string_to_number<int>(value).value_or(
                config.classification.outdated_chrome_version);
      else if (key == Keys::CLS_OUTDATED_FIREFOX_VERSION)
        config.classification.outdated_firefox_version =
            Utils::string_to_number<int>(value).value_or(
                config.classification.outdated_firefox_version);
      else if (key == Keys::CLS_OUTDATED_SAFARI_VERSION)
        config.classification.outdated_safari_version =
            Utils::string_to_number<int>(value).value_or(
                config.classification.outdated_safari_version);
      else if (key == Keys::CLS_OUTDATED_EDGE_VERSION)
        config.classification.outdated_edge_version =
            Utils::string_to_number<int>(value).value_or(
                config.classification.outdated_edge_version);

    } else if (current_section == "Aggregation") {
      if (key == Keys::AGG_GRANULARITY) {
        auto granularity = TimeBucket::parse_granularity(value);
        if (granularity)
          config.aggregation.granularity = *granularity;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown granularity '" << value << "'" << std::endl;
      } else if (key == Keys::AGG_WEEK_START) {
        auto week_start = TimeBucket::parse_week_start(value);
        if (week_start)
          config.aggregation.week_start = *week_start;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown week_start '" << value << "'" << std::endl;
      } else if (key == Keys::AGG_FILL_MISSING_PERIODS)
        config.aggregation.fill_missing_periods = string_to_bool(value);
      else if (key == Keys::AGG_ROLLING_WINDOW)
        config.aggregation.rolling_window =
            Utils::string_to_number<int>(value).value_or(
                config.aggregation.rolling_window);

    } else if (current_section == "Metrics") {
      if (key == Keys::METRICS_ANOMALY_THRESHOLD)
        config.metrics.anomaly_threshold =
            Utils::string_to_number<double>(value).value_or(
                config.metrics.anomaly_threshold);
      else if (key == Keys::METRICS_TOP_N)
        config.metrics.top_n = Utils::string_to_number<int>(value).value_or(
            config.metrics.top_n);
      else if (key == Keys::METRICS_TRENDING_MIN_GROWTH)
        config.metrics.trending_min_growth =
            Utils::string_to_number<double>(value).value_or(
                config.metrics.trending_min_growth);

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "classify.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        }
      }
    }
  }

  config_file.close();
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded successfully from " << filepath);
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded and validated successfully from "
          << config_filepath_);
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
