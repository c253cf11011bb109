#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

enum class LogComponent {
  CORE,
  CONFIG,

  // Classifiers
  CLASSIFY_UA,
  CLASSIFY_REFERRER,

  GEO,
  AGGREGATION,
  METRICS,

  // Summary assembly and its renderers
  REPORT
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    log_levels_ = config.log_levels;
  }

  // Drops every component, silencing all output
  inline void reset() { log_levels_.clear(); }

  bool should_log(LogLevel level, LogComponent component) const {
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return false;

    return level >= it->second;
  }

private:
  LogManager() = default;
  std::map<LogComponent, LogLevel> log_levels_;
};

// Arguments are only evaluated when the component is enabled at this level.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%S")      \
          << '.' << std::setw(3) << std::setfill('0') << ms.count() << "Z ";   \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      std::cout << oss.str() << std::endl;                                     \
    }                                                                          \
  } while (0)

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::CLASSIFY_UA:
    return "CLASSIFY.UA";
  case LogComponent::CLASSIFY_REFERRER:
    return "CLASSIFY.REFERRER";
  case LogComponent::GEO:
    return "GEO";
  case LogComponent::AGGREGATION:
    return "AGGREGATION";
  case LogComponent::METRICS:
    return "METRICS";
  case LogComponent::REPORT:
    return "REPORT";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
