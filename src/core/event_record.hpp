#ifndef EVENT_RECORD_HPP
#define EVENT_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>

// One pageview as handed over by the ingestion layer. Geo fields are already
// resolved and visitor identifiers already anonymised.
struct EventRecord {
  uint64_t timestamp_ms = 0; // UTC
  std::string session_id;
  std::optional<std::string> user_id;
  std::string path;

  std::optional<std::string> referrer;
  std::optional<std::string> user_agent;
  std::optional<std::string> language; // e.g. "en-US"

  std::optional<std::string> country;
  std::optional<std::string> country_code;
  std::optional<std::string> region;
  std::optional<std::string> city;
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::optional<std::string> timezone;

  // Seconds spent on this page
  std::optional<double> duration_s;
  std::optional<bool> exit_page;
};

// A custom event (signup, purchase, ...) recorded against a session
struct TrackedEvent {
  std::string session_id;
  uint64_t timestamp_ms = 0;
  std::string event_type;
  std::optional<double> value;
};

#endif // EVENT_RECORD_HPP
