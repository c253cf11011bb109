#ifndef SESSION_HPP
#define SESSION_HPP

#include "event_record.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct Session {
  std::string id;
  std::optional<std::string> user_id;
  uint64_t start_time_ms = 0;
  // Absent while the session is still open
  std::optional<uint64_t> end_time_ms;
  // Chronological, never reordered
  std::vector<EventRecord> page_views;
  std::optional<bool> converted;

  // Derived from the pageview count, never stored
  bool bounced() const { return page_views.size() <= 1; }

  bool is_closed() const { return end_time_ms.has_value(); }

  // Seconds between start and end; nullopt for an open session
  std::optional<double> duration_seconds() const;
};

#endif // SESSION_HPP
