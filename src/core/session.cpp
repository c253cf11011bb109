#include "session.hpp"

#include <cstdint>
#include <optional>

std::optional<double> Session::duration_seconds() const {
  if (!end_time_ms)
    return std::nullopt;
  return (static_cast<double>(*end_time_ms) -
          static_cast<double>(start_time_ms)) /
         1000.0;
}
