#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);
std::string url_decode(std::string_view encoded_string);

std::string to_lower_copy(std::string_view s);
bool contains(std::string_view haystack, std::string_view needle);

// Half-up rounding (ties go towards +infinity) to the given number of decimals
double round_to_decimals(double value, int decimals);

// part / whole as a percentage rounded to one decimal; 0 when whole is 0
double percentage_of(double part, double whole);

// Broken-down UTC calendar time
struct UtcDateTime {
  int year = 1970;
  int month = 1; // 1-12
  int day = 1;   // 1-31
  int hour = 0;
  int minute = 0;
  int second = 0;
  int weekday = 4; // 0 = Sunday
};

UtcDateTime to_utc_datetime(uint64_t timestamp_ms);
uint64_t from_utc_datetime(int year, int month, int day, int hour = 0,
                           int minute = 0, int second = 0);

// "2024-01-01T10:00:00Z"
std::string format_iso8601_utc(uint64_t timestamp_ms);
// Accepts "YYYY-MM-DDTHH:MM:SSZ" and "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::optional<uint64_t> parse_iso8601_utc(std::string_view text);

struct ParsedUrl {
  std::string scheme;
  std::string host; // lowercased
  std::optional<uint16_t> port;
  std::string path;
  std::string query; // without '?'
  std::string fragment;
};

// Absolute URLs with a host only; anything else is rejected
std::optional<ParsedUrl> parse_url(std::string_view url);

// First non-empty value of the named query parameter, percent-decoded
std::optional<std::string> get_query_param(const ParsedUrl &url,
                                           std::string_view name);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
