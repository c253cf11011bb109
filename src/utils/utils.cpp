#include "utils.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {
namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool is_scheme_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
         c == '-' || c == '.';
}

bool is_forbidden_host_char(char c) {
  switch (c) {
  case '\0':
  case '\t':
  case '\n':
  case '\r':
  case ' ':
  case '#':
  case '/':
  case '<':
  case '>':
  case '?':
  case '@':
  case '\\':
  case '^':
  case '|':
    return true;
  default:
    return false;
  }
}

bool is_special_scheme(const std::string &scheme) {
  return scheme == "http" || scheme == "https" || scheme == "ftp" ||
         scheme == "ws" || scheme == "wss";
}

} // namespace

std::string url_decode(std::string_view encoded_string) {
  std::ostringstream decoded_stream;

  for (size_t i = 0; i < encoded_string.length(); i++) {
    if (encoded_string[i] == '%' && i + 2 < encoded_string.length() &&
        hex_value(encoded_string[i + 1]) >= 0 &&
        hex_value(encoded_string[i + 2]) >= 0) {
      decoded_stream << static_cast<char>(hex_value(encoded_string[i + 1]) * 16 +
                                          hex_value(encoded_string[i + 2]));
      i += 2;
    } else if (encoded_string[i] == '+')
      decoded_stream << ' ';
    else
      decoded_stream << encoded_string[i];
  }
  return decoded_stream.str();
}

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::string to_lower_copy(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return out;
}

bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

double round_to_decimals(double value, int decimals) {
  const double factor = std::pow(10.0, decimals);
  return std::floor(value * factor + 0.5) / factor;
}

double percentage_of(double part, double whole) {
  if (whole == 0.0)
    return 0.0;
  return round_to_decimals(part / whole * 100.0, 1);
}

UtcDateTime to_utc_datetime(uint64_t timestamp_ms) {
  std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm t{};
#if defined(_WIN32)
  gmtime_s(&t, &seconds);
#else
  gmtime_r(&seconds, &t);
#endif

  UtcDateTime dt;
  dt.year = t.tm_year + 1900;
  dt.month = t.tm_mon + 1;
  dt.day = t.tm_mday;
  dt.hour = t.tm_hour;
  dt.minute = t.tm_min;
  dt.second = t.tm_sec;
  dt.weekday = t.tm_wday;
  return dt;
}

uint64_t from_utc_datetime(int year, int month, int day, int hour, int minute,
                           int second) {
  // timegm normalises out-of-range fields, so month 13 rolls into the next
  // year and day 0 into the previous month
  std::tm t{};
  t.tm_year = year - 1900;
  t.tm_mon = month - 1;
  t.tm_mday = day;
  t.tm_hour = hour;
  t.tm_min = minute;
  t.tm_sec = second;
#if defined(_WIN32)
  std::time_t epoch_seconds = _mkgmtime(&t);
#else
  std::time_t epoch_seconds = timegm(&t);
#endif
  if (epoch_seconds < 0)
    return 0;
  return static_cast<uint64_t>(epoch_seconds) * 1000;
}

std::string format_iso8601_utc(uint64_t timestamp_ms) {
  UtcDateTime dt = to_utc_datetime(timestamp_ms);
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
  return buffer;
}

std::optional<uint64_t> parse_iso8601_utc(std::string_view text) {
  // Fixed layout: YYYY-MM-DDTHH:MM:SS[.mmm]Z
  if (text.size() != 20 && text.size() != 24)
    return std::nullopt;
  if (text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' ||
      text[16] != ':' || text.back() != 'Z')
    return std::nullopt;

  auto year = string_to_number<int>(text.substr(0, 4));
  auto month = string_to_number<int>(text.substr(5, 2));
  auto day = string_to_number<int>(text.substr(8, 2));
  auto hour = string_to_number<int>(text.substr(11, 2));
  auto minute = string_to_number<int>(text.substr(14, 2));
  auto second = string_to_number<int>(text.substr(17, 2));
  if (!year || !month || !day || !hour || !minute || !second)
    return std::nullopt;
  if (*month < 1 || *month > 12 || *day < 1 || *day > 31 || *hour > 23 ||
      *minute > 59 || *second > 59)
    return std::nullopt;

  uint64_t millis = 0;
  if (text.size() == 24) {
    if (text[19] != '.')
      return std::nullopt;
    auto ms = string_to_number<uint64_t>(text.substr(20, 3));
    if (!ms)
      return std::nullopt;
    millis = *ms;
  }

  return from_utc_datetime(*year, *month, *day, *hour, *minute, *second) +
         millis;
}

std::optional<ParsedUrl> parse_url(std::string_view url_raw) {
  std::string url = trim_copy(url_raw);
  if (url.empty())
    return std::nullopt;

  size_t colon = url.find(':');
  if (colon == std::string::npos || colon == 0 ||
      !std::isalpha(static_cast<unsigned char>(url[0])))
    return std::nullopt;
  for (size_t i = 1; i < colon; ++i)
    if (!is_scheme_char(url[i]))
      return std::nullopt;

  ParsedUrl parsed;
  parsed.scheme = to_lower_copy(std::string_view(url).substr(0, colon));

  std::string_view rest = std::string_view(url).substr(colon + 1);
  bool has_authority = rest.size() >= 2 && rest[0] == '/' && rest[1] == '/';
  if (has_authority) {
    rest.remove_prefix(2);
  } else if (is_special_scheme(parsed.scheme)) {
    // "https:example.com" still names a host for special schemes
    while (!rest.empty() && (rest.front() == '/' || rest.front() == '\\'))
      rest.remove_prefix(1);
  } else {
    return std::nullopt;
  }

  size_t authority_end = rest.find_first_of("/?#");
  std::string_view authority = rest.substr(0, authority_end);
  std::string_view remainder = authority_end == std::string_view::npos
                                   ? std::string_view{}
                                   : rest.substr(authority_end);

  size_t at = authority.rfind('@');
  if (at != std::string_view::npos)
    authority.remove_prefix(at + 1);

  // Bracketed IPv6 literal, e.g. "[::1]:8080"
  std::string_view host = authority;
  std::string_view port_text;
  bool has_port = false;
  if (!authority.empty() && authority.front() == '[') {
    size_t close = authority.find(']');
    if (close == std::string_view::npos)
      return std::nullopt;
    host = authority.substr(0, close + 1);
    std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':')
        return std::nullopt;
      port_text = after.substr(1);
      has_port = true;
    }
  } else {
    size_t port_sep = authority.rfind(':');
    if (port_sep != std::string_view::npos) {
      host = authority.substr(0, port_sep);
      port_text = authority.substr(port_sep + 1);
      has_port = true;
    }
    for (char c : host)
      if (is_forbidden_host_char(c) || c == ':' || c == '[' || c == ']')
        return std::nullopt;
  }

  if (has_port && !port_text.empty()) {
    auto port = string_to_number<uint16_t>(port_text);
    if (!port)
      return std::nullopt;
    parsed.port = port;
  }

  if (host.empty())
    return std::nullopt;
  parsed.host = to_lower_copy(host);

  size_t fragment_pos = remainder.find('#');
  if (fragment_pos != std::string_view::npos) {
    parsed.fragment = std::string(remainder.substr(fragment_pos + 1));
    remainder = remainder.substr(0, fragment_pos);
  }
  size_t query_pos = remainder.find('?');
  if (query_pos != std::string_view::npos) {
    parsed.query = std::string(remainder.substr(query_pos + 1));
    remainder = remainder.substr(0, query_pos);
  }
  parsed.path = remainder.empty() ? "/" : std::string(remainder);

  for (char c : parsed.path)
    if (c == ' ' || c == '\t' || c == '\n')
      return std::nullopt;

  return parsed;
}

std::optional<std::string> get_query_param(const ParsedUrl &url,
                                           std::string_view name) {
  for (const auto &pair : split_string(url.query, '&')) {
    if (pair.empty())
      continue;
    size_t eq = pair.find('=');
    std::string key = url_decode(std::string_view(pair).substr(0, eq));
    if (key != name)
      continue;
    if (eq == std::string::npos)
      continue;
    std::string value = url_decode(std::string_view(pair).substr(eq + 1));
    if (!value.empty())
      return value;
  }
  return std::nullopt;
}

} // namespace Utils
