#include "referrer_parser.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ReferrerParser {
namespace {

const std::vector<std::string_view> SEARCH_ENGINES = {
    "google", "bing", "yahoo", "duckduckgo", "baidu", "yandex"};

const std::vector<std::string_view> SOCIAL_NETWORKS = {
    "facebook",  "twitter", "linkedin", "instagram",
    "pinterest", "reddit",  "tiktok",   "youtube"};

const std::vector<std::string_view> SEARCH_TERM_PARAMS = {"q", "query",
                                                          "search", "p", "text"};

const std::vector<std::pair<std::string_view, const char *>> SOURCE_ALIASES = {
    {"google.com", "google"},     {"google.co.uk", "google"},
    {"facebook.com", "facebook"}, {"fb.com", "facebook"},
    {"t.co", "twitter"},          {"twitter.com", "twitter"},
    {"linkedin.com", "linkedin"}};

std::optional<std::string_view>
find_host_keyword(const std::string &host,
                  const std::vector<std::string_view> &keywords) {
  for (auto keyword : keywords)
    if (Utils::contains(host, keyword))
      return keyword;
  return std::nullopt;
}

std::optional<std::string> search_term_of(const Utils::ParsedUrl &url) {
  for (auto param : SEARCH_TERM_PARAMS) {
    auto value = Utils::get_query_param(url, param);
    if (value)
      return value;
  }
  return std::nullopt;
}

// Exact domain or one of its subdomains
bool host_matches_domain(std::string_view host, std::string_view domain) {
  if (host == domain)
    return true;
  return host.size() > domain.size() &&
         host.substr(host.size() - domain.size()) == domain &&
         host[host.size() - domain.size() - 1] == '.';
}

std::vector<ReferrerInfo>
classify_all(const std::vector<std::string> &referrers) {
  std::vector<ReferrerInfo> infos;
  infos.reserve(referrers.size());
  for (const auto &referrer : referrers)
    infos.push_back(classify(referrer));
  return infos;
}

} // namespace

std::string normalize_host(std::string_view host) {
  std::string normalized = Utils::to_lower_copy(Utils::trim_copy(host));
  if (normalized.rfind("www.", 0) == 0)
    normalized.erase(0, 4);
  return normalized;
}

ReferrerInfo classify(std::string_view referrer,
                      std::optional<std::string_view> current_host) {
  ReferrerInfo info;
  if (referrer.empty())
    return info;

  auto url = Utils::parse_url(referrer);
  if (!url) {
    LOG(LogLevel::DEBUG, LogComponent::CLASSIFY_REFERRER,
        "Unparseable referrer treated as direct: " << referrer);
    return info;
  }

  const std::string host = normalize_host(url->host);

  if (current_host && !current_host->empty() &&
      host == normalize_host(*current_host)) {
    info.source = host;
    info.medium = Medium::INTERNAL;
    info.is_internal = true;
    return info;
  }

  if (auto engine = find_host_keyword(host, SEARCH_ENGINES)) {
    info.source = std::string(*engine);
    info.medium = Medium::SEARCH;
    info.search_term = search_term_of(*url);
    return info;
  }

  if (auto network = find_host_keyword(host, SOCIAL_NETWORKS)) {
    info.source = std::string(*network);
    info.medium = Medium::SOCIAL;
    return info;
  }

  if (auto utm_source = Utils::get_query_param(*url, "utm_source")) {
    info.source = *utm_source;
    info.medium = Utils::get_query_param(*url, "utm_medium")
                      .value_or(Medium::REFERRAL);
    info.campaign = Utils::get_query_param(*url, "utm_campaign");
    return info;
  }

  info.source = host;
  info.medium = Medium::REFERRAL;
  return info;
}

std::string classify_medium(std::string_view referrer) {
  return classify(referrer).medium;
}

bool is_search(std::string_view referrer) {
  return classify(referrer).medium == Medium::SEARCH;
}

bool is_social(std::string_view referrer) {
  return classify(referrer).medium == Medium::SOCIAL;
}

bool is_direct(std::string_view referrer) { return referrer.empty(); }

bool is_valid_referrer(std::string_view referrer) {
  return !referrer.empty() && Utils::parse_url(referrer).has_value();
}

std::optional<std::string> extract_search_term(std::string_view url) {
  auto parsed = Utils::parse_url(url);
  if (!parsed)
    return std::nullopt;
  return search_term_of(*parsed);
}

std::optional<std::string> extract_domain(std::string_view referrer) {
  if (referrer.empty())
    return std::nullopt;
  auto url = Utils::parse_url(referrer);
  if (!url)
    return std::nullopt;
  return normalize_host(url->host);
}

std::string normalize_source(std::string_view source) {
  const std::string lower = normalize_host(source);
  for (const auto &[domain, label] : SOURCE_ALIASES)
    if (host_matches_domain(lower, domain))
      return label;
  return std::string(source);
}

std::vector<RankedEntry>
source_stats(const std::vector<std::string> &referrers) {
  RankedCounter counter;
  for (const auto &info : classify_all(referrers))
    counter.add(info.source);
  return counter.ranked();
}

std::vector<RankedEntry>
medium_stats(const std::vector<std::string> &referrers) {
  RankedCounter counter;
  for (const auto &info : classify_all(referrers))
    counter.add(info.medium);
  return counter.ranked();
}

std::vector<RankedEntry>
top_referrers(const std::vector<std::string> &referrers, size_t limit) {
  auto stats = source_stats(referrers);
  if (stats.size() > limit)
    stats.resize(limit);
  return stats;
}

std::vector<std::string>
filter_by_medium(const std::vector<std::string> &referrers,
                 std::string_view medium) {
  std::vector<std::string> matching;
  for (const auto &referrer : referrers)
    if (classify(referrer).medium == medium)
      matching.push_back(referrer);
  return matching;
}

double organic_percentage(const std::vector<std::string> &referrers) {
  if (referrers.empty())
    return 0.0;

  auto infos = classify_all(referrers);
  auto organic =
      std::count_if(infos.begin(), infos.end(), [](const ReferrerInfo &info) {
        return info.medium == Medium::SEARCH;
      });
  return Utils::percentage_of(static_cast<double>(organic),
                              static_cast<double>(referrers.size()));
}

std::optional<std::string> campaign_of(std::string_view url_or_path) {
  if (auto url = Utils::parse_url(url_or_path))
    return Utils::get_query_param(*url, "utm_campaign");

  size_t query_pos = url_or_path.find('?');
  if (query_pos == std::string_view::npos)
    return std::nullopt;

  Utils::ParsedUrl relative;
  std::string_view query = url_or_path.substr(query_pos + 1);
  relative.query = std::string(query.substr(0, query.find('#')));
  return Utils::get_query_param(relative, "utm_campaign");
}

std::vector<RankedEntry> campaign_stats(const std::vector<std::string> &urls) {
  RankedCounter counter;
  for (const auto &url : urls)
    if (auto campaign = campaign_of(url))
      counter.add(*campaign);
  return counter.ranked();
}

} // namespace ReferrerParser
