#ifndef REFERRER_PARSER_HPP
#define REFERRER_PARSER_HPP

#include "utils/ranked_counter.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ReferrerParser {

namespace Medium {
constexpr const char *DIRECT = "direct";
constexpr const char *INTERNAL = "internal";
constexpr const char *SEARCH = "search";
constexpr const char *SOCIAL = "social";
constexpr const char *REFERRAL = "referral";
} // namespace Medium

constexpr const char *DIRECT_SOURCE = "(direct)";

struct ReferrerInfo {
  std::string source = DIRECT_SOURCE;
  std::string medium = Medium::DIRECT;
  std::optional<std::string> campaign;
  std::optional<std::string> search_term;
  bool is_internal = false;

  bool operator==(const ReferrerInfo &other) const {
    return source == other.source && medium == other.medium &&
           campaign == other.campaign && search_term == other.search_term &&
           is_internal == other.is_internal;
  }
};

/**
 * Classifies a referrer URL. Empty or unparseable referrers are direct
 * traffic. Precedence: internal (host equals `current_host`), search engine,
 * social network, utm_source, plain referral.
 */
ReferrerInfo classify(std::string_view referrer,
                      std::optional<std::string_view> current_host = {});

// Lowercased with a leading "www." removed
std::string normalize_host(std::string_view host);

std::string classify_medium(std::string_view referrer);
bool is_search(std::string_view referrer);
bool is_social(std::string_view referrer);
// True only for an absent referrer
bool is_direct(std::string_view referrer);
bool is_valid_referrer(std::string_view referrer);

// First non-empty value among q, query, search, p, text
std::optional<std::string> extract_search_term(std::string_view url);

std::optional<std::string> extract_domain(std::string_view referrer);
// Known domain variants (fb.com, t.co, ...) to a canonical label
std::string normalize_source(std::string_view source);

std::vector<RankedEntry>
source_stats(const std::vector<std::string> &referrers);
std::vector<RankedEntry>
medium_stats(const std::vector<std::string> &referrers);
std::vector<RankedEntry>
top_referrers(const std::vector<std::string> &referrers, size_t limit);
std::vector<std::string>
filter_by_medium(const std::vector<std::string> &referrers,
                 std::string_view medium);
// Share of referrers classified as search, one decimal
double organic_percentage(const std::vector<std::string> &referrers);

// utm_campaign of an absolute URL or a path with a query string
std::optional<std::string> campaign_of(std::string_view url_or_path);
std::vector<RankedEntry> campaign_stats(const std::vector<std::string> &urls);

} // namespace ReferrerParser

#endif // REFERRER_PARSER_HPP
