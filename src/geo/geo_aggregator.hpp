#ifndef GEO_AGGREGATOR_HPP
#define GEO_AGGREGATOR_HPP

#include "core/event_record.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Geo {

constexpr double EARTH_RADIUS_KM = 6371.0;
constexpr const char *UNKNOWN_COUNTRY = "Unknown";
constexpr const char *DEFAULT_TIMEZONE = "UTC";

struct Coordinates {
  double latitude = 0.0;
  double longitude = 0.0;
};

struct Bounds {
  double north = 0.0;
  double south = 0.0;
  double east = 0.0;
  double west = 0.0;
};

// Resolved geo attributes of one record
struct GeoRecord {
  std::string id;
  std::optional<std::string> country;
  std::optional<std::string> country_code;
  std::optional<std::string> region;
  std::optional<std::string> city;
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::optional<std::string> timezone;

  // Present only when both latitude and longitude are
  std::optional<Coordinates> coordinates() const;

  static GeoRecord from_event(const EventRecord &event, std::string id);
};

struct GeoAnalytics {
  std::string location;
  uint64_t visitors = 0;
  uint64_t page_views = 0;
  uint64_t sessions = 0;
};

struct LocationCluster {
  std::string anchor_id;
  std::vector<GeoRecord> members; // anchor first
};

// Ranked by page views descending; missing countries count as "Unknown"
std::vector<GeoAnalytics>
aggregate_by_country(const std::vector<GeoRecord> &records);
// "<country> - <region>"; records without a region are skipped
std::vector<GeoAnalytics>
aggregate_by_region(const std::vector<GeoRecord> &records);
// "<city>, <country>"; records without a city are skipped
std::vector<GeoAnalytics>
aggregate_by_city(const std::vector<GeoRecord> &records);

std::vector<GeoAnalytics> top_countries(const std::vector<GeoRecord> &records,
                                        size_t limit);

// Country -> share of records in percent, one decimal
std::map<std::string, double>
country_distribution(const std::vector<GeoRecord> &records);

std::vector<GeoRecord>
filter_by_country_code(const std::vector<GeoRecord> &records,
                       const std::string &country_code);

std::string timezone_of(const GeoRecord &record);

bool is_valid_coordinates(double latitude, double longitude);
bool is_within_bounds(const Coordinates &location, const Bounds &bounds);

/**
 * Haversine great-circle distance in kilometres, one decimal.
 * @throws std::invalid_argument if either point is not a valid coordinate
 */
double calculate_distance(const Coordinates &a, const Coordinates &b);

/**
 * Greedy single-pass clustering. Each unclustered record with coordinates
 * anchors a new cluster and absorbs every later unclustered record within
 * `max_distance_km` of the anchor. Records without valid coordinates are
 * ignored.
 * @throws std::invalid_argument if max_distance_km is negative
 */
std::vector<LocationCluster>
group_nearby_locations(const std::vector<GeoRecord> &records,
                       double max_distance_km);

} // namespace Geo

#endif // GEO_AGGREGATOR_HPP
