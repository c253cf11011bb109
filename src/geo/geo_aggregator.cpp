#include "geo_aggregator.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Geo {
namespace {

constexpr double PI = 3.14159265358979323846;

double to_radians(double degrees) { return degrees * (PI / 180.0); }

std::string country_or_unknown(const GeoRecord &record) {
  return record.country.value_or(UNKNOWN_COUNTRY);
}

// Every record is its own visitor and session: records carry no identity
std::vector<GeoAnalytics> aggregate_by_key(
    const std::vector<GeoRecord> &records,
    const std::function<std::optional<std::string>(const GeoRecord &)> &key_of) {
  std::vector<GeoAnalytics> rows;
  std::unordered_map<std::string, size_t> index;

  for (const auto &record : records) {
    auto key = key_of(record);
    if (!key)
      continue;

    auto [it, inserted] = index.try_emplace(*key, rows.size());
    if (inserted)
      rows.push_back({*key, 0, 0, 0});

    GeoAnalytics &row = rows[it->second];
    row.visitors++;
    row.page_views++;
    row.sessions++;
  }

  std::stable_sort(rows.begin(), rows.end(),
                   [](const GeoAnalytics &a, const GeoAnalytics &b) {
                     return a.page_views > b.page_views;
                   });
  return rows;
}

} // namespace

std::optional<Coordinates> GeoRecord::coordinates() const {
  if (!latitude || !longitude)
    return std::nullopt;
  return Coordinates{*latitude, *longitude};
}

GeoRecord GeoRecord::from_event(const EventRecord &event, std::string id) {
  GeoRecord record;
  record.id = std::move(id);
  record.country = event.country;
  record.country_code = event.country_code;
  record.region = event.region;
  record.city = event.city;
  record.latitude = event.latitude;
  record.longitude = event.longitude;
  record.timezone = event.timezone;
  return record;
}

std::vector<GeoAnalytics>
aggregate_by_country(const std::vector<GeoRecord> &records) {
  return aggregate_by_key(records, [](const GeoRecord &r) {
    return std::optional<std::string>(country_or_unknown(r));
  });
}

std::vector<GeoAnalytics>
aggregate_by_region(const std::vector<GeoRecord> &records) {
  return aggregate_by_key(
      records, [](const GeoRecord &r) -> std::optional<std::string> {
        if (!r.region || r.region->empty())
          return std::nullopt;
        return country_or_unknown(r) + " - " + *r.region;
      });
}

std::vector<GeoAnalytics>
aggregate_by_city(const std::vector<GeoRecord> &records) {
  return aggregate_by_key(
      records, [](const GeoRecord &r) -> std::optional<std::string> {
        if (!r.city || r.city->empty())
          return std::nullopt;
        return *r.city + ", " + country_or_unknown(r);
      });
}

std::vector<GeoAnalytics> top_countries(const std::vector<GeoRecord> &records,
                                        size_t limit) {
  auto rows = aggregate_by_country(records);
  if (rows.size() > limit)
    rows.resize(limit);
  return rows;
}

std::map<std::string, double>
country_distribution(const std::vector<GeoRecord> &records) {
  std::map<std::string, double> distribution;
  if (records.empty())
    return distribution;

  std::map<std::string, uint64_t> counts;
  for (const auto &record : records)
    counts[country_or_unknown(record)]++;

  for (const auto &[country, count] : counts)
    distribution[country] =
        Utils::percentage_of(static_cast<double>(count),
                             static_cast<double>(records.size()));
  return distribution;
}

std::vector<GeoRecord>
filter_by_country_code(const std::vector<GeoRecord> &records,
                       const std::string &country_code) {
  std::vector<GeoRecord> matching;
  std::copy_if(records.begin(), records.end(), std::back_inserter(matching),
               [&](const GeoRecord &r) {
                 return r.country_code == country_code;
               });
  return matching;
}

std::string timezone_of(const GeoRecord &record) {
  return record.timezone.value_or(DEFAULT_TIMEZONE);
}

bool is_valid_coordinates(double latitude, double longitude) {
  return latitude >= -90.0 && latitude <= 90.0 && longitude >= -180.0 &&
         longitude <= 180.0;
}

bool is_within_bounds(const Coordinates &location, const Bounds &bounds) {
  return location.latitude <= bounds.north &&
         location.latitude >= bounds.south &&
         location.longitude <= bounds.east && location.longitude >= bounds.west;
}

double calculate_distance(const Coordinates &a, const Coordinates &b) {
  if (!is_valid_coordinates(a.latitude, a.longitude) ||
      !is_valid_coordinates(b.latitude, b.longitude)) {
    LOG(LogLevel::WARN, LogComponent::GEO,
        "Rejected distance between (" << a.latitude << ", " << a.longitude
                                      << ") and (" << b.latitude << ", "
                                      << b.longitude << ")");
    throw std::invalid_argument("Coordinates out of range");
  }

  const double lat1 = to_radians(a.latitude);
  const double lat2 = to_radians(b.latitude);
  const double delta_lat = to_radians(b.latitude - a.latitude);
  const double delta_lon = to_radians(b.longitude - a.longitude);

  const double h = std::sin(delta_lat / 2) * std::sin(delta_lat / 2) +
                   std::cos(lat1) * std::cos(lat2) * std::sin(delta_lon / 2) *
                       std::sin(delta_lon / 2);
  const double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));

  return Utils::round_to_decimals(EARTH_RADIUS_KM * c, 1);
}

std::vector<LocationCluster>
group_nearby_locations(const std::vector<GeoRecord> &records,
                       double max_distance_km) {
  if (max_distance_km < 0.0 || std::isnan(max_distance_km)) {
    LOG(LogLevel::WARN, LogComponent::GEO,
        "Rejected cluster distance " << max_distance_km);
    throw std::invalid_argument("Cluster distance must not be negative");
  }

  auto usable = [](const GeoRecord &r) {
    auto coords = r.coordinates();
    return coords && is_valid_coordinates(coords->latitude, coords->longitude);
  };

  std::vector<LocationCluster> clusters;
  std::vector<bool> processed(records.size(), false);

  for (size_t i = 0; i < records.size(); ++i) {
    if (processed[i] || !usable(records[i]))
      continue;

    processed[i] = true;
    LocationCluster cluster{records[i].id, {records[i]}};
    const Coordinates anchor = *records[i].coordinates();

    for (size_t j = 0; j < records.size(); ++j) {
      if (processed[j] || !usable(records[j]))
        continue;
      if (calculate_distance(anchor, *records[j].coordinates()) <=
          max_distance_km) {
        cluster.members.push_back(records[j]);
        processed[j] = true;
      }
    }
    clusters.push_back(std::move(cluster));
  }

  LOG(LogLevel::DEBUG, LogComponent::GEO,
      "Grouped " << records.size() << " records into " << clusters.size()
                 << " clusters within " << max_distance_km << " km");
  return clusters;
}

} // namespace Geo
