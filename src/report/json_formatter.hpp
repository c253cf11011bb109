#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "aggregation/time_period_aggregator.hpp"
#include "classify/referrer_parser.hpp"
#include "classify/ua_parser.hpp"
#include "nlohmann/json.hpp"
#include "report/summary_builder.hpp"
#include "utils/ranked_counter.hpp"

#include <string>
#include <vector>

namespace JsonFormatter {

nlohmann::json device_info_to_json(const UAParser::DeviceInfo &info);
nlohmann::json referrer_info_to_json(const ReferrerParser::ReferrerInfo &info);
nlohmann::json
ranked_to_json(const std::vector<RankedEntry> &entries);
nlohmann::json
buckets_to_json(const std::vector<Aggregation::AggregatedBucket> &buckets);

nlohmann::json summary_to_json_object(const Report::AnalyticsSummary &summary);

// indent < 0 gives compact output
std::string format_summary_to_json(const Report::AnalyticsSummary &summary,
                                   int indent = -1);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
