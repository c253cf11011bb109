#include "stats_tracker.hpp"
#include <cmath>
#include <cstdint>
#include <vector>

StatsTracker::StatsTracker() : count_(0), mean_(0), m2_(0), sum_(0) {}

StatsTracker::StatsTracker(const std::vector<double> &values) : StatsTracker() {
  for (double v : values)
    update(v);
}

void StatsTracker::update(double new_value) {
  count_++;
  sum_ += new_value;
  double delta = new_value - mean_;
  mean_ += delta / count_;
  double delta2 = new_value - mean_;
  m2_ += delta * delta2;
}

int64_t StatsTracker::get_count() const { return count_; }

double StatsTracker::get_mean() const { return count_ > 0 ? mean_ : 0.0; }

double StatsTracker::get_sum() const { return sum_; }

double StatsTracker::get_variance() const {
  if (count_ < 2) {
    return 0.0;
  }
  return m2_ / (count_ - 1);
}

double StatsTracker::get_stddev() const { return std::sqrt(get_variance()); }

double StatsTracker::get_population_variance() const {
  if (count_ < 1) {
    return 0.0;
  }
  return m2_ / count_;
}

double StatsTracker::get_population_stddev() const {
  return std::sqrt(get_population_variance());
}
