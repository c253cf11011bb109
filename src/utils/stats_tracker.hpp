#ifndef STATS_TRACKER_HPP
#define STATS_TRACKER_HPP

#include <cstdint>
#include <vector>

class StatsTracker {
public:
  StatsTracker();
  explicit StatsTracker(const std::vector<double> &values);

  // Add a new data point to the stream
  void update(double new_value);

  int64_t get_count() const;
  double get_mean() const;
  double get_sum() const;

  // Sample variance (n - 1)
  double get_variance() const;
  double get_stddev() const;

  // Population variance (n), used for z-scores over a complete series
  double get_population_variance() const;
  double get_population_stddev() const;

private:
  int64_t count_;
  double mean_;
  // M2 is the sum of squares of differences from the current mean
  double m2_;
  double sum_;
};

#endif // STATS_TRACKER_HPP
