#ifndef RANKED_COUNTER_HPP
#define RANKED_COUNTER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

struct RankedEntry {
  std::string label;
  uint64_t count = 0;
  double percentage = 0.0; // one decimal

  bool operator==(const RankedEntry &other) const {
    return label == other.label && count == other.count &&
           percentage == other.percentage;
  }
};

// Label counter whose ranking is stable: equal counts keep first-seen order.
class RankedCounter {
public:
  void add(const std::string &label, uint64_t n = 1);

  uint64_t count_of(const std::string &label) const;
  uint64_t total() const { return total_; }
  size_t distinct() const { return order_.size(); }
  bool empty() const { return order_.empty(); }

  // Sorted by count descending; percentages are shares of total()
  std::vector<RankedEntry> ranked() const;
  // First `limit` entries of ranked()
  std::vector<RankedEntry> top(size_t limit) const;

private:
  std::vector<std::string> order_;
  std::unordered_map<std::string, uint64_t> counts_;
  uint64_t total_ = 0;
};

#endif // RANKED_COUNTER_HPP
