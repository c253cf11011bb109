#include "ranked_counter.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

void RankedCounter::add(const std::string &label, uint64_t n) {
  auto [it, inserted] = counts_.try_emplace(label, 0);
  if (inserted)
    order_.push_back(label);
  it->second += n;
  total_ += n;
}

uint64_t RankedCounter::count_of(const std::string &label) const {
  auto it = counts_.find(label);
  return it == counts_.end() ? 0 : it->second;
}

std::vector<RankedEntry> RankedCounter::ranked() const {
  std::vector<RankedEntry> entries;
  entries.reserve(order_.size());
  for (const auto &label : order_) {
    uint64_t count = counts_.at(label);
    entries.push_back({label, count,
                       Utils::percentage_of(static_cast<double>(count),
                                            static_cast<double>(total_))});
  }
  std::stable_sort(entries.begin(), entries.end(),
                   [](const RankedEntry &a, const RankedEntry &b) {
                     return a.count > b.count;
                   });
  return entries;
}

std::vector<RankedEntry> RankedCounter::top(size_t limit) const {
  auto entries = ranked();
  if (entries.size() > limit)
    entries.resize(limit);
  return entries;
}
