// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <map>
#include <string>
#include <unordered_map>

#include "base/common/basic_types.h"

namespace graph_heuristics {

/**
 * Relative frequency of each key (label or relationship type) among all recorded occurrences.
 * Every probability is in [0, 1], a non-empty distribution sums to 1.
 * Immutable after construction.
 */
class LabelledDistribution {
 public:
  LabelledDistribution() {}

  // Keys with a non-positive count are left out.
  static LabelledDistribution FromCounts(const std::unordered_map<int32, int64> &counts);

  // 0 for a key never observed.
  double Get(int32 key) const {
    auto it = probabilities_.find(key);
    return it == probabilities_.end() ? 0.0 : it->second;
  }

  bool Contains(int32 key) const { return probabilities_.find(key) != probabilities_.end(); }

  size_t size() const { return probabilities_.size(); }
  bool empty() const { return probabilities_.empty(); }

  const std::map<int32, double> &probabilities() const { return probabilities_; }

  std::string ToString() const;

  bool operator==(const LabelledDistribution &other) const { return probabilities_ == other.probabilities_; }
  bool operator!=(const LabelledDistribution &other) const { return !(*this == other); }

 private:
  std::map<int32, double> probabilities_;
};

}  // namespace graph_heuristics
