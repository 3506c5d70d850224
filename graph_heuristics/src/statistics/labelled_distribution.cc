// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/statistics/labelled_distribution.h"

#include <algorithm>

#include "base/common/string.h"

namespace graph_heuristics {

LabelledDistribution LabelledDistribution::FromCounts(const std::unordered_map<int32, int64> &counts) {
  LabelledDistribution result;
  int64 total = 0;
  for (const auto &pair : counts) {
    if (pair.second > 0) { total += pair.second; }
  }
  if (total == 0) { return result; }
  for (const auto &pair : counts) {
    if (pair.second <= 0) { continue; }
    result.probabilities_[pair.first] = std::min(1.0, static_cast<double>(pair.second) / total);
  }
  return result;
}

std::string LabelledDistribution::ToString() const {
  return "{" +
         absl::StrJoin(probabilities_, ", ",
                       [](std::string *out, const std::pair<const int32, double> &pair) {
                         absl::StrAppendFormat(out, "%d: %.4f", pair.first, pair.second);
                       }) +
         "}";
}

}  // namespace graph_heuristics
