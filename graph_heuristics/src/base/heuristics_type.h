// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "base/common/basic_types.h"
#include "graph_heuristics/src/proto/heuristics.pb.h"

namespace graph_heuristics {

using NodeId = int64;
using LabelId = int32;
using RelTypeId = int32;

using IdList = std::vector<int32>;
// relationship type id -> degree of one node.
using DegreeMap = std::unordered_map<RelTypeId, int64>;

// Key of the degree estimate.
struct DegreeKey {
  LabelId label_id;
  RelTypeId rel_type_id;
  Direction direction;

  bool operator<(const DegreeKey &other) const {
    return std::tie(label_id, rel_type_id, direction) <
           std::tie(other.label_id, other.rel_type_id, other.direction);
  }
  bool operator==(const DegreeKey &other) const {
    return label_id == other.label_id && rel_type_id == other.rel_type_id && direction == other.direction;
  }

  std::string ToString() const {
    return "(" + std::to_string(label_id) + ", " + std::to_string(rel_type_id) + ", " +
           Direction_Name(direction) + ")";
  }
};

// Running mean of degree samples.
struct DegreeAccumulator {
  int64 sum = 0;
  int64 count = 0;

  double Mean() const { return count == 0 ? 0.0 : static_cast<double>(sum) / count; }

  bool operator==(const DegreeAccumulator &other) const {
    return sum == other.sum && count == other.count;
  }
};

}  // namespace graph_heuristics
