// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <map>
#include <memory>
#include <string>
#include <unordered_map>

#include "absl/synchronization/mutex.h"
#include "graph_heuristics/src/base/heuristics_type.h"
#include "graph_heuristics/src/statistics/labelled_distribution.h"

namespace graph_heuristics {

class SnapshotCodec;

// Read-optimized statistics, derived from the raw counters by StatisticsSnapshot::Recompute().
// Never modified after being published.
struct StatisticsView {
  LabelledDistribution labels;
  LabelledDistribution rel_types;
  // Average degree of each observed (label, relationship type, direction).
  std::map<DegreeKey, double> degrees;
  // observed / (observed + skipped), 0 before any sample.
  double live_nodes_ratio = 0;
  int64 max_addressable_nodes = 0;

  // 0 for a triple never observed.
  double Degree(LabelId label, RelTypeId rel_type, Direction direction) const {
    auto it = degrees.find({label, rel_type, direction});
    return it == degrees.end() ? 0.0 : it->second;
  }
};

/**
 * Aggregate of all sampled observations.
 *
 * Raw counters are written by a single writer (the active sampling pass) without locking,
 * and are never read by the query planner. Readers only see the view published by the
 * last Recompute(): the whole view is swapped at once, so a reader observes either the
 * previous view or the new one, never a mix.
 */
class StatisticsSnapshot {
 public:
  StatisticsSnapshot();

  // Mutators, single writer only.

  /**
   * \brief Fold one live node into the counters.
   * \param in_degrees, out_degrees Degree per relationship type. A type of `rel_types` missing from
   *        the map counts as degree 0.
   */
  void RecordNode(const IdList &labels,
                  const IdList &rel_types,
                  const DegreeMap &in_degrees,
                  const DegreeMap &out_degrees);

  // A candidate id with no live node behind it.
  void RecordSkip() { skipped_count_++; }

  // Keeps the maximum of all reported bounds.
  void RecordMaxNodeBound(int64 bound) {
    if (bound > max_node_id_observed_) { max_node_id_observed_ = bound; }
  }

  // Rebuild the derived view from the raw counters and publish it.
  void Recompute();

  // Read API, safe from any thread at any time.

  // The view published by the last Recompute(). Use it to read several values consistently.
  std::shared_ptr<const StatisticsView> CurrentView() const;

  std::shared_ptr<const LabelledDistribution> LabelDistribution() const;
  std::shared_ptr<const LabelledDistribution> RelationshipTypeDistribution() const;
  double Degree(LabelId label, RelTypeId rel_type, Direction direction) const {
    return CurrentView()->Degree(label, rel_type, direction);
  }
  double LiveNodesRatio() const { return CurrentView()->live_nodes_ratio; }
  int64 MaxAddressableNodes() const { return CurrentView()->max_addressable_nodes; }

  // Raw counters, for the writer side and persistence only.
  int64 observed_count() const { return observed_count_; }
  int64 skipped_count() const { return skipped_count_; }
  int64 max_node_id_observed() const { return max_node_id_observed_; }
  const std::unordered_map<LabelId, int64> &label_frequency() const { return label_frequency_; }
  const std::unordered_map<RelTypeId, int64> &rel_type_frequency() const { return rel_type_frequency_; }
  const std::map<DegreeKey, DegreeAccumulator> &degree_accumulator() const { return degree_accumulator_; }

  std::string ToString() const;

  // Compares raw counters. Intended for tests.
  bool operator==(const StatisticsSnapshot &other) const;
  bool operator!=(const StatisticsSnapshot &other) const { return !(*this == other); }

 private:
  friend class SnapshotCodec;

  int64 observed_count_ = 0;
  int64 skipped_count_ = 0;
  int64 max_node_id_observed_ = 0;
  std::unordered_map<LabelId, int64> label_frequency_;
  std::unordered_map<RelTypeId, int64> rel_type_frequency_;
  std::map<DegreeKey, DegreeAccumulator> degree_accumulator_;

  mutable absl::Mutex view_mutex_;
  std::shared_ptr<const StatisticsView> view_ ABSL_GUARDED_BY(view_mutex_);

  DISALLOW_COPY_AND_ASSIGN(StatisticsSnapshot);
};

}  // namespace graph_heuristics
