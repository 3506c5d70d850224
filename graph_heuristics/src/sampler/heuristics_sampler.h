// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "absl/random/random.h"
#include "absl/synchronization/mutex.h"
#include "graph_heuristics/src/schedule/job_scheduler.h"
#include "graph_heuristics/src/statistics/statistics_snapshot.h"
#include "graph_heuristics/src/store/graph_store_reader.h"

namespace graph_heuristics {

/**
 * One sampling pass draws `batch_size` node ids uniformly from [0, HighestNodeIdInUse()),
 * reads labels, relationship types and degrees of the live ones, folds them into the
 * snapshot and republishes the derived view.
 *
 * A node deleted while it is being read counts as skipped. Any other storage error aborts
 * the pass before the snapshot is touched.
 */
class HeuristicsSampler : public RecurringTask {
 public:
  static constexpr int kDefaultBatchSize = 100;

  HeuristicsSampler() = delete;
  HeuristicsSampler(const GraphStoreReader *store, StatisticsSnapshot *snapshot, int batch_size = kDefaultBatchSize);

  std::string Name() const override { return "HeuristicsSampler"; }

  /**
   * \brief Run one pass.
   * \return PASS_IN_PROGRESS if another pass of this sampler is running, the storage error if
   *         the pass was aborted, OK otherwise.
   */
  ErrorCode RunOnce() override;

  int batch_size() const { return batch_size_; }

  // Number of completed passes.
  int64 pass_count() const { return pass_count_; }

 private:
  struct NodeObservation {
    IdList labels;
    IdList rel_types;
    DegreeMap in_degrees;
    DegreeMap out_degrees;
  };

  // Candidates read by one pass, folded into the snapshot once the whole batch is read.
  struct PassResult {
    std::vector<NodeObservation> nodes;
    int64 skipped = 0;
  };

  ErrorCode SampleBatch(int64 bound, PassResult *result) ABSL_EXCLUSIVE_LOCKS_REQUIRED(pass_mutex_);

  // \return NODE_NOT_FOUND when the node is gone, the caller treats it as a skip.
  ErrorCode ReadNode(NodeId id, NodeObservation *observation) const;

  void Fold(const PassResult &result, int64 bound);

  const GraphStoreReader *store_;
  StatisticsSnapshot *snapshot_;
  int batch_size_;

  absl::Mutex pass_mutex_;
  absl::BitGen random_ ABSL_GUARDED_BY(pass_mutex_);
  std::atomic<int64> pass_count_{0};

  DISALLOW_COPY_AND_ASSIGN(HeuristicsSampler);
};

}  // namespace graph_heuristics
