// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/sampler/heuristics_sampler.h"

#include <utility>

#include "absl/time/clock.h"
#include "base/common/logging.h"
#include "base/util/scope_exit.h"

namespace graph_heuristics {

HeuristicsSampler::HeuristicsSampler(const GraphStoreReader *store, StatisticsSnapshot *snapshot, int batch_size)
    : store_(store), snapshot_(snapshot), batch_size_(batch_size) {
  CHECK(store_) << "HeuristicsSampler init fail, store = null";
  CHECK(snapshot_) << "HeuristicsSampler init fail, snapshot = null";
  CHECK_GT(batch_size_, 0) << "Invalid batch size";
}

ErrorCode HeuristicsSampler::RunOnce() {
  if (!pass_mutex_.TryLock()) {
    LOG(WARNING) << "Previous heuristics pass is still running, skip this one.";
    return ErrorCode::PASS_IN_PROGRESS;
  }
  base::ScopeExit unlock([this]() { pass_mutex_.Unlock(); });

  absl::Time start = absl::Now();
  int64 bound = store_->HighestNodeIdInUse();
  PassResult result;
  result.nodes.reserve(batch_size_);
  ErrorCode code = SampleBatch(bound, &result);
  if (code != ErrorCode::OK) {
    LOG(ERROR) << "Heuristics pass aborted, snapshot unchanged: " << ErrorCode_Name(code);
    return code;
  }
  Fold(result, bound);
  int64 pass_count = ++pass_count_;

  LOG_EVERY_N_SEC(INFO, 300) << "Heuristics pass " << pass_count << " finish, live = " << result.nodes.size()
                             << ", skipped = " << result.skipped << ", bound = " << bound
                             << ", cost = " << absl::Now() - start;
  return ErrorCode::OK;
}

ErrorCode HeuristicsSampler::SampleBatch(int64 bound, PassResult *result) {
  for (int i = 0; i < batch_size_; ++i) {
    // Nothing to draw from on an empty store, every candidate is a miss.
    if (bound <= 0) {
      result->skipped++;
      continue;
    }
    NodeId id = absl::Uniform<NodeId>(random_, 0, bound);
    if (!store_->NodeExists(id)) {
      result->skipped++;
      continue;
    }
    NodeObservation observation;
    ErrorCode code = ReadNode(id, &observation);
    if (code == ErrorCode::NODE_NOT_FOUND) {
      // Deleted after the existence check.
      result->skipped++;
      continue;
    }
    if (code != ErrorCode::OK) {
      LOG(ERROR) << "Read node " << id << " fail: " << ErrorCode_Name(code);
      return code;
    }
    result->nodes.emplace_back(std::move(observation));
  }
  return ErrorCode::OK;
}

ErrorCode HeuristicsSampler::ReadNode(NodeId id, NodeObservation *observation) const {
  ErrorCode code = store_->NodeGetRelationshipTypes(id, &observation->rel_types);
  if (code != ErrorCode::OK) { return code; }
  code = store_->NodeGetLabels(id, &observation->labels);
  if (code != ErrorCode::OK) { return code; }
  for (RelTypeId rel_type : observation->rel_types) {
    int64 degree = 0;
    code = store_->NodeGetDegree(id, Direction::INCOMING, rel_type, &degree);
    if (code != ErrorCode::OK) { return code; }
    observation->in_degrees[rel_type] = degree;
    code = store_->NodeGetDegree(id, Direction::OUTGOING, rel_type, &degree);
    if (code != ErrorCode::OK) { return code; }
    observation->out_degrees[rel_type] = degree;
  }
  return ErrorCode::OK;
}

void HeuristicsSampler::Fold(const PassResult &result, int64 bound) {
  for (const auto &node : result.nodes) {
    snapshot_->RecordNode(node.labels, node.rel_types, node.in_degrees, node.out_degrees);
  }
  for (int64 i = 0; i < result.skipped; ++i) { snapshot_->RecordSkip(); }
  snapshot_->RecordMaxNodeBound(bound);
  snapshot_->Recompute();
}

}  // namespace graph_heuristics
