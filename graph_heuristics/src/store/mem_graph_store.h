// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <set>
#include <unordered_map>

#include "absl/synchronization/mutex.h"
#include "graph_heuristics/src/store/graph_store_reader.h"

namespace graph_heuristics {

/**
 * In-memory graph with labelled nodes and typed, directed relationships.
 * Node ids are allocated sequentially from 0 and never reused.
 * Multi read-write safe.
 */
class MemGraphStore : public GraphStoreReader {
 public:
  MemGraphStore() {}

  NodeId CreateNode(const IdList &labels = {});

  // Deletes the node and every relationship attached to it.
  bool DeleteNode(NodeId id);

  bool AddLabel(NodeId id, LabelId label);

  // \return false if either end does not exist.
  bool CreateRelationship(NodeId src, NodeId dst, RelTypeId rel_type);

  int64 NodeCount() const;

  int64 HighestNodeIdInUse() const override;
  bool NodeExists(NodeId id) const override;
  ErrorCode NodeGetRelationshipTypes(NodeId id, IdList *rel_types) const override;
  ErrorCode NodeGetLabels(NodeId id, IdList *labels) const override;
  ErrorCode NodeGetDegree(NodeId id, Direction direction, RelTypeId rel_type, int64 *degree) const override;

 private:
  struct Relationship {
    NodeId src;
    NodeId dst;
    RelTypeId rel_type;
  };
  struct Node {
    std::set<LabelId> labels;
    std::set<int64> relationships;
  };

  mutable absl::Mutex mu_;
  std::unordered_map<NodeId, Node> nodes_ ABSL_GUARDED_BY(mu_);
  std::unordered_map<int64, Relationship> relationships_ ABSL_GUARDED_BY(mu_);
  NodeId next_node_id_ ABSL_GUARDED_BY(mu_) = 0;
  int64 next_relationship_id_ ABSL_GUARDED_BY(mu_) = 0;

  DISALLOW_COPY_AND_ASSIGN(MemGraphStore);
};

}  // namespace graph_heuristics
