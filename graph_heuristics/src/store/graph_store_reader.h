// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include "graph_heuristics/src/base/heuristics_type.h"

namespace graph_heuristics {

/**
 * Read access to the graph storage, as needed by the heuristics sampler.
 * Implementations must be safe to call from the sampler thread while the graph is
 * modified concurrently. A node may disappear between two calls.
 */
class GraphStoreReader {
 public:
  virtual ~GraphStoreReader() {}

  // Upper bound of node ids: every live node id is smaller than it.
  virtual int64 HighestNodeIdInUse() const = 0;

  virtual bool NodeExists(NodeId id) const = 0;

  /**
   * \brief Distinct relationship types incident to node `id`, in either direction.
   * \return NODE_NOT_FOUND if the node does not exist.
   */
  virtual ErrorCode NodeGetRelationshipTypes(NodeId id, IdList *rel_types) const = 0;

  // \return NODE_NOT_FOUND if the node does not exist.
  virtual ErrorCode NodeGetLabels(NodeId id, IdList *labels) const = 0;

  // Number of relationships of `rel_type` in `direction`. A self loop counts once per direction.
  virtual ErrorCode NodeGetDegree(NodeId id, Direction direction, RelTypeId rel_type, int64 *degree) const = 0;
};

}  // namespace graph_heuristics
