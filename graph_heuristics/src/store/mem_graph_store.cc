// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/store/mem_graph_store.h"

namespace graph_heuristics {

NodeId MemGraphStore::CreateNode(const IdList &labels) {
  absl::MutexLock lock(&mu_);
  NodeId id = next_node_id_++;
  Node &node = nodes_[id];
  node.labels.insert(labels.begin(), labels.end());
  return id;
}

bool MemGraphStore::DeleteNode(NodeId id) {
  absl::MutexLock lock(&mu_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) { return false; }
  for (int64 rel_id : it->second.relationships) {
    const Relationship &rel = relationships_.at(rel_id);
    NodeId other = rel.src == id ? rel.dst : rel.src;
    if (other != id) { nodes_.at(other).relationships.erase(rel_id); }
    relationships_.erase(rel_id);
  }
  nodes_.erase(it);
  return true;
}

bool MemGraphStore::AddLabel(NodeId id, LabelId label) {
  absl::MutexLock lock(&mu_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) { return false; }
  it->second.labels.insert(label);
  return true;
}

bool MemGraphStore::CreateRelationship(NodeId src, NodeId dst, RelTypeId rel_type) {
  absl::MutexLock lock(&mu_);
  auto src_it = nodes_.find(src);
  auto dst_it = nodes_.find(dst);
  if (src_it == nodes_.end() || dst_it == nodes_.end()) { return false; }
  int64 rel_id = next_relationship_id_++;
  relationships_[rel_id] = {src, dst, rel_type};
  src_it->second.relationships.insert(rel_id);
  dst_it->second.relationships.insert(rel_id);
  return true;
}

int64 MemGraphStore::NodeCount() const {
  absl::ReaderMutexLock lock(&mu_);
  return nodes_.size();
}

int64 MemGraphStore::HighestNodeIdInUse() const {
  absl::ReaderMutexLock lock(&mu_);
  return next_node_id_;
}

bool MemGraphStore::NodeExists(NodeId id) const {
  absl::ReaderMutexLock lock(&mu_);
  return nodes_.find(id) != nodes_.end();
}

ErrorCode MemGraphStore::NodeGetRelationshipTypes(NodeId id, IdList *rel_types) const {
  absl::ReaderMutexLock lock(&mu_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) { return ErrorCode::NODE_NOT_FOUND; }
  std::set<RelTypeId> types;
  for (int64 rel_id : it->second.relationships) { types.insert(relationships_.at(rel_id).rel_type); }
  rel_types->assign(types.begin(), types.end());
  return ErrorCode::OK;
}

ErrorCode MemGraphStore::NodeGetLabels(NodeId id, IdList *labels) const {
  absl::ReaderMutexLock lock(&mu_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) { return ErrorCode::NODE_NOT_FOUND; }
  labels->assign(it->second.labels.begin(), it->second.labels.end());
  return ErrorCode::OK;
}

ErrorCode MemGraphStore::NodeGetDegree(NodeId id,
                                       Direction direction,
                                       RelTypeId rel_type,
                                       int64 *degree) const {
  absl::ReaderMutexLock lock(&mu_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) { return ErrorCode::NODE_NOT_FOUND; }
  int64 result = 0;
  for (int64 rel_id : it->second.relationships) {
    const Relationship &rel = relationships_.at(rel_id);
    if (rel.rel_type != rel_type) { continue; }
    if ((direction == Direction::OUTGOING && rel.src == id) || (direction == Direction::INCOMING && rel.dst == id)) {
      result++;
    }
  }
  *degree = result;
  return ErrorCode::OK;
}

}  // namespace graph_heuristics
