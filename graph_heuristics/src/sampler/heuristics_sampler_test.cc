// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/sampler/heuristics_sampler.h"

#include <atomic>
#include <stdexcept>
#include <thread>

#include "absl/synchronization/notification.h"
#include "base/testing/gtest.h"
#include "graph_heuristics/src/store/mem_graph_store.h"

namespace graph_heuristics {

namespace {

// Every node reports NODE_NOT_FOUND after passing the existence check, as if deleted in between.
class VanishingStore : public MemGraphStore {
 public:
  ErrorCode NodeGetRelationshipTypes(NodeId id, IdList *rel_types) const override {
    return ErrorCode::NODE_NOT_FOUND;
  }
};

class FailingStore : public MemGraphStore {
 public:
  ErrorCode NodeGetLabels(NodeId id, IdList *labels) const override {
    if (fail_) { return ErrorCode::STORAGE_FAILURE; }
    return MemGraphStore::NodeGetLabels(id, labels);
  }
  void set_fail(bool fail) { fail_ = fail; }

 private:
  std::atomic<bool> fail_{false};
};

// Existence checks throw while `throw_` is set.
class ThrowingStore : public MemGraphStore {
 public:
  bool NodeExists(NodeId id) const override {
    if (throw_) { throw std::runtime_error("storage read error"); }
    return MemGraphStore::NodeExists(id);
  }
  void set_throw(bool t) { throw_ = t; }

 private:
  std::atomic<bool> throw_{false};
};

// The first existence check blocks until released.
class BlockingStore : public MemGraphStore {
 public:
  bool NodeExists(NodeId id) const override {
    if (!entered_.HasBeenNotified()) {
      entered_.Notify();
      release_.WaitForNotification();
    }
    return MemGraphStore::NodeExists(id);
  }
  void WaitEntered() { entered_.WaitForNotification(); }
  void Release() { release_.Notify(); }

 private:
  mutable absl::Notification entered_;
  absl::Notification release_;
};

// Ring of `n` nodes with label 1, each pointing to the next through type 7.
void BuildRing(MemGraphStore *store, int n) {
  for (int i = 0; i < n; ++i) { store->CreateNode({1}); }
  for (int i = 0; i < n; ++i) { store->CreateRelationship(i, (i + 1) % n, 7); }
}

}  // namespace

TEST(HeuristicsSamplerTest, EachPassAddsBatchSize) {
  MemGraphStore store;
  BuildRing(&store, 100);
  for (int i = 0; i < 100; i += 2) { store.DeleteNode(i); }
  StatisticsSnapshot snapshot;
  HeuristicsSampler sampler(&store, &snapshot);
  EXPECT_EQ(HeuristicsSampler::kDefaultBatchSize, sampler.batch_size());

  for (int pass = 1; pass <= 5; ++pass) {
    ASSERT_EQ(ErrorCode::OK, sampler.RunOnce());
    EXPECT_EQ(pass * 100, snapshot.observed_count() + snapshot.skipped_count());
  }
  EXPECT_EQ(5, sampler.pass_count());
  EXPECT_EQ(100, snapshot.MaxAddressableNodes());
  EXPECT_GT(snapshot.observed_count(), 0);
  EXPECT_GT(snapshot.skipped_count(), 0);
  EXPECT_GT(snapshot.LiveNodesRatio(), 0.0);
  EXPECT_LT(snapshot.LiveNodesRatio(), 1.0);
}

TEST(HeuristicsSamplerTest, AllNodesLive) {
  MemGraphStore store;
  BuildRing(&store, 20);
  StatisticsSnapshot snapshot;
  HeuristicsSampler sampler(&store, &snapshot, 30);
  ASSERT_EQ(ErrorCode::OK, sampler.RunOnce());

  EXPECT_EQ(30, snapshot.observed_count());
  EXPECT_EQ(0, snapshot.skipped_count());
  EXPECT_DOUBLE_EQ(1.0, snapshot.LiveNodesRatio());
  EXPECT_DOUBLE_EQ(1.0, snapshot.LabelDistribution()->Get(1));
  EXPECT_DOUBLE_EQ(1.0, snapshot.RelationshipTypeDistribution()->Get(7));
  EXPECT_DOUBLE_EQ(1.0, snapshot.Degree(1, 7, Direction::OUTGOING));
  EXPECT_DOUBLE_EQ(1.0, snapshot.Degree(1, 7, Direction::INCOMING));
  EXPECT_EQ(0.0, snapshot.Degree(1, 8, Direction::INCOMING));
  EXPECT_EQ(20, snapshot.MaxAddressableNodes());
}

TEST(HeuristicsSamplerTest, EmptyStore) {
  MemGraphStore store;
  StatisticsSnapshot snapshot;
  HeuristicsSampler sampler(&store, &snapshot);
  ASSERT_EQ(ErrorCode::OK, sampler.RunOnce());
  EXPECT_EQ(0, snapshot.observed_count());
  EXPECT_EQ(100, snapshot.skipped_count());
  EXPECT_EQ(0.0, snapshot.LiveNodesRatio());
  EXPECT_EQ(0, snapshot.MaxAddressableNodes());
  EXPECT_TRUE(snapshot.LabelDistribution()->empty());
}

TEST(HeuristicsSamplerTest, NodeDeletedWhileRead) {
  VanishingStore store;
  BuildRing(&store, 10);
  StatisticsSnapshot snapshot;
  HeuristicsSampler sampler(&store, &snapshot, 50);
  ASSERT_EQ(ErrorCode::OK, sampler.RunOnce());
  EXPECT_EQ(0, snapshot.observed_count());
  EXPECT_EQ(50, snapshot.skipped_count());
  EXPECT_EQ(10, snapshot.MaxAddressableNodes());
}

TEST(HeuristicsSamplerTest, StorageFailureLeavesSnapshotUnchanged) {
  FailingStore store;
  BuildRing(&store, 10);
  StatisticsSnapshot snapshot;
  HeuristicsSampler sampler(&store, &snapshot, 10);
  ASSERT_EQ(ErrorCode::OK, sampler.RunOnce());
  auto view = snapshot.CurrentView();
  int64 observed = snapshot.observed_count();

  store.set_fail(true);
  for (int i = 0; i < 10; ++i) { store.CreateNode({2}); }
  EXPECT_EQ(ErrorCode::STORAGE_FAILURE, sampler.RunOnce());
  EXPECT_EQ(observed, snapshot.observed_count());
  EXPECT_EQ(0, snapshot.skipped_count());
  EXPECT_EQ(10, snapshot.max_node_id_observed());
  EXPECT_EQ(view, snapshot.CurrentView());
  EXPECT_EQ(1, sampler.pass_count());

  store.set_fail(false);
  ASSERT_EQ(ErrorCode::OK, sampler.RunOnce());
  EXPECT_EQ(20, snapshot.MaxAddressableNodes());
  EXPECT_EQ(2, sampler.pass_count());
}

TEST(HeuristicsSamplerTest, ExceptionReleasesPassLock) {
  ThrowingStore store;
  BuildRing(&store, 10);
  StatisticsSnapshot snapshot;
  HeuristicsSampler sampler(&store, &snapshot, 10);

  store.set_throw(true);
  EXPECT_THROW(sampler.RunOnce(), std::runtime_error);
  EXPECT_EQ(0, snapshot.observed_count());
  EXPECT_EQ(0, snapshot.skipped_count());
  EXPECT_EQ(0, sampler.pass_count());

  store.set_throw(false);
  EXPECT_EQ(ErrorCode::OK, sampler.RunOnce());
  EXPECT_EQ(10, snapshot.observed_count());
  EXPECT_EQ(1, sampler.pass_count());
}

TEST(HeuristicsSamplerTest, OnePassAtATime) {
  BlockingStore store;
  BuildRing(&store, 10);
  StatisticsSnapshot snapshot;
  HeuristicsSampler sampler(&store, &snapshot, 10);

  ErrorCode first = ErrorCode::ILLEGAL_STATE;
  std::thread runner([&]() { first = sampler.RunOnce(); });
  store.WaitEntered();
  EXPECT_EQ(ErrorCode::PASS_IN_PROGRESS, sampler.RunOnce());
  EXPECT_EQ(0, snapshot.observed_count() + snapshot.skipped_count());
  store.Release();
  runner.join();

  EXPECT_EQ(ErrorCode::OK, first);
  EXPECT_EQ(10, snapshot.observed_count());
  EXPECT_EQ(1, sampler.pass_count());
}

}  // namespace graph_heuristics
