// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <memory>
#include <string>

#include "absl/synchronization/mutex.h"
#include "base/util/fs_wrapper.h"
#include "graph_heuristics/src/base/config.h"
#include "graph_heuristics/src/sampler/heuristics_sampler.h"
#include "graph_heuristics/src/schedule/job_scheduler.h"
#include "graph_heuristics/src/statistics/statistics_snapshot.h"
#include "graph_heuristics/src/store/graph_store_reader.h"

namespace graph_heuristics {

enum class ServiceState {
  STOPPED = 0,
  STARTED = 1,
};

std::string ServiceStateName(ServiceState state);

/**
 * Keeps approximate graph statistics up to date for the query planner.
 *
 * Owns the statistics snapshot and its sampler. While started, the sampler runs on the
 * scheduler every `sample_interval_s`. Statistics are persisted with Save() after Stop(),
 * and resumed with Load() on the next start of the process.
 *
 * The read API may be called from any thread at any time.
 */
class HeuristicsService {
 public:
  HeuristicsService() = delete;
  // Start with empty statistics.
  HeuristicsService(const GraphStoreReader *store, JobScheduler *scheduler, const HeuristicsConfig &config);
  ~HeuristicsService();

  /**
   * \brief Resume statistics saved at `config.stats_path`.
   * A missing or corrupt file is not an error, the service starts with empty statistics.
   */
  static std::unique_ptr<HeuristicsService> Load(base::FSWrapper *fs,
                                                 const GraphStoreReader *store,
                                                 JobScheduler *scheduler,
                                                 const HeuristicsConfig &config);

  /**
   * \brief Register the sampler on the scheduler.
   * \return ILLEGAL_STATE if started already, or the scheduler's error. State is unchanged on error.
   */
  ErrorCode Start();

  /**
   * \brief Deregister the sampler. Waits for a running pass to finish, but never interrupts it.
   * \return ILLEGAL_STATE if not started, or the scheduler's error. State is unchanged on error.
   */
  ErrorCode Stop();

  ServiceState state() const;

  /**
   * \brief Persist statistics to `config.stats_path`. Only allowed when stopped, so that no pass runs.
   * \return ILLEGAL_STATE if started, PERSIST_WRITE_FAILED if the file could not be written.
   */
  ErrorCode Save(base::FSWrapper *fs) const;

  // Read API for the query planner.
  std::shared_ptr<const LabelledDistribution> LabelDistribution() const { return snapshot_->LabelDistribution(); }
  std::shared_ptr<const LabelledDistribution> RelationshipTypeDistribution() const {
    return snapshot_->RelationshipTypeDistribution();
  }
  double Degree(LabelId label, RelTypeId rel_type, Direction direction) const {
    return snapshot_->Degree(label, rel_type, direction);
  }
  double LiveNodesRatio() const { return snapshot_->LiveNodesRatio(); }
  int64 MaxAddressableNodes() const { return snapshot_->MaxAddressableNodes(); }
  std::shared_ptr<const StatisticsView> CurrentView() const { return snapshot_->CurrentView(); }

  const StatisticsSnapshot &snapshot() const { return *snapshot_; }
  const HeuristicsConfig &config() const { return config_; }

  // Equal when the statistics are equal.
  bool operator==(const HeuristicsService &other) const { return *snapshot_ == *other.snapshot_; }

 private:
  HeuristicsService(std::unique_ptr<StatisticsSnapshot> snapshot,
                    const GraphStoreReader *store,
                    JobScheduler *scheduler,
                    const HeuristicsConfig &config);

  HeuristicsConfig config_;
  JobScheduler *scheduler_;
  std::unique_ptr<StatisticsSnapshot> snapshot_;
  std::unique_ptr<HeuristicsSampler> sampler_;

  mutable absl::Mutex state_mutex_;
  ServiceState state_ ABSL_GUARDED_BY(state_mutex_) = ServiceState::STOPPED;

  DISALLOW_COPY_AND_ASSIGN(HeuristicsService);
};

}  // namespace graph_heuristics
