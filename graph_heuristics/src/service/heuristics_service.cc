// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/service/heuristics_service.h"

#include <utility>

#include "base/common/logging.h"
#include "graph_heuristics/src/persistence/snapshot_codec.h"

namespace graph_heuristics {

std::string ServiceStateName(ServiceState state) {
  switch (state) {
    case ServiceState::STOPPED:
      return "STOPPED";
    case ServiceState::STARTED:
      return "STARTED";
  }
  return "UNKNOWN";
}

HeuristicsService::HeuristicsService(const GraphStoreReader *store,
                                     JobScheduler *scheduler,
                                     const HeuristicsConfig &config)
    : HeuristicsService(std::make_unique<StatisticsSnapshot>(), store, scheduler, config) {}

HeuristicsService::HeuristicsService(std::unique_ptr<StatisticsSnapshot> snapshot,
                                     const GraphStoreReader *store,
                                     JobScheduler *scheduler,
                                     const HeuristicsConfig &config)
    : config_(config), scheduler_(scheduler), snapshot_(std::move(snapshot)) {
  CHECK(scheduler_) << "HeuristicsService init fail, scheduler = null";
  CHECK(snapshot_);
  sampler_ = std::make_unique<HeuristicsSampler>(store, snapshot_.get(), config_.batch_size);
}

HeuristicsService::~HeuristicsService() {
  if (state() == ServiceState::STARTED) {
    ErrorCode code = Stop();
    LOG_IF(ERROR, code != ErrorCode::OK) << "Stop heuristics on destruction fail: " << ErrorCode_Name(code);
  }
}

std::unique_ptr<HeuristicsService> HeuristicsService::Load(base::FSWrapper *fs,
                                                           const GraphStoreReader *store,
                                                           JobScheduler *scheduler,
                                                           const HeuristicsConfig &config) {
  auto snapshot = SnapshotCodec::Load(fs, config.stats_path);
  return std::unique_ptr<HeuristicsService>(new HeuristicsService(std::move(snapshot), store, scheduler, config));
}

ErrorCode HeuristicsService::Start() {
  absl::MutexLock lock(&state_mutex_);
  if (state_ != ServiceState::STOPPED) {
    LOG(ERROR) << "Start heuristics service in state " << ServiceStateName(state_);
    return ErrorCode::ILLEGAL_STATE;
  }
  ErrorCode code =
      scheduler_->ScheduleRecurring(JobGroup::HEURISTICS, sampler_.get(), absl::Seconds(config_.sample_interval_s));
  if (code != ErrorCode::OK) {
    LOG(ERROR) << "Start heuristics service fail, schedule sampler: " << ErrorCode_Name(code);
    return code;
  }
  state_ = ServiceState::STARTED;
  LOG(INFO) << "Heuristics service started, " << config_.ToString();
  return ErrorCode::OK;
}

ErrorCode HeuristicsService::Stop() {
  absl::MutexLock lock(&state_mutex_);
  if (state_ != ServiceState::STARTED) {
    LOG(ERROR) << "Stop heuristics service in state " << ServiceStateName(state_);
    return ErrorCode::ILLEGAL_STATE;
  }
  ErrorCode code = scheduler_->CancelRecurring(JobGroup::HEURISTICS, sampler_.get());
  if (code != ErrorCode::OK) {
    LOG(ERROR) << "Stop heuristics service fail, cancel sampler: " << ErrorCode_Name(code);
    return code;
  }
  state_ = ServiceState::STOPPED;
  LOG(INFO) << "Heuristics service stopped after " << sampler_->pass_count() << " passes.";
  return ErrorCode::OK;
}

ServiceState HeuristicsService::state() const {
  absl::MutexLock lock(&state_mutex_);
  return state_;
}

ErrorCode HeuristicsService::Save(base::FSWrapper *fs) const {
  absl::MutexLock lock(&state_mutex_);
  if (state_ != ServiceState::STOPPED) {
    LOG(ERROR) << "Save heuristics while " << ServiceStateName(state_) << ", stop the service first.";
    return ErrorCode::ILLEGAL_STATE;
  }
  return SnapshotCodec::Save(fs, config_.stats_path, *snapshot_);
}

}  // namespace graph_heuristics
