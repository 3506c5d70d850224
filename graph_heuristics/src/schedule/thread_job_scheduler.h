// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <map>
#include <memory>
#include <thread>
#include <utility>

#include "absl/synchronization/mutex.h"
#include "graph_heuristics/src/schedule/job_scheduler.h"

namespace graph_heuristics {

/**
 * Each registered task gets a dedicated thread which sleeps for the interval and runs the task,
 * so runs of one task are strictly sequential. A slow run delays the next one.
 */
class ThreadJobScheduler : public JobScheduler {
 public:
  ThreadJobScheduler() {}
  // Cancels every job still registered.
  ~ThreadJobScheduler() override { Shutdown(); }

  ErrorCode ScheduleRecurring(JobGroup group, RecurringTask *task, absl::Duration interval) override;
  ErrorCode CancelRecurring(JobGroup group, RecurringTask *task) override;

  // Cancel all jobs and reject new ones with SCHEDULER_STOPPED.
  void Shutdown();

  int JobNum() const;

 private:
  struct Job {
    Job(JobGroup group, RecurringTask *task, absl::Duration interval)
        : group(group), task(task), interval(interval) {}

    JobGroup group;
    RecurringTask *task;
    absl::Duration interval;
    absl::Mutex mu;
    bool cancelled ABSL_GUARDED_BY(mu) = false;
    std::thread worker;
  };
  using JobKey = std::pair<JobGroup, RecurringTask *>;

  static void RunLoop(Job *job);
  static void StopJob(Job *job);

  mutable absl::Mutex mu_;
  bool shutdown_ ABSL_GUARDED_BY(mu_) = false;
  std::map<JobKey, std::unique_ptr<Job>> jobs_ ABSL_GUARDED_BY(mu_);

  DISALLOW_COPY_AND_ASSIGN(ThreadJobScheduler);
};

}  // namespace graph_heuristics
