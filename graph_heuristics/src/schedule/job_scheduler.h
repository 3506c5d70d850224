// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <string>

#include "absl/time/time.h"
#include "graph_heuristics/src/base/heuristics_type.h"

namespace graph_heuristics {

// Jobs are registered per group, so that unrelated components may share a scheduler.
enum class JobGroup {
  HEURISTICS = 0,
};

inline std::string JobGroupName(JobGroup group) {
  switch (group) {
    case JobGroup::HEURISTICS:
      return "heuristics";
  }
  return "unknown";
}

class RecurringTask {
 public:
  virtual ~RecurringTask() {}

  virtual std::string Name() const = 0;

  // One execution. The scheduler only logs a non-OK result.
  virtual ErrorCode RunOnce() = 0;
};

/**
 * Runs registered tasks repeatedly. A task registered once never runs concurrently with itself.
 * The scheduler does not own the tasks; a task must stay alive until it is cancelled.
 */
class JobScheduler {
 public:
  virtual ~JobScheduler() {}

  /**
   * \brief Run `task` every `interval`, first run one interval after registration.
   * \return TASK_ALREADY_SCHEDULED if (group, task) is registered already.
   */
  virtual ErrorCode ScheduleRecurring(JobGroup group, RecurringTask *task, absl::Duration interval) = 0;

  /**
   * \brief Stop scheduling `task`. Blocks until a run in progress has returned, never interrupts it.
   * Must not be called from inside the task.
   * \return TASK_NOT_SCHEDULED if (group, task) is not registered.
   */
  virtual ErrorCode CancelRecurring(JobGroup group, RecurringTask *task) = 0;
};

}  // namespace graph_heuristics
