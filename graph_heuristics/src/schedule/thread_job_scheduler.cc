// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/schedule/thread_job_scheduler.h"

#include "base/common/logging.h"

namespace graph_heuristics {

ErrorCode ThreadJobScheduler::ScheduleRecurring(JobGroup group, RecurringTask *task, absl::Duration interval) {
  CHECK(task) << "Schedule a null task, group = " << JobGroupName(group);
  CHECK(interval > absl::ZeroDuration()) << "Invalid interval for task " << task->Name() << ": " << interval;
  absl::MutexLock lock(&mu_);
  if (shutdown_) {
    LOG(ERROR) << "Scheduler is stopped, reject task: " << task->Name();
    return ErrorCode::SCHEDULER_STOPPED;
  }
  JobKey key(group, task);
  if (jobs_.find(key) != jobs_.end()) {
    LOG(ERROR) << "Task " << task->Name() << " already scheduled in group " << JobGroupName(group);
    return ErrorCode::TASK_ALREADY_SCHEDULED;
  }
  auto job = std::make_unique<Job>(group, task, interval);
  Job *job_ptr = job.get();
  jobs_[key] = std::move(job);
  job_ptr->worker = std::thread(&ThreadJobScheduler::RunLoop, job_ptr);
  LOG(INFO) << "Schedule task " << task->Name() << " in group " << JobGroupName(group) << " every " << interval;
  return ErrorCode::OK;
}

ErrorCode ThreadJobScheduler::CancelRecurring(JobGroup group, RecurringTask *task) {
  std::unique_ptr<Job> job;
  {
    absl::MutexLock lock(&mu_);
    auto it = jobs_.find(JobKey(group, task));
    if (it == jobs_.end()) {
      LOG(ERROR) << "Cancel a task not scheduled in group " << JobGroupName(group);
      return ErrorCode::TASK_NOT_SCHEDULED;
    }
    job = std::move(it->second);
    jobs_.erase(it);
  }
  // Join outside mu_, a run in progress may take a while.
  StopJob(job.get());
  LOG(INFO) << "Cancel task " << task->Name() << " in group " << JobGroupName(group);
  return ErrorCode::OK;
}

void ThreadJobScheduler::Shutdown() {
  std::map<JobKey, std::unique_ptr<Job>> jobs;
  {
    absl::MutexLock lock(&mu_);
    shutdown_ = true;
    jobs.swap(jobs_);
  }
  for (auto &pair : jobs) { StopJob(pair.second.get()); }
  LOG_IF(INFO, !jobs.empty()) << "Scheduler shutdown, cancelled " << jobs.size() << " jobs.";
}

int ThreadJobScheduler::JobNum() const {
  absl::MutexLock lock(&mu_);
  return jobs_.size();
}

void ThreadJobScheduler::RunLoop(Job *job) {
  while (true) {
    {
      absl::MutexLock lock(&job->mu);
      if (job->mu.AwaitWithTimeout(absl::Condition(&job->cancelled), job->interval)) { break; }
    }
    ErrorCode code = job->task->RunOnce();
    if (code != ErrorCode::OK) {
      LOG_EVERY_N_SEC(WARNING, 60) << "Task " << job->task->Name() << " run fail: " << ErrorCode_Name(code);
    }
  }
}

void ThreadJobScheduler::StopJob(Job *job) {
  {
    absl::MutexLock lock(&job->mu);
    job->cancelled = true;
  }
  if (job->worker.joinable()) { job->worker.join(); }
}

}  // namespace graph_heuristics
