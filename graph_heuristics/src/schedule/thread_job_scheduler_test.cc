// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/schedule/thread_job_scheduler.h"

#include <atomic>
#include <string>
#include <thread>

#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "base/testing/gtest.h"

namespace graph_heuristics {

namespace {

class CountingTask : public RecurringTask {
 public:
  std::string Name() const override { return "CountingTask"; }

  ErrorCode RunOnce() override {
    if (running_.exchange(true)) { overlapped_ = true; }
    if (run_ms_ > 0) { absl::SleepFor(absl::Milliseconds(run_ms_)); }
    count_++;
    running_ = false;
    return result_;
  }

  // Polls until at least `n` runs finished, false on timeout.
  bool WaitForCount(int n, int timeout_ms = 10000) const {
    for (int waited = 0; waited < timeout_ms; waited += 5) {
      if (count_ >= n) { return true; }
      absl::SleepFor(absl::Milliseconds(5));
    }
    return count_ >= n;
  }

  std::atomic<int> count_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> overlapped_{false};
  int run_ms_ = 0;
  ErrorCode result_ = ErrorCode::OK;
};

class BlockingTask : public RecurringTask {
 public:
  std::string Name() const override { return "BlockingTask"; }

  ErrorCode RunOnce() override {
    if (!entered_.HasBeenNotified()) { entered_.Notify(); }
    release_.WaitForNotification();
    finished_ = true;
    return ErrorCode::OK;
  }

  absl::Notification entered_;
  absl::Notification release_;
  std::atomic<bool> finished_{false};
};

}  // namespace

TEST(ThreadJobSchedulerTest, RunRepeatedly) {
  ThreadJobScheduler scheduler;
  CountingTask task;
  ASSERT_EQ(ErrorCode::OK, scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &task, absl::Milliseconds(5)));
  EXPECT_EQ(1, scheduler.JobNum());
  EXPECT_TRUE(task.WaitForCount(3));
  ASSERT_EQ(ErrorCode::OK, scheduler.CancelRecurring(JobGroup::HEURISTICS, &task));
  EXPECT_EQ(0, scheduler.JobNum());

  int count = task.count_.load();
  absl::SleepFor(absl::Milliseconds(50));
  EXPECT_EQ(count, task.count_.load());
}

TEST(ThreadJobSchedulerTest, FirstRunAfterInterval) {
  ThreadJobScheduler scheduler;
  CountingTask task;
  ASSERT_EQ(ErrorCode::OK, scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &task, absl::Hours(1)));
  absl::SleepFor(absl::Milliseconds(50));
  EXPECT_EQ(0, task.count_.load());
  // Cancel wakes the sleeping job up.
  EXPECT_EQ(ErrorCode::OK, scheduler.CancelRecurring(JobGroup::HEURISTICS, &task));
  EXPECT_EQ(0, task.count_.load());
}

TEST(ThreadJobSchedulerTest, RegistrationErrors) {
  ThreadJobScheduler scheduler;
  CountingTask task, other;
  EXPECT_EQ(ErrorCode::TASK_NOT_SCHEDULED, scheduler.CancelRecurring(JobGroup::HEURISTICS, &task));
  ASSERT_EQ(ErrorCode::OK, scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &task, absl::Hours(1)));
  EXPECT_EQ(ErrorCode::TASK_ALREADY_SCHEDULED,
            scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &task, absl::Seconds(1)));
  EXPECT_EQ(ErrorCode::TASK_NOT_SCHEDULED, scheduler.CancelRecurring(JobGroup::HEURISTICS, &other));
  ASSERT_EQ(ErrorCode::OK, scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &other, absl::Hours(1)));
  EXPECT_EQ(2, scheduler.JobNum());

  EXPECT_EQ(ErrorCode::OK, scheduler.CancelRecurring(JobGroup::HEURISTICS, &task));
  EXPECT_EQ(ErrorCode::TASK_NOT_SCHEDULED, scheduler.CancelRecurring(JobGroup::HEURISTICS, &task));
  // Registered again after cancel.
  EXPECT_EQ(ErrorCode::OK, scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &task, absl::Hours(1)));

  scheduler.Shutdown();
  EXPECT_EQ(0, scheduler.JobNum());
  EXPECT_EQ(ErrorCode::SCHEDULER_STOPPED, scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &task, absl::Hours(1)));
  EXPECT_EQ(ErrorCode::TASK_NOT_SCHEDULED, scheduler.CancelRecurring(JobGroup::HEURISTICS, &other));
}

TEST(ThreadJobSchedulerTest, RunsNeverOverlap) {
  ThreadJobScheduler scheduler;
  CountingTask task;
  task.run_ms_ = 5;
  // Failed runs keep the job alive.
  task.result_ = ErrorCode::STORAGE_FAILURE;
  ASSERT_EQ(ErrorCode::OK, scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &task, absl::Milliseconds(1)));
  EXPECT_TRUE(task.WaitForCount(10));
  ASSERT_EQ(ErrorCode::OK, scheduler.CancelRecurring(JobGroup::HEURISTICS, &task));
  EXPECT_FALSE(task.overlapped_.load());
}

TEST(ThreadJobSchedulerTest, CancelWaitsForRunningTask) {
  ThreadJobScheduler scheduler;
  BlockingTask task;
  ASSERT_EQ(ErrorCode::OK, scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &task, absl::Milliseconds(1)));
  task.entered_.WaitForNotification();

  std::atomic<bool> cancelled{false};
  std::thread canceller([&]() {
    EXPECT_EQ(ErrorCode::OK, scheduler.CancelRecurring(JobGroup::HEURISTICS, &task));
    cancelled = true;
  });
  absl::SleepFor(absl::Milliseconds(50));
  EXPECT_FALSE(cancelled.load());
  EXPECT_FALSE(task.finished_.load());

  task.release_.Notify();
  canceller.join();
  EXPECT_TRUE(cancelled.load());
  EXPECT_TRUE(task.finished_.load());
}

TEST(ThreadJobSchedulerTest, DestructorCancelsJobs) {
  CountingTask task;
  {
    ThreadJobScheduler scheduler;
    ASSERT_EQ(ErrorCode::OK, scheduler.ScheduleRecurring(JobGroup::HEURISTICS, &task, absl::Milliseconds(1)));
    EXPECT_TRUE(task.WaitForCount(1));
  }
  int count = task.count_.load();
  absl::SleepFor(absl::Milliseconds(20));
  EXPECT_EQ(count, task.count_.load());
}

}  // namespace graph_heuristics
