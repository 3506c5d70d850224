// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "base/common/logging.h"

#include <filesystem>
#include <iostream>
#include <string>

#include "absl/base/call_once.h"
#include "absl/log/initialize.h"
#include "absl/log/log_sink_registry.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "base/common/file_util.h"

ABSL_FLAG(std::string, log_dir, "log", "log directory");

FileLogSink::FileLogSink(const std::string &program) {
  if (program.empty()) { return; }
  const std::string &dir = absl::GetFlag(FLAGS_log_dir);
  if (!base::ExistOrCreateDirectory(dir)) {
    std::cerr << "fail to create log dir: " << dir << ", log to stdout instead." << std::endl;
    return;
  }
  path_ = dir + "/" + program + "." +
          absl::FormatTime("%Y%m%d-%H%M%S", absl::Now(), absl::LocalTimeZone()) + ".log";
  file_.open(path_, std::ios::out | std::ios::app);
  if (!file_.is_open()) {
    std::cerr << "fail to open log file: " << path_ << ", log to stdout instead." << std::endl;
    path_.clear();
    return;
  }
  std::cout << "Log writing to " << path_ << std::endl;
}

FileLogSink::~FileLogSink() {
  if (file_.is_open()) { file_.close(); }
}

void FileLogSink::Send(const absl::LogEntry &entry) {
  if (file_.is_open()) {
    file_ << entry.text_message_with_prefix_and_newline();
    if (entry.log_severity() >= absl::LogSeverity::kError) { file_.flush(); }
  } else {
    std::cout << entry.text_message_with_prefix_and_newline();
  }
}

void InitLogging(const char *program) {
  static absl::once_flag once;
  absl::call_once(once, [program]() {
    std::string name;
    if (program) { name = std::filesystem::path(program).filename().string(); }
    static FileLogSink log_sink(name);
    absl::AddLogSink(&log_sink);
    absl::InitializeLog();
  });
}
