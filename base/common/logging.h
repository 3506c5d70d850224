// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <fstream>
#include <string>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/log/log_sink.h"
#include "base/common/gflags.h"

ABSL_DECLARE_FLAG(std::string, log_dir);

// Sends every log entry to `<log_dir>/<program>.<start time>.log`.
// Falls back to stdout when no program name is given (unit tests, tools).
class FileLogSink : public absl::LogSink {
 public:
  explicit FileLogSink(const std::string &program);
  ~FileLogSink() override;

  void Send(const absl::LogEntry &entry) override;

 private:
  std::string path_;
  std::ofstream file_;
};

// Installs the file sink once per process, later calls do nothing. `program` is usually argv[0].
void InitLogging(const char *program = nullptr);
