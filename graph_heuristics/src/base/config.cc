// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/base/config.h"

#include "base/common/logging.h"

ABSL_FLAG(int32, heuristics_sample_interval_s, 30, "Interval between two heuristics sampling passes.");
ABSL_FLAG(int32, heuristics_batch_size, 100, "Candidate node ids drawn by each heuristics sampling pass.");
ABSL_FLAG(std::string, heuristics_stats_path, "heuristics.db", "File to persist heuristics statistics.");

namespace graph_heuristics {

HeuristicsConfig HeuristicsConfig::FromFlags() {
  HeuristicsConfig config;
  config.sample_interval_s = absl::GetFlag(FLAGS_heuristics_sample_interval_s);
  config.batch_size = absl::GetFlag(FLAGS_heuristics_batch_size);
  config.stats_path = absl::GetFlag(FLAGS_heuristics_stats_path);
  CHECK_GT(config.sample_interval_s, 0) << "heuristics_sample_interval_s must be positive";
  CHECK_GT(config.batch_size, 0) << "heuristics_batch_size must be positive";
  CHECK(!config.stats_path.empty()) << "heuristics_stats_path must not be empty";
  return config;
}

HeuristicsConfig HeuristicsConfig::FromJson(const base::Json *config) {
  HeuristicsConfig result = FromFlags();
  if (config == nullptr) { return result; }
  if (!config->IsObject()) {
    LOG(WARNING) << "heuristics config is not an object, use flags instead: " << *config;
    return result;
  }

  int64 interval = config->GetInt("sample_interval_s", static_cast<int64>(result.sample_interval_s));
  if (interval <= 0 || interval > kInt32Max) {
    LOG(WARNING) << "sample_interval_s out of range: " << interval << ". Use " << result.sample_interval_s
                 << " instead.";
  } else {
    result.sample_interval_s = interval;
  }

  int64 batch_size = config->GetInt("batch_size", static_cast<int64>(result.batch_size));
  if (batch_size <= 0 || batch_size > kInt32Max) {
    LOG(WARNING) << "batch_size out of range: " << batch_size << ". Use " << result.batch_size << " instead.";
  } else {
    result.batch_size = batch_size;
  }

  std::string stats_path = config->GetString("stats_path", result.stats_path);
  if (stats_path.empty()) {
    LOG(WARNING) << "stats_path is empty. Use " << result.stats_path << " instead.";
  } else {
    result.stats_path = stats_path;
  }
  LOG(INFO) << "heuristics config: " << result.ToString();
  return result;
}

}  // namespace graph_heuristics
