// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <sstream>
#include <string>

#include "base/common/gflags.h"
#include "base/jansson/json.h"

ABSL_DECLARE_FLAG(int32, heuristics_sample_interval_s);
ABSL_DECLARE_FLAG(int32, heuristics_batch_size);
ABSL_DECLARE_FLAG(std::string, heuristics_stats_path);

namespace graph_heuristics {

// Config for the heuristics service.
struct HeuristicsConfig {
  // Seconds between two sampling passes.
  int sample_interval_s = 30;
  // Candidate node ids drawn by each pass. Fixed for the lifetime of a service.
  int batch_size = 100;
  // Where the snapshot is saved on stop and loaded on start.
  std::string stats_path = "heuristics.db";

  // Take every value from command line flags.
  static HeuristicsConfig FromFlags();

  /**
   * \brief Read `sample_interval_s`, `batch_size` and `stats_path` from a json object.
   * Missing or invalid keys fall back to the flag values.
   * \param config May be null, which equals FromFlags().
   */
  static HeuristicsConfig FromJson(const base::Json *config);

  std::string ToString() const {
    std::ostringstream oss;
    oss << "sample_interval_s = " << sample_interval_s << ", batch_size = " << batch_size
        << ", stats_path = " << stats_path;
    return oss.str();
  }
};

}  // namespace graph_heuristics
