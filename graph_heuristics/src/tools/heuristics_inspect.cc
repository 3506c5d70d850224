// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include <iostream>
#include <string>

#include "absl/flags/parse.h"
#include "base/common/gflags.h"
#include "base/common/logging.h"
#include "base/util/fs_wrapper.h"
#include "graph_heuristics/src/base/config.h"
#include "graph_heuristics/src/persistence/snapshot_codec.h"

ABSL_FLAG(bool, heuristics_inspect_degrees, true, "Print the degree estimate of every observed triple.");

// Prints a saved heuristics file, e.g.
//   heuristics_inspect --heuristics_stats_path=data/heuristics.db
int main(int argc, char **argv) {
  absl::ParseCommandLine(argc, argv);
  InitLogging();

  auto config = graph_heuristics::HeuristicsConfig::FromFlags();
  base::LocalFSWrapper fs;
  if (!fs.FileExists(config.stats_path)) {
    std::cerr << "No heuristics file at " << config.stats_path << std::endl;
    return 1;
  }
  std::string data;
  if (!fs.GetData(config.stats_path, &data)) {
    std::cerr << "Read " << config.stats_path << " fail" << std::endl;
    return 1;
  }
  graph_heuristics::StatisticsSnapshot snapshot;
  if (!graph_heuristics::SnapshotCodec::Decode(data, &snapshot)) {
    std::cerr << config.stats_path << " is not a valid heuristics file, see log for details." << std::endl;
    return 2;
  }

  auto view = snapshot.CurrentView();
  std::cout << "file: " << config.stats_path << " (" << data.size() << " bytes)" << std::endl;
  std::cout << "counters: " << snapshot.ToString() << std::endl;
  std::cout << "live_nodes_ratio: " << view->live_nodes_ratio << std::endl;
  std::cout << "max_addressable_nodes: " << view->max_addressable_nodes << std::endl;
  std::cout << "labels: " << view->labels.ToString() << std::endl;
  std::cout << "rel_types: " << view->rel_types.ToString() << std::endl;
  if (absl::GetFlag(FLAGS_heuristics_inspect_degrees)) {
    std::cout << "degrees:" << std::endl;
    for (const auto &pair : view->degrees) {
      std::cout << "  " << pair.first.ToString() << " = " << pair.second << std::endl;
    }
  }
  return 0;
}
