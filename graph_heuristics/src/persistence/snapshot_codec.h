// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#pragma once

#include <memory>
#include <string>

#include "base/util/fs_wrapper.h"
#include "graph_heuristics/src/statistics/statistics_snapshot.h"

namespace graph_heuristics {

/**
 * Binary encoding of a StatisticsSnapshot.
 * File structure, integers in host (little endian) byte order:
 *   magic(4) | format_version(4) | payload_size(8) | payload_crc32c(4) | payload
 * In which payload is a serialized StatisticsSnapshotProto holding the raw counters.
 * The derived view is rebuilt after decoding.
 */
class SnapshotCodec {
 public:
  static constexpr uint32 kMagic = 0x52554548;  // "HEUR"
  static constexpr uint32 kFormatVersion = 1;
  static constexpr size_t kHeaderSize = sizeof(uint32) * 2 + sizeof(uint64) + sizeof(uint32);

  static std::string Encode(const StatisticsSnapshot &snapshot);

  /**
   * \brief Decode `data` into `snapshot` and recompute its view.
   * \param snapshot A freshly constructed snapshot. Left untouched when decoding fails.
   * \return false if `data` is truncated, malformed, or of an unknown version.
   */
  static bool Decode(const std::string &data, StatisticsSnapshot *snapshot);

  /**
   * \brief Write `snapshot` to `path`, replacing previous content.
   * Data goes to `path`.tmp first and is moved over `path` afterwards, so `path` always holds
   * either the previous save or the new one.
   * \return PERSIST_WRITE_FAILED on any filesystem error.
   */
  static ErrorCode Save(base::FSWrapper *fs, const std::string &path, const StatisticsSnapshot &snapshot);

  // Never fails: a missing, unreadable or corrupt file gives an empty snapshot.
  static std::unique_ptr<StatisticsSnapshot> Load(base::FSWrapper *fs, const std::string &path);

  static std::string TempPath(const std::string &path) { return path + ".tmp"; }

 private:
  static bool Validate(const StatisticsSnapshotProto &proto);
};

}  // namespace graph_heuristics
