// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/persistence/snapshot_codec.h"

#include <cstring>
#include <limits>
#include <set>

#include "absl/crc/crc32c.h"
#include "absl/strings/string_view.h"
#include "base/common/logging.h"
#include "google/protobuf/io/coded_stream.h"
#include "google/protobuf/io/zero_copy_stream_impl_lite.h"
#include "google/protobuf/map.h"

namespace graph_heuristics {

namespace {

template <typename T>
void AppendFixed(T value, std::string *result) {
  auto old_size = result->size();
  result->resize(old_size + sizeof(T));
  memcpy(&(*result)[old_size], &value, sizeof(T));
}

template <typename T>
T ReadFixed(const std::string &data, size_t *offset) {
  T value;
  memcpy(&value, data.data() + *offset, sizeof(T));
  *offset += sizeof(T);
  return value;
}

uint32 Crc32c(absl::string_view data) { return static_cast<uint32>(absl::ComputeCrc32c(data)); }

const int64 kInt64Max = std::numeric_limits<int64>::max();

// Each count lies in [0, observed], a node adds at most one occurrence per key. The total must fit int64.
bool ValidateFrequency(const google::protobuf::Map<int32, int64> &frequency, int64 observed) {
  int64 total = 0;
  for (const auto &pair : frequency) {
    if (pair.second < 0 || pair.second > observed || pair.second > kInt64Max - total) { return false; }
    total += pair.second;
  }
  return true;
}

}  // namespace

std::string SnapshotCodec::Encode(const StatisticsSnapshot &snapshot) {
  StatisticsSnapshotProto proto;
  proto.set_observed_count(snapshot.observed_count());
  proto.set_skipped_count(snapshot.skipped_count());
  proto.set_max_node_id_observed(snapshot.max_node_id_observed());
  for (const auto &pair : snapshot.label_frequency()) { (*proto.mutable_label_frequency())[pair.first] = pair.second; }
  for (const auto &pair : snapshot.rel_type_frequency()) {
    (*proto.mutable_rel_type_frequency())[pair.first] = pair.second;
  }
  for (const auto &pair : snapshot.degree_accumulator()) {
    auto *entry = proto.add_degrees();
    entry->set_label_id(pair.first.label_id);
    entry->set_rel_type_id(pair.first.rel_type_id);
    entry->set_direction(pair.first.direction);
    entry->set_degree_sum(pair.second.sum);
    entry->set_sample_count(pair.second.count);
  }
  std::string payload;
  {
    // Map iteration order is unspecified, keep the same snapshot encoding to the same bytes.
    google::protobuf::io::StringOutputStream stream(&payload);
    google::protobuf::io::CodedOutputStream coded(&stream);
    coded.SetSerializationDeterministic(true);
    CHECK(proto.SerializeToCodedStream(&coded)) << "serialize heuristics snapshot fail";
  }

  std::string result;
  result.reserve(kHeaderSize + payload.size());
  AppendFixed<uint32>(kMagic, &result);
  AppendFixed<uint32>(kFormatVersion, &result);
  AppendFixed<uint64>(payload.size(), &result);
  AppendFixed<uint32>(Crc32c(payload), &result);
  result.append(payload);
  return result;
}

bool SnapshotCodec::Decode(const std::string &data, StatisticsSnapshot *snapshot) {
  if (data.size() < kHeaderSize) {
    LOG(WARNING) << "heuristics data too short: " << data.size() << " bytes";
    return false;
  }
  size_t offset = 0;
  uint32 magic = ReadFixed<uint32>(data, &offset);
  if (magic != kMagic) {
    LOG(WARNING) << "heuristics data has a bad magic: " << magic;
    return false;
  }
  uint32 version = ReadFixed<uint32>(data, &offset);
  if (version != kFormatVersion) {
    LOG(WARNING) << "Unknown heuristics format version: " << version << ", expect " << kFormatVersion;
    return false;
  }
  uint64 payload_size = ReadFixed<uint64>(data, &offset);
  uint32 crc = ReadFixed<uint32>(data, &offset);
  if (payload_size != data.size() - kHeaderSize) {
    LOG(WARNING) << "heuristics payload size mismatch, header = " << payload_size
                 << ", actual = " << data.size() - kHeaderSize;
    return false;
  }
  absl::string_view payload(data.data() + kHeaderSize, payload_size);
  if (Crc32c(payload) != crc) {
    LOG(WARNING) << "heuristics payload checksum mismatch";
    return false;
  }
  StatisticsSnapshotProto proto;
  if (!proto.ParseFromArray(payload.data(), payload.size())) {
    LOG(WARNING) << "heuristics payload parse fail";
    return false;
  }
  if (!Validate(proto)) { return false; }

  snapshot->observed_count_ = proto.observed_count();
  snapshot->skipped_count_ = proto.skipped_count();
  snapshot->max_node_id_observed_ = proto.max_node_id_observed();
  snapshot->label_frequency_.clear();
  for (const auto &pair : proto.label_frequency()) { snapshot->label_frequency_[pair.first] = pair.second; }
  snapshot->rel_type_frequency_.clear();
  for (const auto &pair : proto.rel_type_frequency()) { snapshot->rel_type_frequency_[pair.first] = pair.second; }
  snapshot->degree_accumulator_.clear();
  for (const auto &entry : proto.degrees()) {
    auto &acc = snapshot->degree_accumulator_[{entry.label_id(), entry.rel_type_id(), entry.direction()}];
    acc.sum = entry.degree_sum();
    acc.count = entry.sample_count();
  }
  snapshot->Recompute();
  return true;
}

bool SnapshotCodec::Validate(const StatisticsSnapshotProto &proto) {
  if (proto.observed_count() < 0 || proto.skipped_count() < 0 || proto.max_node_id_observed() < 0 ||
      proto.skipped_count() > kInt64Max - proto.observed_count()) {
    LOG(WARNING) << "heuristics counters out of range: " << proto.ShortDebugString();
    return false;
  }
  if (!ValidateFrequency(proto.label_frequency(), proto.observed_count())) {
    LOG(WARNING) << "invalid label frequency, observed = " << proto.observed_count();
    return false;
  }
  if (!ValidateFrequency(proto.rel_type_frequency(), proto.observed_count())) {
    LOG(WARNING) << "invalid relationship type frequency, observed = " << proto.observed_count();
    return false;
  }
  std::set<DegreeKey> keys;
  for (const auto &entry : proto.degrees()) {
    if (!Direction_IsValid(entry.direction()) || entry.sample_count() < 0 ||
        entry.sample_count() > proto.observed_count() || entry.degree_sum() < 0) {
      LOG(WARNING) << "invalid degree entry: " << entry.ShortDebugString();
      return false;
    }
    if (!keys.insert({entry.label_id(), entry.rel_type_id(), entry.direction()}).second) {
      LOG(WARNING) << "duplicated degree entry: " << entry.ShortDebugString();
      return false;
    }
  }
  return true;
}

ErrorCode SnapshotCodec::Save(base::FSWrapper *fs, const std::string &path, const StatisticsSnapshot &snapshot) {
  CHECK(fs) << "Save heuristics with null filesystem";
  std::string data = Encode(snapshot);
  std::string temp_path = TempPath(path);
  if (!fs->PutData(data.data(), data.size(), temp_path)) {
    LOG(ERROR) << "failed to write heuristics to temp file: " << temp_path;
    if (!fs->Rmr(temp_path)) { LOG(ERROR) << "failed to clean temp file: " << temp_path; }
    return ErrorCode::PERSIST_WRITE_FAILED;
  }
  if (!fs->Move(temp_path, path)) {
    LOG(ERROR) << "failed to move heuristics temp file(" << temp_path << ") to " << path;
    return ErrorCode::PERSIST_WRITE_FAILED;
  }
  LOG(INFO) << "Save heuristics to " << path << ", " << data.size() << " bytes, " << snapshot.ToString();
  return ErrorCode::OK;
}

std::unique_ptr<StatisticsSnapshot> SnapshotCodec::Load(base::FSWrapper *fs, const std::string &path) {
  CHECK(fs) << "Load heuristics with null filesystem";
  auto snapshot = std::make_unique<StatisticsSnapshot>();
  if (!fs->FileExists(path)) {
    LOG(INFO) << "No heuristics file at " << path << ", start with empty statistics.";
    return snapshot;
  }
  std::string data;
  if (!fs->GetData(path, &data)) {
    LOG(WARNING) << "Read heuristics file fail: " << path << ", start with empty statistics.";
    return snapshot;
  }
  if (!Decode(data, snapshot.get())) {
    LOG(WARNING) << "Heuristics file is corrupt: " << path << ", start with empty statistics.";
    return std::make_unique<StatisticsSnapshot>();
  }
  LOG(INFO) << "Load heuristics from " << path << ", " << snapshot->ToString();
  return snapshot;
}

}  // namespace graph_heuristics
