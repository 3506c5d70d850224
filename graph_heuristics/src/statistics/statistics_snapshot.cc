// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/statistics/statistics_snapshot.h"

#include <sstream>
#include <utility>

namespace graph_heuristics {

namespace {

int64 DegreeOf(const DegreeMap &degrees, RelTypeId rel_type) {
  auto it = degrees.find(rel_type);
  return it == degrees.end() ? 0 : it->second;
}

}  // namespace

StatisticsSnapshot::StatisticsSnapshot() : view_(std::make_shared<const StatisticsView>()) {}

void StatisticsSnapshot::RecordNode(const IdList &labels,
                                    const IdList &rel_types,
                                    const DegreeMap &in_degrees,
                                    const DegreeMap &out_degrees) {
  observed_count_++;
  for (LabelId label : labels) { label_frequency_[label]++; }
  for (RelTypeId rel_type : rel_types) { rel_type_frequency_[rel_type]++; }
  for (LabelId label : labels) {
    for (RelTypeId rel_type : rel_types) {
      auto &incoming = degree_accumulator_[{label, rel_type, Direction::INCOMING}];
      incoming.sum += DegreeOf(in_degrees, rel_type);
      incoming.count++;
      auto &outgoing = degree_accumulator_[{label, rel_type, Direction::OUTGOING}];
      outgoing.sum += DegreeOf(out_degrees, rel_type);
      outgoing.count++;
    }
  }
}

void StatisticsSnapshot::Recompute() {
  auto view = std::make_shared<StatisticsView>();
  view->labels = LabelledDistribution::FromCounts(label_frequency_);
  view->rel_types = LabelledDistribution::FromCounts(rel_type_frequency_);
  for (const auto &pair : degree_accumulator_) { view->degrees.emplace(pair.first, pair.second.Mean()); }
  int64 total = observed_count_ + skipped_count_;
  view->live_nodes_ratio = total == 0 ? 0.0 : static_cast<double>(observed_count_) / total;
  view->max_addressable_nodes = max_node_id_observed_;

  std::shared_ptr<const StatisticsView> published(std::move(view));
  {
    absl::MutexLock lock(&view_mutex_);
    view_.swap(published);
  }
  // The previous view is released here, outside the lock, unless a reader still holds it.
}

std::shared_ptr<const StatisticsView> StatisticsSnapshot::CurrentView() const {
  absl::MutexLock lock(&view_mutex_);
  return view_;
}

std::shared_ptr<const LabelledDistribution> StatisticsSnapshot::LabelDistribution() const {
  auto view = CurrentView();
  return std::shared_ptr<const LabelledDistribution>(view, &view->labels);
}

std::shared_ptr<const LabelledDistribution> StatisticsSnapshot::RelationshipTypeDistribution() const {
  auto view = CurrentView();
  return std::shared_ptr<const LabelledDistribution>(view, &view->rel_types);
}

std::string StatisticsSnapshot::ToString() const {
  std::ostringstream oss;
  oss << "observed = " << observed_count_ << ", skipped = " << skipped_count_
      << ", max_node_id = " << max_node_id_observed_ << ", labels = " << label_frequency_.size()
      << ", rel_types = " << rel_type_frequency_.size() << ", degree_keys = " << degree_accumulator_.size();
  return oss.str();
}

bool StatisticsSnapshot::operator==(const StatisticsSnapshot &other) const {
  return observed_count_ == other.observed_count_ && skipped_count_ == other.skipped_count_ &&
         max_node_id_observed_ == other.max_node_id_observed_ && label_frequency_ == other.label_frequency_ &&
         rel_type_frequency_ == other.rel_type_frequency_ && degree_accumulator_ == other.degree_accumulator_;
}

}  // namespace graph_heuristics
