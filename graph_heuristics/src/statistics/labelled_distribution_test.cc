// Copyright (c) 2025 Kuaishou Technology
// SPDX-License-Identifier: MIT

#include "graph_heuristics/src/statistics/labelled_distribution.h"

#include "base/testing/gtest.h"

namespace graph_heuristics {

TEST(LabelledDistributionTest, Empty) {
  auto distribution = LabelledDistribution::FromCounts({});
  EXPECT_TRUE(distribution.empty());
  EXPECT_EQ(0, distribution.size());
  EXPECT_EQ(0.0, distribution.Get(1));
  EXPECT_FALSE(distribution.Contains(1));
  EXPECT_EQ("{}", distribution.ToString());
}

TEST(LabelledDistributionTest, NormalizeByTotal) {
  auto distribution = LabelledDistribution::FromCounts({{1, 3}, {2, 1}});
  ASSERT_EQ(2, distribution.size());
  EXPECT_DOUBLE_EQ(0.75, distribution.Get(1));
  EXPECT_DOUBLE_EQ(0.25, distribution.Get(2));
  EXPECT_EQ(0.0, distribution.Get(3));
  EXPECT_TRUE(distribution.Contains(2));
  EXPECT_EQ("{1: 0.7500, 2: 0.2500}", distribution.ToString());
}

TEST(LabelledDistributionTest, SumIsOne) {
  std::unordered_map<int32, int64> counts;
  for (int i = 0; i < 37; ++i) { counts[i] = i * 7 + 1; }
  auto distribution = LabelledDistribution::FromCounts(counts);
  double sum = 0;
  for (const auto &pair : distribution.probabilities()) {
    EXPECT_GE(pair.second, 0.0);
    EXPECT_LE(pair.second, 1.0);
    sum += pair.second;
  }
  EXPECT_NEAR(1.0, sum, 1e-9);
}

TEST(LabelledDistributionTest, SkipNonPositiveCount) {
  auto distribution = LabelledDistribution::FromCounts({{1, 0}, {2, 4}, {3, -2}});
  ASSERT_EQ(1, distribution.size());
  EXPECT_FALSE(distribution.Contains(1));
  EXPECT_FALSE(distribution.Contains(3));
  EXPECT_DOUBLE_EQ(1.0, distribution.Get(2));
}

TEST(LabelledDistributionTest, Equality) {
  auto a = LabelledDistribution::FromCounts({{1, 2}, {2, 2}});
  auto b = LabelledDistribution::FromCounts({{1, 5}, {2, 5}});
  auto c = LabelledDistribution::FromCounts({{1, 5}});
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}

}  // namespace graph_heuristics
