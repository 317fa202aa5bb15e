#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "TemporalBinning/BinSet.h"

using namespace TemporalBinning;

TEST(BinSetTest, CutpointsAreSortedAndDeduplicated) {
  BinSet bins = BinSet::from_cutpoints({3.0, 1.0, 2.0, 2.0});

  ASSERT_EQ(bins.size(), 4u);
  EXPECT_EQ(bins.cutpoints(), (std::vector<double>{1.0, 2.0, 3.0}));
  EXPECT_TRUE(std::isinf(bins[0].lower_bound) && bins[0].lower_bound < 0);
  EXPECT_TRUE(std::isinf(bins[3].upper_bound) && bins[3].upper_bound > 0);
  EXPECT_NO_THROW(bins.validate());
}

TEST(BinSetTest, NoCutpointsGiveSingleBin) {
  BinSet bins = BinSet::from_cutpoints({});
  ASSERT_EQ(bins.size(), 1u);
  EXPECT_EQ(bins.locate(-1e300), 0u);
  EXPECT_EQ(bins.locate(1e300), 0u);
}

TEST(BinSetTest, RejectsNonFiniteCutpoints) {
  EXPECT_THROW(BinSet::from_cutpoints({1.0, std::numeric_limits<double>::quiet_NaN()}),
               std::invalid_argument);
  EXPECT_THROW(BinSet::from_cutpoints({std::numeric_limits<double>::infinity()}),
               std::invalid_argument);
}

TEST(BinSetTest, LocateUsesHalfOpenIntervals) {
  BinSet bins = BinSet::from_cutpoints({1.0, 2.0, 3.0});

  EXPECT_EQ(bins.locate(0.5), 0u);
  EXPECT_EQ(bins.locate(1.0), 1u);
  EXPECT_EQ(bins.locate(1.999), 1u);
  EXPECT_EQ(bins.locate(3.0), 3u);
  EXPECT_EQ(bins.locate(std::numeric_limits<double>::quiet_NaN()), BinSet::npos);
  EXPECT_EQ(bins.locate(std::string("a")), BinSet::npos);
}

TEST(BinSetTest, MergeAdjacentTakesConvexHull) {
  BinSet bins = BinSet::from_cutpoints({1.0, 2.0, 3.0});
  bins.merge_adjacent(1);

  ASSERT_EQ(bins.size(), 3u);
  EXPECT_DOUBLE_EQ(bins[1].lower_bound, 1.0);
  EXPECT_DOUBLE_EQ(bins[1].upper_bound, 3.0);
  EXPECT_EQ(bins.cutpoints(), (std::vector<double>{1.0, 3.0}));
  EXPECT_NO_THROW(bins.validate());

  EXPECT_THROW(bins.merge_adjacent(2), std::out_of_range);
}

TEST(BinSetTest, IntervalLabels) {
  BinSet bins = BinSet::from_cutpoints({1.5});
  std::vector<std::string> labels = bins.labels();
  ASSERT_EQ(labels.size(), 2u);
  EXPECT_EQ(labels[0], "[-Inf;1.500000)");
  EXPECT_EQ(labels[1], "[1.500000;+Inf)");
}

TEST(BinSetTest, CategoricalGroups) {
  BinSet bins = BinSet::from_groups({{"a", "b"}, {"c"}});

  EXPECT_EQ(bins.kind(), FeatureKind::CATEGORICAL);
  EXPECT_EQ(bins.locate(std::string("a")), 0u);
  EXPECT_EQ(bins.locate(std::string("c")), 1u);
  EXPECT_EQ(bins.locate(std::string("z")), BinSet::npos);
  EXPECT_EQ(bins.locate(1.0), BinSet::npos);
  EXPECT_EQ(bins.labels()[0], "a%;%b");

  bins.merge_adjacent(0);
  ASSERT_EQ(bins.size(), 1u);
  EXPECT_EQ(bins.locate(std::string("c")), 0u);
  EXPECT_EQ(bins.groups()[0], (std::vector<std::string>{"a", "b", "c"}));
}

TEST(BinSetTest, RejectsInvalidGroups) {
  EXPECT_THROW(BinSet::from_groups({}), std::invalid_argument);
  EXPECT_THROW(BinSet::from_groups({{"a"}, {}}), std::invalid_argument);
  EXPECT_THROW(BinSet::from_groups({{"a"}, {"b", "a"}}), std::invalid_argument);
  EXPECT_THROW(BinSet::from_groups({{""}}), std::invalid_argument);
}

TEST(BinSetTest, SamePartitionIgnoresCounts) {
  BinSet a = BinSet::from_cutpoints({1.0, 2.0});
  BinSet b = BinSet::from_cutpoints({1.0, 2.0});
  b.update_counts({5, 5, 5}, {1, 2, 3});

  EXPECT_TRUE(a.same_partition(b));
  EXPECT_FALSE(a.same_partition(BinSet::from_cutpoints({1.0})));
  EXPECT_EQ(b[2].count_pos, 3);
  EXPECT_EQ(b[2].count_neg, 2);
  EXPECT_THROW(b.update_counts({1}, {1}), std::invalid_argument);
}
