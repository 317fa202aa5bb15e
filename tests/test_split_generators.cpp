#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <stdexcept>

#include "TemporalBinning/CohortAggregator.h"
#include "TemporalBinning/SplitGenerator.h"
#include "test_data.h"

using namespace TemporalBinning;

namespace {

ObservationSet one_to_hundred() {
  std::vector<double> values;
  std::vector<int> labels;
  for (int i = 1; i <= 100; ++i) {
    values.push_back(i);
    labels.push_back(i % 3 == 0 ? 1 : 0);
  }
  return ObservationSet::numeric(values, labels);
}

ObservationSet categories_with_rare_tail() {
  test_data::Columns cols;
  cols.add(std::string("A"), 500, 50);
  cols.add(std::string("B"), 300, 90);
  cols.add(std::string("C"), 195, 39);
  cols.add(std::string("r1"), 3, 3);
  cols.add(std::string("r2"), 2, 2);
  return cols.categorical();
}

} // namespace

TEST(QuantileSplitTest, EqualFrequencyCutpoints) {
  SplitParameters params;
  params.max_bins = 4;
  BinSet bins = QuantileSplit().produce(one_to_hundred(), params);

  EXPECT_EQ(bins.cutpoints(), (std::vector<double>{26.0, 51.0, 76.0}));

  CohortTable table = CohortAggregator().aggregate(bins, one_to_hundred());
  EXPECT_EQ(table.bin_counts(), (std::vector<int>{25, 25, 25, 25}));
}

TEST(QuantileSplitTest, MinBinSizeCapsBinCount) {
  SplitParameters params;
  params.max_bins = 10;
  params.min_bin_size = 0.3;
  EXPECT_EQ(QuantileSplit().produce(one_to_hundred(), params).size(), 3u);
}

TEST(QuantileSplitTest, TinyMinBinSizeLeavesMaxBinsInCharge) {
  SplitParameters params;
  params.max_bins = 4;
  params.min_bin_size = 1e-12;
  BinSet bins = QuantileSplit().produce(one_to_hundred(), params);

  EXPECT_EQ(bins.size(), 4u);
  EXPECT_EQ(bins.cutpoints(), (std::vector<double>{26.0, 51.0, 76.0}));
}

TEST(QuantileSplitTest, TiesStayTogether) {
  ObservationSet obs = ObservationSet::numeric({1, 1, 1, 2, 2}, {0, 1, 0, 1, 0});
  SplitParameters params;
  params.max_bins = 5;
  BinSet bins = QuantileSplit().produce(obs, params);

  EXPECT_EQ(bins.cutpoints(), (std::vector<double>{2.0}));
}

TEST(QuantileSplitTest, RejectsCategoricalInput) {
  EXPECT_THROW(QuantileSplit().produce(categories_with_rare_tail(), SplitParameters()),
               std::invalid_argument);
}

TEST(EqualWidthSplitTest, SplitsRangeEvenly) {
  std::vector<double> values;
  std::vector<int> labels;
  for (int i = 0; i <= 10; ++i) {
    values.push_back(i);
    labels.push_back(i % 2);
  }
  SplitParameters params;
  params.max_bins = 5;
  BinSet bins = EqualWidthSplit().produce(ObservationSet::numeric(values, labels), params);

  std::vector<double> cp = bins.cutpoints();
  ASSERT_EQ(cp.size(), 4u);
  EXPECT_DOUBLE_EQ(cp[0], 2.0);
  EXPECT_DOUBLE_EQ(cp[3], 8.0);
}

TEST(EqualWidthSplitTest, ConstantFeatureGivesOneBin) {
  ObservationSet obs = ObservationSet::numeric({3, 3, 3}, {0, 1, 0});
  EXPECT_EQ(EqualWidthSplit().produce(obs, SplitParameters()).size(), 1u);
}

TEST(KMeansSplitTest, SeparatesTightClusters) {
  std::vector<double> values;
  std::vector<int> labels;
  for (double center : {0.0, 5.0, 10.0}) {
    for (int i = 0; i < 30; ++i) {
      values.push_back(center + 0.01 * i);
      labels.push_back(i % 2);
    }
  }
  ObservationSet obs = ObservationSet::numeric(values, labels);
  SplitParameters params;
  params.max_bins = 3;

  BinSet bins = KMeansSplit().produce(obs, params);

  ASSERT_EQ(bins.cutpoints().size(), 2u);
  EXPECT_NEAR(bins.cutpoints()[0], 2.645, 1e-9);
  EXPECT_NEAR(bins.cutpoints()[1], 7.645, 1e-9);
  CohortTable table = CohortAggregator().aggregate(bins, obs);
  EXPECT_EQ(table.bin_counts(), (std::vector<int>{30, 30, 30}));
}

TEST(KMeansSplitTest, EmptyClustersAreDropped) {
  std::vector<double> values;
  std::vector<int> labels;
  for (int i = 0; i < 10; ++i) {
    values.push_back(0.0);
    values.push_back(0.1);
    values.push_back(10.0);
    labels.push_back(0);
    labels.push_back(1);
    labels.push_back(i % 2);
  }
  SplitParameters params;
  params.max_bins = 5;

  BinSet bins = KMeansSplit().produce(ObservationSet::numeric(values, labels), params);

  ASSERT_EQ(bins.cutpoints().size(), 1u);
  EXPECT_NEAR(bins.cutpoints()[0], 5.025, 1e-9);
}

TEST(KMeansSplitTest, ConstantFeatureGivesOneBin) {
  ObservationSet obs = ObservationSet::numeric({3.0, 3.0, 3.0, 3.0}, {0, 1, 0, 1});
  EXPECT_EQ(KMeansSplit().produce(obs, SplitParameters()).size(), 1u);
  EXPECT_THROW(KMeansSplit().produce(categories_with_rare_tail(), SplitParameters()),
               std::invalid_argument);
  EXPECT_THROW(KMeansSplit(0), std::invalid_argument);
}

TEST(CategoricalSplitTest, RareCategoriesArePooledAndGroupsOrderedByRate) {
  BinSet bins = CategoricalSplit().produce(categories_with_rare_tail(), SplitParameters());

  ASSERT_EQ(bins.size(), 4u);
  std::vector<std::vector<std::string>> groups = bins.groups();
  EXPECT_EQ(groups[0], (std::vector<std::string>{"A"}));
  EXPECT_EQ(groups[1], (std::vector<std::string>{"C"}));
  EXPECT_EQ(groups[2], (std::vector<std::string>{"B"}));
  EXPECT_EQ(groups[3], (std::vector<std::string>{"r1", "r2"}));
}

TEST(CategoricalSplitTest, MergesDownToMaxBins) {
  SplitParameters params;
  params.max_bins = 2;
  BinSet bins = CategoricalSplit().produce(categories_with_rare_tail(), params);

  ASSERT_EQ(bins.size(), 2u);
  std::set<std::string> covered;
  for (const auto& g : bins.groups()) covered.insert(g.begin(), g.end());
  EXPECT_EQ(covered, (std::set<std::string>{"A", "B", "C", "r1", "r2"}));
  EXPECT_NO_THROW(CohortAggregator().aggregate(bins, categories_with_rare_tail()));
}

TEST(CategoricalSplitTest, RejectsInvalidThreshold) {
  EXPECT_THROW(CategoricalSplit(1.5), std::invalid_argument);
}

TEST(FixedSplitTest, ReturnsSuppliedPartition) {
  BinSet fixed = BinSet::from_cutpoints({10.0, 50.0});
  BinSet produced = FixedSplit(fixed).produce(one_to_hundred(), SplitParameters());

  EXPECT_TRUE(produced.same_partition(fixed));
  EXPECT_THROW(FixedSplit(fixed).produce(categories_with_rare_tail(), SplitParameters()),
               std::invalid_argument);
}

TEST(SplitGeneratorFactoryTest, BuildsGeneratorsByName) {
  EXPECT_EQ(make_split_generator("quantile")->name(), "quantile");
  EXPECT_EQ(make_split_generator("uniform")->name(), "uniform");
  EXPECT_EQ(make_split_generator("kmeans")->name(), "kmeans");
  EXPECT_EQ(make_split_generator("categorical")->name(), "categorical");
  EXPECT_THROW(make_split_generator("entropy"), std::invalid_argument);
}

TEST(SplitParametersTest, Validation) {
  SplitParameters params;
  params.max_bins = 0;
  EXPECT_THROW(params.validate(), std::invalid_argument);
  params = SplitParameters();
  params.min_bin_size = -1.0;
  EXPECT_THROW(params.validate(), std::invalid_argument);
}
