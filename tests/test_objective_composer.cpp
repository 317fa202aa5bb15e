#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "TemporalBinning/ObjectiveComposer.h"

using namespace TemporalBinning;

namespace {

BinSet two_bins(int pos0, int neg0, int pos1, int neg1) {
  BinSet bins = BinSet::from_cutpoints({1.0});
  bins.update_counts({pos0 + neg0, pos1 + neg1}, {pos0, pos1});
  return bins;
}

} // namespace

TEST(ObjectiveComposerTest, IvIsZeroWhenSharesCoincide) {
  ObjectiveComposer composer;
  EXPECT_DOUBLE_EQ(composer.information_value(two_bins(10, 20, 30, 60)), 0.0);
}

TEST(ObjectiveComposerTest, IvAndWoeMatchHandComputedValues) {
  ObjectiveComposer composer;
  BinSet bins = two_bins(40, 10, 10, 40);

  // Event shares 0.8 / 0.2, non-event shares 0.2 / 0.8
  EXPECT_NEAR(composer.information_value(bins), 1.2 * std::log(4.0), 1e-12);

  std::vector<WoeEntry> table = composer.woe_table(bins);
  ASSERT_EQ(table.size(), 2u);
  EXPECT_EQ(table[0].id, 1);
  EXPECT_EQ(table[1].id, 2);
  EXPECT_EQ(table[0].label, "[-Inf;1.000000)");
  EXPECT_NEAR(table[0].woe, std::log(4.0), 1e-12);
  EXPECT_NEAR(table[1].woe, -std::log(4.0), 1e-12);
  EXPECT_NEAR(table[0].iv + table[1].iv, composer.information_value(bins), 1e-12);
  EXPECT_EQ(table[0].count, 50);
  EXPECT_EQ(table[0].count_pos, 40);
  EXPECT_DOUBLE_EQ(table[0].event_rate, 0.8);
}

TEST(ObjectiveComposerTest, ZeroSharesAreFloored) {
  ObjectiveComposer composer;
  BinSet bins = two_bins(0, 50, 50, 0);

  int substitutions = 0;
  double iv = composer.information_value(bins, &substitutions);
  EXPECT_TRUE(std::isfinite(iv));
  EXPECT_GT(iv, 0.0);
  EXPECT_EQ(substitutions, 2);

  std::vector<WoeEntry> table = composer.woe_table(bins);
  EXPECT_NEAR(table[0].woe, std::log(1e-4), 1e-9);
  EXPECT_NEAR(table[1].woe, -std::log(1e-4), 1e-9);
}

TEST(ObjectiveComposerTest, SmallNonzeroSharesAreKeptExactly) {
  ObjectiveComposer composer;
  // Event share of bin 0 is 1 / 20000 = 5e-5, below the floor but not zero
  BinSet bins = two_bins(1, 100, 19999, 100);

  double p0 = 1.0 / 20000.0, q0 = 0.5;
  double p1 = 19999.0 / 20000.0, q1 = 0.5;
  double expected = (p0 - q0) * std::log(p0 / q0) + (p1 - q1) * std::log(p1 / q1);

  int substitutions = 0;
  double iv = composer.information_value(bins, &substitutions);
  EXPECT_EQ(substitutions, 0);
  EXPECT_NEAR(iv, expected, 1e-12);

  std::vector<WoeEntry> table = composer.woe_table(bins);
  EXPECT_NEAR(table[0].woe, std::log(p0 / q0), 1e-12);
}

TEST(ObjectiveComposerTest, ScoreCombinesWeightedMetrics) {
  StabilityMetrics metrics;
  metrics.separability = 0.5;
  metrics.ks = 0.3;
  metrics.psi = 0.1;

  EXPECT_NEAR(ObjectiveComposer().score(metrics, 0.2), 0.42, 1e-12);

  ObjectiveWeights weights;
  weights.psi = 1.0;
  EXPECT_NEAR(ObjectiveComposer(weights).score(metrics, 0.2), 0.32, 1e-12);

  weights = ObjectiveWeights();
  weights.separability = 0.0;
  weights.iv = 1.0;
  weights.ks = 0.0;
  EXPECT_NEAR(ObjectiveComposer(weights).score(metrics, 0.2), 0.2, 1e-12);
}

TEST(ObjectiveComposerTest, RejectsNonFiniteWeights) {
  ObjectiveWeights weights;
  weights.iv = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(ObjectiveComposer{weights}, std::invalid_argument);
  EXPECT_THROW(ObjectiveComposer(ObjectiveWeights(), 0.0), std::invalid_argument);
}
