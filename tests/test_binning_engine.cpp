#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

#include "TemporalBinning/BinningEngine.h"
#include "TemporalBinning/Errors.h"
#include "test_data.h"

using namespace TemporalBinning;

namespace {

BinningConfig ascending_config() {
  BinningConfig config;
  config.refiner.trend = MonotonicTrend::ASCENDING;
  config.refiner.min_event_rate_diff = 0.02;
  config.refiner.min_bin_size = 0.05;
  return config;
}

} // namespace

TEST(BinningEngineTest, FitSatisfiesConstraintsAndComposesScore) {
  ObservationSet obs = test_data::synthetic_numeric(8000, 4).numeric();
  std::ostringstream log;
  BinningEngine engine(ascending_config(), &log, true);

  FitResult fit = engine.fit(obs, QuantileSplit());

  EXPECT_EQ(fit.generator, "quantile");
  ASSERT_GE(fit.bins.size(), 2u);
  EXPECT_LE(fit.bins.size(), 6u);
  EXPECT_EQ(fit.direction, MonotonicTrend::ASCENDING);

  std::vector<double> rates = fit.bins.event_rates();
  EXPECT_TRUE(is_monotonic(rates, MonotonicTrend::ASCENDING));
  for (size_t i = 1; i < rates.size(); ++i) {
    EXPECT_GE(rates[i] - rates[i - 1], 0.02 - 1e-9);
  }
  for (const auto& bin : fit.bins.bins()) {
    EXPECT_GE(bin.count, 0.05 * obs.size());
  }

  EXPECT_EQ(fit.table.n_cohorts(), 4u);
  EXPECT_EQ(fit.table.total_count(), 8000);
  EXPECT_EQ(fit.woe_table.size(), fit.bins.size());
  EXPECT_GT(fit.iv, 0.0);
  EXPECT_NEAR(fit.score,
              0.7 * fit.stability.separability + 0.2 * fit.iv + 0.1 * fit.stability.ks,
              1e-12);
  EXPECT_NE(log.str().find("Info: Final bins"), std::string::npos);
}

TEST(BinningEngineTest, SingleCohortFailsWhenStabilityIsChecked) {
  ObservationSet obs = test_data::synthetic_numeric(2000, 1).numeric();
  EXPECT_THROW(BinningEngine(ascending_config()).fit(obs, QuantileSplit()), EmptyCohortError);
}

TEST(BinningEngineTest, SingleCohortScoresWithoutStabilityCheck) {
  ObservationSet obs = test_data::synthetic_numeric(2000, 1).numeric();
  BinningConfig config = ascending_config();
  config.check_stability = false;

  FitResult fit = BinningEngine(config).fit(obs, QuantileSplit());

  EXPECT_DOUBLE_EQ(fit.stability.psi, 0.0);
  bool noted = false;
  for (const auto& w : fit.warnings) {
    if (w.find("Single cohort") != std::string::npos) noted = true;
  }
  EXPECT_TRUE(noted);
}

TEST(BinningEngineTest, ImpossibleMinBinSizeIsUnsatisfiable) {
  BinningConfig config;
  config.refiner.min_bin_size = 1.5;
  EXPECT_THROW(BinningEngine{config}, UnsatisfiableConstraintError);
}

TEST(BinningEngineTest, FitFromExplicitPartition) {
  ObservationSet obs = test_data::synthetic_numeric(4000, 3).numeric();
  BinSet initial = BinSet::from_cutpoints({0.2, 0.4, 0.6, 0.8});

  FitResult fit = BinningEngine(ascending_config()).fit(obs, initial);
  EXPECT_EQ(fit.generator, "initial");
  EXPECT_EQ(fit.table.total_count(), 4000);
}

TEST(BinningEngineTest, IvFloorSubstitutionsAreCounted) {
  test_data::Columns cols;
  cols.add(0.5, 100, 0, 1);
  cols.add(0.5, 100, 0, 2);
  cols.add(1.5, 100, 50, 1);
  cols.add(1.5, 100, 50, 2);

  BinningConfig config;
  config.refiner.trend = MonotonicTrend::ASCENDING;
  FitResult fit = BinningEngine(config).fit(cols.numeric(), BinSet::from_cutpoints({1.0}));

  ASSERT_EQ(fit.bins.size(), 2u);
  EXPECT_EQ(fit.stability.iv_substitutions, 1);
  EXPECT_EQ(fit.stability.epsilon_substitutions, 0);
  bool warned = false;
  for (const auto& w : fit.warnings) {
    if (w.find("floored in the IV computation") != std::string::npos) warned = true;
  }
  EXPECT_TRUE(warned);
}

TEST(BinningEngineTest, NumericWoeTransform) {
  ObservationSet obs = test_data::synthetic_numeric(4000, 2).numeric();
  FitResult fit = BinningEngine(ascending_config()).fit(obs, QuantileSplit());

  std::vector<double> out = transform_woe(fit, std::vector<double>{
    0.0, 0.99, std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()
  });

  ASSERT_EQ(out.size(), 4u);
  EXPECT_DOUBLE_EQ(out[0], fit.woe_table.front().woe);
  EXPECT_DOUBLE_EQ(out[1], fit.woe_table.back().woe);
  EXPECT_TRUE(std::isnan(out[2]));
  EXPECT_TRUE(std::isnan(out[3]));
  EXPECT_THROW(transform_woe(fit, std::vector<std::string>{"a"}), std::invalid_argument);
}

TEST(BinningEngineTest, CategoricalWoeTransform) {
  test_data::Columns cols;
  cols.add(std::string("low"), 400, 20, 1);
  cols.add(std::string("low"), 400, 24, 2);
  cols.add(std::string("mid"), 300, 45, 1);
  cols.add(std::string("mid"), 300, 48, 2);
  cols.add(std::string("high"), 200, 60, 1);
  cols.add(std::string("high"), 200, 64, 2);

  BinningConfig config;
  config.refiner.trend = MonotonicTrend::ASCENDING;
  FitResult fit = BinningEngine(config).fit(cols.categorical(), CategoricalSplit());

  ASSERT_EQ(fit.bins.size(), 3u);
  std::vector<double> out = transform_woe(fit, std::vector<std::string>{"low", "high", "unseen"});
  EXPECT_DOUBLE_EQ(out[0], fit.woe_table[0].woe);
  EXPECT_DOUBLE_EQ(out[1], fit.woe_table[2].woe);
  EXPECT_TRUE(std::isnan(out[2]));
  EXPECT_THROW(transform_woe(fit, std::vector<double>{1.0}), std::invalid_argument);
}

TEST(BinningEngineTest, InvariantToRowOrderAndCohortRelabeling) {
  test_data::Columns cols = test_data::synthetic_numeric(6000, 4, 19);
  BinningEngine engine(ascending_config());
  FitResult base = engine.fit(cols.numeric(), QuantileSplit());

  std::vector<size_t> order(cols.values.size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::mt19937 rng(5);
  std::shuffle(order.begin(), order.end(), rng);
  test_data::Columns shuffled;
  for (size_t i : order) {
    shuffled.values.push_back(cols.values[i]);
    shuffled.labels.push_back(cols.labels[i]);
    shuffled.cohorts.push_back(cols.cohorts[i] * 100 + 202300);
  }
  FitResult other = engine.fit(shuffled.numeric(), QuantileSplit());

  EXPECT_TRUE(other.bins.same_partition(base.bins));
  EXPECT_DOUBLE_EQ(other.iv, base.iv);
  EXPECT_DOUBLE_EQ(other.stability.psi, base.stability.psi);
  EXPECT_DOUBLE_EQ(other.stability.separability, base.stability.separability);
  EXPECT_DOUBLE_EQ(other.score, base.score);
}
