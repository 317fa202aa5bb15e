#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>

#include "TemporalBinning/BinComparator.h"
#include "test_data.h"

using namespace TemporalBinning;

TEST(BinComparatorTest, FitsEveryConfiguration) {
  ObservationSet obs = test_data::synthetic_numeric(5000, 3).numeric();
  BinComparator comparator;

  BinningConfig coarse;
  coarse.split.max_bins = 3;
  comparator.add("coarse", std::make_shared<QuantileSplit>(), coarse);
  comparator.add("uniform", std::make_shared<EqualWidthSplit>());
  comparator.add("fixed", std::make_shared<FixedSplit>(BinSet::from_cutpoints({0.5})));
  ASSERT_EQ(comparator.size(), 3u);

  const std::vector<ComparisonRow>& rows = comparator.compare(obs);

  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].name, "coarse");
  EXPECT_EQ(rows[0].generator, "quantile");
  EXPECT_LE(rows[0].n_bins, 3);
  EXPECT_EQ(rows[2].n_bins, 2);
  for (const auto& row : rows) {
    EXPECT_FALSE(row.failed);
    EXPECT_GT(row.iv, 0.0);
    EXPECT_DOUBLE_EQ(row.score, row.fit.score);
    EXPECT_DOUBLE_EQ(row.psi, row.fit.stability.psi);
  }

  int best = comparator.best();
  ASSERT_GE(best, 0);
  for (const auto& row : rows) {
    EXPECT_GE(rows[best].score, row.score);
  }
}

TEST(BinComparatorTest, FailingConfigurationBecomesFailedRow) {
  ObservationSet obs = test_data::synthetic_numeric(2000, 1).numeric();
  std::ostringstream log;
  BinComparator comparator(&log);

  comparator.add("checked", std::make_shared<QuantileSplit>());
  BinningConfig unchecked;
  unchecked.check_stability = false;
  comparator.add("unchecked", std::make_shared<QuantileSplit>(), unchecked);

  const std::vector<ComparisonRow>& rows = comparator.compare(obs);

  ASSERT_EQ(rows.size(), 2u);
  EXPECT_TRUE(rows[0].failed);
  EXPECT_EQ(rows[0].error_kind, "EmptyCohortError");
  EXPECT_FALSE(rows[1].failed);
  EXPECT_EQ(comparator.best(), 1);
  EXPECT_NE(log.str().find("Warning: Configuration 'checked' failed"), std::string::npos);
}

TEST(BinComparatorTest, AllFailedHasNoBest) {
  ObservationSet obs = test_data::synthetic_numeric(500, 1).numeric();
  BinComparator comparator;
  comparator.add("", std::make_shared<QuantileSplit>());
  comparator.compare(obs);

  EXPECT_EQ(comparator.results()[0].name, "quantile");
  EXPECT_EQ(comparator.best(), -1);
}

TEST(BinComparatorTest, RejectsBadEntries) {
  BinComparator comparator;
  comparator.add("a", std::make_shared<QuantileSplit>());
  EXPECT_THROW(comparator.add("a", std::make_shared<EqualWidthSplit>()), std::invalid_argument);
  EXPECT_THROW(comparator.add("b", nullptr), std::invalid_argument);
  EXPECT_THROW(comparator.results(), std::logic_error);
}
