#ifndef TEMPORAL_BINNING_TEST_DATA_H
#define TEMPORAL_BINNING_TEST_DATA_H

#include "TemporalBinning/Observations.h"
#include <cmath>
#include <random>
#include <string>
#include <vector>

namespace TemporalBinning {
namespace test_data {

/**
 * @brief Column buffers for building observation sets row by row
 */
struct Columns {
  std::vector<double> values;
  std::vector<std::string> categories;
  std::vector<int> labels;
  std::vector<int> cohorts;

  /// Add `count` rows with the given value, `events` of them labelled 1
  void add(double value, int count, int events, int cohort = 0) {
    for (int i = 0; i < count; ++i) {
      values.push_back(value);
      labels.push_back(i < events ? 1 : 0);
      cohorts.push_back(cohort);
    }
  }

  void add(const std::string& category, int count, int events, int cohort = 0) {
    for (int i = 0; i < count; ++i) {
      categories.push_back(category);
      labels.push_back(i < events ? 1 : 0);
      cohorts.push_back(cohort);
    }
  }

  ObservationSet numeric() const { return ObservationSet::numeric(values, labels, cohorts); }
  ObservationSet categorical() const { return ObservationSet::categorical(categories, labels, cohorts); }
};

/**
 * @brief One observation block per bin: bin b holds value b + 0.5
 *
 * With cutpoints {1, 2, ..., n - 1} every block lands in its own bin.
 */
inline ObservationSet blocks(const std::vector<int>& counts, const std::vector<int>& events) {
  Columns cols;
  for (size_t b = 0; b < counts.size(); ++b) {
    cols.add(static_cast<double>(b) + 0.5, counts[b], events[b]);
  }
  return cols.numeric();
}

inline std::vector<double> unit_cutpoints(size_t n_bins) {
  std::vector<double> cp;
  for (size_t i = 1; i < n_bins; ++i) cp.push_back(static_cast<double>(i));
  return cp;
}

/**
 * @brief Numeric feature on [0, 1) whose event probability rises with the value
 *
 * Cohort ids are first_cohort, first_cohort + 1, ...
 */
inline Columns synthetic_numeric(size_t n, int n_cohorts, unsigned int seed = 7,
                                 int first_cohort = 1) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> unif(0.0, 1.0);
  std::uniform_int_distribution<int> cohort(0, n_cohorts - 1);

  Columns cols;
  for (size_t i = 0; i < n; ++i) {
    double x = unif(rng);
    double p = 1.0 / (1.0 + std::exp(-(x - 0.6) * 6.0));
    cols.values.push_back(x);
    cols.labels.push_back(unif(rng) < p ? 1 : 0);
    cols.cohorts.push_back(first_cohort + cohort(rng));
  }
  return cols;
}

} // namespace test_data
} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_TEST_DATA_H
