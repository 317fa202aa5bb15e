/**
 * @file safe_math.h
 * @brief Numerically stable summation and floored share helpers
 *
 * Provides:
 * - Compensated (Neumaier) summation
 * - Share computation with an explicit floor for zero proportions
 */

#ifndef TEMPORAL_BINNING_SAFE_MATH_H
#define TEMPORAL_BINNING_SAFE_MATH_H

#include "TemporalBinning/Utilities.h"
#include <vector>
#include <algorithm>
#include <numeric>

namespace TemporalBinning {

/**
 * @brief Compensated (Neumaier) sum
 *
 * Used for the PSI, IV and separability totals.
 *
 * Reference:
 * Neumaier, A. (1974). "Rundungsfehleranalyse einiger Verfahren
 * zur Summation endlicher Summen". ZAMM, 54, 39-51.
 */
inline double compensated_sum(const std::vector<double>& values) {
  if (values.empty()) return 0.0;

  double sum = values[0];
  double c = 0.0;

  for (size_t i = 1; i < values.size(); ++i) {
    double t = sum + values[i];

    if (std::abs(sum) >= std::abs(values[i])) {
      c += (sum - t) + values[i];
    } else {
      c += (values[i] - t) + sum;
    }

    sum = t;
  }

  return sum + c;
}

/**
 * @brief Proportion count/total, with a floor replacing zero shares
 *
 * Nonzero shares are returned exactly, however small.
 *
 * @param count Part count
 * @param total Whole count
 * @param floor Value substituted for a zero share
 * @param substitutions Incremented each time the floor is used (optional)
 */
inline double floored_share(int count, int total, double floor = SHARE_FLOOR,
                            int* substitutions = nullptr) {
  if (count <= 0 || total <= 0) {
    if (substitutions) ++(*substitutions);
    return floor;
  }
  return static_cast<double>(count) / total;
}

/**
 * @brief Sample standard deviation, 0 for fewer than two values
 */
inline double sample_sd(const std::vector<double>& values) {
  if (values.size() < 2) return 0.0;

  // Welford's running variance
  double mean = 0.0;
  double m2 = 0.0;
  for (size_t i = 0; i < values.size(); ++i) {
    double delta = values[i] - mean;
    mean += delta / static_cast<double>(i + 1);
    m2 += delta * (values[i] - mean);
  }
  return std::sqrt(m2 / static_cast<double>(values.size() - 1));
}

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_SAFE_MATH_H
