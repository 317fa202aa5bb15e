/**
 * @file monotonicity_utils.h
 * @brief Monotonic trend detection and constraint violation search
 *
 * Features:
 * - Welford's online algorithm for numerically stable correlation
 * - Slope-based trend detection over ordered bins
 * - Leftmost violation search used by the refiner
 *
 * References:
 * - Welford, B. P. (1962). "Note on a method for calculating corrected sums of
 *   squares and products". Technometrics, 4(3), 419-420.
 */

#ifndef TEMPORAL_BINNING_MONOTONICITY_UTILS_H
#define TEMPORAL_BINNING_MONOTONICITY_UTILS_H

#include "TemporalBinning/Utilities.h"
#include <vector>

namespace TemporalBinning {

/**
 * @brief Detect monotonic trend from feature-target correlation (Welford's algorithm)
 *
 * @param feature Feature values
 * @param target Binary target values
 * @return ASCENDING for a non-negative correlation, DESCENDING otherwise
 */
template<typename T>
inline MonotonicTrend detect_trend_from_correlation(
    const std::vector<double>& feature,
    const std::vector<T>& target
) {
  if (feature.size() != target.size() || feature.size() < 2) {
    return MonotonicTrend::ASCENDING;
  }

  size_t n = feature.size();

  double mean_f = 0.0, mean_t = 0.0;
  double M2_f = 0.0, M2_t = 0.0;
  double M_ft = 0.0;  // Covariance accumulator

  for (size_t i = 0; i < n; ++i) {
    double f = feature[i];
    double t = static_cast<double>(target[i]);

    double delta_f = f - mean_f;
    double delta_t = t - mean_t;

    mean_f += delta_f / (i + 1);
    mean_t += delta_t / (i + 1);

    double delta_f_new = f - mean_f;
    double delta_t_new = t - mean_t;

    M2_f += delta_f * delta_f_new;
    M2_t += delta_t * delta_t_new;
    M_ft += delta_f * delta_t_new;
  }

  double denom = std::sqrt(M2_f * M2_t);
  if (denom < EPSILON) {
    return MonotonicTrend::ASCENDING;
  }

  double correlation = clamp(M_ft / denom, -1.0, 1.0);

  return (correlation >= 0) ? MonotonicTrend::ASCENDING : MonotonicTrend::DESCENDING;
}

/**
 * @brief Trend of values against their ordinal position (least squares slope)
 *
 * @param values Values in bin order
 * @param weights Optional bin weights (population counts); empty for equal weights
 * @return Detected trend direction
 */
inline MonotonicTrend detect_trend_welford(const std::vector<double>& values,
                                           const std::vector<int>& weights = std::vector<int>()) {
  if (values.size() < 2) {
    return MonotonicTrend::ASCENDING;
  }

  double sum_w = 0.0;
  double mean_x = 0.0, mean_y = 0.0;
  double M2_x = 0.0, M_xy = 0.0;

  for (size_t i = 0; i < values.size(); ++i) {
    double w = weights.empty() ? 1.0 : static_cast<double>(weights[i]);
    if (w <= 0.0) continue;

    double x = static_cast<double>(i);
    double y = values[i];

    sum_w += w;
    double delta_x = x - mean_x;
    double delta_y = y - mean_y;
    mean_x += delta_x * w / sum_w;
    mean_y += delta_y * w / sum_w;

    M2_x += w * delta_x * (x - mean_x);
    M_xy += w * delta_x * (y - mean_y);
  }

  if (M2_x < EPSILON) {
    return MonotonicTrend::ASCENDING;
  }

  return (M_xy / M2_x >= 0) ? MonotonicTrend::ASCENDING : MonotonicTrend::DESCENDING;
}

/**
 * @brief Find the leftmost adjacent pair violating the direction
 *
 * @param values Event rates in bin order
 * @param trend ASCENDING or DESCENDING (anything else never violates)
 * @return Index of the left bin of the pair, or -1 if none
 */
inline int find_monotonicity_violation(const std::vector<double>& values,
                                       MonotonicTrend trend) {
  if (values.size() < 2) return -1;
  if (trend != MonotonicTrend::ASCENDING && trend != MonotonicTrend::DESCENDING) return -1;

  bool ascending = (trend == MonotonicTrend::ASCENDING);

  for (size_t i = 1; i < values.size(); ++i) {
    if (ascending && values[i] < values[i-1] - EPSILON) {
      return static_cast<int>(i - 1);
    }
    if (!ascending && values[i] > values[i-1] + EPSILON) {
      return static_cast<int>(i - 1);
    }
  }

  return -1;
}

/**
 * @brief Find the leftmost adjacent pair closer than the minimum gap
 *
 * @param values Event rates in bin order
 * @param min_gap Required |difference| between neighbours
 * @return Index of the left bin of the pair, or -1 if none
 */
inline int find_gap_violation(const std::vector<double>& values, double min_gap) {
  if (values.size() < 2 || min_gap <= 0.0) return -1;

  for (size_t i = 1; i < values.size(); ++i) {
    // Tolerance keeps gaps equal to the threshold from failing on rounding
    if (std::abs(values[i] - values[i-1]) < min_gap - EPSILON) {
      return static_cast<int>(i - 1);
    }
  }

  return -1;
}

/**
 * @brief Count direction changes in a series (ignoring flat steps)
 */
inline int count_trend_changes(const std::vector<double>& values) {
  int changes = 0;
  int last_sign = 0;
  for (size_t i = 1; i < values.size(); ++i) {
    double diff = values[i] - values[i-1];
    int sign = diff > EPSILON ? 1 : (diff < -EPSILON ? -1 : 0);
    if (sign == 0) continue;
    if (last_sign != 0 && sign != last_sign) ++changes;
    last_sign = sign;
  }
  return changes;
}

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_MONOTONICITY_UTILS_H
