#ifndef TEMPORAL_BINNING_UTILITIES_H
#define TEMPORAL_BINNING_UTILITIES_H

#include <cmath>
#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace TemporalBinning {

// Constants
constexpr double EPSILON = 1e-10;
constexpr double SHARE_FLOOR = 1e-4;      // Floor for zero shares in PSI / IV / WoE
constexpr double MAX_WOE = 20.0;          // Cap for numerical stability
constexpr double MIN_WOE = -20.0;         // Cap for numerical stability
constexpr int PARALLEL_THRESHOLD = 20000; // Observations before assignment goes parallel

/**
 * @brief Monotonicity trend options
 *
 * AUTO: Detect trend from the data
 * ASCENDING: Event rate must not decrease with bin order
 * DESCENDING: Event rate must not increase with bin order
 * NONE: No monotonicity enforcement
 */
enum class MonotonicTrend {
  AUTO,
  ASCENDING,
  DESCENDING,
  NONE
};

/**
 * @brief Aggregation of per-cohort PSI values into the scalar used for scoring
 */
enum class PsiAggregation {
  MEAN,
  MAX
};

/**
 * @brief Convert string to MonotonicTrend enum
 * @param trend_str String representation ("auto", "ascending", "descending", "none")
 * @return MonotonicTrend enum value
 */
inline MonotonicTrend string_to_monotonic_trend(const std::string& trend_str) {
  if (trend_str == "ascending" || trend_str == "increasing") return MonotonicTrend::ASCENDING;
  if (trend_str == "descending" || trend_str == "decreasing") return MonotonicTrend::DESCENDING;
  if (trend_str == "none") return MonotonicTrend::NONE;
  return MonotonicTrend::AUTO; // Default
}

/**
 * @brief Convert MonotonicTrend enum to string
 * @param trend MonotonicTrend enum value
 * @return String representation
 */
inline std::string monotonic_trend_to_string(MonotonicTrend trend) {
  switch (trend) {
    case MonotonicTrend::ASCENDING: return "ascending";
    case MonotonicTrend::DESCENDING: return "descending";
    case MonotonicTrend::NONE: return "none";
    default: return "auto";
  }
}

inline PsiAggregation string_to_psi_aggregation(const std::string& str) {
  return str == "max" ? PsiAggregation::MAX : PsiAggregation::MEAN;
}

/**
 * @brief Safe division with zero denominator protection
 * @param num Numerator
 * @param denom Denominator
 * @param epsilon Minimum denominator magnitude
 * @return num/denom, or 0 when the denominator vanishes
 */
inline double safe_divide(double num, double denom, double epsilon = EPSILON) {
  if (std::abs(denom) < epsilon) {
    return 0.0;
  }
  return num / denom;
}

/**
 * @brief Clamp value to range [min_val, max_val]
 */
inline double clamp(double value, double min_val, double max_val) {
  return std::max(min_val, std::min(value, max_val));
}

/**
 * @brief Check if values are monotonic in the requested direction
 *
 * AUTO accepts either direction, NONE accepts anything.
 *
 * @param values Values in bin order
 * @param trend Required direction
 * @param tolerance Allowed violation magnitude
 * @return true if the sequence respects the direction
 */
template<typename Container>
bool is_monotonic(const Container& values, MonotonicTrend trend = MonotonicTrend::AUTO,
                  double tolerance = EPSILON) {
  if (values.size() <= 1 || trend == MonotonicTrend::NONE) {
    return true;
  }

  bool increasing = true;
  bool decreasing = true;

  for (size_t i = 1; i < values.size(); ++i) {
    if (values[i] < values[i-1] - tolerance) {
      increasing = false;
    }
    if (values[i] > values[i-1] + tolerance) {
      decreasing = false;
    }
  }

  switch (trend) {
    case MonotonicTrend::ASCENDING: return increasing;
    case MonotonicTrend::DESCENDING: return decreasing;
    default: return increasing || decreasing;
  }
}

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_UTILITIES_H
