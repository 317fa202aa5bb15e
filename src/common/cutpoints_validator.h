#ifndef TEMPORAL_BINNING_CUTPOINTS_VALIDATOR_H
#define TEMPORAL_BINNING_CUTPOINTS_VALIDATOR_H

#include <vector>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace TemporalBinning {

/**
 * @brief Validate and clean cutpoints for a numeric partition
 *
 * The function:
 * 1. Rejects NaN and infinite cutpoints (the outer bounds are implicit)
 * 2. Sorts cutpoints in ascending order
 * 3. Removes duplicates using floating-point tolerance (1e-10)
 *
 * @param cutpoints Vector of cutpoints to validate
 * @return Vector of unique, sorted cutpoints
 * @throws std::invalid_argument for non-finite cutpoints
 *
 * @example
 * std::vector<double> cp = {30.0, 10.0, 20.0, 20.0};
 * cp = validate_cutpoints(cp);  // Returns {10.0, 20.0, 30.0}
 */
inline std::vector<double> validate_cutpoints(std::vector<double> cutpoints) {
  for (double cp : cutpoints) {
    if (!std::isfinite(cp)) {
      throw std::invalid_argument("Cutpoints must be finite; outer bounds -Inf/+Inf are implicit.");
    }
  }

  std::sort(cutpoints.begin(), cutpoints.end());

  auto it = std::unique(cutpoints.begin(), cutpoints.end(),
    [](double a, double b) {
      return std::abs(a - b) < 1e-10;
    });

  cutpoints.erase(it, cutpoints.end());

  return cutpoints;
}

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_CUTPOINTS_VALIDATOR_H
