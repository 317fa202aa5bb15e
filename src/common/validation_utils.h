/**
 * @file validation_utils.h
 * @brief Input validation utilities
 */

#ifndef TEMPORAL_BINNING_VALIDATION_UTILS_H
#define TEMPORAL_BINNING_VALIDATION_UTILS_H

#include "TemporalBinning/Utilities.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace TemporalBinning {

/**
 * @brief Require 0/1 labels with both classes present
 *
 * @throws std::invalid_argument naming the first bad position, or the missing class
 */
inline void validate_binary_target(const std::vector<int>& labels) {
  if (labels.empty()) {
    throw std::invalid_argument("Target vector cannot be empty");
  }

  int seen = 0;  // bit 0: a 0 label, bit 1: a 1 label
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] != 0 && labels[i] != 1) {
      throw std::invalid_argument("Target must contain only 0 and 1; found " +
                                  std::to_string(labels[i]) + " at position " +
                                  std::to_string(i + 1));
    }
    seen |= (1 << labels[i]);
  }

  if (seen != 3) {
    throw std::invalid_argument(std::string("Target has no ") +
                                (seen == 1 ? "events (1)" : "non-events (0)") +
                                "; both classes are needed for WoE and IV");
  }
}

/**
 * @brief Require two parallel columns of the same length
 */
inline void validate_same_length(size_t n_a, const std::string& name_a,
                                 size_t n_b, const std::string& name_b) {
  if (n_a != n_b) {
    throw std::invalid_argument(name_a + " and " + name_b + " must have the same size (" +
                                std::to_string(n_a) + " vs " + std::to_string(n_b) + ")");
  }
}

/**
 * @brief Number of NaN and infinite entries
 */
inline size_t count_non_finite(const std::vector<double>& values) {
  size_t bad = 0;
  for (double v : values) {
    if (!std::isfinite(v)) ++bad;
  }
  return bad;
}

/**
 * @brief Require a finite, non-negative value
 */
inline void validate_non_negative(double value, const std::string& name) {
  if (!std::isfinite(value) || value < 0.0) {
    throw std::invalid_argument(name + " must be a finite non-negative number, got: " +
                                std::to_string(value));
  }
}

/**
 * @brief Require lower <= upper for a search range
 */
template<typename T>
inline void validate_range(T lower, T upper, const std::string& name) {
  if (lower > upper) {
    throw std::invalid_argument(name + " range is empty: lower (" + std::to_string(lower) +
                                ") > upper (" + std::to_string(upper) + ")");
  }
}

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_VALIDATION_UTILS_H
