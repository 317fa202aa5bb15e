#ifndef TEMPORAL_BINNING_BIN_STRUCTURES_H
#define TEMPORAL_BINNING_BIN_STRUCTURES_H

#include <vector>
#include <string>
#include <cmath>
#include <limits>
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace TemporalBinning {

/// Default separator used to label merged categorical groups
const char* const DEFAULT_BIN_SEPARATOR = "%;%";

/**
 * @brief Type of the feature being binned
 */
enum class FeatureKind {
  NUMERIC,
  CATEGORICAL
};

/**
 * @brief A single bin: a half-open interval [lower, upper) for numeric
 * features or a group of categories for categorical features
 *
 * Counts are derived aggregates refreshed from the observations whenever the
 * owning BinSet changes.
 */
struct Bin {
  double lower_bound = -std::numeric_limits<double>::infinity();
  double upper_bound = std::numeric_limits<double>::infinity();
  std::vector<std::string> categories;
  int count = 0;       // Total observations in bin
  int count_pos = 0;   // Events (label = 1)
  int count_neg = 0;   // Non-events (label = 0)

  Bin() = default;

  Bin(double lower, double upper)
    : lower_bound(lower), upper_bound(upper) {}

  explicit Bin(const std::vector<std::string>& cats)
    : categories(cats) {}

  /// Get event rate, 0 for an empty bin
  double event_rate() const {
    return count > 0 ? static_cast<double>(count_pos) / count : 0.0;
  }

  void reset_counts() {
    count = 0;
    count_pos = 0;
    count_neg = 0;
  }

  void add_counts(int p_count, int n_count) {
    count += (p_count + n_count);
    count_pos += p_count;
    count_neg += n_count;
  }

  /// Check if value is in bin [lower, upper)
  bool contains(double value) const {
    return value >= lower_bound && value < upper_bound;
  }

  /// Merge with the next bin: convex hull of intervals, union of categories
  void merge_with(const Bin& other) {
    lower_bound = std::min(lower_bound, other.lower_bound);
    upper_bound = std::max(upper_bound, other.upper_bound);
    categories.insert(categories.end(), other.categories.begin(), other.categories.end());
    count += other.count;
    count_pos += other.count_pos;
    count_neg += other.count_neg;
  }

  /// Interval label, e.g. "[-Inf;1.500000)"
  std::string interval_name() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    if (std::isinf(lower_bound) && lower_bound < 0) {
      oss << "[-Inf";
    } else {
      oss << "[" << lower_bound;
    }
    oss << ";";
    if (std::isinf(upper_bound) && upper_bound > 0) {
      oss << "+Inf)";
    } else {
      oss << upper_bound << ")";
    }
    return oss.str();
  }

  /// Get bin name as joined categories
  std::string group_name(const std::string& separator = DEFAULT_BIN_SEPARATOR) const {
    std::string result;
    for (size_t i = 0; i < categories.size(); ++i) {
      if (i > 0) result += separator;
      result += categories[i];
    }
    return result;
  }
};

/**
 * @brief Tally of one (bin, cohort) cell
 */
struct CohortCell {
  int count = 0;
  int event_count = 0;

  int non_event_count() const { return count - event_count; }

  /// Event rate of the cell, NaN when the cell is empty
  double event_rate() const {
    return count > 0 ? static_cast<double>(event_count) / count
                     : std::numeric_limits<double>::quiet_NaN();
  }
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_BIN_STRUCTURES_H
