#ifndef TEMPORAL_BINNING_BIN_SET_H
#define TEMPORAL_BINNING_BIN_SET_H

#include "BinStructures.h"
#include <vector>
#include <string>
#include <unordered_map>

namespace TemporalBinning {

/**
 * @brief Ordered partition of one feature's domain
 *
 * Numeric sets are contiguous half-open intervals from -Inf to +Inf.
 * Categorical sets are disjoint category groups whose order is the ordinal
 * position used for monotonicity.
 */
class BinSet {
public:
  static constexpr size_t npos = static_cast<size_t>(-1);

  BinSet() = default;

  /**
   * @brief Numeric partition from interior cutpoints
   *
   * Cutpoints are sorted and de-duplicated; n cutpoints give n + 1 bins.
   * @throws std::invalid_argument for non-finite cutpoints
   */
  static BinSet from_cutpoints(const std::vector<double>& cutpoints);

  /**
   * @brief Categorical partition from ordered category groups
   * @throws std::invalid_argument for empty groups, empty names or a category
   *         listed twice
   */
  static BinSet from_groups(const std::vector<std::vector<std::string>>& groups,
                            const std::string& separator = DEFAULT_BIN_SEPARATOR);

  FeatureKind kind() const { return kind_; }
  size_t size() const { return bins_.size(); }
  bool empty() const { return bins_.empty(); }

  const std::vector<Bin>& bins() const { return bins_; }
  const Bin& operator[](size_t i) const { return bins_[i]; }
  const std::string& separator() const { return separator_; }

  /// Index of the bin holding the value, npos if none
  size_t locate(double value) const;
  /// Index of the group holding the category, npos if not covered
  size_t locate(const std::string& category) const;

  /**
   * @brief Merge bin `left` with bin `left + 1`
   * @throws std::out_of_range if the pair does not exist
   */
  void merge_adjacent(size_t left);

  /// Refresh derived counts (one entry per bin)
  void update_counts(const std::vector<int>& counts, const std::vector<int>& events);

  /// Interior cutpoints (upper bounds of all bins but the last)
  std::vector<double> cutpoints() const;

  /// Category groups in ordinal order
  std::vector<std::vector<std::string>> groups() const;

  /// Human readable labels in ordinal order
  std::vector<std::string> labels() const;

  std::vector<double> event_rates() const;

  /// Same boundaries or groups, ignoring counts
  bool same_partition(const BinSet& other) const;

  /**
   * @brief Check structural invariants
   * @throws std::invalid_argument describing the first violation
   */
  void validate() const;

private:
  void rebuild_index();

  FeatureKind kind_ = FeatureKind::NUMERIC;
  std::vector<Bin> bins_;
  std::string separator_ = DEFAULT_BIN_SEPARATOR;
  std::unordered_map<std::string, size_t> category_index_;
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_BIN_SET_H
