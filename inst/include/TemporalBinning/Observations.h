#ifndef TEMPORAL_BINNING_OBSERVATIONS_H
#define TEMPORAL_BINNING_OBSERVATIONS_H

#include "BinStructures.h"
#include <vector>
#include <string>

namespace TemporalBinning {

/**
 * @brief One labelled, time-stamped row
 *
 * Only the member matching the feature kind is meaningful.
 */
struct Observation {
  double value = 0.0;
  std::string category;
  int label = 0;
  int cohort_id = 0;
};

/**
 * @brief Immutable column-wise observation set for a single feature
 *
 * Cohort ids are ordered integers (for instance yyyymm); their natural order
 * is the temporal order. When no cohorts are given every row belongs to
 * cohort 0.
 */
class ObservationSet {
public:
  /**
   * @brief Build a numeric observation set
   * @throws std::invalid_argument on size mismatch, empty input, non-finite
   *         values or a target that is not binary with both classes present
   */
  static ObservationSet numeric(std::vector<double> values,
                                std::vector<int> labels,
                                std::vector<int> cohorts = std::vector<int>());

  /**
   * @brief Build a categorical observation set
   * @throws std::invalid_argument on size mismatch, empty input, empty
   *         category strings or a non-binary target
   */
  static ObservationSet categorical(std::vector<std::string> values,
                                    std::vector<int> labels,
                                    std::vector<int> cohorts = std::vector<int>());

  /// Build from rows; the kind decides which Observation member is read
  static ObservationSet from_rows(const std::vector<Observation>& rows, FeatureKind kind);

  FeatureKind kind() const { return kind_; }
  size_t size() const { return labels_.size(); }

  const std::vector<double>& numeric_values() const { return numeric_; }
  const std::vector<std::string>& categorical_values() const { return categorical_; }
  const std::vector<int>& labels() const { return labels_; }
  const std::vector<int>& cohorts() const { return cohorts_; }

  /// Distinct cohort ids in ascending (temporal) order
  const std::vector<int>& distinct_cohorts() const { return distinct_cohorts_; }

  int total_pos() const { return total_pos_; }
  int total_neg() const { return static_cast<int>(size()) - total_pos_; }

private:
  ObservationSet() = default;
  void finalize();

  FeatureKind kind_ = FeatureKind::NUMERIC;
  std::vector<double> numeric_;
  std::vector<std::string> categorical_;
  std::vector<int> labels_;
  std::vector<int> cohorts_;
  std::vector<int> distinct_cohorts_;
  int total_pos_ = 0;
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_OBSERVATIONS_H
