#include <vector>
#include <string>
#include <algorithm>
#include <numeric>
#include <stdexcept>

#include "TemporalBinning/Observations.h"
#include "common/validation_utils.h"

namespace TemporalBinning {

ObservationSet ObservationSet::numeric(std::vector<double> values,
                                       std::vector<int> labels,
                                       std::vector<int> cohorts) {
  validate_same_length(values.size(), "Feature", labels.size(), "target");

  size_t bad = count_non_finite(values);
  if (bad > 0) {
    throw std::invalid_argument(
      "Numeric feature contains " + std::to_string(bad) +
      " NaN or Inf values; remove or impute them before binning."
    );
  }

  ObservationSet obs;
  obs.kind_ = FeatureKind::NUMERIC;
  obs.numeric_ = std::move(values);
  obs.labels_ = std::move(labels);
  obs.cohorts_ = std::move(cohorts);
  obs.finalize();
  return obs;
}

ObservationSet ObservationSet::categorical(std::vector<std::string> values,
                                           std::vector<int> labels,
                                           std::vector<int> cohorts) {
  validate_same_length(values.size(), "Feature", labels.size(), "target");

  if (std::any_of(values.begin(), values.end(), [](const std::string& s) {
    return s.empty();
  })) {
    throw std::invalid_argument("Feature cannot contain empty strings. Consider preprocessing your data.");
  }

  ObservationSet obs;
  obs.kind_ = FeatureKind::CATEGORICAL;
  obs.categorical_ = std::move(values);
  obs.labels_ = std::move(labels);
  obs.cohorts_ = std::move(cohorts);
  obs.finalize();
  return obs;
}

ObservationSet ObservationSet::from_rows(const std::vector<Observation>& rows, FeatureKind kind) {
  std::vector<int> labels;
  std::vector<int> cohorts;
  labels.reserve(rows.size());
  cohorts.reserve(rows.size());

  if (kind == FeatureKind::NUMERIC) {
    std::vector<double> values;
    values.reserve(rows.size());
    for (const auto& row : rows) {
      values.push_back(row.value);
      labels.push_back(row.label);
      cohorts.push_back(row.cohort_id);
    }
    return numeric(std::move(values), std::move(labels), std::move(cohorts));
  }

  std::vector<std::string> values;
  values.reserve(rows.size());
  for (const auto& row : rows) {
    values.push_back(row.category);
    labels.push_back(row.label);
    cohorts.push_back(row.cohort_id);
  }
  return categorical(std::move(values), std::move(labels), std::move(cohorts));
}

void ObservationSet::finalize() {
  validate_binary_target(labels_);

  if (cohorts_.empty()) {
    cohorts_.assign(labels_.size(), 0);
  } else {
    validate_same_length(cohorts_.size(), "Cohort", labels_.size(), "target");
  }

  distinct_cohorts_ = cohorts_;
  std::sort(distinct_cohorts_.begin(), distinct_cohorts_.end());
  distinct_cohorts_.erase(std::unique(distinct_cohorts_.begin(), distinct_cohorts_.end()),
                          distinct_cohorts_.end());

  total_pos_ = std::accumulate(labels_.begin(), labels_.end(), 0);
}

} // namespace TemporalBinning
