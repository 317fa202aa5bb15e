// [[Rcpp::plugins(openmp)]]
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "TemporalBinning/CohortAggregator.h"
#include "TemporalBinning/Errors.h"
#include "TemporalBinning/Utilities.h"

namespace TemporalBinning {

// =============================================================================
// COHORT TABLE
// =============================================================================

CohortTable::CohortTable(size_t n_bins, std::vector<int> cohort_ids)
  : n_bins_(n_bins), cohort_ids_(std::move(cohort_ids)),
    cells_(n_bins * cohort_ids_.size()) {}

int CohortTable::cohort_index(int cohort_id) const {
  auto it = std::lower_bound(cohort_ids_.begin(), cohort_ids_.end(), cohort_id);
  if (it == cohort_ids_.end() || *it != cohort_id) {
    return -1;
  }
  return static_cast<int>(it - cohort_ids_.begin());
}

int CohortTable::bin_count(size_t bin) const {
  int total = 0;
  for (size_t c = 0; c < n_cohorts(); ++c) total += cell(bin, c).count;
  return total;
}

int CohortTable::bin_events(size_t bin) const {
  int total = 0;
  for (size_t c = 0; c < n_cohorts(); ++c) total += cell(bin, c).event_count;
  return total;
}

int CohortTable::cohort_count(size_t cohort) const {
  int total = 0;
  for (size_t b = 0; b < n_bins_; ++b) total += cell(b, cohort).count;
  return total;
}

int CohortTable::total_count() const {
  int total = 0;
  for (const auto& c : cells_) total += c.count;
  return total;
}

int CohortTable::total_events() const {
  int total = 0;
  for (const auto& c : cells_) total += c.event_count;
  return total;
}

std::vector<int> CohortTable::bin_counts() const {
  std::vector<int> out(n_bins_);
  for (size_t b = 0; b < n_bins_; ++b) out[b] = bin_count(b);
  return out;
}

std::vector<int> CohortTable::bin_event_counts() const {
  std::vector<int> out(n_bins_);
  for (size_t b = 0; b < n_bins_; ++b) out[b] = bin_events(b);
  return out;
}

int CohortTable::empty_cells() const {
  return static_cast<int>(std::count_if(cells_.begin(), cells_.end(),
                                        [](const CohortCell& c) { return c.count == 0; }));
}

// =============================================================================
// AGGREGATOR
// =============================================================================

std::vector<size_t> CohortAggregator::assign(const BinSet& bins, const ObservationSet& obs) const {
  if (bins.empty()) {
    throw std::invalid_argument("Cannot assign observations to an empty BinSet.");
  }
  if (bins.kind() != obs.kind()) {
    throw std::invalid_argument("BinSet and observations describe different feature kinds.");
  }

  const int n = static_cast<int>(obs.size());
  std::vector<size_t> assignment(obs.size(), BinSet::npos);

  if (obs.kind() == FeatureKind::NUMERIC) {
    const std::vector<double>& values = obs.numeric_values();
#ifdef _OPENMP
#pragma omp parallel for if(n > PARALLEL_THRESHOLD)
#endif
    for (int i = 0; i < n; ++i) {
      assignment[i] = bins.locate(values[i]);
    }
  } else {
    const std::vector<std::string>& values = obs.categorical_values();
    for (int i = 0; i < n; ++i) {
      assignment[i] = bins.locate(values[i]);
    }
  }

  for (int i = 0; i < n; ++i) {
    if (assignment[i] == BinSet::npos) {
      std::string value = obs.kind() == FeatureKind::NUMERIC
                            ? std::to_string(obs.numeric_values()[i])
                            : obs.categorical_values()[i];
      throw std::invalid_argument("Value '" + value + "' at row " + std::to_string(i) +
                                  " is not covered by the partition.");
    }
  }

  return assignment;
}

CohortTable CohortAggregator::tally(const std::vector<size_t>& assignment, size_t n_bins,
                                    const ObservationSet& obs) const {
  require_cohorts(obs);

  if (assignment.size() != obs.size()) {
    throw std::invalid_argument("Assignment must have one entry per observation.");
  }

  CohortTable table(n_bins, obs.distinct_cohorts());
  const std::vector<int>& labels = obs.labels();
  const std::vector<int>& cohorts = obs.cohorts();

  for (size_t i = 0; i < assignment.size(); ++i) {
    if (assignment[i] >= n_bins) {
      throw std::invalid_argument("Assignment refers to bin " + std::to_string(assignment[i]) +
                                  " of " + std::to_string(n_bins) + ".");
    }
    CohortCell& cell = table.cell(assignment[i],
                                  static_cast<size_t>(table.cohort_index(cohorts[i])));
    cell.count++;
    cell.event_count += labels[i];
  }

  return table;
}

CohortTable CohortAggregator::aggregate(const BinSet& bins, const ObservationSet& obs) const {
  require_cohorts(obs);
  return tally(assign(bins, obs), bins.size(), obs);
}

void CohortAggregator::require_cohorts(const ObservationSet& obs) const {
  if (check_stability_ && obs.distinct_cohorts().size() < 2) {
    throw EmptyCohortError(
      "Stability checking needs at least 2 distinct cohorts; found " +
      std::to_string(obs.distinct_cohorts().size()) + "."
    );
  }
}

} // namespace TemporalBinning
