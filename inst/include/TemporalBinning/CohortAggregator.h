#ifndef TEMPORAL_BINNING_COHORT_AGGREGATOR_H
#define TEMPORAL_BINNING_COHORT_AGGREGATOR_H

#include "BinStructures.h"
#include "BinSet.h"
#include "Observations.h"
#include <vector>

namespace TemporalBinning {

/**
 * @brief Dense (bin, cohort) tally stored as a flat arena
 *
 * Cell (b, c) lives at index b * n_cohorts + c. Every pair is present;
 * pairs without observations hold zero counts.
 */
class CohortTable {
public:
  CohortTable() = default;
  CohortTable(size_t n_bins, std::vector<int> cohort_ids);

  size_t n_bins() const { return n_bins_; }
  size_t n_cohorts() const { return cohort_ids_.size(); }
  const std::vector<int>& cohort_ids() const { return cohort_ids_; }

  const CohortCell& cell(size_t bin, size_t cohort) const {
    return cells_[bin * cohort_ids_.size() + cohort];
  }
  CohortCell& cell(size_t bin, size_t cohort) {
    return cells_[bin * cohort_ids_.size() + cohort];
  }

  /// Position of a cohort id, or -1 when absent
  int cohort_index(int cohort_id) const;

  int bin_count(size_t bin) const;
  int bin_events(size_t bin) const;
  int cohort_count(size_t cohort) const;
  int total_count() const;
  int total_events() const;

  /// Per-bin totals across cohorts
  std::vector<int> bin_counts() const;
  std::vector<int> bin_event_counts() const;

  /// Number of (bin, cohort) cells without observations
  int empty_cells() const;

private:
  size_t n_bins_ = 0;
  std::vector<int> cohort_ids_;
  std::vector<CohortCell> cells_;
};

/**
 * @brief Groups observations by bin and cohort
 *
 * Pure: results depend only on the BinSet and observations passed in.
 */
class CohortAggregator {
public:
  /**
   * @param check_stability When true, aggregation requires at least two
   *        distinct cohorts and raises EmptyCohortError otherwise
   */
  explicit CohortAggregator(bool check_stability = false)
    : check_stability_(check_stability) {}

  /**
   * @brief Bin index of every observation
   * @throws std::invalid_argument if the kinds differ or a value is not
   *         covered by the partition
   */
  std::vector<size_t> assign(const BinSet& bins, const ObservationSet& obs) const;

  /**
   * @brief Tally pre-assigned observations
   * @param assignment Bin index per observation, each below n_bins
   */
  CohortTable tally(const std::vector<size_t>& assignment, size_t n_bins,
                    const ObservationSet& obs) const;

  /// assign() followed by tally()
  CohortTable aggregate(const BinSet& bins, const ObservationSet& obs) const;

private:
  void require_cohorts(const ObservationSet& obs) const;

  bool check_stability_;
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_COHORT_AGGREGATOR_H
