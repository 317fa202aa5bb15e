#ifndef TEMPORAL_BINNING_STABILITY_SCORER_H
#define TEMPORAL_BINNING_STABILITY_SCORER_H

#include "CohortAggregator.h"
#include "Utilities.h"
#include <vector>
#include <string>

namespace TemporalBinning {

/**
 * @brief Options for the stability metrics
 */
struct StabilityOptions {
  bool use_reference_cohort = false;  // false: earliest cohort is the reference
  int reference_cohort = 0;
  double psi_floor = SHARE_FLOOR;
  PsiAggregation psi_aggregation = PsiAggregation::MEAN;

  // Separability penalties
  bool penalize_low_frequency = false;
  int low_frequency_threshold = 30;
  bool penalize_inversions = false;
  double penalty = 0.1;

  /// @throws std::invalid_argument for out-of-range values
  void validate() const;
};

/**
 * @brief Stability statistics of one BinSet over time cohorts
 *
 * Per-cohort vectors are aligned with cohort_ids; per-bin vectors with the
 * bin ordinal.
 */
struct StabilityMetrics {
  double psi = 0.0;        // Aggregate used for scoring
  double psi_mean = 0.0;
  double psi_max = 0.0;
  std::vector<double> psi_by_cohort;
  std::vector<int> cohort_ids;
  int reference_cohort = 0;

  double ks = 0.0;
  double ks_over_time = 0.0;
  double separability = 0.0;

  std::vector<std::vector<double>> event_rates;  // [bin][cohort], NaN if undefined
  std::vector<double> bin_rate_sd;
  std::vector<double> bin_rate_range;

  int epsilon_substitutions = 0;  // Zero cohort shares floored in PSI
  int iv_substitutions = 0;       // Zero event or non-event shares floored in IV, set by the engine
  int undefined_cells = 0;
  int skipped_comparisons = 0;
  std::vector<std::string> notes;
};

/**
 * @brief PSI, KS and temporal separability from a CohortTable
 *
 * All metrics are functions of the (bin, cohort) tallies only, so they do
 * not depend on the storage order of observations and are unchanged by an
 * order-preserving relabeling of cohorts.
 */
class StabilityScorer {
public:
  explicit StabilityScorer(const StabilityOptions& options = StabilityOptions());

  /**
   * @brief Compute every stability metric
   * @throws InsufficientDataError if a bin has no population
   * @throws std::invalid_argument for an empty table or unknown reference cohort
   */
  StabilityMetrics score(const CohortTable& table) const;

  /**
   * @brief PSI of one cohort against another
   * @param substitutions Incremented for each floored share (optional)
   */
  double psi(const CohortTable& table, size_t cohort, size_t reference,
             int* substitutions = nullptr) const;

  /// Max |cumulative event share - cumulative non-event share| over bins
  static double ks(const CohortTable& table);

  /**
   * @brief Two-sample KS between the bin event rates of the first and last cohort
   */
  static double ks_over_time(const CohortTable& table);

  /**
   * @brief Mean pairwise distance between bin event-rate series
   * @param skipped Incremented per (pair, cohort) skipped for an undefined rate
   */
  double separability(const CohortTable& table, int* skipped = nullptr) const;

  const StabilityOptions& options() const { return options_; }

private:
  size_t reference_index(const CohortTable& table) const;

  StabilityOptions options_;
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_STABILITY_SCORER_H
