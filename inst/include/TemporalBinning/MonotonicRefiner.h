#ifndef TEMPORAL_BINNING_MONOTONIC_REFINER_H
#define TEMPORAL_BINNING_MONOTONIC_REFINER_H

#include "BinSet.h"
#include "CohortAggregator.h"
#include "Observations.h"
#include "Utilities.h"
#include <vector>
#include <string>
#include <ostream>

namespace TemporalBinning {

/**
 * @brief Constraints enforced by the refiner
 */
struct RefinerConfig {
  MonotonicTrend trend = MonotonicTrend::AUTO;
  double min_event_rate_diff = 0.02;  // Minimum |rate difference| between neighbours
  double min_bin_size = 0.05;         // Fraction of all observations
  int min_bins = 1;
  int max_bins = 0;                   // 0 = unlimited

  /**
   * @throws std::invalid_argument for negative or non-finite thresholds
   * @throws UnsatisfiableConstraintError when constraints contradict each other
   */
  void validate() const;
};

enum class MergeReason {
  MIN_SIZE,
  MONOTONICITY,
  MIN_GAP,
  MAX_BINS
};

std::string merge_reason_to_string(MergeReason reason);

/**
 * @brief One merge of bins `left` and `left + 1`
 */
struct MergeRecord {
  int iteration = 0;
  size_t left = 0;
  MergeReason reason = MergeReason::MIN_SIZE;
  std::vector<double> rates_before;
};

struct RefinementResult {
  BinSet bins;                      // Final partition with refreshed counts
  std::vector<size_t> assignment;   // Final bin of each observation
  CohortTable table;
  MonotonicTrend direction = MonotonicTrend::NONE;
  std::vector<MergeRecord> merges;
  int iterations = 0;
  std::vector<std::string> warnings;
};

/**
 * @brief Greedy leftmost merging until size, monotonicity, gap and
 * bin-count constraints hold
 *
 * Each iteration re-aggregates and performs at most one merge, in priority
 * order: undersized bins, monotonicity violations, gap violations, then
 * max_bins. The leftmost candidate always wins, so the output is
 * deterministic. Refining a terminal partition returns it unchanged.
 */
class MonotonicRefiner {
public:
  /**
   * @param config Constraints (validated here)
   * @param log Stream for Info/Warning lines, nullptr for silence
   * @param verbose Emit Info lines
   */
  explicit MonotonicRefiner(const RefinerConfig& config, std::ostream* log = nullptr,
                            bool verbose = false);

  /**
   * @brief Refine an initial partition against the observations
   * @throws UnsatisfiableConstraintError if the partition cannot satisfy the
   *         constraints without dropping below min_bins
   * @throws EmptyCohortError from the aggregator when stability is checked
   */
  RefinementResult refine(const BinSet& initial, const ObservationSet& obs,
                          const CohortAggregator& aggregator = CohortAggregator()) const;

  const RefinerConfig& config() const { return config_; }

private:
  MonotonicTrend resolve_direction(const BinSet& bins, const ObservationSet& obs) const;
  size_t undersized_merge(const BinSet& bins, double floor, bool* found) const;
  size_t cheapest_merge(const BinSet& bins) const;
  void log_info(const std::string& message) const;
  void add_warning(RefinementResult& result, const std::string& message) const;

  RefinerConfig config_;
  std::ostream* log_;
  bool verbose_;
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_MONOTONIC_REFINER_H
