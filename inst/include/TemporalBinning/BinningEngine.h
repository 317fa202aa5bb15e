#ifndef TEMPORAL_BINNING_BINNING_ENGINE_H
#define TEMPORAL_BINNING_BINNING_ENGINE_H

#include "BinSet.h"
#include "CohortAggregator.h"
#include "MonotonicRefiner.h"
#include "ObjectiveComposer.h"
#include "Observations.h"
#include "SplitGenerator.h"
#include "StabilityScorer.h"
#include <ostream>
#include <string>
#include <vector>

namespace TemporalBinning {

/**
 * @brief Full configuration of one fit
 */
struct BinningConfig {
  RefinerConfig refiner;
  StabilityOptions stability;
  ObjectiveWeights weights;
  bool check_stability = true;  // Require at least two cohorts
  SplitParameters split;

  /// Validate every part; see the individual validate() members
  void validate() const;
};

/**
 * @brief Result of BinningEngine::fit
 */
struct FitResult {
  std::string generator;            // Name of the split generator, "initial" otherwise
  BinSet bins;
  CohortTable table;
  StabilityMetrics stability;
  double iv = 0.0;
  double score = 0.0;
  std::vector<WoeEntry> woe_table;
  MonotonicTrend direction = MonotonicTrend::NONE;
  std::vector<MergeRecord> merges;
  int iterations = 0;
  std::vector<std::string> warnings;
};

/**
 * @brief Split generation, refinement, stability scoring and objective
 * in one call
 */
class BinningEngine {
public:
  /**
   * @param config Configuration, validated on construction
   * @param log Stream for Info/Warning lines, nullptr for silence
   * @param verbose Emit Info lines
   */
  explicit BinningEngine(const BinningConfig& config = BinningConfig(),
                         std::ostream* log = nullptr, bool verbose = false);

  /// Fit starting from the partition produced by a split generator
  FitResult fit(const ObservationSet& obs, const SplitGenerator& generator) const;

  /**
   * @brief Fit starting from an explicit initial partition
   * @throws std::invalid_argument for invalid input
   * @throws TemporalBinningError subclasses for data or constraint failures
   */
  FitResult fit(const ObservationSet& obs, const BinSet& initial) const;

  const BinningConfig& config() const { return config_; }

private:
  FitResult run(const ObservationSet& obs, const BinSet& initial,
                const std::string& generator) const;

  BinningConfig config_;
  std::ostream* log_;
  bool verbose_;
};

/**
 * @brief Map numeric values to the WoE of their bin
 *
 * Values outside every bin (NaN and +Inf) map to NaN.
 * @throws std::invalid_argument if the fit is categorical
 */
std::vector<double> transform_woe(const FitResult& fit, const std::vector<double>& values);

/**
 * @brief Map categories to the WoE of their group; unseen categories map to NaN
 * @throws std::invalid_argument if the fit is numeric
 */
std::vector<double> transform_woe(const FitResult& fit, const std::vector<std::string>& values);

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_BINNING_ENGINE_H
