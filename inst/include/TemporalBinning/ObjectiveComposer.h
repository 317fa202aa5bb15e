#ifndef TEMPORAL_BINNING_OBJECTIVE_COMPOSER_H
#define TEMPORAL_BINNING_OBJECTIVE_COMPOSER_H

#include "BinSet.h"
#include "StabilityScorer.h"
#include "Utilities.h"
#include <vector>
#include <string>

namespace TemporalBinning {

/**
 * @brief Weights of the composite objective
 *
 * score = separability * sep + iv * IV + ks * KS - psi * PSI
 */
struct ObjectiveWeights {
  double separability = 0.7;
  double iv = 0.2;
  double ks = 0.1;
  double psi = 0.0;

  /// @throws std::invalid_argument for non-finite weights
  void validate() const;
};

/**
 * @brief One row of the WoE table
 */
struct WoeEntry {
  int id = 0;
  std::string label;
  int count = 0;
  int count_pos = 0;
  int count_neg = 0;
  double event_rate = 0.0;
  double woe = 0.0;
  double iv = 0.0;
};

/**
 * @brief Information value, WoE table and the scalar ranking score
 *
 * Uses the same share floor as PSI. Pure and deterministic.
 */
class ObjectiveComposer {
public:
  explicit ObjectiveComposer(const ObjectiveWeights& weights = ObjectiveWeights(),
                             double floor = SHARE_FLOOR);

  /**
   * @brief Total IV over the bins' current counts
   * @param substitutions Incremented for each floored share (optional)
   */
  double information_value(const BinSet& bins, int* substitutions = nullptr) const;

  /// WoE and IV contribution per bin, in ordinal order
  std::vector<WoeEntry> woe_table(const BinSet& bins, int* substitutions = nullptr) const;

  /// Weighted composite of separability, IV, KS and PSI
  double score(const StabilityMetrics& metrics, double iv) const;

  const ObjectiveWeights& weights() const { return weights_; }

private:
  ObjectiveWeights weights_;
  double floor_;
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_OBJECTIVE_COMPOSER_H
