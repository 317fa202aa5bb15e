#include <vector>
#include <string>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "TemporalBinning/BinningEngine.h"

namespace TemporalBinning {

void BinningConfig::validate() const {
  refiner.validate();
  stability.validate();
  weights.validate();
  split.validate();
}

BinningEngine::BinningEngine(const BinningConfig& config, std::ostream* log, bool verbose)
  : config_(config), log_(log), verbose_(verbose) {
  config_.validate();
}

FitResult BinningEngine::fit(const ObservationSet& obs, const SplitGenerator& generator) const {
  BinSet initial = generator.produce(obs, config_.split);
  if (verbose_ && log_) {
    *log_ << "Info: Split generator '" << generator.name() << "' produced "
          << initial.size() << " initial bins." << std::endl;
  }
  return run(obs, initial, generator.name());
}

FitResult BinningEngine::fit(const ObservationSet& obs, const BinSet& initial) const {
  return run(obs, initial, "initial");
}

FitResult BinningEngine::run(const ObservationSet& obs, const BinSet& initial,
                             const std::string& generator) const {
  CohortAggregator aggregator(config_.check_stability);
  MonotonicRefiner refiner(config_.refiner, log_, verbose_);
  StabilityScorer scorer(config_.stability);
  ObjectiveComposer composer(config_.weights, config_.stability.psi_floor);

  RefinementResult refined = refiner.refine(initial, obs, aggregator);

  FitResult result;
  result.generator = generator;
  result.bins = refined.bins;
  result.table = refined.table;
  result.direction = refined.direction;
  result.merges = refined.merges;
  result.iterations = refined.iterations;
  result.warnings = refined.warnings;

  result.stability = scorer.score(result.table);

  result.iv = composer.information_value(result.bins, &result.stability.iv_substitutions);
  result.woe_table = composer.woe_table(result.bins);
  result.score = composer.score(result.stability, result.iv);

  if (result.stability.iv_substitutions > 0) {
    result.warnings.push_back(std::to_string(result.stability.iv_substitutions) +
                              " zero event or non-event shares floored in the IV computation.");
  }
  for (const auto& note : result.stability.notes) {
    result.warnings.push_back(note);
  }

  if (verbose_ && log_) {
    *log_ << "Info: Final bins: " << result.bins.size()
          << ", IV: " << result.iv
          << ", PSI: " << result.stability.psi
          << ", KS: " << result.stability.ks
          << ", separability: " << result.stability.separability
          << ", score: " << result.score << std::endl;
  }

  return result;
}

std::vector<double> transform_woe(const FitResult& fit, const std::vector<double>& values) {
  if (fit.bins.kind() != FeatureKind::NUMERIC) {
    throw std::invalid_argument("Numeric values cannot be mapped through a categorical fit.");
  }
  std::vector<double> out(values.size(), std::numeric_limits<double>::quiet_NaN());
  for (size_t i = 0; i < values.size(); ++i) {
    size_t b = fit.bins.locate(values[i]);
    if (b != BinSet::npos && b < fit.woe_table.size()) {
      out[i] = fit.woe_table[b].woe;
    }
  }
  return out;
}

std::vector<double> transform_woe(const FitResult& fit, const std::vector<std::string>& values) {
  if (fit.bins.kind() != FeatureKind::CATEGORICAL) {
    throw std::invalid_argument("Categories cannot be mapped through a numeric fit.");
  }
  std::vector<double> out(values.size(), std::numeric_limits<double>::quiet_NaN());
  for (size_t i = 0; i < values.size(); ++i) {
    size_t b = fit.bins.locate(values[i]);
    if (b != BinSet::npos && b < fit.woe_table.size()) {
      out[i] = fit.woe_table[b].woe;
    }
  }
  return out;
}

} // namespace TemporalBinning
