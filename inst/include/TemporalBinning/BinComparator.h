#ifndef TEMPORAL_BINNING_BIN_COMPARATOR_H
#define TEMPORAL_BINNING_BIN_COMPARATOR_H

#include "BinningEngine.h"
#include "Observations.h"
#include "SplitGenerator.h"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace TemporalBinning {

/**
 * @brief Metrics of one named configuration
 */
struct ComparisonRow {
  std::string name;
  std::string generator;
  double iv = 0.0;
  int n_bins = 0;
  double psi = 0.0;
  double ks = 0.0;
  double separability = 0.0;
  double score = 0.0;
  bool failed = false;
  std::string error_kind;
  std::string error;
  FitResult fit;
};

/**
 * @brief Fits several named configurations on the same observations
 */
class BinComparator {
public:
  explicit BinComparator(std::ostream* log = nullptr, bool verbose = false);

  /**
   * @brief Register a configuration; an empty name falls back to the generator name
   * @throws std::invalid_argument for a null generator or a duplicate name
   */
  void add(const std::string& name, std::shared_ptr<const SplitGenerator> generator,
           const BinningConfig& config = BinningConfig());

  size_t size() const { return entries_.size(); }

  /**
   * @brief Fit every configuration; failures become rows with failed = true
   */
  const std::vector<ComparisonRow>& compare(const ObservationSet& obs);

  /// @throws std::logic_error before compare() has run
  const std::vector<ComparisonRow>& results() const;

  /// Index of the best successful row by score, -1 if all failed
  int best() const;

private:
  struct Entry {
    std::string name;
    std::shared_ptr<const SplitGenerator> generator;
    BinningConfig config;
  };

  std::vector<Entry> entries_;
  std::vector<ComparisonRow> results_;
  bool compared_ = false;
  std::ostream* log_;
  bool verbose_;
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_BIN_COMPARATOR_H
