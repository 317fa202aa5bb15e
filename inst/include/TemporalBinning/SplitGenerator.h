#ifndef TEMPORAL_BINNING_SPLIT_GENERATOR_H
#define TEMPORAL_BINNING_SPLIT_GENERATOR_H

#include "BinSet.h"
#include "Observations.h"
#include <memory>
#include <string>
#include <vector>

namespace TemporalBinning {

/**
 * @brief Parameters handed to a split generator
 */
struct SplitParameters {
  int max_bins = 6;
  double min_bin_size = 0.05;  // Caps equal-frequency bins at 1 / min_bin_size

  /// @throws std::invalid_argument for max_bins < 1 or a negative min_bin_size
  void validate() const;
};

/**
 * @brief Base class for strategies producing the initial partition
 *
 * A generator must return an exhaustive partition of the observed domain:
 * every observation passed to produce() must fall into exactly one bin.
 */
class SplitGenerator {
public:
  virtual ~SplitGenerator() = default;

  /**
   * @brief Build the initial BinSet
   * @throws std::invalid_argument if the observations have the wrong kind
   */
  virtual BinSet produce(const ObservationSet& obs, const SplitParameters& params) const = 0;

  virtual std::string name() const = 0;
};

/**
 * @brief Equal-frequency numeric split
 *
 * Produces up to min(max_bins, 1 / min_bin_size, unique values) bins with
 * cutpoints at sample quantiles.
 */
class QuantileSplit : public SplitGenerator {
public:
  BinSet produce(const ObservationSet& obs, const SplitParameters& params) const override;
  std::string name() const override { return "quantile"; }
};

/**
 * @brief Equal-width numeric split between the observed minimum and maximum
 */
class EqualWidthSplit : public SplitGenerator {
public:
  BinSet produce(const ObservationSet& obs, const SplitParameters& params) const override;
  std::string name() const override { return "uniform"; }
};

/**
 * @brief One-dimensional k-means numeric split
 *
 * Starts from min(max_bins, unique values) centroids spaced evenly over the
 * observed range and runs Lloyd iterations until no centroid moves by more
 * than tolerance * range. Clusters left empty are dropped. Cutpoints are the
 * midpoints between adjacent centroids.
 */
class KMeansSplit : public SplitGenerator {
public:
  explicit KMeansSplit(int max_iterations = 100, double tolerance = 1e-6);

  BinSet produce(const ObservationSet& obs, const SplitParameters& params) const override;
  std::string name() const override { return "kmeans"; }

private:
  int max_iterations_;
  double tolerance_;
};

/**
 * @brief Categorical split with rare-category grouping
 *
 * Categories whose share is below rare_threshold are pooled into one group.
 * Groups are ordered by event rate and adjacent groups are merged (least IV
 * loss first) until at most max_bins remain.
 */
class CategoricalSplit : public SplitGenerator {
public:
  explicit CategoricalSplit(double rare_threshold = 0.01,
                            const std::string& separator = DEFAULT_BIN_SEPARATOR);

  BinSet produce(const ObservationSet& obs, const SplitParameters& params) const override;
  std::string name() const override { return "categorical"; }

private:
  double rare_threshold_;
  std::string separator_;
};

/**
 * @brief Caller-supplied partition returned as is
 */
class FixedSplit : public SplitGenerator {
public:
  explicit FixedSplit(BinSet bins);

  BinSet produce(const ObservationSet& obs, const SplitParameters& params) const override;
  std::string name() const override { return "fixed"; }

private:
  BinSet bins_;
};

/**
 * @brief Built-in generator by name ("quantile", "uniform", "kmeans", "categorical")
 * @throws std::invalid_argument for an unknown name
 */
std::unique_ptr<SplitGenerator> make_split_generator(const std::string& name);

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_SPLIT_GENERATOR_H
