#ifndef TEMPORAL_BINNING_SEARCH_ADAPTER_H
#define TEMPORAL_BINNING_SEARCH_ADAPTER_H

#include "BinningEngine.h"
#include "BinSet.h"
#include "Observations.h"
#include "SplitGenerator.h"
#include "StabilityScorer.h"
#include <atomic>
#include <mutex>
#include <ostream>
#include <random>
#include <string>
#include <vector>

namespace TemporalBinning {

/**
 * @brief One point of the hyperparameter space
 */
struct SearchParameters {
  int max_bins = 6;
  double min_bin_size = 0.05;
  double min_event_rate_diff = 0.02;
};

/**
 * @brief Bounds of the hyperparameter space (inclusive)
 */
struct ParameterSpace {
  int max_bins_lower = 3;
  int max_bins_upper = 10;
  double min_bin_size_lower = 0.01;
  double min_bin_size_upper = 0.1;
  double min_event_rate_diff_lower = 0.01;
  double min_event_rate_diff_upper = 0.1;

  /// @throws std::invalid_argument for empty or negative ranges
  void validate() const;
};

struct SearchTrial;

/**
 * @brief Source of hyperparameter vectors for the search
 *
 * Proposals are requested sequentially in trial order; observe() is called
 * with every finished trial in the same order.
 */
class ParameterProposer {
public:
  virtual ~ParameterProposer() = default;
  virtual SearchParameters propose(int trial_number) = 0;
  virtual void observe(const SearchTrial& trial) { (void)trial; }
};

/**
 * @brief Uniform random sampling of the parameter space, reproducible by seed
 */
class RandomSearchProposer : public ParameterProposer {
public:
  explicit RandomSearchProposer(const ParameterSpace& space = ParameterSpace(),
                                unsigned int seed = 42);

  SearchParameters propose(int trial_number) override;

private:
  ParameterSpace space_;
  std::mt19937 rng_;
};

/**
 * @brief Result of one objective evaluation; immutable once scored
 */
struct SearchTrial {
  int number = 0;
  SearchParameters params;
  BinSet bins;
  StabilityMetrics stability;
  double iv = 0.0;
  double score = 0.0;
  bool failed = false;
  std::string error_kind;
  std::string error_message;
  double elapsed_seconds = 0.0;
};

/**
 * @brief Append-only trial log shared by concurrent trials
 */
class TrialHistory {
public:
  void append(const SearchTrial& trial);

  /// Copy of all trials sorted by trial number
  std::vector<SearchTrial> snapshot() const;

  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<SearchTrial> trials_;
};

struct SearchOptions {
  int n_trials = 20;
  double time_budget_seconds = 0.0;  // 0 = no limit
  int n_threads = 1;
  bool refit_best = true;

  /// @throws std::invalid_argument for non-positive counts or a negative budget
  void validate() const;
};

struct SearchSummary {
  bool has_best = false;
  int best_trial = -1;
  SearchParameters best_params;
  double best_score = 0.0;
  bool refitted = false;
  FitResult best_fit;
  std::vector<SearchTrial> trials;
  int n_failed = 0;
  bool cancelled = false;
};

/**
 * @brief Hyperparameter search over split generation, refinement and scoring
 *
 * The observations and the generator are borrowed and must outlive the
 * adapter. Failed evaluations are recorded with the sentinel score
 * SearchAdapter::FAILED_SCORE and never abort the search.
 */
class SearchAdapter {
public:
  static const double FAILED_SCORE;

  SearchAdapter(const ObservationSet& obs, const SplitGenerator& generator,
                const BinningConfig& base = BinningConfig(),
                std::ostream* log = nullptr, bool verbose = false);

  /// Base configuration with the hyperparameters applied
  BinningConfig config_for(const SearchParameters& params) const;

  /**
   * @brief Score one hyperparameter vector and append the trial to the history
   */
  SearchTrial evaluate(const SearchParameters& params);

  /// Scalar objective of one hyperparameter vector
  double objective(const SearchParameters& params);

  /**
   * @brief Run trials proposed by the proposer and refit the best vector
   *
   * Trials run in batches of n_threads (OpenMP). A stop request or an
   * exhausted time budget is honoured before each trial starts.
   */
  SearchSummary optimize(ParameterProposer& proposer, const SearchOptions& options = SearchOptions());

  /// Ask a running optimize() to stop before its next trial
  void request_stop() { stop_requested_ = true; }
  bool stop_requested() const { return stop_requested_; }

  const TrialHistory& history() const { return history_; }

private:
  SearchTrial run_trial(const SearchParameters& params, int number) const;
  void log_trial(const SearchTrial& trial) const;

  const ObservationSet& obs_;
  const SplitGenerator& generator_;
  BinningConfig base_;
  std::ostream* log_;
  bool verbose_;
  TrialHistory history_;
  std::atomic<int> next_trial_;
  std::atomic<bool> stop_requested_;
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_SEARCH_ADAPTER_H
