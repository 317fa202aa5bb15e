// [[Rcpp::plugins(openmp)]]
#include <vector>
#include <string>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "TemporalBinning/SearchAdapter.h"
#include "TemporalBinning/Errors.h"
#include "common/validation_utils.h"

namespace TemporalBinning {

const double SearchAdapter::FAILED_SCORE = std::numeric_limits<double>::lowest();

// =============================================================================
// PARAMETER SPACE AND PROPOSER
// =============================================================================

void ParameterSpace::validate() const {
  validate_range(max_bins_lower, max_bins_upper, "max_bins");
  validate_range(min_bin_size_lower, min_bin_size_upper, "min_bin_size");
  validate_range(min_event_rate_diff_lower, min_event_rate_diff_upper, "min_event_rate_diff");
  if (max_bins_lower < 1) {
    throw std::invalid_argument("max_bins lower bound must be at least 1.");
  }
  validate_non_negative(min_bin_size_lower, "min_bin_size lower bound");
  validate_non_negative(min_event_rate_diff_lower, "min_event_rate_diff lower bound");
}

RandomSearchProposer::RandomSearchProposer(const ParameterSpace& space, unsigned int seed)
  : space_(space), rng_(seed) {
  space_.validate();
}

SearchParameters RandomSearchProposer::propose(int trial_number) {
  (void)trial_number;
  std::uniform_int_distribution<int> bins_dist(space_.max_bins_lower, space_.max_bins_upper);
  std::uniform_real_distribution<double> size_dist(space_.min_bin_size_lower, space_.min_bin_size_upper);
  std::uniform_real_distribution<double> diff_dist(space_.min_event_rate_diff_lower,
                                                   space_.min_event_rate_diff_upper);

  SearchParameters params;
  params.max_bins = bins_dist(rng_);
  params.min_bin_size = size_dist(rng_);
  params.min_event_rate_diff = diff_dist(rng_);
  return params;
}

// =============================================================================
// TRIAL HISTORY
// =============================================================================

void TrialHistory::append(const SearchTrial& trial) {
  std::lock_guard<std::mutex> lock(mutex_);
  trials_.push_back(trial);
}

std::vector<SearchTrial> TrialHistory::snapshot() const {
  std::vector<SearchTrial> copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    copy = trials_;
  }
  std::stable_sort(copy.begin(), copy.end(),
                   [](const SearchTrial& a, const SearchTrial& b) { return a.number < b.number; });
  return copy;
}

size_t TrialHistory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trials_.size();
}

void SearchOptions::validate() const {
  if (n_trials < 1) {
    throw std::invalid_argument("n_trials must be at least 1.");
  }
  if (n_threads < 1) {
    throw std::invalid_argument("n_threads must be at least 1.");
  }
  validate_non_negative(time_budget_seconds, "time_budget_seconds");
}

// =============================================================================
// SEARCH ADAPTER
// =============================================================================

SearchAdapter::SearchAdapter(const ObservationSet& obs, const SplitGenerator& generator,
                             const BinningConfig& base, std::ostream* log, bool verbose)
  : obs_(obs), generator_(generator), base_(base), log_(log), verbose_(verbose),
    next_trial_(0), stop_requested_(false) {}

BinningConfig SearchAdapter::config_for(const SearchParameters& params) const {
  BinningConfig config = base_;
  config.split.max_bins = params.max_bins;
  config.split.min_bin_size = params.min_bin_size;
  config.refiner.max_bins = params.max_bins;
  config.refiner.min_bin_size = params.min_bin_size;
  config.refiner.min_event_rate_diff = params.min_event_rate_diff;
  return config;
}

SearchTrial SearchAdapter::run_trial(const SearchParameters& params, int number) const {
  auto start = std::chrono::steady_clock::now();

  SearchTrial trial;
  trial.number = number;
  trial.params = params;

  try {
    // Silent engine: trials report through log_trial in trial order
    BinningEngine engine(config_for(params));
    FitResult fit = engine.fit(obs_, generator_);
    trial.bins = fit.bins;
    trial.stability = fit.stability;
    trial.iv = fit.iv;
    trial.score = fit.score;
  } catch (const TemporalBinningError& e) {
    trial.failed = true;
    trial.error_kind = e.kind();
    trial.error_message = e.what();
  } catch (const std::invalid_argument& e) {
    trial.failed = true;
    trial.error_kind = "InvalidArgument";
    trial.error_message = e.what();
  }

  if (trial.failed) {
    trial.score = FAILED_SCORE;
  }

  trial.elapsed_seconds = std::chrono::duration<double>(
    std::chrono::steady_clock::now() - start).count();
  return trial;
}

void SearchAdapter::log_trial(const SearchTrial& trial) const {
  if (!log_) return;
  if (trial.failed) {
    *log_ << "Warning: Trial " << trial.number << " failed (" << trial.error_kind
          << "): " << trial.error_message << std::endl;
  } else if (verbose_) {
    *log_ << "Info: Trial " << trial.number
          << ": score=" << trial.score
          << ", sep=" << trial.stability.separability
          << ", iv=" << trial.iv
          << ", ks=" << trial.stability.ks
          << ", bins=" << trial.bins.size() << std::endl;
  }
}

SearchTrial SearchAdapter::evaluate(const SearchParameters& params) {
  SearchTrial trial = run_trial(params, next_trial_++);
  history_.append(trial);
  log_trial(trial);
  return trial;
}

double SearchAdapter::objective(const SearchParameters& params) {
  return evaluate(params).score;
}

SearchSummary SearchAdapter::optimize(ParameterProposer& proposer, const SearchOptions& options) {
  options.validate();
  stop_requested_ = false;

  const auto start = std::chrono::steady_clock::now();
  auto budget_exhausted = [&]() {
    if (options.time_budget_seconds <= 0.0) return false;
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return elapsed >= options.time_budget_seconds;
  };

  SearchSummary summary;
  std::vector<int> own_trials;
  int launched = 0;

  while (launched < options.n_trials) {
    if (stop_requested_ || budget_exhausted()) {
      summary.cancelled = true;
      break;
    }

    const int batch = std::min(options.n_threads, options.n_trials - launched);
    const int first = next_trial_.fetch_add(batch);

    // Proposals are drawn in trial order so results do not depend on scheduling
    std::vector<SearchParameters> proposals;
    proposals.reserve(batch);
    for (int k = 0; k < batch; ++k) {
      proposals.push_back(proposer.propose(first + k));
    }

    std::vector<SearchTrial> results(batch);
    std::vector<char> ran(batch, 0);
    std::exception_ptr error;

#ifdef _OPENMP
#pragma omp parallel for num_threads(batch) schedule(static, 1) if(batch > 1)
#endif
    for (int k = 0; k < batch; ++k) {
      if (stop_requested_ || budget_exhausted()) {
        continue;
      }
      try {
        results[k] = run_trial(proposals[k], first + k);
        ran[k] = 1;
      } catch (...) {
        // Unexpected failures cannot leave the parallel region; rethrown below
#ifdef _OPENMP
#pragma omp critical
#endif
        {
          if (!error) error = std::current_exception();
        }
      }
    }

    if (error) {
      std::rethrow_exception(error);
    }

    for (int k = 0; k < batch; ++k) {
      if (!ran[k]) {
        summary.cancelled = true;
        continue;
      }
      history_.append(results[k]);
      proposer.observe(results[k]);
      log_trial(results[k]);
      own_trials.push_back(results[k].number);
    }
    launched += batch;
  }

  // Best successful trial of this run, earliest on ties
  std::vector<SearchTrial> all = history_.snapshot();
  for (const auto& trial : all) {
    if (std::find(own_trials.begin(), own_trials.end(), trial.number) == own_trials.end()) {
      continue;
    }
    summary.trials.push_back(trial);
    if (trial.failed) {
      summary.n_failed++;
      continue;
    }
    if (!summary.has_best || trial.score > summary.best_score) {
      summary.has_best = true;
      summary.best_trial = trial.number;
      summary.best_params = trial.params;
      summary.best_score = trial.score;
    }
  }

  if (verbose_ && log_) {
    *log_ << "Info: Search finished: " << summary.trials.size() << " trials, "
          << summary.n_failed << " failed"
          << (summary.cancelled ? ", cancelled" : "") << "." << std::endl;
  }

  if (summary.has_best && options.refit_best) {
    BinningEngine engine(config_for(summary.best_params), log_, verbose_);
    summary.best_fit = engine.fit(obs_, generator_);
    summary.refitted = true;
  } else if (!summary.has_best && log_) {
    *log_ << "Warning: No successful trial; nothing to refit." << std::endl;
  }

  return summary;
}

} // namespace TemporalBinning
