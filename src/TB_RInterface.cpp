// [[Rcpp::plugins(cpp17)]]
// [[Rcpp::plugins(openmp)]]
#include <Rcpp.h>
#include <vector>
#include <string>
#include <memory>
#include <cmath>
#include <stdexcept>

#include "TemporalBinning/BinningEngine.h"
#include "TemporalBinning/BinComparator.h"
#include "TemporalBinning/Errors.h"
#include "TemporalBinning/SearchAdapter.h"

using namespace Rcpp;
using namespace TemporalBinning;

namespace {

// A NULL cohort puts every row in cohort 0
std::vector<int> as_cohorts(const Nullable<IntegerVector>& cohort_) {
  if (cohort_.isNull()) {
    return std::vector<int>();
  }
  IntegerVector cohort(cohort_.get());
  for (int i = 0; i < cohort.size(); ++i) {
    if (cohort[i] == NA_INTEGER) {
      Rcpp::stop("cohort cannot contain NA values.");
    }
  }
  return Rcpp::as<std::vector<int>>(cohort);
}

std::vector<int> as_target(const IntegerVector& target) {
  for (int i = 0; i < target.size(); ++i) {
    if (target[i] == NA_INTEGER) {
      Rcpp::stop("target cannot contain NA values.");
    }
  }
  return Rcpp::as<std::vector<int>>(target);
}

void emit_warnings(const std::vector<std::string>& warnings) {
  for (const auto& w : warnings) {
    Rcpp::warning(w);
  }
}

List stability_to_list(const StabilityMetrics& m) {
  NumericMatrix rates(static_cast<int>(m.event_rates.size()),
                      static_cast<int>(m.cohort_ids.size()));
  for (size_t b = 0; b < m.event_rates.size(); ++b) {
    for (size_t c = 0; c < m.event_rates[b].size(); ++c) {
      double r = m.event_rates[b][c];
      rates(b, c) = std::isnan(r) ? NA_REAL : r;
    }
  }

  return List::create(
    Named("psi") = m.psi,
    Named("psi_mean") = m.psi_mean,
    Named("psi_max") = m.psi_max,
    Named("psi_by_cohort") = m.psi_by_cohort,
    Named("cohorts") = m.cohort_ids,
    Named("reference_cohort") = m.reference_cohort,
    Named("ks") = m.ks,
    Named("ks_over_time") = m.ks_over_time,
    Named("separability") = m.separability,
    Named("event_rate_by_cohort") = rates,
    Named("event_rate_sd") = m.bin_rate_sd,
    Named("event_rate_range") = m.bin_rate_range,
    Named("epsilon_substitutions") = m.epsilon_substitutions,
    Named("iv_substitutions") = m.iv_substitutions,
    Named("undefined_cells") = m.undefined_cells,
    Named("notes") = m.notes
  );
}

List fit_to_list(const FitResult& fit) {
  const size_t n = fit.woe_table.size();
  IntegerVector ids(n);
  CharacterVector labels(n);
  NumericVector woe(n), iv(n), event_rate(n);
  IntegerVector count(n), count_pos(n), count_neg(n);

  for (size_t i = 0; i < n; ++i) {
    const WoeEntry& e = fit.woe_table[i];
    ids[i] = e.id;
    labels[i] = e.label;
    woe[i] = e.woe;
    iv[i] = e.iv;
    count[i] = e.count;
    count_pos[i] = e.count_pos;
    count_neg[i] = e.count_neg;
    event_rate[i] = e.event_rate;
  }

  IntegerVector merge_iteration(fit.merges.size());
  IntegerVector merge_left(fit.merges.size());
  CharacterVector merge_reason(fit.merges.size());
  for (size_t i = 0; i < fit.merges.size(); ++i) {
    merge_iteration[i] = fit.merges[i].iteration;
    merge_left[i] = static_cast<int>(fit.merges[i].left) + 1;
    merge_reason[i] = merge_reason_to_string(fit.merges[i].reason);
  }

  List out = List::create(
    Named("id") = ids,
    Named("bin") = labels,
    Named("woe") = woe,
    Named("iv") = iv,
    Named("count") = count,
    Named("count_pos") = count_pos,
    Named("count_neg") = count_neg,
    Named("event_rate") = event_rate,
    Named("total_iv") = fit.iv,
    Named("score") = fit.score,
    Named("direction") = monotonic_trend_to_string(fit.direction),
    Named("generator") = fit.generator,
    Named("iterations") = fit.iterations,
    Named("stability") = stability_to_list(fit.stability),
    Named("merges") = DataFrame::create(
      Named("iteration") = merge_iteration,
      Named("left_bin") = merge_left,
      Named("reason") = merge_reason
    )
  );

  if (fit.bins.kind() == FeatureKind::NUMERIC) {
    out["cutpoints"] = fit.bins.cutpoints();
  }
  return out;
}

BinningConfig make_config(int max_bins, double min_bin_size, double min_event_rate_diff,
                          const std::string& monotonic_trend, bool check_stability) {
  BinningConfig config;
  config.split.max_bins = max_bins;
  config.split.min_bin_size = min_bin_size;
  config.refiner.max_bins = max_bins;
  config.refiner.min_bin_size = min_bin_size;
  config.refiner.min_event_rate_diff = min_event_rate_diff;
  config.refiner.trend = string_to_monotonic_trend(monotonic_trend);
  config.check_stability = check_stability;
  return config;
}

} // namespace

// [[Rcpp::export]]
List tb_fit_numeric(NumericVector feature,
                    IntegerVector target,
                    Nullable<IntegerVector> cohort = R_NilValue,
                    std::string method = "quantile",
                    int max_bins = 6,
                    double min_bin_size = 0.05,
                    double min_event_rate_diff = 0.02,
                    std::string monotonic_trend = "auto",
                    bool check_stability = true,
                    bool verbose = false) {
  try {
    ObservationSet obs = ObservationSet::numeric(Rcpp::as<std::vector<double>>(feature),
                                                 as_target(target), as_cohorts(cohort));
    BinningConfig config = make_config(max_bins, min_bin_size, min_event_rate_diff,
                                       monotonic_trend, check_stability);
    std::unique_ptr<SplitGenerator> generator = make_split_generator(method);
    BinningEngine engine(config, &Rcpp::Rcout, verbose);
    FitResult fit = engine.fit(obs, *generator);
    emit_warnings(fit.warnings);
    return fit_to_list(fit);
  } catch (const TemporalBinningError& e) {
    Rcpp::stop(std::string(e.kind()) + ": " + e.what());
  } catch (const std::exception& e) {
    Rcpp::stop("Error in tb_fit_numeric: " + std::string(e.what()));
  }
}

// [[Rcpp::export]]
List tb_fit_categorical(CharacterVector feature,
                        IntegerVector target,
                        Nullable<IntegerVector> cohort = R_NilValue,
                        int max_bins = 6,
                        double min_bin_size = 0.05,
                        double min_event_rate_diff = 0.02,
                        std::string monotonic_trend = "auto",
                        double rare_threshold = 0.01,
                        std::string bin_separator = "%;%",
                        bool check_stability = true,
                        bool verbose = false) {
  try {
    for (int i = 0; i < feature.size(); ++i) {
      if (CharacterVector::is_na(feature[i])) {
        Rcpp::stop("feature cannot contain NA values.");
      }
    }
    ObservationSet obs = ObservationSet::categorical(Rcpp::as<std::vector<std::string>>(feature),
                                                     as_target(target), as_cohorts(cohort));
    BinningConfig config = make_config(max_bins, min_bin_size, min_event_rate_diff,
                                       monotonic_trend, check_stability);
    CategoricalSplit generator(rare_threshold, bin_separator);
    BinningEngine engine(config, &Rcpp::Rcout, verbose);
    FitResult fit = engine.fit(obs, generator);
    emit_warnings(fit.warnings);
    return fit_to_list(fit);
  } catch (const TemporalBinningError& e) {
    Rcpp::stop(std::string(e.kind()) + ": " + e.what());
  } catch (const std::exception& e) {
    Rcpp::stop("Error in tb_fit_categorical: " + std::string(e.what()));
  }
}

// [[Rcpp::export]]
List tb_stability(NumericVector feature,
                  IntegerVector target,
                  IntegerVector cohort,
                  NumericVector cutpoints,
                  std::string psi_aggregation = "mean",
                  bool penalize_low_frequency = false,
                  bool penalize_inversions = false) {
  try {
    ObservationSet obs = ObservationSet::numeric(Rcpp::as<std::vector<double>>(feature),
                                                 as_target(target), as_cohorts(cohort));
    BinSet bins = BinSet::from_cutpoints(Rcpp::as<std::vector<double>>(cutpoints));

    StabilityOptions options;
    options.psi_aggregation = string_to_psi_aggregation(psi_aggregation);
    options.penalize_low_frequency = penalize_low_frequency;
    options.penalize_inversions = penalize_inversions;

    CohortAggregator aggregator(true);
    StabilityScorer scorer(options);
    StabilityMetrics metrics = scorer.score(aggregator.aggregate(bins, obs));
    emit_warnings(metrics.notes);
    return stability_to_list(metrics);
  } catch (const TemporalBinningError& e) {
    Rcpp::stop(std::string(e.kind()) + ": " + e.what());
  } catch (const std::exception& e) {
    Rcpp::stop("Error in tb_stability: " + std::string(e.what()));
  }
}

// [[Rcpp::export]]
List tb_optimize(NumericVector feature,
                 IntegerVector target,
                 Nullable<IntegerVector> cohort = R_NilValue,
                 std::string method = "quantile",
                 int n_trials = 20,
                 int seed = 42,
                 int n_threads = 1,
                 double time_budget = 0.0,
                 bool verbose = false) {
  try {
    ObservationSet obs = ObservationSet::numeric(Rcpp::as<std::vector<double>>(feature),
                                                 as_target(target), as_cohorts(cohort));
    std::unique_ptr<SplitGenerator> generator = make_split_generator(method);

    SearchAdapter adapter(obs, *generator, BinningConfig(), &Rcpp::Rcout, verbose);
    RandomSearchProposer proposer(ParameterSpace(), static_cast<unsigned int>(seed));
    SearchOptions options;
    options.n_trials = n_trials;
    options.n_threads = n_threads;
    options.time_budget_seconds = time_budget;

    SearchSummary summary = adapter.optimize(proposer, options);

    const size_t n = summary.trials.size();
    IntegerVector number(n), trial_bins(n), max_bins(n);
    NumericVector min_bin_size(n), min_event_rate_diff(n), score(n), iv(n), psi(n), elapsed(n);
    LogicalVector failed(n);
    CharacterVector error(n);
    for (size_t i = 0; i < n; ++i) {
      const SearchTrial& t = summary.trials[i];
      number[i] = t.number;
      max_bins[i] = t.params.max_bins;
      min_bin_size[i] = t.params.min_bin_size;
      min_event_rate_diff[i] = t.params.min_event_rate_diff;
      failed[i] = t.failed;
      score[i] = t.failed ? NA_REAL : t.score;
      iv[i] = t.failed ? NA_REAL : t.iv;
      psi[i] = t.failed ? NA_REAL : t.stability.psi;
      trial_bins[i] = t.failed ? NA_INTEGER : static_cast<int>(t.bins.size());
      error[i] = t.failed ? t.error_kind + ": " + t.error_message : std::string();
      elapsed[i] = t.elapsed_seconds;
    }

    List out = List::create(
      Named("trials") = DataFrame::create(
        Named("trial") = number,
        Named("max_bins") = max_bins,
        Named("min_bin_size") = min_bin_size,
        Named("min_event_rate_diff") = min_event_rate_diff,
        Named("score") = score,
        Named("iv") = iv,
        Named("psi") = psi,
        Named("n_bins") = trial_bins,
        Named("failed") = failed,
        Named("error") = error,
        Named("elapsed") = elapsed,
        Named("stringsAsFactors") = false
      ),
      Named("cancelled") = summary.cancelled
    );

    if (summary.has_best) {
      out["best_params"] = List::create(
        Named("max_bins") = summary.best_params.max_bins,
        Named("min_bin_size") = summary.best_params.min_bin_size,
        Named("min_event_rate_diff") = summary.best_params.min_event_rate_diff
      );
      out["best_score"] = summary.best_score;
      if (summary.refitted) {
        emit_warnings(summary.best_fit.warnings);
        out["fit"] = fit_to_list(summary.best_fit);
      }
    } else {
      Rcpp::warning("All trials failed.");
    }
    return out;
  } catch (const TemporalBinningError& e) {
    Rcpp::stop(std::string(e.kind()) + ": " + e.what());
  } catch (const std::exception& e) {
    Rcpp::stop("Error in tb_optimize: " + std::string(e.what()));
  }
}

// [[Rcpp::export]]
List tb_compare(NumericVector feature,
                IntegerVector target,
                Nullable<IntegerVector> cohort = R_NilValue,
                CharacterVector methods = CharacterVector::create("quantile", "uniform"),
                int max_bins = 6,
                double min_bin_size = 0.05,
                double min_event_rate_diff = 0.02) {
  try {
    ObservationSet obs = ObservationSet::numeric(Rcpp::as<std::vector<double>>(feature),
                                                 as_target(target), as_cohorts(cohort));
    BinningConfig config = make_config(max_bins, min_bin_size, min_event_rate_diff, "auto", true);

    BinComparator comparator(&Rcpp::Rcout, false);
    for (int i = 0; i < methods.size(); ++i) {
      std::string method = Rcpp::as<std::string>(methods[i]);
      comparator.add(method, std::shared_ptr<const SplitGenerator>(make_split_generator(method)),
                     config);
    }
    const std::vector<ComparisonRow>& rows = comparator.compare(obs);

    const size_t n = rows.size();
    CharacterVector name(n), generator(n), error(n);
    NumericVector iv(n), psi(n), ks(n), separability(n), score(n);
    IntegerVector n_bins(n);
    LogicalVector failed(n);
    for (size_t i = 0; i < n; ++i) {
      const ComparisonRow& r = rows[i];
      name[i] = r.name;
      generator[i] = r.generator;
      failed[i] = r.failed;
      error[i] = r.error;
      iv[i] = r.failed ? NA_REAL : r.iv;
      psi[i] = r.failed ? NA_REAL : r.psi;
      ks[i] = r.failed ? NA_REAL : r.ks;
      separability[i] = r.failed ? NA_REAL : r.separability;
      score[i] = r.failed ? NA_REAL : r.score;
      n_bins[i] = r.failed ? NA_INTEGER : r.n_bins;
    }

    return DataFrame::create(
      Named("name") = name,
      Named("generator") = generator,
      Named("iv") = iv,
      Named("n_bins") = n_bins,
      Named("psi") = psi,
      Named("ks") = ks,
      Named("separability") = separability,
      Named("score") = score,
      Named("failed") = failed,
      Named("error") = error,
      Named("stringsAsFactors") = false
    );
  } catch (const std::exception& e) {
    Rcpp::stop("Error in tb_compare: " + std::string(e.what()));
  }
}
