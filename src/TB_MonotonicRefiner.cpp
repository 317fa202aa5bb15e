#include <vector>
#include <string>
#include <sstream>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "TemporalBinning/MonotonicRefiner.h"
#include "TemporalBinning/Errors.h"
#include "common/monotonicity_utils.h"
#include "common/woe_iv_utils.h"

namespace TemporalBinning {

void RefinerConfig::validate() const {
  if (!std::isfinite(min_event_rate_diff) || min_event_rate_diff < 0.0) {
    throw std::invalid_argument("min_event_rate_diff must be a finite non-negative number.");
  }
  if (!std::isfinite(min_bin_size) || min_bin_size < 0.0) {
    throw std::invalid_argument("min_bin_size must be a finite non-negative number.");
  }
  if (min_bins < 1) {
    throw std::invalid_argument("min_bins must be at least 1.");
  }
  if (max_bins < 0) {
    throw std::invalid_argument("max_bins must be non-negative (0 means unlimited).");
  }
  if (min_bin_size > 1.0) {
    throw UnsatisfiableConstraintError(
      "min_bin_size (" + std::to_string(min_bin_size) +
      ") exceeds 1.0: no bin can hold more than all observations."
    );
  }
  if (max_bins > 0 && max_bins < min_bins) {
    throw UnsatisfiableConstraintError(
      "max_bins (" + std::to_string(max_bins) + ") is below min_bins (" +
      std::to_string(min_bins) + ")."
    );
  }
}

std::string merge_reason_to_string(MergeReason reason) {
  switch (reason) {
    case MergeReason::MIN_SIZE: return "min_size";
    case MergeReason::MONOTONICITY: return "monotonicity";
    case MergeReason::MIN_GAP: return "min_gap";
    case MergeReason::MAX_BINS: return "max_bins";
  }
  return "unknown";
}

MonotonicRefiner::MonotonicRefiner(const RefinerConfig& config, std::ostream* log, bool verbose)
  : config_(config), log_(log), verbose_(verbose) {
  config_.validate();
}

void MonotonicRefiner::log_info(const std::string& message) const {
  if (verbose_ && log_) {
    *log_ << "Info: " << message << std::endl;
  }
}

void MonotonicRefiner::add_warning(RefinementResult& result, const std::string& message) const {
  result.warnings.push_back(message);
  if (verbose_ && log_) {
    *log_ << "Warning: " << message << std::endl;
  }
}

MonotonicTrend MonotonicRefiner::resolve_direction(const BinSet& bins,
                                                   const ObservationSet& obs) const {
  if (config_.trend != MonotonicTrend::AUTO) {
    return config_.trend;
  }
  if (obs.kind() == FeatureKind::NUMERIC) {
    return detect_trend_from_correlation(obs.numeric_values(), obs.labels());
  }
  // Categorical groups have no numeric order: use the slope over ordinal positions
  std::vector<int> weights;
  weights.reserve(bins.size());
  for (const auto& bin : bins.bins()) {
    weights.push_back(bin.count);
  }
  return detect_trend_welford(bins.event_rates(), weights);
}

size_t MonotonicRefiner::undersized_merge(const BinSet& bins, double floor, bool* found) const {
  *found = false;
  const size_t n = bins.size();
  for (size_t i = 0; i < n; ++i) {
    const Bin& bin = bins[i];
    if (bin.count > 0 && static_cast<double>(bin.count) >= floor - EPSILON) {
      continue;
    }
    *found = true;
    if (i == 0) return 0;
    if (i == n - 1) return n - 2;

    double rate = bin.event_rate();
    double diff_left = std::abs(rate - bins[i - 1].event_rate());
    double diff_right = std::abs(rate - bins[i + 1].event_rate());
    return diff_right < diff_left ? i : i - 1;
  }
  return 0;
}

size_t MonotonicRefiner::cheapest_merge(const BinSet& bins) const {
  int total_pos = 0;
  int total_neg = 0;
  for (const auto& bin : bins.bins()) {
    total_pos += bin.count_pos;
    total_neg += bin.count_neg;
  }

  size_t best = 0;
  double best_loss = std::numeric_limits<double>::max();
  for (size_t i = 0; i + 1 < bins.size(); ++i) {
    double loss = merge_iv_loss(bins[i].count_pos, bins[i].count_neg,
                                bins[i + 1].count_pos, bins[i + 1].count_neg,
                                total_pos, total_neg);
    if (loss < best_loss - EPSILON) {
      best_loss = loss;
      best = i;
    }
  }
  return best;
}

RefinementResult MonotonicRefiner::refine(const BinSet& initial, const ObservationSet& obs,
                                          const CohortAggregator& aggregator) const {
  initial.validate();

  if (static_cast<int>(initial.size()) < config_.min_bins) {
    throw UnsatisfiableConstraintError(
      "Initial partition has " + std::to_string(initial.size()) +
      " bins, fewer than min_bins (" + std::to_string(config_.min_bins) + ")."
    );
  }

  RefinementResult result;
  BinSet bins = initial;

  result.assignment = aggregator.assign(bins, obs);
  result.table = aggregator.tally(result.assignment, bins.size(), obs);
  bins.update_counts(result.table.bin_counts(), result.table.bin_event_counts());

  result.direction = resolve_direction(bins, obs);
  const double floor = config_.min_bin_size * static_cast<double>(obs.size());

  log_info("Refining " + std::to_string(bins.size()) + " initial bins, direction '" +
           monotonic_trend_to_string(result.direction) + "'.");

  int iteration = 0;
  while (true) {
    if (bins.size() <= 1) {
      add_warning(result, "Only one bin remains after refinement.");
      break;
    }

    std::vector<double> rates = bins.event_rates();
    MergeReason reason = MergeReason::MIN_SIZE;
    bool found = false;
    size_t left = undersized_merge(bins, floor, &found);

    if (!found) {
      int v = find_monotonicity_violation(rates, result.direction);
      if (v >= 0) {
        left = static_cast<size_t>(v);
        reason = MergeReason::MONOTONICITY;
        found = true;
      }
    }
    if (!found) {
      int v = find_gap_violation(rates, config_.min_event_rate_diff);
      if (v >= 0) {
        left = static_cast<size_t>(v);
        reason = MergeReason::MIN_GAP;
        found = true;
      }
    }
    if (!found && config_.max_bins > 0 && static_cast<int>(bins.size()) > config_.max_bins) {
      left = cheapest_merge(bins);
      reason = MergeReason::MAX_BINS;
      found = true;
    }

    if (!found) {
      break;
    }

    if (static_cast<int>(bins.size()) <= config_.min_bins) {
      throw UnsatisfiableConstraintError(
        "A " + merge_reason_to_string(reason) + " merge of bins " + std::to_string(left) +
        " and " + std::to_string(left + 1) + " is required but the partition already has min_bins (" +
        std::to_string(config_.min_bins) + ") bins."
      );
    }

    MergeRecord record;
    record.iteration = iteration;
    record.left = left;
    record.reason = reason;
    record.rates_before = rates;
    result.merges.push_back(record);

    log_info("Iteration " + std::to_string(iteration) + ": merging bins " +
             std::to_string(left) + " and " + std::to_string(left + 1) + " (" +
             merge_reason_to_string(reason) + ").");

    bins.merge_adjacent(left);
    for (auto& a : result.assignment) {
      if (a > left) --a;
    }
    result.table = aggregator.tally(result.assignment, bins.size(), obs);
    bins.update_counts(result.table.bin_counts(), result.table.bin_event_counts());
    iteration++;
  }

  result.iterations = iteration;
  result.bins = bins;

  log_info("Refinement finished with " + std::to_string(bins.size()) + " bins after " +
           std::to_string(iteration) + " merges.");

  return result;
}

} // namespace TemporalBinning
