#include <vector>
#include <string>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "TemporalBinning/StabilityScorer.h"
#include "TemporalBinning/Errors.h"
#include "common/safe_math.h"
#include "common/woe_iv_utils.h"
#include "common/monotonicity_utils.h"

namespace TemporalBinning {

void StabilityOptions::validate() const {
  if (!(psi_floor > 0.0 && psi_floor < 1.0)) {
    throw std::invalid_argument("psi_floor must be in (0, 1), got: " + std::to_string(psi_floor));
  }
  if (low_frequency_threshold < 0) {
    throw std::invalid_argument("low_frequency_threshold must be non-negative.");
  }
  if (!std::isfinite(penalty) || penalty < 0.0) {
    throw std::invalid_argument("penalty must be a finite non-negative number.");
  }
}

StabilityScorer::StabilityScorer(const StabilityOptions& options)
  : options_(options) {
  options_.validate();
}

size_t StabilityScorer::reference_index(const CohortTable& table) const {
  if (!options_.use_reference_cohort) {
    return 0;  // cohort ids are sorted, so index 0 is the earliest
  }
  int idx = table.cohort_index(options_.reference_cohort);
  if (idx < 0) {
    throw std::invalid_argument("Reference cohort " + std::to_string(options_.reference_cohort) +
                                " is not present in the data.");
  }
  return static_cast<size_t>(idx);
}

double StabilityScorer::psi(const CohortTable& table, size_t cohort, size_t reference,
                            int* substitutions) const {
  if (cohort == reference) return 0.0;

  const int total_c = table.cohort_count(cohort);
  const int total_r = table.cohort_count(reference);

  std::vector<double> terms;
  terms.reserve(table.n_bins());
  for (size_t b = 0; b < table.n_bins(); ++b) {
    double p = floored_share(table.cell(b, cohort).count, total_c, options_.psi_floor, substitutions);
    double q = floored_share(table.cell(b, reference).count, total_r, options_.psi_floor, substitutions);
    terms.push_back(divergence_term(p, q));
  }
  return std::max(0.0, compensated_sum(terms));
}

double StabilityScorer::ks(const CohortTable& table) {
  const double total_pos = static_cast<double>(table.total_events());
  const double total_neg = static_cast<double>(table.total_count() - table.total_events());

  double cum_pos = 0.0;
  double cum_neg = 0.0;
  double max_ks = 0.0;

  for (size_t b = 0; b < table.n_bins(); ++b) {
    int events = table.bin_events(b);
    cum_pos += events;
    cum_neg += table.bin_count(b) - events;
    double diff = std::abs(safe_divide(cum_pos, total_pos) - safe_divide(cum_neg, total_neg));
    max_ks = std::max(max_ks, diff);
  }

  return max_ks;
}

double StabilityScorer::ks_over_time(const CohortTable& table) {
  if (table.n_cohorts() < 2) return 0.0;

  std::vector<double> first;
  std::vector<double> last;
  for (size_t b = 0; b < table.n_bins(); ++b) {
    double r_first = table.cell(b, 0).event_rate();
    double r_last = table.cell(b, table.n_cohorts() - 1).event_rate();
    if (!std::isnan(r_first)) first.push_back(r_first);
    if (!std::isnan(r_last)) last.push_back(r_last);
  }
  if (first.empty() || last.empty()) return 0.0;

  std::sort(first.begin(), first.end());
  std::sort(last.begin(), last.end());

  // Largest gap between the two empirical CDFs, evaluated at every sample point
  const double n1 = static_cast<double>(first.size());
  const double n2 = static_cast<double>(last.size());
  size_t i = 0, j = 0;
  double d = 0.0;
  while (i < first.size() && j < last.size()) {
    double x = std::min(first[i], last[j]);
    while (i < first.size() && first[i] <= x) ++i;
    while (j < last.size() && last[j] <= x) ++j;
    d = std::max(d, std::abs(i / n1 - j / n2));
  }
  return d;
}

double StabilityScorer::separability(const CohortTable& table, int* skipped) const {
  const size_t n_bins = table.n_bins();
  if (n_bins < 2) return 0.0;

  const size_t n_cohorts = table.n_cohorts();
  std::vector<double> pair_distances;

  for (size_t a = 0; a < n_bins; ++a) {
    for (size_t b = a + 1; b < n_bins; ++b) {
      double sum = 0.0;
      int used = 0;
      for (size_t c = 0; c < n_cohorts; ++c) {
        double ra = table.cell(a, c).event_rate();
        double rb = table.cell(b, c).event_rate();
        if (std::isnan(ra) || std::isnan(rb)) {
          if (skipped) ++(*skipped);
          continue;
        }
        sum += std::abs(ra - rb);
        used++;
      }
      if (used > 0) {
        pair_distances.push_back(sum / used);
      }
    }
  }

  double score = pair_distances.empty()
                   ? 0.0
                   : compensated_sum(pair_distances) / static_cast<double>(pair_distances.size());

  if (options_.penalize_low_frequency) {
    for (size_t b = 0; b < n_bins; ++b) {
      int min_count = std::numeric_limits<int>::max();
      for (size_t c = 0; c < n_cohorts; ++c) {
        min_count = std::min(min_count, table.cell(b, c).count);
      }
      if (min_count < options_.low_frequency_threshold) {
        score -= options_.penalty;
      }
    }
  }

  if (options_.penalize_inversions) {
    for (size_t b = 0; b < n_bins; ++b) {
      std::vector<double> series;
      for (size_t c = 0; c < n_cohorts; ++c) {
        double r = table.cell(b, c).event_rate();
        if (!std::isnan(r)) series.push_back(r);
      }
      if (count_trend_changes(series) > 0) {
        score -= options_.penalty;
      }
    }
  }

  return score;
}

StabilityMetrics StabilityScorer::score(const CohortTable& table) const {
  if (table.n_bins() == 0 || table.n_cohorts() == 0) {
    throw std::invalid_argument("Cannot score an empty cohort table.");
  }

  for (size_t b = 0; b < table.n_bins(); ++b) {
    if (table.bin_count(b) == 0) {
      throw InsufficientDataError("Bin " + std::to_string(b) + " has zero population.");
    }
  }

  StabilityMetrics m;
  m.cohort_ids = table.cohort_ids();

  const size_t ref = reference_index(table);
  m.reference_cohort = table.cohort_ids()[ref];

  // PSI against the reference cohort
  m.psi_by_cohort.assign(table.n_cohorts(), 0.0);
  if (table.n_cohorts() < 2) {
    m.notes.push_back("Single cohort: PSI set to 0 (nothing to compare).");
  } else {
    double sum = 0.0;
    int compared = 0;
    for (size_t c = 0; c < table.n_cohorts(); ++c) {
      if (c == ref) continue;
      double value = psi(table, c, ref, &m.epsilon_substitutions);
      m.psi_by_cohort[c] = value;
      m.psi_max = std::max(m.psi_max, value);
      sum += value;
      compared++;
    }
    m.psi_mean = sum / compared;
  }
  m.psi = options_.psi_aggregation == PsiAggregation::MAX ? m.psi_max : m.psi_mean;

  if (m.epsilon_substitutions > 0) {
    m.notes.push_back(std::to_string(m.epsilon_substitutions) +
                      " zero population shares replaced by the PSI floor.");
  }

  m.ks = ks(table);
  m.ks_over_time = ks_over_time(table);
  m.separability = separability(table, &m.skipped_comparisons);

  if (m.skipped_comparisons > 0) {
    m.notes.push_back(std::to_string(m.skipped_comparisons) +
                      " bin-pair comparisons skipped for undefined cohort event rates.");
  }

  // Per-bin event-rate series
  m.event_rates.resize(table.n_bins());
  m.bin_rate_sd.resize(table.n_bins());
  m.bin_rate_range.resize(table.n_bins());
  for (size_t b = 0; b < table.n_bins(); ++b) {
    std::vector<double> defined;
    m.event_rates[b].resize(table.n_cohorts());
    for (size_t c = 0; c < table.n_cohorts(); ++c) {
      double r = table.cell(b, c).event_rate();
      m.event_rates[b][c] = r;
      if (std::isnan(r)) {
        m.undefined_cells++;
      } else {
        defined.push_back(r);
      }
    }
    m.bin_rate_sd[b] = sample_sd(defined);
    if (!defined.empty()) {
      auto mm = std::minmax_element(defined.begin(), defined.end());
      m.bin_rate_range[b] = *mm.second - *mm.first;
    }
  }

  if (m.undefined_cells > 0) {
    m.notes.push_back(std::to_string(m.undefined_cells) +
                      " (bin, cohort) cells are empty; their event rate is undefined.");
  }

  return m;
}

} // namespace TemporalBinning
