/**
 * @file woe_iv_utils.h
 * @brief Weight of Evidence, Information Value and PSI terms
 *
 * All divergences use share flooring: a zero event or population share is
 * replaced by SHARE_FLOOR before the logarithm. This biases the result for
 * near-empty bins, so callers count every substitution and report it.
 *
 * Scientific References:
 * - Good, I. J. (1950). "Probability and the Weighing of Evidence".
 * - Kullback, S., & Leibler, R. A. (1951). "On information and sufficiency".
 * - Siddiqi, N. (2006). "Credit Risk Scorecards" (Chapter 3: WoE and IV).
 */

#ifndef TEMPORAL_BINNING_WOE_IV_UTILS_H
#define TEMPORAL_BINNING_WOE_IV_UTILS_H

#include "TemporalBinning/Utilities.h"
#include "safe_math.h"

namespace TemporalBinning {

/**
 * @brief Symmetric divergence term (a - b) * ln(a / b)
 *
 * Used for both IV (event vs non-event share) and PSI (cohort vs reference
 * share). Always non-negative and exactly 0 when a == b.
 */
inline double divergence_term(double a, double b) {
  if (a == b) return 0.0;
  return (a - b) * std::log(a / b);
}

/**
 * @brief Compute Weight of Evidence for a bin
 *
 * @param pos Event count in bin
 * @param neg Non-event count in bin
 * @param total_pos Total events across all bins
 * @param total_neg Total non-events across all bins
 * @param floor Floor for zero shares
 * @param substitutions Incremented for each floored share (optional)
 * @return ln(event_share / nonevent_share), clamped to [MIN_WOE, MAX_WOE]
 */
inline double compute_woe(int pos, int neg, int total_pos, int total_neg,
                          double floor = SHARE_FLOOR, int* substitutions = nullptr) {
  double dist_pos = floored_share(pos, total_pos, floor, substitutions);
  double dist_neg = floored_share(neg, total_neg, floor, substitutions);
  return clamp(std::log(dist_pos / dist_neg), MIN_WOE, MAX_WOE);
}

/**
 * @brief Compute Information Value contribution for a bin
 *
 * IV_i = (event_share_i - nonevent_share_i) * ln(event_share_i / nonevent_share_i)
 */
inline double compute_iv(int pos, int neg, int total_pos, int total_neg,
                         double floor = SHARE_FLOOR, int* substitutions = nullptr) {
  double dist_pos = floored_share(pos, total_pos, floor, substitutions);
  double dist_neg = floored_share(neg, total_neg, floor, substitutions);
  double iv = divergence_term(dist_pos, dist_neg);
  return std::isfinite(iv) ? iv : 0.0;
}

/**
 * @brief Total IV of adjacent bins after a hypothetical merge minus before
 *
 * @return Information lost by merging bins (pos_a, neg_a) and (pos_b, neg_b)
 */
inline double merge_iv_loss(int pos_a, int neg_a, int pos_b, int neg_b,
                            int total_pos, int total_neg, double floor = SHARE_FLOOR) {
  double before = compute_iv(pos_a, neg_a, total_pos, total_neg, floor) +
                  compute_iv(pos_b, neg_b, total_pos, total_neg, floor);
  double after = compute_iv(pos_a + pos_b, neg_a + neg_b, total_pos, total_neg, floor);
  return before - after;
}

/**
 * @brief Compute total IV from bin containers
 *
 * @tparam BinType Bin structure exposing count_pos and count_neg
 */
template<typename BinType>
inline double compute_total_iv_bins(const std::vector<BinType>& bins,
                                    double floor = SHARE_FLOOR,
                                    int* substitutions = nullptr) {
  if (bins.empty()) return 0.0;

  int total_pos = 0;
  int total_neg = 0;
  for (const auto& bin : bins) {
    total_pos += bin.count_pos;
    total_neg += bin.count_neg;
  }

  std::vector<double> iv_values;
  iv_values.reserve(bins.size());
  for (const auto& bin : bins) {
    iv_values.push_back(compute_iv(bin.count_pos, bin.count_neg, total_pos, total_neg,
                                   floor, substitutions));
  }

  return compensated_sum(iv_values);
}

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_WOE_IV_UTILS_H
