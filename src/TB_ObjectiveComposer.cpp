#include <vector>
#include <string>
#include <cmath>
#include <stdexcept>

#include "TemporalBinning/ObjectiveComposer.h"
#include "common/woe_iv_utils.h"

namespace TemporalBinning {

void ObjectiveWeights::validate() const {
  if (!std::isfinite(separability) || !std::isfinite(iv) ||
      !std::isfinite(ks) || !std::isfinite(psi)) {
    throw std::invalid_argument("Objective weights must be finite.");
  }
}

ObjectiveComposer::ObjectiveComposer(const ObjectiveWeights& weights, double floor)
  : weights_(weights), floor_(floor) {
  weights_.validate();
  if (!(floor_ > 0.0 && floor_ < 1.0)) {
    throw std::invalid_argument("Share floor must be in (0, 1).");
  }
}

double ObjectiveComposer::information_value(const BinSet& bins, int* substitutions) const {
  return compute_total_iv_bins(bins.bins(), floor_, substitutions);
}

std::vector<WoeEntry> ObjectiveComposer::woe_table(const BinSet& bins, int* substitutions) const {
  int total_pos = 0;
  int total_neg = 0;
  for (const auto& bin : bins.bins()) {
    total_pos += bin.count_pos;
    total_neg += bin.count_neg;
  }

  std::vector<std::string> labels = bins.labels();
  std::vector<WoeEntry> table;
  table.reserve(bins.size());

  for (size_t i = 0; i < bins.size(); ++i) {
    const Bin& bin = bins[i];
    WoeEntry entry;
    entry.id = static_cast<int>(i) + 1;
    entry.label = labels[i];
    entry.count = bin.count;
    entry.count_pos = bin.count_pos;
    entry.count_neg = bin.count_neg;
    entry.event_rate = bin.event_rate();
    entry.woe = compute_woe(bin.count_pos, bin.count_neg, total_pos, total_neg,
                            floor_, substitutions);
    entry.iv = compute_iv(bin.count_pos, bin.count_neg, total_pos, total_neg, floor_);
    table.push_back(entry);
  }

  return table;
}

double ObjectiveComposer::score(const StabilityMetrics& metrics, double iv) const {
  return weights_.separability * metrics.separability +
         weights_.iv * iv +
         weights_.ks * metrics.ks -
         weights_.psi * metrics.psi;
}

} // namespace TemporalBinning
