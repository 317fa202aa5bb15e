#include <vector>
#include <string>
#include <map>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "TemporalBinning/SplitGenerator.h"
#include "TemporalBinning/Utilities.h"
#include "common/woe_iv_utils.h"

namespace TemporalBinning {

namespace {

void require_kind(const ObservationSet& obs, FeatureKind kind, const std::string& generator) {
  if (obs.kind() != kind) {
    throw std::invalid_argument(
      "Split generator '" + generator + "' expects a " +
      (kind == FeatureKind::NUMERIC ? std::string("numeric") : std::string("categorical")) +
      " feature."
    );
  }
}

int count_unique_sorted(const std::vector<double>& sorted) {
  if (sorted.empty()) return 0;
  int n_unique = 1;
  for (size_t i = 1; i < sorted.size(); ++i) {
    if (sorted[i] != sorted[i - 1]) n_unique++;
  }
  return n_unique;
}

// Category group with its totals, used while merging
struct CategoryGroup {
  std::vector<std::string> categories;
  int count_pos = 0;
  int count_neg = 0;

  int total() const { return count_pos + count_neg; }
  double event_rate() const {
    return total() > 0 ? static_cast<double>(count_pos) / total() : 0.0;
  }
};

} // namespace

void SplitParameters::validate() const {
  if (max_bins < 1) {
    throw std::invalid_argument("max_bins must be at least 1.");
  }
  if (!std::isfinite(min_bin_size) || min_bin_size < 0.0) {
    throw std::invalid_argument("min_bin_size must be a finite non-negative number.");
  }
}

// =============================================================================
// QUANTILE
// =============================================================================

BinSet QuantileSplit::produce(const ObservationSet& obs, const SplitParameters& params) const {
  require_kind(obs, FeatureKind::NUMERIC, name());
  params.validate();

  std::vector<double> sorted = obs.numeric_values();
  std::sort(sorted.begin(), sorted.end());
  const size_t n = sorted.size();

  int n_bins = std::min(params.max_bins, count_unique_sorted(sorted));
  if (params.min_bin_size > 0.0) {
    // Compared in double: 1 / min_bin_size may not fit in an int
    double cap = std::floor(1.0 / params.min_bin_size + EPSILON);
    if (cap < n_bins) n_bins = std::max(1, static_cast<int>(cap));
  }

  std::vector<double> cutpoints;
  for (int j = 1; j < n_bins; ++j) {
    size_t idx = static_cast<size_t>(j) * n / static_cast<size_t>(n_bins);
    if (idx == 0) continue;
    // Cut at the first value above the quantile so ties stay in one bin
    auto it = std::upper_bound(sorted.begin(), sorted.end(), sorted[idx - 1]);
    if (it != sorted.end()) {
      cutpoints.push_back(*it);
    }
  }

  return BinSet::from_cutpoints(cutpoints);
}

// =============================================================================
// EQUAL WIDTH
// =============================================================================

BinSet EqualWidthSplit::produce(const ObservationSet& obs, const SplitParameters& params) const {
  require_kind(obs, FeatureKind::NUMERIC, name());
  params.validate();

  const std::vector<double>& values = obs.numeric_values();
  auto mm = std::minmax_element(values.begin(), values.end());
  double min_val = *mm.first;
  double max_val = *mm.second;

  std::vector<double> sorted = values;
  std::sort(sorted.begin(), sorted.end());
  int n_bins = std::min(params.max_bins, count_unique_sorted(sorted));

  std::vector<double> cutpoints;
  if (max_val > min_val && n_bins > 1) {
    double width = (max_val - min_val) / n_bins;
    for (int j = 1; j < n_bins; ++j) {
      cutpoints.push_back(min_val + j * width);
    }
  }

  return BinSet::from_cutpoints(cutpoints);
}

// =============================================================================
// K-MEANS
// =============================================================================

KMeansSplit::KMeansSplit(int max_iterations, double tolerance)
  : max_iterations_(max_iterations), tolerance_(tolerance) {
  if (max_iterations_ < 1) {
    throw std::invalid_argument("max_iterations must be at least 1.");
  }
  if (!std::isfinite(tolerance_) || tolerance_ < 0.0) {
    throw std::invalid_argument("tolerance must be a finite non-negative number.");
  }
}

BinSet KMeansSplit::produce(const ObservationSet& obs, const SplitParameters& params) const {
  require_kind(obs, FeatureKind::NUMERIC, name());
  params.validate();

  std::vector<double> sorted = obs.numeric_values();
  std::sort(sorted.begin(), sorted.end());

  int n_bins = std::min(params.max_bins, count_unique_sorted(sorted));
  double min_val = sorted.front();
  double range = sorted.back() - min_val;
  if (n_bins <= 1 || range < EPSILON) {
    return BinSet::from_cutpoints(std::vector<double>());
  }

  // Initialize centroids evenly spaced
  std::vector<double> centroids;
  for (int i = 0; i < n_bins; ++i) {
    centroids.push_back(min_val + (i + 0.5) * range / n_bins);
  }

  for (int iter = 0; iter < max_iterations_; ++iter) {
    // Sorted values and sorted centroids: each cluster is a contiguous run
    std::vector<double> sums(centroids.size(), 0.0);
    std::vector<int> counts(centroids.size(), 0);
    size_t c = 0;
    for (double v : sorted) {
      while (c + 1 < centroids.size() && v >= (centroids[c] + centroids[c + 1]) / 2.0) {
        ++c;
      }
      sums[c] += v;
      counts[c]++;
    }

    std::vector<double> updated;
    double shift = 0.0;
    for (size_t j = 0; j < centroids.size(); ++j) {
      if (counts[j] == 0) continue;
      double mean = sums[j] / counts[j];
      shift = std::max(shift, std::fabs(mean - centroids[j]));
      updated.push_back(mean);
    }

    bool dropped = updated.size() != centroids.size();
    centroids.swap(updated);
    if (centroids.size() <= 1) break;
    if (!dropped && shift <= tolerance_ * range) break;
  }

  std::vector<double> cutpoints;
  for (size_t j = 1; j < centroids.size(); ++j) {
    cutpoints.push_back((centroids[j - 1] + centroids[j]) / 2.0);
  }
  return BinSet::from_cutpoints(cutpoints);
}

// =============================================================================
// CATEGORICAL
// =============================================================================

CategoricalSplit::CategoricalSplit(double rare_threshold, const std::string& separator)
  : rare_threshold_(rare_threshold), separator_(separator) {
  if (!std::isfinite(rare_threshold_) || rare_threshold_ < 0.0 || rare_threshold_ >= 1.0) {
    throw std::invalid_argument("rare_threshold must be in [0, 1).");
  }
}

BinSet CategoricalSplit::produce(const ObservationSet& obs, const SplitParameters& params) const {
  require_kind(obs, FeatureKind::CATEGORICAL, name());
  params.validate();

  // Ordered map keeps the grouping independent of storage order
  std::map<std::string, CategoryGroup> stats;
  const std::vector<std::string>& values = obs.categorical_values();
  const std::vector<int>& labels = obs.labels();
  for (size_t i = 0; i < values.size(); ++i) {
    CategoryGroup& g = stats[values[i]];
    if (labels[i] == 1) g.count_pos++;
    else g.count_neg++;
  }

  const double n = static_cast<double>(obs.size());
  std::vector<CategoryGroup> groups;
  CategoryGroup rare;
  for (auto& kv : stats) {
    if (static_cast<double>(kv.second.total()) / n < rare_threshold_) {
      rare.categories.push_back(kv.first);
      rare.count_pos += kv.second.count_pos;
      rare.count_neg += kv.second.count_neg;
    } else {
      kv.second.categories.push_back(kv.first);
      groups.push_back(kv.second);
    }
  }
  if (!rare.categories.empty()) {
    groups.push_back(rare);
  }

  std::stable_sort(groups.begin(), groups.end(),
                   [](const CategoryGroup& a, const CategoryGroup& b) {
                     return a.event_rate() < b.event_rate();
                   });

  const int total_pos = obs.total_pos();
  const int total_neg = obs.total_neg();

  while (static_cast<int>(groups.size()) > params.max_bins) {
    size_t best = 0;
    double best_loss = std::numeric_limits<double>::max();
    for (size_t i = 0; i + 1 < groups.size(); ++i) {
      double loss = merge_iv_loss(groups[i].count_pos, groups[i].count_neg,
                                  groups[i + 1].count_pos, groups[i + 1].count_neg,
                                  total_pos, total_neg);
      if (loss < best_loss - EPSILON) {
        best_loss = loss;
        best = i;
      }
    }
    CategoryGroup& left = groups[best];
    const CategoryGroup& right = groups[best + 1];
    left.categories.insert(left.categories.end(), right.categories.begin(), right.categories.end());
    left.count_pos += right.count_pos;
    left.count_neg += right.count_neg;
    groups.erase(groups.begin() + best + 1);
  }

  std::vector<std::vector<std::string>> partition;
  partition.reserve(groups.size());
  for (const auto& g : groups) {
    partition.push_back(g.categories);
  }
  return BinSet::from_groups(partition, separator_);
}

// =============================================================================
// FIXED
// =============================================================================

FixedSplit::FixedSplit(BinSet bins)
  : bins_(std::move(bins)) {
  bins_.validate();
}

BinSet FixedSplit::produce(const ObservationSet& obs, const SplitParameters& params) const {
  require_kind(obs, bins_.kind(), name());
  (void)params;
  return bins_;
}

std::unique_ptr<SplitGenerator> make_split_generator(const std::string& name) {
  if (name == "quantile") return std::unique_ptr<SplitGenerator>(new QuantileSplit());
  if (name == "uniform") return std::unique_ptr<SplitGenerator>(new EqualWidthSplit());
  if (name == "kmeans") return std::unique_ptr<SplitGenerator>(new KMeansSplit());
  if (name == "categorical") return std::unique_ptr<SplitGenerator>(new CategoricalSplit());
  throw std::invalid_argument("Unknown split generator '" + name +
                              "'. Use 'quantile', 'uniform', 'kmeans' or 'categorical'.");
}

} // namespace TemporalBinning
