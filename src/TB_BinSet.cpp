#include <vector>
#include <string>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_set>

#include "TemporalBinning/BinSet.h"
#include "common/cutpoints_validator.h"

namespace TemporalBinning {

constexpr size_t BinSet::npos;

BinSet BinSet::from_cutpoints(const std::vector<double>& cutpoints) {
  std::vector<double> cp = validate_cutpoints(cutpoints);

  BinSet set;
  set.kind_ = FeatureKind::NUMERIC;
  set.bins_.reserve(cp.size() + 1);

  double lower = -std::numeric_limits<double>::infinity();
  for (double c : cp) {
    set.bins_.emplace_back(lower, c);
    lower = c;
  }
  set.bins_.emplace_back(lower, std::numeric_limits<double>::infinity());
  return set;
}

BinSet BinSet::from_groups(const std::vector<std::vector<std::string>>& groups,
                           const std::string& separator) {
  if (groups.empty()) {
    throw std::invalid_argument("A categorical partition needs at least one group.");
  }

  BinSet set;
  set.kind_ = FeatureKind::CATEGORICAL;
  set.separator_ = separator;
  set.bins_.reserve(groups.size());

  for (const auto& group : groups) {
    set.bins_.emplace_back(group);
  }
  set.validate();
  set.rebuild_index();
  return set;
}

size_t BinSet::locate(double value) const {
  if (kind_ != FeatureKind::NUMERIC || bins_.empty() || std::isnan(value)) {
    return npos;
  }
  // First bin whose (exclusive) upper bound is above the value
  auto it = std::upper_bound(bins_.begin(), bins_.end(), value,
                             [](double v, const Bin& b) { return v < b.upper_bound; });
  if (it == bins_.end()) {
    return npos;
  }
  return static_cast<size_t>(it - bins_.begin());
}

size_t BinSet::locate(const std::string& category) const {
  if (kind_ != FeatureKind::CATEGORICAL) {
    return npos;
  }
  auto it = category_index_.find(category);
  return it == category_index_.end() ? npos : it->second;
}

void BinSet::merge_adjacent(size_t left) {
  if (left + 1 >= bins_.size()) {
    throw std::out_of_range("Cannot merge bin " + std::to_string(left) +
                            " with its right neighbour in a set of " +
                            std::to_string(bins_.size()) + " bins.");
  }

  bins_[left].merge_with(bins_[left + 1]);
  bins_.erase(bins_.begin() + left + 1);

  if (kind_ == FeatureKind::CATEGORICAL) {
    rebuild_index();
  }
}

void BinSet::update_counts(const std::vector<int>& counts, const std::vector<int>& events) {
  if (counts.size() != bins_.size() || events.size() != bins_.size()) {
    throw std::invalid_argument("Count vectors must have one entry per bin.");
  }
  for (size_t i = 0; i < bins_.size(); ++i) {
    bins_[i].reset_counts();
    bins_[i].add_counts(events[i], counts[i] - events[i]);
  }
}

std::vector<double> BinSet::cutpoints() const {
  std::vector<double> cp;
  if (kind_ != FeatureKind::NUMERIC || bins_.size() < 2) {
    return cp;
  }
  cp.reserve(bins_.size() - 1);
  for (size_t i = 0; i + 1 < bins_.size(); ++i) {
    cp.push_back(bins_[i].upper_bound);
  }
  return cp;
}

std::vector<std::vector<std::string>> BinSet::groups() const {
  std::vector<std::vector<std::string>> out;
  out.reserve(bins_.size());
  for (const auto& bin : bins_) {
    out.push_back(bin.categories);
  }
  return out;
}

std::vector<std::string> BinSet::labels() const {
  std::vector<std::string> out;
  out.reserve(bins_.size());
  for (const auto& bin : bins_) {
    out.push_back(kind_ == FeatureKind::NUMERIC ? bin.interval_name()
                                                : bin.group_name(separator_));
  }
  return out;
}

std::vector<double> BinSet::event_rates() const {
  std::vector<double> rates;
  rates.reserve(bins_.size());
  for (const auto& bin : bins_) {
    rates.push_back(bin.event_rate());
  }
  return rates;
}

bool BinSet::same_partition(const BinSet& other) const {
  if (kind_ != other.kind_ || bins_.size() != other.bins_.size()) {
    return false;
  }
  for (size_t i = 0; i < bins_.size(); ++i) {
    if (kind_ == FeatureKind::NUMERIC) {
      if (bins_[i].lower_bound != other.bins_[i].lower_bound ||
          bins_[i].upper_bound != other.bins_[i].upper_bound) {
        return false;
      }
    } else if (bins_[i].categories != other.bins_[i].categories) {
      return false;
    }
  }
  return true;
}

void BinSet::validate() const {
  if (bins_.empty()) {
    throw std::invalid_argument("BinSet has no bins.");
  }

  if (kind_ == FeatureKind::NUMERIC) {
    if (!(std::isinf(bins_.front().lower_bound) && bins_.front().lower_bound < 0)) {
      throw std::invalid_argument("First bin must start at -Inf.");
    }
    if (!(std::isinf(bins_.back().upper_bound) && bins_.back().upper_bound > 0)) {
      throw std::invalid_argument("Last bin must end at +Inf.");
    }
    for (size_t i = 0; i < bins_.size(); ++i) {
      if (!(bins_[i].lower_bound < bins_[i].upper_bound)) {
        throw std::invalid_argument("Bin " + std::to_string(i) + " has an empty interval.");
      }
      if (i > 0 && bins_[i].lower_bound != bins_[i-1].upper_bound) {
        throw std::invalid_argument("Gap or overlap between bins " + std::to_string(i - 1) +
                                    " and " + std::to_string(i) + ".");
      }
    }
    return;
  }

  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < bins_.size(); ++i) {
    if (bins_[i].categories.empty()) {
      throw std::invalid_argument("Categorical bin " + std::to_string(i) + " has no categories.");
    }
    for (const auto& cat : bins_[i].categories) {
      if (cat.empty()) {
        throw std::invalid_argument("Category names cannot be empty.");
      }
      if (!seen.insert(cat).second) {
        throw std::invalid_argument("Category '" + cat + "' appears in more than one bin.");
      }
    }
  }
}

void BinSet::rebuild_index() {
  category_index_.clear();
  for (size_t i = 0; i < bins_.size(); ++i) {
    for (const auto& cat : bins_[i].categories) {
      category_index_[cat] = i;
    }
  }
}

} // namespace TemporalBinning
