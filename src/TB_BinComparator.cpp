#include <vector>
#include <string>
#include <stdexcept>
#include <utility>

#include "TemporalBinning/BinComparator.h"
#include "TemporalBinning/Errors.h"

namespace TemporalBinning {

BinComparator::BinComparator(std::ostream* log, bool verbose)
  : log_(log), verbose_(verbose) {}

void BinComparator::add(const std::string& name, std::shared_ptr<const SplitGenerator> generator,
                        const BinningConfig& config) {
  if (!generator) {
    throw std::invalid_argument("Comparison entry needs a split generator.");
  }
  Entry entry;
  entry.name = name.empty() ? generator->name() : name;
  for (const auto& e : entries_) {
    if (e.name == entry.name) {
      throw std::invalid_argument("Duplicate comparison name '" + entry.name + "'.");
    }
  }
  entry.generator = std::move(generator);
  entry.config = config;
  entries_.push_back(entry);
}

const std::vector<ComparisonRow>& BinComparator::compare(const ObservationSet& obs) {
  results_.clear();
  results_.reserve(entries_.size());

  for (const auto& entry : entries_) {
    ComparisonRow row;
    row.name = entry.name;
    row.generator = entry.generator->name();

    try {
      BinningEngine engine(entry.config, log_, verbose_);
      row.fit = engine.fit(obs, *entry.generator);
      row.iv = row.fit.iv;
      row.n_bins = static_cast<int>(row.fit.bins.size());
      row.psi = row.fit.stability.psi;
      row.ks = row.fit.stability.ks;
      row.separability = row.fit.stability.separability;
      row.score = row.fit.score;
    } catch (const TemporalBinningError& e) {
      row.failed = true;
      row.error_kind = e.kind();
      row.error = e.what();
    } catch (const std::invalid_argument& e) {
      row.failed = true;
      row.error_kind = "InvalidArgument";
      row.error = e.what();
    }

    if (row.failed && log_) {
      *log_ << "Warning: Configuration '" << row.name << "' failed: " << row.error << std::endl;
    }
    results_.push_back(row);
  }

  compared_ = true;
  return results_;
}

const std::vector<ComparisonRow>& BinComparator::results() const {
  if (!compared_) {
    throw std::logic_error("Run compare() before reading results.");
  }
  return results_;
}

int BinComparator::best() const {
  int best_index = -1;
  for (size_t i = 0; i < results().size(); ++i) {
    if (results_[i].failed) continue;
    if (best_index < 0 || results_[i].score > results_[best_index].score) {
      best_index = static_cast<int>(i);
    }
  }
  return best_index;
}

} // namespace TemporalBinning
