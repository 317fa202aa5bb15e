#ifndef TEMPORAL_BINNING_ERRORS_H
#define TEMPORAL_BINNING_ERRORS_H

#include <stdexcept>
#include <string>

namespace TemporalBinning {

/**
 * @brief Base class for domain failures of the binning engine
 *
 * Input and configuration mistakes are reported with std::invalid_argument;
 * the classes below describe data or constraint situations that a search can
 * record and move past.
 */
class TemporalBinningError : public std::runtime_error {
public:
  explicit TemporalBinningError(const std::string& message)
    : std::runtime_error(message) {}

  /// Short identifier used in trial logs and R results
  virtual const char* kind() const noexcept { return "TemporalBinningError"; }
};

/// Fewer than two distinct cohorts while stability checking is requested
class EmptyCohortError : public TemporalBinningError {
public:
  explicit EmptyCohortError(const std::string& message)
    : TemporalBinningError(message) {}
  const char* kind() const noexcept override { return "EmptyCohortError"; }
};

/// A bin without population
class InsufficientDataError : public TemporalBinningError {
public:
  explicit InsufficientDataError(const std::string& message)
    : TemporalBinningError(message) {}
  const char* kind() const noexcept override { return "InsufficientDataError"; }
};

/// Hard constraints that cannot hold at the same time
class UnsatisfiableConstraintError : public TemporalBinningError {
public:
  explicit UnsatisfiableConstraintError(const std::string& message)
    : TemporalBinningError(message) {}
  const char* kind() const noexcept override { return "UnsatisfiableConstraintError"; }
};

} // namespace TemporalBinning

#endif // TEMPORAL_BINNING_ERRORS_H
