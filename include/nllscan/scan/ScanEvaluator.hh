#pragma once

#include <array>
#include <memory>
#include <optional>

#include "nllscan/grid/GridReconstructor.hh"
#include "nllscan/interp/Interpolator1D.hh"
#include "nllscan/interp/Interpolator2D.hh"
#include "nllscan/scan/ScanResult.hh"
#include "nllscan/scan/ScanSet.hh"
#include "nllscan/stats/StatisticsConfig.hh"

namespace nllscan {

/// Result of a 1D scan together with the interpolant it was derived from.
struct ScanEvaluation1D {
  ScanResult1D                          result;
  std::shared_ptr<const Interpolator1D> interpolator;
};

/// Result of a 2D scan, its interpolant and the grid prepared for display
/// (repaired if configured, clamped to a positive floor if z_log is set).
/// The interpolant is built from the defined samples, not from the grid.
struct ScanEvaluation2D {
  ScanResult2D                          result;
  /// const does not make Eval thread-safe (the triangulation keeps a search
  /// cache); serialize calls or give each thread its own Interpolator2D.
  std::shared_ptr<const Interpolator2D> interpolator;
  ReconstructedGrid                     grid;
};

/**
 * Turns a 1D or 2D likelihood scan into best-fit values and 1/2 sigma
 * intervals.
 *
 *   1D: samples -> Interpolator1D -> MinimumLocator -> IntervalExtractor (ndof 1)
 *   2D: samples -> GridReconstructor -> Interpolator2D -> MinimumLocator
 *       -> IntervalExtractor per axis through the minimum (ndof 2)
 *
 * Every call builds its own intermediate state; an evaluator can be shared
 * between threads, the returned 2D interpolant cannot.
 */
class ScanEvaluator {
public:
  explicit ScanEvaluator(stats::StatisticsConfig cfg = {});

  /// poi_min skips the minimum search when given.
  ScanEvaluation1D Evaluate(const ScanSet1D& scan,
                            std::optional<double> poi_min = std::nullopt) const;

  /// poi_mins skips the minimum search when given.
  ScanEvaluation2D Evaluate(const ScanSet2D& scan,
                            std::optional<std::array<double, 2>> poi_mins = std::nullopt) const;

  const stats::StatisticsConfig& config() const noexcept { return cfg_; }

private:
  stats::StatisticsConfig cfg_;
};

} // namespace nllscan
