#pragma once

#include <functional>
#include <string>

#include "nllscan/stats/StatisticsConfig.hh"

namespace nllscan::fit {

/// Outcome of one bounded 1D minimisation.
struct Minimum1D {
  bool        converged = false;
  double      x    = 0.0;
  double      fval = 0.0;
  int         iterations = 0;
  int         status = 0;        ///< minimiser status code, 0 on success
  double      margin = 0.0;      ///< distance from a bound still counted as pinned
  bool        left_surface = false;  ///< best point only found outside the surface
  bool        at_surface_edge = false;  ///< best point borders an undefined region
  std::string message;           ///< diagnostic, empty on success

  /// True if x lies strictly inside (lo, hi), i.e. not pinned to a bound
  /// within the resolution of the minimiser.
  bool StrictlyInside(double lo, double hi) const;
};

/**
 * Bounded scalar minimisation shared by the 1D best-fit search and every
 * level-crossing search.
 *
 * The interval is first scanned on MinimizerOptions::scan_points points and
 * the best bracket is refined with Brent's method
 * (ROOT::Math::BrentMinimizer1D). Non-finite objective values (queries that
 * leave the interpolated surface) are replaced by kOutsidePenalty.
 *
 * A converged minimum whose objective is undefined within Minimum1D::margin
 * on either side is flagged at_surface_edge: it is the last defined point
 * before the penalty plateau, not a stationary point of the objective.
 */
class BoundedMinimizer1D {
public:
  static constexpr double kOutsidePenalty = 1e9;

  explicit BoundedMinimizer1D(const stats::MinimizerOptions& opt);

  Minimum1D Minimize(const std::function<double(double)>& objective,
                     double lo, double hi) const;

private:
  stats::MinimizerOptions opt_;
};

} // namespace nllscan::fit
