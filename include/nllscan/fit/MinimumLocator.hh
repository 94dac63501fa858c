#pragma once

#include <array>

#include "nllscan/scan/ScanSet.hh"
#include "nllscan/stats/StatisticsConfig.hh"

namespace nllscan {
class Interpolator1D;
class Interpolator2D;
}

namespace nllscan::fit {

/**
 * Best-fit estimate of an interpolated dnll2 surface.
 *
 * The minimum of a profile likelihood scan sits at dnll2 = 0, so the 1D search
 * minimises |dnll2(x)| and the 2D search minimises dnll2(x, y)^2, each over
 * the sampled range shrunk inwards by MinimizerOptions::edge_epsilon.
 *
 * A minimiser that does not converge is fatal: std::runtime_error carrying
 * the minimiser diagnostic.
 */
class MinimumLocator {
public:
  explicit MinimumLocator(const stats::MinimizerOptions& opt, int verbosity = 0);

  double Locate(const Interpolator1D& interp, const AxisRange& range) const;

  /// Bounded Minuit2 minimisation (Migrad, Simplex fallback) started from
  /// MinimizerOptions::start, moved into the search box when it lies outside.
  std::array<double, 2> Locate(const Interpolator2D& interp,
                               const AxisRange& x_range,
                               const AxisRange& y_range) const;

private:
  AxisRange shrink_(const AxisRange& r) const;

  stats::MinimizerOptions opt_;
  int                     verbosity_;
};

} // namespace nllscan::fit
