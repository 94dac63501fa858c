#include "nllscan/fit/BoundedMinimizer1D.hh"

#include <Math/BrentMinimizer1D.h>
#include <Math/Functor.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace nllscan::fit {

bool Minimum1D::StrictlyInside(double lo, double hi) const {
  return x > lo + margin && x < hi - margin;
}

BoundedMinimizer1D::BoundedMinimizer1D(const stats::MinimizerOptions& opt) : opt_(opt) {
  if (opt_.max_iterations <= 0)
    throw std::invalid_argument("BoundedMinimizer1D: max_iterations must be > 0");
  if (opt_.scan_points < 2)
    throw std::invalid_argument("BoundedMinimizer1D: scan_points must be >= 2");
  if (!(opt_.abs_tolerance > 0.0) || !(opt_.rel_tolerance >= 0.0))
    throw std::invalid_argument("BoundedMinimizer1D: tolerances must be positive");
}

Minimum1D BoundedMinimizer1D::Minimize(const std::function<double(double)>& objective,
                                       double lo, double hi) const {
  Minimum1D res;
  if (!(hi > lo)) {
    std::ostringstream ss;
    ss << "empty search interval [" << lo << ", " << hi << "]";
    res.status  = -3;
    res.message = ss.str();
    res.x       = lo;
    return res;
  }

  ROOT::Math::Functor1D func([&objective](double x) {
    const double f = objective(x);
    return std::isfinite(f) ? f : kOutsidePenalty;
  });

  ROOT::Math::BrentMinimizer1D brent;
  brent.SetNpx(opt_.scan_points);
  brent.SetFunction(func, lo, hi);
  const bool ok = brent.Minimize(opt_.max_iterations, opt_.abs_tolerance, opt_.rel_tolerance);

  res.converged  = ok && brent.Status() == 0;
  res.x          = brent.XMinimum();
  res.fval       = brent.FValMinimum();
  res.iterations = brent.Iterations();
  res.status     = brent.Status();
  res.margin     = 1e-6 * (hi - lo) + 100.0 * opt_.abs_tolerance;

  if (!res.converged) {
    std::ostringstream ss;
    ss << "Brent minimization did not converge in [" << lo << ", " << hi
       << "] (status " << res.status << ", " << res.iterations << " iterations)";
    res.message = ss.str();
  } else if (res.fval >= kOutsidePenalty) {
    res.converged    = false;
    res.left_surface = true;
    res.message      = "minimum lies outside the interpolated surface";
  } else {
    const double left  = res.x - res.margin;
    const double right = res.x + res.margin;
    if ((left > lo && !std::isfinite(objective(left))) ||
        (right < hi && !std::isfinite(objective(right)))) {
      res.at_surface_edge = true;
      res.message         = "minimum lies on the edge of the interpolated surface";
    }
  }
  return res;
}

} // namespace nllscan::fit
