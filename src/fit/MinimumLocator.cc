#include "nllscan/fit/MinimumLocator.hh"
#include "nllscan/fit/BoundedMinimizer1D.hh"
#include "nllscan/interp/Interpolator1D.hh"
#include "nllscan/interp/Interpolator2D.hh"

#include <Math/Factory.h>
#include <Math/Functor.h>
#include <Math/Minimizer.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace nllscan::fit {

namespace {

std::string minuit2_status_message(int status) {
  switch (status) {
    case 0: return "ok";
    case 1: return "covariance matrix was made positive definite";
    case 2: return "Hesse is invalid";
    case 3: return "estimated distance to minimum is above max";
    case 4: return "reached call limit";
    default: return "unknown failure";
  }
}

} // namespace

MinimumLocator::MinimumLocator(const stats::MinimizerOptions& opt, int verbosity)
  : opt_(opt), verbosity_(verbosity)
{
  if (!(opt_.edge_epsilon >= 0.0))
    throw std::invalid_argument("MinimumLocator: edge_epsilon must be >= 0");
}

AxisRange MinimumLocator::shrink_(const AxisRange& r) const {
  return {r.min + opt_.edge_epsilon, r.max - opt_.edge_epsilon};
}

double MinimumLocator::Locate(const Interpolator1D& interp, const AxisRange& range) const {
  const AxisRange b = shrink_(range);

  BoundedMinimizer1D minimizer(opt_);
  const auto res = minimizer.Minimize([&interp](double x) { return std::abs(interp(x)); },
                                      b.min, b.max);
  if (!res.converged)
    throw std::runtime_error("could not find minimum of dnll2 interpolation: " + res.message);

  if (verbosity_ > 1) {
    std::cout << "[minimum] x=" << res.x << " |dnll2|=" << res.fval
              << " after " << res.iterations << " iterations\n";
  }
  return res.x;
}

std::array<double, 2> MinimumLocator::Locate(const Interpolator2D& interp,
                                             const AxisRange& x_range,
                                             const AxisRange& y_range) const {
  const AxisRange bx = shrink_(x_range);
  const AxisRange by = shrink_(y_range);
  if (!(bx.max > bx.min) || !(by.max > by.min))
    throw std::runtime_error("could not find minimum of dnll2 interpolation: "
                             "sampled range narrower than the edge margin");

  auto objective = [&interp](const double* p) {
    const double z = interp(p[0], p[1]);
    return std::isfinite(z) ? z * z : BoundedMinimizer1D::kOutsidePenalty;
  };
  ROOT::Math::Functor fcn(objective, 2);

  std::unique_ptr<ROOT::Math::Minimizer> minimizer(
      ROOT::Math::Factory::CreateMinimizer("Minuit2", "Minimize"));
  if (!minimizer)
    throw std::runtime_error("could not create Minuit2 minimizer");

  minimizer->SetMaxFunctionCalls(opt_.max_function_calls);
  minimizer->SetTolerance(opt_.tolerance);
  minimizer->SetStrategy(static_cast<int>(opt_.strategy));
  minimizer->SetPrintLevel(verbosity_ > 2 ? 1 : 0);
  minimizer->SetFunction(fcn);

  const double x0 = std::clamp(opt_.start[0], bx.min, bx.max);
  const double y0 = std::clamp(opt_.start[1], by.min, by.max);
  minimizer->SetLimitedVariable(0, "x", x0, 0.01 * (bx.max - bx.min), bx.min, bx.max);
  minimizer->SetLimitedVariable(1, "y", y0, 0.01 * (by.max - by.min), by.min, by.max);

  // Migrad with a Simplex fallback; one retry from the last point if invalid
  bool ok = minimizer->Minimize();
  if (!ok) ok = minimizer->Minimize();
  const double* xs = minimizer->X();

  if (!ok || minimizer->MinValue() >= BoundedMinimizer1D::kOutsidePenalty) {
    std::ostringstream ss;
    ss << "could not find minimum of dnll2 interpolation: Minuit2 status "
       << minimizer->Status() << " (" << minuit2_status_message(minimizer->Status()) << ")"
       << ", edm=" << minimizer->Edm() << ", calls=" << minimizer->NCalls();
    if (ok) ss << ", minimum lies outside the interpolated surface";
    throw std::runtime_error(ss.str());
  }

  if (verbosity_ > 1) {
    std::cout << "[minimum] (x,y)=(" << xs[0] << "," << xs[1] << ") dnll2^2="
              << minimizer->MinValue() << " after " << minimizer->NCalls() << " calls\n";
  }
  return {xs[0], xs[1]};
}

} // namespace nllscan::fit
