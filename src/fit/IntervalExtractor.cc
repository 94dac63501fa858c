#include "nllscan/fit/IntervalExtractor.hh"
#include "nllscan/fit/BoundedMinimizer1D.hh"

#include <iostream>

namespace nllscan::fit {

const char* to_string(CrossingStatus s) {
  switch (s) {
    case CrossingStatus::Found:        return "found";
    case CrossingStatus::NotConverged: return "not converged";
    case CrossingStatus::AtBoundary:   return "at boundary";
    case CrossingStatus::OffSurface:   return "off surface";
  }
  return "unknown";
}

IntervalExtractor::IntervalExtractor(const stats::MinimizerOptions& opt,
                                     const stats::ChiSquareLevels& levels,
                                     int verbosity)
  : opt_(opt), levels_(levels), verbosity_(verbosity) {}

Crossing IntervalExtractor::search_(const Profile& profile, double lo, double hi,
                                    double level) const {
  BoundedMinimizer1D minimizer(opt_);
  const auto res = minimizer.Minimize(
      [&profile, level](double x) {
        const double d = profile(x) - level;
        return d * d;
      },
      lo, hi);

  Crossing c;
  c.x = res.x;
  if (res.left_surface) {
    c.status  = CrossingStatus::OffSurface;
    c.message = res.message;
  } else if (!res.converged) {
    c.status  = CrossingStatus::NotConverged;
    c.message = res.message;
  } else if (!res.StrictlyInside(lo, hi)) {
    c.status  = CrossingStatus::AtBoundary;
    c.message = "level not reached inside the sampled range";
  } else if (res.at_surface_edge) {
    c.status  = CrossingStatus::AtBoundary;
    c.message = "level not reached inside the defined surface";
  } else {
    c.status = CrossingStatus::Found;
  }

  if (verbosity_ > 1) {
    std::cout << "[interval] level " << level << " in [" << lo << ", " << hi << "]: "
              << to_string(c.status) << " x=" << c.x << "\n";
  }
  return c;
}

LevelCrossings IntervalExtractor::FindCrossings(const Profile& profile, double minimum,
                                                const AxisRange& range, double level) const {
  LevelCrossings out;
  out.upper = search_(profile, minimum, range.max - opt_.edge_epsilon, level);
  out.lower = search_(profile, range.min + opt_.edge_epsilon, minimum, level);
  return out;
}

AxisCrossings IntervalExtractor::Extract(const Profile& profile, double minimum,
                                         const AxisRange& range, int ndof) const {
  AxisCrossings out;
  out.sigma1 = FindCrossings(profile, minimum, range, levels_.Level(ndof, 1));
  out.sigma2 = FindCrossings(profile, minimum, range, levels_.Level(ndof, 2));
  return out;
}

} // namespace nllscan::fit
