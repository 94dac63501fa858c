#include "nllscan/scan/ScanResult.hh"
#include "nllscan/fit/IntervalExtractor.hh"

#include <iomanip>
#include <sstream>

namespace nllscan {

AxisResult AssembleAxisResult(double best_fit, const fit::AxisCrossings& crossings) {
  AxisResult r;
  r.best_fit = best_fit;
  r.plus1  = crossings.sigma1.upper.value();
  r.minus1 = crossings.sigma1.lower.value();
  r.plus2  = crossings.sigma2.upper.value();
  r.minus2 = crossings.sigma2.lower.value();

  if (r.plus1 && r.minus1)
    r.uncertainty = AsymmetricError{*r.plus1 - best_fit, best_fit - *r.minus1};
  return r;
}

std::string FormatAxisResult(const AxisResult& r, int precision) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision) << r.best_fit;
  if (r.uncertainty) {
    ss << " +" << r.uncertainty->up << " -" << r.uncertainty->down;
  }
  return ss.str();
}

} // namespace nllscan
