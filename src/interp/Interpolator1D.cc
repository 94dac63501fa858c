#include "nllscan/interp/Interpolator1D.hh"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace nllscan {

Interpolator1D::Interpolator1D(const ScanSet1D& scan) {
  auto samples = scan.ValidSamples();
  if (samples.size() < 2)
    throw std::invalid_argument("Interpolator1D: need at least two defined samples");

  std::stable_sort(samples.begin(), samples.end(),
                   [](const ScanSample1D& a, const ScanSample1D& b) { return a.x < b.x; });

  x_.reserve(samples.size());
  y_.reserve(samples.size());
  for (const auto& s : samples) {
    x_.push_back(s.x);
    y_.push_back(s.dnll2);
  }
  if (x_.front() == x_.back())
    throw std::invalid_argument("Interpolator1D: defined samples span a single x value");
}

double Interpolator1D::Eval(double x) const {
  if (!(x >= x_.front() && x <= x_.back()))
    return std::numeric_limits<double>::quiet_NaN();
  if (x == x_.back()) return y_.back();

  // Binary search for bracketing indices
  size_t lo = 0, hi = x_.size() - 1;
  while (hi - lo > 1) {
    const size_t mid = (lo + hi) / 2;
    if (x_[mid] <= x) lo = mid; else hi = mid;
  }
  const double x0 = x_[lo], x1 = x_[hi];
  const double y0 = y_[lo], y1 = y_[hi];
  if (x1 == x0) return y1;
  const double t = (x - x0) / (x1 - x0);
  return y0 + t * (y1 - y0);
}

} // namespace nllscan
