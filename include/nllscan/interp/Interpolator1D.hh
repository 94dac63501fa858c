#pragma once

#include <vector>

#include "nllscan/scan/ScanSet.hh"

namespace nllscan {

/// Piecewise-linear interpolation of the defined samples of a 1D scan.
class Interpolator1D {
public:
  /// Drops undefined samples and sorts the rest by x.
  /// Throws std::invalid_argument with fewer than two defined samples.
  explicit Interpolator1D(const ScanSet1D& scan);

  /// Interpolated dnll2 at x; NaN outside [x_min(), x_max()].
  double Eval(double x) const;
  double operator()(double x) const { return Eval(x); }

  double x_min() const noexcept { return x_.front(); }
  double x_max() const noexcept { return x_.back(); }

  const std::vector<double>& x() const noexcept { return x_; }
  const std::vector<double>& y() const noexcept { return y_; }

private:
  std::vector<double> x_;
  std::vector<double> y_;
};

} // namespace nllscan
