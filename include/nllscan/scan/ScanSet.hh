#pragma once

#include <cstddef>
#include <vector>

namespace nllscan {

/// One point of a 1D scan. dnll2 is NaN when the underlying fit failed.
struct ScanSample1D {
  double x     = 0.0;
  double dnll2 = 0.0;
};

/// One point of a 2D scan. dnll2 is NaN when the underlying fit failed.
struct ScanSample2D {
  double x     = 0.0;
  double y     = 0.0;
  double dnll2 = 0.0;
};

/// Closed range of sampled parameter values.
struct AxisRange {
  double min = 0.0;
  double max = 0.0;
};

/**
 * Samples of a 1D likelihood scan, built once from parallel arrays.
 *
 * The sampled range covers every sample, including those with an
 * undefined dnll2 value.
 */
class ScanSet1D {
public:
  ScanSet1D(std::vector<double> x, std::vector<double> dnll2);

  std::size_t size() const noexcept { return x_.size(); }
  ScanSample1D Sample(std::size_t i) const { return {x_.at(i), dnll2_.at(i)}; }

  const std::vector<double>& x()     const noexcept { return x_; }
  const std::vector<double>& dnll2() const noexcept { return dnll2_; }

  const AxisRange& range() const noexcept { return range_; }

  /// Samples with a defined dnll2, in input order.
  std::vector<ScanSample1D> ValidSamples() const;

private:
  std::vector<double> x_;
  std::vector<double> dnll2_;
  AxisRange           range_;
};

/**
 * Samples of a 2D likelihood scan, built once from parallel arrays.
 * The distinct x values times the distinct y values are expected to span a
 * rectangular grid; any cell may be undefined.
 */
class ScanSet2D {
public:
  ScanSet2D(std::vector<double> x, std::vector<double> y, std::vector<double> dnll2);

  std::size_t size() const noexcept { return x_.size(); }
  ScanSample2D Sample(std::size_t i) const { return {x_.at(i), y_.at(i), dnll2_.at(i)}; }

  const std::vector<double>& x()     const noexcept { return x_; }
  const std::vector<double>& y()     const noexcept { return y_; }
  const std::vector<double>& dnll2() const noexcept { return dnll2_; }

  const AxisRange& x_range() const noexcept { return x_range_; }
  const AxisRange& y_range() const noexcept { return y_range_; }

  std::vector<ScanSample2D> ValidSamples() const;

private:
  std::vector<double> x_;
  std::vector<double> y_;
  std::vector<double> dnll2_;
  AxisRange           x_range_;
  AxisRange           y_range_;
};

} // namespace nllscan
