#include "nllscan/scan/ScanSet.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace nllscan {

namespace {

AxisRange make_range(const std::vector<double>& v, const char* what) {
  for (double x : v) {
    if (!std::isfinite(x))
      throw std::invalid_argument(std::string("ScanSet: non-finite ") + what + " coordinate");
  }
  const auto [lo, hi] = std::minmax_element(v.begin(), v.end());
  return {*lo, *hi};
}

} // namespace

ScanSet1D::ScanSet1D(std::vector<double> x, std::vector<double> dnll2)
  : x_(std::move(x)), dnll2_(std::move(dnll2))
{
  if (x_.size() != dnll2_.size())
    throw std::invalid_argument("ScanSet1D: x/dnll2 size mismatch");
  if (x_.empty())
    throw std::invalid_argument("ScanSet1D: empty scan");
  range_ = make_range(x_, "x");
}

std::vector<ScanSample1D> ScanSet1D::ValidSamples() const {
  std::vector<ScanSample1D> out;
  out.reserve(x_.size());
  for (std::size_t i = 0; i < x_.size(); ++i) {
    if (std::isnan(dnll2_[i])) continue;
    out.push_back({x_[i], dnll2_[i]});
  }
  return out;
}

ScanSet2D::ScanSet2D(std::vector<double> x, std::vector<double> y, std::vector<double> dnll2)
  : x_(std::move(x)), y_(std::move(y)), dnll2_(std::move(dnll2))
{
  if (x_.size() != y_.size() || x_.size() != dnll2_.size())
    throw std::invalid_argument("ScanSet2D: x/y/dnll2 size mismatch");
  if (x_.empty())
    throw std::invalid_argument("ScanSet2D: empty scan");
  x_range_ = make_range(x_, "x");
  y_range_ = make_range(y_, "y");
}

std::vector<ScanSample2D> ScanSet2D::ValidSamples() const {
  std::vector<ScanSample2D> out;
  out.reserve(x_.size());
  for (std::size_t i = 0; i < x_.size(); ++i) {
    if (std::isnan(dnll2_[i])) continue;
    out.push_back({x_[i], y_[i], dnll2_[i]});
  }
  return out;
}

} // namespace nllscan
