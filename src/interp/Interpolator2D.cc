#include "nllscan/interp/Interpolator2D.hh"
#include "nllscan/scan/ScanSet.hh"

#include <Math/Delaunay2D.h>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace nllscan {

Interpolator2D::Interpolator2D(const ScanSet2D& scan) {
  const auto samples = scan.ValidSamples();
  x_.reserve(samples.size());
  y_.reserve(samples.size());
  z_.reserve(samples.size());
  for (const auto& s : samples) {
    x_.push_back(s.x);
    y_.push_back(s.y);
    z_.push_back(s.dnll2);
  }
  build_();
}

Interpolator2D::Interpolator2D(Interpolator2D&&) noexcept = default;
Interpolator2D& Interpolator2D::operator=(Interpolator2D&&) noexcept = default;
Interpolator2D::~Interpolator2D() = default;

void Interpolator2D::build_() {
  if (x_.size() < 3)
    throw std::invalid_argument("Interpolator2D: need at least three defined samples");

  delaunay_ = std::make_unique<ROOT::Math::Delaunay2D>(
      static_cast<int>(x_.size()), x_.data(), y_.data(), z_.data());
  delaunay_->SetZOuterValue(std::numeric_limits<double>::quiet_NaN());
  delaunay_->FindAllTriangles();

  if (delaunay_->NumberOfTriangles() == 0)
    throw std::invalid_argument("Interpolator2D: samples are collinear, no triangulation");
}

double Interpolator2D::Eval(double x, double y) const {
  return delaunay_->Interpolate(x, y);
}

} // namespace nllscan
