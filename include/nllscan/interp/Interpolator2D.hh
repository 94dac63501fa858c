#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace ROOT { namespace Math { class Delaunay2D; } }

namespace nllscan {

class ScanSet2D;

/**
 * Scattered-data interpolation of a 2D scan.
 *
 * The defined samples are Delaunay-triangulated (ROOT::Math::Delaunay2D) and
 * the surface is linear inside each triangle, hence continuous across
 * triangle edges. Outside the convex hull of the samples Eval returns NaN.
 *
 * Eval is not safe to call concurrently on the same instance: the
 * triangulation keeps a search cache.
 */
class Interpolator2D {
public:
  /// Interpolate the defined samples; undefined ones leave holes.
  explicit Interpolator2D(const ScanSet2D& scan);

  Interpolator2D(Interpolator2D&&) noexcept;
  Interpolator2D& operator=(Interpolator2D&&) noexcept;
  ~Interpolator2D();

  double Eval(double x, double y) const;
  double operator()(double x, double y) const { return Eval(x, y); }

  std::size_t n_points() const noexcept { return x_.size(); }

private:
  void build_();

  // The triangulation refers to these arrays, they must outlive it.
  std::vector<double> x_;
  std::vector<double> y_;
  std::vector<double> z_;
  std::unique_ptr<ROOT::Math::Delaunay2D> delaunay_;
};

} // namespace nllscan
