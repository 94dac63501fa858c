#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "nllscan/stats/StatisticsConfig.hh"

class TH2D;

namespace nllscan {

class ScanSet2D;

/**
 * Dense grid of dnll2 values of a 2D scan.
 *
 * Cells are stored row-major, indexed [iy * nx + ix], where ix (iy) is the
 * rank of the x (y) coordinate within the sorted unique x (y) values, i.e.
 * x is the inner, fast-varying axis. Undefined cells hold NaN.
 */
class ReconstructedGrid {
public:
  ReconstructedGrid(std::vector<double> x_values, std::vector<double> y_values);

  std::size_t nx() const noexcept { return x_.size(); }
  std::size_t ny() const noexcept { return y_.size(); }

  const std::vector<double>& x_values() const noexcept { return x_; }
  const std::vector<double>& y_values() const noexcept { return y_; }

  double at(std::size_t iy, std::size_t ix) const { return data_.at(iy * nx() + ix); }
  void   set(std::size_t iy, std::size_t ix, double v) { data_.at(iy * nx() + ix) = v; }

  std::size_t CountUndefined() const;

  /// Build a ROOT histogram with one bin centred on each sampled coordinate.
  /// Undefined cells are left empty.
  std::unique_ptr<TH2D> MakeTH2D(const std::string& name) const;

private:
  std::vector<double> x_;
  std::vector<double> y_;
  std::vector<double> data_;
};

/**
 * Maps scattered 2D scan samples onto a ReconstructedGrid and repairs
 * failed-fit cells.
 */
class GridReconstructor {
public:
  explicit GridReconstructor(stats::GridConfig cfg = {}, int verbosity = 0);

  /// Place every sample at its sorted-rank cell and, if configured,
  /// repair undefined cells with FillMissing.
  ReconstructedGrid Build(const ScanSet2D& scan) const;

  /// Grid without any repair. Duplicate coordinates: last write wins.
  static ReconstructedGrid Reconstruct(const ScanSet2D& scan);

  /// Single pass: every undefined cell becomes the mean of its defined
  /// neighbours (up to 8). Cells without a defined neighbour stay undefined.
  /// Returns the number of cells that were filled.
  static std::size_t FillMissing(ReconstructedGrid& grid);

  /// Replace non-positive defined cells by min(smallest positive cell, floor).
  /// floor <= 0 selects the default of 1e-3.
  static void ClampForLogScale(ReconstructedGrid& grid, double floor);

private:
  stats::GridConfig cfg_;
  int               verbosity_;
};

} // namespace nllscan
