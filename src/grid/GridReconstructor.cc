#include "nllscan/grid/GridReconstructor.hh"
#include "nllscan/scan/ScanSet.hh"

#include <TH2D.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

namespace nllscan {

namespace {

constexpr double kDefaultLogFloor = 1e-3;

std::vector<double> unique_sorted(std::vector<double> v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
  return v;
}

// Rank of value within the sorted unique axis values.
std::size_t rank_of(const std::vector<double>& axis, double value) {
  const auto it = std::upper_bound(axis.begin(), axis.end(), value);
  return static_cast<std::size_t>(std::distance(axis.begin(), it)) - 1;
}

// Bin edges so each sampled center gets its own bin
std::vector<double> make_edges_from_centers(const std::vector<double>& c) {
  const std::size_t N = c.size();
  std::vector<double> edges(N + 1);

  if (N == 1) {
    const double w = std::abs(c[0]) > 0 ? std::abs(c[0]) * 0.5 : 0.5;
    edges[0] = c[0] - w;
    edges[1] = c[0] + w;
    return edges;
  }

  edges[0] = c[0] - 0.5 * (c[1] - c[0]);
  for (std::size_t i = 1; i < N; ++i) {
    edges[i] = 0.5 * (c[i - 1] + c[i]);
  }
  edges[N] = c[N - 1] + 0.5 * (c[N - 1] - c[N - 2]);
  return edges;
}

} // namespace

ReconstructedGrid::ReconstructedGrid(std::vector<double> x_values, std::vector<double> y_values)
  : x_(std::move(x_values)), y_(std::move(y_values))
{
  if (x_.empty() || y_.empty())
    throw std::invalid_argument("ReconstructedGrid: axes must not be empty");
  data_.assign(x_.size() * y_.size(), std::numeric_limits<double>::quiet_NaN());
}

std::size_t ReconstructedGrid::CountUndefined() const {
  return static_cast<std::size_t>(
      std::count_if(data_.begin(), data_.end(), [](double v) { return std::isnan(v); }));
}

std::unique_ptr<TH2D> ReconstructedGrid::MakeTH2D(const std::string& name) const {
  const auto xe = make_edges_from_centers(x_);
  const auto ye = make_edges_from_centers(y_);

  auto h = std::make_unique<TH2D>(name.c_str(), name.c_str(),
                                  static_cast<int>(nx()), xe.data(),
                                  static_cast<int>(ny()), ye.data());
  h->SetDirectory(nullptr);
  for (std::size_t iy = 0; iy < ny(); ++iy) {
    for (std::size_t ix = 0; ix < nx(); ++ix) {
      const double v = at(iy, ix);
      if (std::isnan(v)) continue;
      h->SetBinContent(static_cast<int>(ix) + 1, static_cast<int>(iy) + 1, v);
    }
  }
  return h;
}

GridReconstructor::GridReconstructor(stats::GridConfig cfg, int verbosity)
  : cfg_(cfg), verbosity_(verbosity) {}

ReconstructedGrid GridReconstructor::Build(const ScanSet2D& scan) const {
  ReconstructedGrid grid = Reconstruct(scan);

  const std::size_t n_missing = grid.CountUndefined();
  if (verbosity_ > 0) {
    std::cout << "[grid] " << grid.nx() << " x " << grid.ny() << " cells, "
              << n_missing << " undefined\n";
  }

  if (cfg_.fill_nans && n_missing > 0) {
    const std::size_t n_filled = FillMissing(grid);
    if (verbosity_ > 0) {
      std::cout << "[grid] filled " << n_filled << " of " << n_missing
                << " undefined cells from neighbours\n";
    }
    if (n_filled < n_missing) {
      std::cerr << "[grid] WARNING: " << (n_missing - n_filled)
                << " cells have no defined neighbour and stay undefined\n";
    }
  }
  return grid;
}

ReconstructedGrid GridReconstructor::Reconstruct(const ScanSet2D& scan) {
  ReconstructedGrid grid(unique_sorted(scan.x()), unique_sorted(scan.y()));

  for (std::size_t i = 0; i < scan.size(); ++i) {
    const auto s = scan.Sample(i);
    grid.set(rank_of(grid.y_values(), s.y), rank_of(grid.x_values(), s.x), s.dnll2);
  }
  return grid;
}

std::size_t GridReconstructor::FillMissing(ReconstructedGrid& grid) {
  const long nx = static_cast<long>(grid.nx());
  const long ny = static_cast<long>(grid.ny());

  // Means are computed from the unrepaired grid and applied afterwards,
  // so cells filled in this pass never feed their neighbours.
  std::vector<std::pair<std::size_t, std::size_t>> cells;
  std::vector<double> means;

  for (long iy = 0; iy < ny; ++iy) {
    for (long ix = 0; ix < nx; ++ix) {
      if (!std::isnan(grid.at(iy, ix))) continue;

      double sum = 0.0;
      int n = 0;
      for (long dy = -1; dy <= 1; ++dy) {
        for (long dx = -1; dx <= 1; ++dx) {
          if (dx == 0 && dy == 0) continue;
          const long jy = iy + dy, jx = ix + dx;
          if (jy < 0 || jy >= ny || jx < 0 || jx >= nx) continue;
          const double v = grid.at(jy, jx);
          if (std::isnan(v)) continue;
          sum += v;
          ++n;
        }
      }
      if (n == 0) continue;
      cells.emplace_back(iy, ix);
      means.push_back(sum / n);
    }
  }

  for (std::size_t k = 0; k < cells.size(); ++k)
    grid.set(cells[k].first, cells[k].second, means[k]);
  return cells.size();
}

void GridReconstructor::ClampForLogScale(ReconstructedGrid& grid, double floor) {
  double pos_min = floor > 0.0 ? floor : kDefaultLogFloor;
  for (std::size_t iy = 0; iy < grid.ny(); ++iy) {
    for (std::size_t ix = 0; ix < grid.nx(); ++ix) {
      const double v = grid.at(iy, ix);
      if (v > 0.0) pos_min = std::min(pos_min, v);
    }
  }

  for (std::size_t iy = 0; iy < grid.ny(); ++iy) {
    for (std::size_t ix = 0; ix < grid.nx(); ++ix) {
      if (grid.at(iy, ix) <= 0.0) grid.set(iy, ix, pos_min);
    }
  }
}

} // namespace nllscan
