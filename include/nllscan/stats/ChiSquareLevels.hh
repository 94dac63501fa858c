#pragma once

#include <array>

namespace nllscan::stats {

/**
 * Threshold values of -2 Delta lnL that correspond to 1 and 2 sigma gaussian
 * coverage, for one and two degrees of freedom.
 *
 * The defaults are precomputed (chi2_ndof quantiles at the 68.27% / 95.45%
 * gaussian coverage):
 *   ndof = 1 : 1.000, 4.000
 *   ndof = 2 : 2.296, 6.180
 *
 * Nothing here evaluates a chi2 distribution at runtime. A table can be
 * overridden from configuration, but it is validated on construction.
 */
class ChiSquareLevels {
public:
  /// Default table.
  ChiSquareLevels();

  /// Custom table; each row is {1 sigma, 2 sigma}.
  ChiSquareLevels(std::array<double, 2> ndof1, std::array<double, 2> ndof2);

  /// Threshold for ndof in {1,2} and sigma in {1,2}. Throws std::invalid_argument otherwise.
  double Level(int ndof, int sigma) const;

  static const ChiSquareLevels& Default();

private:
  static void validate_row_(const std::array<double, 2>& row, int ndof);

  std::array<std::array<double, 2>, 2> levels_;
};

} // namespace nllscan::stats
