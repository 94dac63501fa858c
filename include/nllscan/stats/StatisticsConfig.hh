#pragma once

#include <array>

#include "nllscan/stats/ChiSquareLevels.hh"

namespace nllscan::stats {

/**
 * Budget and tolerances for the bounded minimisations.
 *
 * The 1D searches (best fit of a 1D scan, every level crossing) use
 * max_iterations / abs_tolerance / rel_tolerance / scan_points.
 * The 2D best-fit search uses max_function_calls / tolerance / strategy / start.
 */
struct MinimizerOptions {
  double edge_epsilon   = 1e-4;   ///< inward shrink of the sampled range
  int    max_iterations = 100;    ///< Brent iterations per 1D search
  double abs_tolerance  = 1e-8;
  double rel_tolerance  = 1e-10;
  int    scan_points    = 100;    ///< grid points scanned before Brent refinement

  unsigned int max_function_calls = 5000;
  double       tolerance          = 1e-4;   ///< Migrad EDM tolerance
  unsigned int strategy           = 1;      ///< 0 low, 1 medium, >=2 high
  std::array<double, 2> start     = {1.0, 1.0};
};

/// Grid repair / log-axis treatment of 2D scans.
struct GridConfig {
  bool   fill_nans = true;
  bool   z_log     = false;
  double z_min     = 0.0;   ///< explicit log-axis floor, <= 0 means "use default"
};

/**
 * Configuration of one scan evaluation, derived from the JSON "run",
 * "minimizer", "grid" and "chi2_levels" blocks.
 */
struct StatisticsConfig {
  int              verbosity = 0;   ///< 0=silent, 1=summary, 2+=debug
  MinimizerOptions minimizer;
  GridConfig       grid;
  ChiSquareLevels  chi2_levels;
};

} // namespace nllscan::stats
