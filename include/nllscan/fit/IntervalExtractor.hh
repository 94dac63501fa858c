#pragma once

#include <functional>
#include <optional>
#include <string>

#include "nllscan/scan/ScanSet.hh"
#include "nllscan/stats/ChiSquareLevels.hh"
#include "nllscan/stats/StatisticsConfig.hh"

namespace nllscan::fit {

/// Why a level-crossing search did or did not produce a bound.
enum class CrossingStatus {
  Found,         ///< converged strictly inside the search interval
  NotConverged,  ///< minimiser reported failure
  AtBoundary,    ///< converged onto a bound or the edge of the defined surface
  OffSurface     ///< the search only found points outside the interpolated surface
};

const char* to_string(CrossingStatus s);

/// Result of the search on one side of the minimum.
struct Crossing {
  CrossingStatus status = CrossingStatus::NotConverged;
  double         x = 0.0;        ///< last minimiser position, meaningful only if Found
  std::string    message;

  bool found() const noexcept { return status == CrossingStatus::Found; }
  std::optional<double> value() const {
    return found() ? std::optional<double>(x) : std::nullopt;
  }
};

/// Upper (+) and lower (-) crossing of one level.
struct LevelCrossings {
  Crossing upper;
  Crossing lower;
};

/// Crossings of the 1 and 2 sigma levels along one axis.
struct AxisCrossings {
  LevelCrossings sigma1;
  LevelCrossings sigma2;
};

/**
 * Searches outward from the minimum for the points where a 1D profile of
 * the interpolated surface equals a threshold level.
 *
 * For level v the objective (profile(x) - v)^2 is minimised over
 * [minimum, max - eps] and [min + eps, minimum]. A side is accepted only if
 * the minimiser converged strictly inside its interval. Failures are never
 * errors; they come back as a Crossing with a non-Found status.
 */
class IntervalExtractor {
public:
  using Profile = std::function<double(double)>;

  IntervalExtractor(const stats::MinimizerOptions& opt,
                    const stats::ChiSquareLevels& levels,
                    int verbosity = 0);

  LevelCrossings FindCrossings(const Profile& profile, double minimum,
                               const AxisRange& range, double level) const;

  /// 1 and 2 sigma crossings using the levels for ndof degrees of freedom.
  AxisCrossings Extract(const Profile& profile, double minimum,
                        const AxisRange& range, int ndof) const;

private:
  Crossing search_(const Profile& profile, double lo, double hi, double level) const;

  stats::MinimizerOptions opt_;
  stats::ChiSquareLevels  levels_;
  int                     verbosity_;
};

} // namespace nllscan::fit
