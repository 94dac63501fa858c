#pragma once

#include <optional>
#include <string>

namespace nllscan {

namespace fit { struct AxisCrossings; }

/// Asymmetric 1 sigma uncertainty of a best-fit value.
struct AsymmetricError {
  double up   = 0.0;   ///< +1 sigma bound - best fit
  double down = 0.0;   ///< best fit - (-1 sigma bound)
};

/**
 * Summary of one scanned parameter.
 *
 * Each bound is present only if its crossing search succeeded. The
 * uncertainty is present only if both 1 sigma bounds are; it never
 * falls back to a symmetric value.
 */
struct AxisResult {
  double best_fit = 0.0;

  std::optional<double> minus2;
  std::optional<double> minus1;
  std::optional<double> plus1;
  std::optional<double> plus2;

  std::optional<AsymmetricError> uncertainty;
};

struct ScanResult1D {
  AxisResult poi;
};

struct ScanResult2D {
  AxisResult poi1;
  AxisResult poi2;
};

/// Combine a best fit and its crossings into an AxisResult.
AxisResult AssembleAxisResult(double best_fit, const fit::AxisCrossings& crossings);

/// "1.23 +0.45 -0.67" with the given precision, or just the value when the
/// uncertainty is absent.
std::string FormatAxisResult(const AxisResult& r, int precision = 2);

} // namespace nllscan
