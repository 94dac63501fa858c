#include "nllscan/scan/ScanEvaluator.hh"
#include "nllscan/fit/IntervalExtractor.hh"
#include "nllscan/fit/MinimumLocator.hh"

#include <iostream>
#include <utility>

namespace nllscan {

namespace {

void print_axis(const char* name, const AxisResult& r) {
  std::cout << "[scan] " << name << " = " << FormatAxisResult(r, 4) << "\n";
}

} // namespace

ScanEvaluator::ScanEvaluator(stats::StatisticsConfig cfg) : cfg_(std::move(cfg)) {}

ScanEvaluation1D ScanEvaluator::Evaluate(const ScanSet1D& scan,
                                         std::optional<double> poi_min) const {
  std::shared_ptr<const Interpolator1D> interp = std::make_shared<Interpolator1D>(scan);

  double best = 0.0;
  if (poi_min.has_value()) {
    best = *poi_min;
  } else {
    fit::MinimumLocator locator(cfg_.minimizer, cfg_.verbosity);
    best = locator.Locate(*interp, scan.range());
  }

  fit::IntervalExtractor extractor(cfg_.minimizer, cfg_.chi2_levels, cfg_.verbosity);
  const auto crossings = extractor.Extract(
      [&interp](double x) { return interp->Eval(x); }, best, scan.range(), 1);

  ScanEvaluation1D out;
  out.result.poi    = AssembleAxisResult(best, crossings);
  out.interpolator  = std::move(interp);

  if (cfg_.verbosity > 0) {
    std::cout << "[scan] 1D scan: " << scan.size() << " samples, "
              << out.interpolator->x().size() << " defined\n";
    print_axis("poi", out.result.poi);
  }
  return out;
}

ScanEvaluation2D ScanEvaluator::Evaluate(const ScanSet2D& scan,
                                         std::optional<std::array<double, 2>> poi_mins) const {
  GridReconstructor reconstructor(cfg_.grid, cfg_.verbosity);
  ReconstructedGrid grid = reconstructor.Build(scan);

  // the surface is built from the defined samples only; repaired cells are
  // for display and never become interpolation nodes
  std::shared_ptr<const Interpolator2D> interp = std::make_shared<Interpolator2D>(scan);

  std::array<double, 2> best{};
  if (poi_mins.has_value()) {
    best = *poi_mins;
  } else {
    fit::MinimumLocator locator(cfg_.minimizer, cfg_.verbosity);
    best = locator.Locate(*interp, scan.x_range(), scan.y_range());
  }

  fit::IntervalExtractor extractor(cfg_.minimizer, cfg_.chi2_levels, cfg_.verbosity);
  const double x_best = best[0];
  const double y_best = best[1];
  const auto crossings1 = extractor.Extract(
      [&interp, y_best](double x) { return interp->Eval(x, y_best); },
      x_best, scan.x_range(), 2);
  const auto crossings2 = extractor.Extract(
      [&interp, x_best](double y) { return interp->Eval(x_best, y); },
      y_best, scan.y_range(), 2);

  if (cfg_.grid.z_log)
    GridReconstructor::ClampForLogScale(grid, cfg_.grid.z_min);

  ScanEvaluation2D out{
      ScanResult2D{AssembleAxisResult(x_best, crossings1), AssembleAxisResult(y_best, crossings2)},
      std::move(interp),
      std::move(grid)};

  if (cfg_.verbosity > 0) {
    std::cout << "[scan] 2D scan: " << scan.size() << " samples, "
              << out.interpolator->n_points() << " interpolation points\n";
    print_axis("poi1", out.result.poi1);
    print_axis("poi2", out.result.poi2);
  }
  return out;
}

} // namespace nllscan
