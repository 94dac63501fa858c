#include <gtest/gtest.h>

#include "nllscan/scan/ScanEvaluator.hh"
#include "test_helpers.hh"

#include <cmath>
#include <stdexcept>

using namespace nllscan;
using nllscan::test::nan;

// ===========================================================================
// 1D pipeline
// ===========================================================================

TEST(ScanEvaluator1DTest, ParabolaGroundTruth) {
  const ScanEvaluator evaluator;
  const auto eval = evaluator.Evaluate(test::MakeParabola1D());
  const auto& r = eval.result.poi;

  EXPECT_NEAR(r.best_fit, 0.0, 1e-5);
  ASSERT_TRUE(r.plus1 && r.minus1);
  EXPECT_NEAR(*r.plus1, 1.0, 1e-5);
  EXPECT_NEAR(*r.minus1, -1.0, 1e-5);
  ASSERT_TRUE(r.plus2 && r.minus2);
  EXPECT_NEAR(*r.plus2, 2.0, 1e-5);
  EXPECT_NEAR(*r.minus2, -2.0, 1e-5);

  ASSERT_TRUE(r.uncertainty.has_value());
  EXPECT_NEAR(r.uncertainty->up, 1.0, 1e-4);
  EXPECT_NEAR(r.uncertainty->down, 1.0, 1e-4);
}

TEST(ScanEvaluator1DTest, InterpolantIsReturned) {
  const auto eval = ScanEvaluator().Evaluate(test::MakeParabola1D());
  ASSERT_TRUE(eval.interpolator);
  EXPECT_DOUBLE_EQ(eval.interpolator->Eval(1.5), 2.5);
}

TEST(ScanEvaluator1DTest, ExternalBestFitSkipsSearch) {
  const auto eval = ScanEvaluator().Evaluate(test::MakeParabola1D(), 0.5);
  const auto& r = eval.result.poi;
  EXPECT_DOUBLE_EQ(r.best_fit, 0.5);
  ASSERT_TRUE(r.uncertainty.has_value());
  EXPECT_NEAR(r.uncertainty->up, 0.5, 1e-5);
  EXPECT_NEAR(r.uncertainty->down, 1.5, 1e-5);
}

TEST(ScanEvaluator1DTest, LevelAboveScanRangeIsAbsent) {
  stats::StatisticsConfig cfg;
  cfg.chi2_levels = stats::ChiSquareLevels({1.0, 10.0}, {2.296, 6.18});
  const auto eval = ScanEvaluator(cfg).Evaluate(test::MakeParabola1D());
  const auto& r = eval.result.poi;

  EXPECT_TRUE(r.plus1.has_value());
  EXPECT_TRUE(r.minus1.has_value());
  EXPECT_FALSE(r.plus2.has_value());
  EXPECT_FALSE(r.minus2.has_value());
}

TEST(ScanEvaluator1DTest, LevelNotReachedBeforeFailedEdgeSampleIsAbsent) {
  stats::StatisticsConfig cfg;
  cfg.chi2_levels = stats::ChiSquareLevels({1.0, 6.0}, {2.296, 6.18});
  const ScanSet1D scan({-3.0, -2.0, -1.0, 0.0, 1.0, 2.0, 3.0},
                       {nan(), 4.0, 1.0, 0.0, 1.0, 4.0, 9.0});
  const auto eval = ScanEvaluator(cfg).Evaluate(scan);
  const auto& r = eval.result.poi;

  EXPECT_DOUBLE_EQ(scan.range().min, -3.0);
  ASSERT_TRUE(r.minus1 && r.plus1);
  EXPECT_NEAR(*r.minus1, -1.0, 1e-5);
  EXPECT_FALSE(r.minus2.has_value());
  ASSERT_TRUE(r.plus2.has_value());
  EXPECT_NEAR(*r.plus2, 2.4, 1e-5);
}

TEST(ScanEvaluator1DTest, MissingOneSigmaBoundLeavesUncertaintyAbsent) {
  // rises to 9 on the right, only to 0.5 on the left
  const ScanSet1D scan({-3.0, -2.0, -1.0, 0.0, 1.0, 2.0, 3.0},
                       {0.5, 0.3, 0.1, 0.0, 1.0, 4.0, 9.0});
  const auto eval = ScanEvaluator().Evaluate(scan);
  const auto& r = eval.result.poi;

  EXPECT_NEAR(r.best_fit, 0.0, 1e-5);
  EXPECT_TRUE(r.plus1.has_value());
  EXPECT_FALSE(r.minus1.has_value());
  EXPECT_FALSE(r.uncertainty.has_value());
}

TEST(ScanEvaluator1DTest, UndefinedSampleDoesNotShiftResult) {
  const auto clean = ScanEvaluator().Evaluate(test::MakeParabola1D());

  std::vector<double> x = test::MakeParabola1D().x();
  std::vector<double> z = test::MakeParabola1D().dnll2();
  x.push_back(1.5);
  z.push_back(nan());
  const auto dirty = ScanEvaluator().Evaluate(ScanSet1D(x, z));

  EXPECT_DOUBLE_EQ(dirty.result.poi.best_fit, clean.result.poi.best_fit);
  EXPECT_DOUBLE_EQ(*dirty.result.poi.plus1, *clean.result.poi.plus1);
  EXPECT_DOUBLE_EQ(*dirty.result.poi.minus1, *clean.result.poi.minus1);
  EXPECT_DOUBLE_EQ(*dirty.result.poi.plus2, *clean.result.poi.plus2);
  EXPECT_DOUBLE_EQ(*dirty.result.poi.minus2, *clean.result.poi.minus2);
}

TEST(ScanEvaluator1DTest, RepeatedEvaluationIsBitIdentical) {
  const auto scan = test::MakeParabola1D();
  const ScanEvaluator evaluator;
  const auto a = evaluator.Evaluate(scan).result.poi;
  const auto b = evaluator.Evaluate(scan).result.poi;

  EXPECT_EQ(a.best_fit, b.best_fit);
  EXPECT_EQ(a.plus1, b.plus1);
  EXPECT_EQ(a.minus1, b.minus1);
  EXPECT_EQ(a.plus2, b.plus2);
  EXPECT_EQ(a.minus2, b.minus2);
  ASSERT_TRUE(a.uncertainty && b.uncertainty);
  EXPECT_EQ(a.uncertainty->up, b.uncertainty->up);
  EXPECT_EQ(a.uncertainty->down, b.uncertainty->down);
}

TEST(ScanEvaluator1DTest, MinimumSearchFailureIsFatal) {
  stats::StatisticsConfig cfg;
  cfg.minimizer.edge_epsilon = 0.6;   // shrinks [0, 1] to an empty interval
  const ScanSet1D scan({0.0, 0.5, 1.0}, {1.0, 0.0, 1.0});
  try {
    ScanEvaluator(cfg).Evaluate(scan);
    FAIL() << "expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("could not find minimum"), std::string::npos);
  }
}

TEST(ScanEvaluator1DTest, AllUndefinedScanIsRejected) {
  const ScanSet1D scan({0.0, 1.0, 2.0}, {nan(), nan(), nan()});
  EXPECT_THROW(ScanEvaluator().Evaluate(scan), std::invalid_argument);
}

// ===========================================================================
// 2D pipeline
// ===========================================================================

TEST(ScanEvaluator2DTest, SeparableSurfaceAxesThroughMinimum) {
  const auto eval = ScanEvaluator().Evaluate(test::MakeSeparable2D());
  const auto& r1 = eval.result.poi1;
  const auto& r2 = eval.result.poi2;

  EXPECT_NEAR(r1.best_fit, 1.0, 1e-2);
  EXPECT_NEAR(r2.best_fit, -2.0, 1e-2);

  // 2 dof, 1 sigma: linear interpolation between dnll2 = 1 and 4
  const double d1 = 1.0 + (2.296 - 1.0) / 3.0;
  ASSERT_TRUE(r1.plus1 && r1.minus1);
  EXPECT_NEAR(*r1.plus1, 1.0 + d1, 2e-2);
  EXPECT_NEAR(*r1.minus1, 1.0 - d1, 2e-2);
  EXPECT_NEAR(*r1.plus1 - r1.best_fit, r1.best_fit - *r1.minus1, 2e-2);

  ASSERT_TRUE(r2.plus1 && r2.minus1);
  EXPECT_NEAR(*r2.plus1, -2.0 + d1, 2e-2);
  EXPECT_NEAR(*r2.minus1, -2.0 - d1, 2e-2);
  EXPECT_NEAR(*r2.plus1 - r2.best_fit, r2.best_fit - *r2.minus1, 2e-2);

  // 2 dof, 2 sigma: between dnll2 = 4 and 9
  const double d2 = 2.0 + (6.180 - 4.0) / 5.0;
  ASSERT_TRUE(r1.plus2 && r1.minus2);
  EXPECT_NEAR(*r1.plus2, 1.0 + d2, 2e-2);
  EXPECT_NEAR(*r1.minus2, 1.0 - d2, 2e-2);

  ASSERT_TRUE(r1.uncertainty && r2.uncertainty);
  EXPECT_NEAR(r1.uncertainty->up, d1, 3e-2);
  EXPECT_NEAR(r2.uncertainty->down, d1, 3e-2);
}

TEST(ScanEvaluator2DTest, ExternalBestFit) {
  const auto eval = ScanEvaluator().Evaluate(test::MakeSeparable2D(),
                                             std::array<double, 2>{1.0, -2.0});
  EXPECT_DOUBLE_EQ(eval.result.poi1.best_fit, 1.0);
  EXPECT_DOUBLE_EQ(eval.result.poi2.best_fit, -2.0);
  ASSERT_TRUE(eval.result.poi1.uncertainty);
  const double d1 = 1.0 + (2.296 - 1.0) / 3.0;
  EXPECT_NEAR(eval.result.poi1.uncertainty->up, d1, 1e-5);
  EXPECT_NEAR(eval.result.poi1.uncertainty->down, d1, 1e-5);
}

TEST(ScanEvaluator2DTest, FailedCornerFitDoesNotShiftResult) {
  const ScanEvaluator evaluator;
  const auto clean = evaluator.Evaluate(test::MakeSeparable2D()).result;
  const auto dirty = evaluator.Evaluate(test::MakeSeparable2D(5, 2)).result;

  EXPECT_NEAR(dirty.poi1.best_fit, clean.poi1.best_fit, 1e-3);
  EXPECT_NEAR(dirty.poi2.best_fit, clean.poi2.best_fit, 1e-3);
  ASSERT_TRUE(dirty.poi1.plus1 && clean.poi1.plus1);
  EXPECT_NEAR(*dirty.poi1.plus1, *clean.poi1.plus1, 1e-3);
  ASSERT_TRUE(dirty.poi2.minus1 && clean.poi2.minus1);
  EXPECT_NEAR(*dirty.poi2.minus1, *clean.poi2.minus1, 1e-3);
}

TEST(ScanEvaluator2DTest, FailedFitNextToMinimumIsAHoleNotARepairedNode) {
  const ScanEvaluator evaluator;
  const auto clean = evaluator.Evaluate(test::MakeSeparable2D()).result;
  const auto eval  = evaluator.Evaluate(test::MakeSeparable2D(2, -2));
  const auto& dirty = eval.result;

  // the display grid is repaired with the mean of the eight neighbours
  EXPECT_DOUBLE_EQ(eval.grid.at(4, 5), 20.0 / 8.0);

  EXPECT_NEAR(dirty.poi1.best_fit, 1.0, 1e-2);
  EXPECT_NEAR(dirty.poi2.best_fit, -2.0, 1e-2);

  // along y = -2 the surface bridges the hole from (1,-2) = 0 to (3,-2) = 4
  ASSERT_TRUE(dirty.poi1.plus1 && dirty.poi1.minus1);
  EXPECT_NEAR(*dirty.poi1.plus1, 1.0 + 2.0 * 2.296 / 4.0, 2e-2);
  EXPECT_NEAR(*dirty.poi1.minus1, *clean.poi1.minus1, 2e-2);

  // the y axis through the minimum does not touch the hole
  ASSERT_TRUE(dirty.poi2.plus1 && dirty.poi2.minus1);
  EXPECT_NEAR(*dirty.poi2.plus1, *clean.poi2.plus1, 2e-2);
  EXPECT_NEAR(*dirty.poi2.minus1, *clean.poi2.minus1, 2e-2);
}

TEST(ScanEvaluator2DTest, RepeatedEvaluationIsBitIdentical) {
  const auto scan = test::MakeSeparable2D(0, 0);
  const ScanEvaluator evaluator;
  const auto a = evaluator.Evaluate(scan).result;
  const auto b = evaluator.Evaluate(scan).result;

  EXPECT_EQ(a.poi1.best_fit, b.poi1.best_fit);
  EXPECT_EQ(a.poi2.best_fit, b.poi2.best_fit);
  EXPECT_EQ(a.poi1.plus1, b.poi1.plus1);
  EXPECT_EQ(a.poi1.minus2, b.poi1.minus2);
  EXPECT_EQ(a.poi2.plus2, b.poi2.plus2);
  EXPECT_EQ(a.poi2.minus1, b.poi2.minus1);
}

TEST(ScanEvaluator2DTest, EachEvaluationOwnsItsInterpolant) {
  const ScanEvaluator evaluator;
  const auto scan = test::MakeSeparable2D();
  const auto a = evaluator.Evaluate(scan, std::array<double, 2>{1.0, -2.0});
  const auto b = evaluator.Evaluate(scan, std::array<double, 2>{1.0, -2.0});
  ASSERT_TRUE(a.interpolator && b.interpolator);
  EXPECT_NE(a.interpolator.get(), b.interpolator.get());
  EXPECT_EQ(a.interpolator.use_count(), 1);
  EXPECT_EQ(a.interpolator->Eval(2.0, -2.0), b.interpolator->Eval(2.0, -2.0));
}

TEST(ScanEvaluator2DTest, ReturnedGridIsRepairedAndLogClamped) {
  stats::StatisticsConfig cfg;
  cfg.grid.z_log = true;
  const auto eval = ScanEvaluator(cfg).Evaluate(test::MakeSeparable2D(0, 0));

  EXPECT_EQ(eval.grid.CountUndefined(), 0u);
  // the dnll2 = 0 cell at (x=1, y=-2) is lifted to the default floor
  EXPECT_DOUBLE_EQ(eval.grid.at(4, 4), 1e-3);
  // the interpolant still sees the unclamped minimum
  EXPECT_NEAR(eval.interpolator->Eval(1.0, -2.0), 0.0, 1e-9);
}

TEST(ScanEvaluator2DTest, TwoSigmaOutsideNarrowScanIsAbsent) {
  // x in [0, 2], y in [0, 2], minimum at (1, 1): dnll2 reaches 2 at most along an axis
  std::vector<double> x, y, z;
  for (int iy = 0; iy <= 4; ++iy) {
    for (int ix = 0; ix <= 4; ++ix) {
      const double xv = 0.5 * ix, yv = 0.5 * iy;
      x.push_back(xv);
      y.push_back(yv);
      z.push_back(2.0 * ((xv - 1.0) * (xv - 1.0) + (yv - 1.0) * (yv - 1.0)));
    }
  }
  const auto eval = ScanEvaluator().Evaluate(ScanSet2D(x, y, z),
                                             std::array<double, 2>{1.0, 1.0});
  EXPECT_FALSE(eval.result.poi1.plus1.has_value());
  EXPECT_FALSE(eval.result.poi1.plus2.has_value());
  EXPECT_FALSE(eval.result.poi1.uncertainty.has_value());
}
