#include "edit/operators/CPU_kernels/tone_kernels.hpp"
#include "edit/operators/tone/clahe_op.hpp"
#include "edit/operators/tone/gamma_curve_op.hpp"
#include "edit/operators/tone/histogram_stretch_op.hpp"
#include "edit/operators/tone/tone_curve_op.hpp"

#include "../op_test_fixation.hpp"
#include "edit/operators/utils/color_conversion.hpp"
#include "type/enhance_error.hpp"

using namespace astroslide;

namespace {
auto LumaStdDev(const PixelBuffer& buffer) -> double {
  cv::Scalar mean, stddev;
  cv::meanStdDev(ColorCvt::Luminance(buffer), mean, stddev);
  return stddev[0];
}
}  // namespace

TEST_F(OperationTests, PercentileInterpolatesBetweenRanks) {
  cv::Mat plane(1, 10, CV_32FC1);
  for (int i = 0; i < 10; ++i) {
    // Shuffled on purpose
    plane.at<float>(0, i) = static_cast<float>((i * 7) % 10);
  }
  EXPECT_FLOAT_EQ(kernels::Percentile(plane, 0.0), 0.0f);
  EXPECT_FLOAT_EQ(kernels::Percentile(plane, 100.0), 9.0f);
  EXPECT_FLOAT_EQ(kernels::Percentile(plane, 50.0), 4.5f);
  EXPECT_FLOAT_EQ(kernels::Percentile(plane, 25.0), 2.25f);
}

TEST_F(OperationTests, FullRangeStretchIsIdempotent) {
  auto once  = kernels::HistogramStretch(Gradient(32, 48), 0.0, 100.0);
  auto twice = kernels::HistogramStretch(once, 0.0, 100.0);
  EXPECT_EQ(MaxAbsDiff(once, twice), 0.0);

  double lo = 0.0, hi = 0.0;
  cv::minMaxLoc(once.GetCPUData().reshape(1), &lo, &hi);
  EXPECT_FLOAT_EQ(static_cast<float>(lo), 0.0f);
  EXPECT_FLOAT_EQ(static_cast<float>(hi), 1.0f);
}

TEST_F(OperationTests, StretchLeavesFlatChannelAlone) {
  auto flat = Uniform(8, 8, cv::Scalar(0.25, 0.25, 0.25));
  auto out  = kernels::HistogramStretch(flat, 0.1, 99.9);
  EXPECT_EQ(MaxAbsDiff(flat, out), 0.0);
}

TEST_F(OperationTests, StretchRejectsInvertedPercentiles) {
  EXPECT_THROW(kernels::HistogramStretch(Gradient(8, 8), 90.0, 10.0), EnhanceException);
  EXPECT_THROW(kernels::HistogramStretch(Gradient(8, 8), -1.0, 10.0), EnhanceException);
}

TEST_F(OperationTests, HistogramStretchOpBlendsByAmount) {
  auto               input = Gradient(16, 16, 0.3f, 0.6f);
  auto               full  = kernels::HistogramStretch(input, 0.0, 100.0);

  HistogramStretchOp op{nlohmann::json{
      {"histogram_stretch", {{"low", 0.0}, {"high", 100.0}, {"amount", 0.5}}}}};
  auto               half = input.Clone();
  op.Apply(half);

  const float in_px   = input.GetCPUData().at<cv::Vec3f>(4, 4)[0];
  const float full_px = full.GetCPUData().at<cv::Vec3f>(4, 4)[0];
  EXPECT_NEAR(half.GetCPUData().at<cv::Vec3f>(4, 4)[0], 0.5f * (in_px + full_px), 1e-5);
}

TEST_F(OperationTests, GammaCurveRaisesToPower) {
  auto         buffer = Uniform(4, 4, cv::Scalar::all(0.25));
  GammaCurveOp op{nlohmann::json{{"gamma_curve", {{"gamma", 0.5}}}}};
  op.Apply(buffer);
  EXPECT_NEAR(buffer.GetCPUData().at<cv::Vec3f>(1, 1)[2], 0.5f, 1e-6);

  EXPECT_THROW(kernels::GammaCurve(buffer, 0.0f), EnhanceException);
  GammaCurveOp unit{nlohmann::json{{"gamma_curve", {{"gamma", 1.0}}}}};
  EXPECT_TRUE(unit.IsIdentity());
}

TEST_F(OperationTests, ClaheExpandsLowContrast) {
  auto    buffer = Gradient(64, 64, 0.4f, 0.55f);
  auto    before = LumaStdDev(buffer);
  ClaheOp op{nlohmann::json{
      {"clahe_contrast", {{"clip_limit", 40.0}, {"tile_grid_size", 2}, {"amount", 1.0}}}}};
  op.Apply(buffer);
  EXPECT_GT(LumaStdDev(buffer), before);
}

TEST_F(OperationTests, EqualizeTilesStaysInRange) {
  cv::Mat plane(20, 30, CV_32FC1);
  cv::RNG rng(3);
  rng.fill(plane, cv::RNG::UNIFORM, 0.0, 1.0);
  // Grid larger than the image is reduced to it
  cv::Mat out = kernels::EqualizeTiles(plane, 3.0, 64);
  double  lo = 0.0, hi = 0.0;
  cv::minMaxLoc(out, &lo, &hi);
  EXPECT_GE(lo, 0.0);
  EXPECT_LE(hi, 1.0);

  EXPECT_THROW(kernels::EqualizeTiles(plane, 2.0, 0), EnhanceException);
}

TEST_F(OperationTests, ToneCurveLiftsShadowsAndCompressesHighlights) {
  ToneCurveOp lift{nlohmann::json{{"tone_curve", {{"shadow_lift", 0.4}, {"shadow_gamma", 0.85}}}}};
  auto        dark = Uniform(4, 4, cv::Scalar(0.1), 1);
  lift.Apply(dark);
  EXPECT_GT(dark.GetCPUData().at<float>(0, 0), 0.1f);

  ToneCurveOp compress{nlohmann::json{
      {"tone_curve", {{"highlight_compression", 0.3}, {"highlight_threshold", 0.75}}}}};
  auto        bright = Uniform(4, 4, cv::Scalar(0.9), 1);
  compress.Apply(bright);
  EXPECT_LT(bright.GetCPUData().at<float>(0, 0), 0.9f);
  EXPECT_GT(bright.GetCPUData().at<float>(0, 0), 0.75f);

  ToneCurveOp none{nlohmann::json{{"tone_curve", nlohmann::json::object()}}};
  EXPECT_TRUE(none.IsIdentity());
}

TEST_F(OperationTests, SCurveSpreadsMidtones) {
  ToneCurveOp s_curve{nlohmann::json{{"tone_curve", {{"s_curve", 0.3}, {"s_curve_slope", 10.0}}}}};
  auto        low  = Uniform(2, 2, cv::Scalar(0.4), 1);
  auto        high = Uniform(2, 2, cv::Scalar(0.6), 1);
  s_curve.Apply(low);
  s_curve.Apply(high);
  EXPECT_LT(low.GetCPUData().at<float>(0, 0), 0.4f);
  EXPECT_GT(high.GetCPUData().at<float>(0, 0), 0.6f);
}
