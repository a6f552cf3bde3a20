#include "edit/operators/CPU_kernels/detail_kernels.hpp"
#include "edit/operators/detail/denoise_op.hpp"
#include "edit/operators/detail/sharpen_op.hpp"

#include "../op_test_fixation.hpp"
#include "type/enhance_error.hpp"

using namespace astroslide;

namespace {
auto StdDev(const PixelBuffer& buffer) -> double {
  cv::Scalar mean, stddev;
  cv::meanStdDev(buffer.GetCPUData().reshape(1), mean, stddev);
  return stddev[0];
}

auto Step(int rows, int cols, float lo, float hi) -> PixelBuffer {
  cv::Mat data(rows, cols, CV_32FC3, cv::Scalar::all(lo));
  data.colRange(cols / 2, cols).setTo(cv::Scalar::all(hi));
  return PixelBuffer::FromFloatMat(std::move(data), ColorSpace::RGB);
}
}  // namespace

TEST_F(OperationTests, UnsharpMaskOvershootsAtEdges) {
  auto   step = Step(16, 32, 0.3f, 0.6f);
  auto   out  = kernels::UnsharpMask(step, 2.0f, 0.5f);
  double lo = 0.0, hi = 0.0;
  cv::minMaxLoc(out.GetCPUData().reshape(1), &lo, &hi);
  EXPECT_GT(hi, 0.6);
  EXPECT_LT(lo, 0.3);
  // Flat regions far from the edge are unchanged
  EXPECT_NEAR(out.GetCPUData().at<cv::Vec3f>(8, 0)[0], 0.3f, 1e-5);
}

TEST_F(OperationTests, UnsharpMaskValidatesRadius) {
  auto step = Step(8, 8, 0.3f, 0.6f);
  try {
    kernels::UnsharpMask(step, 0.0f, 0.5f);
    FAIL() << "expected INVALID_PARAMETER";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::INVALID_PARAMETER);
  }
  auto same = kernels::UnsharpMask(step, 1.0f, 0.0f);
  EXPECT_EQ(MaxAbsDiff(step, same), 0.0);
}

TEST_F(OperationTests, SharpenOpIdentityAtZeroAmount) {
  SharpenOp op{nlohmann::json{{"unsharp_mask", {{"radius", 2.0}, {"amount", 0.0}}}}};
  EXPECT_TRUE(op.IsIdentity());
}

TEST_F(OperationTests, DenoiseReducesNoise) {
  auto noisy  = Noisy(64, 64, 0.4f, 0.03f);
  auto before = StdDev(noisy);
  kernels::DenoiseParams params;
  params.strength_ = 1.0f;
  auto out         = kernels::Denoise(noisy, params);
  EXPECT_LT(StdDev(out), 0.8 * before);
}

TEST_F(OperationTests, DenoiseAtZeroStrengthKeepsInput) {
  auto noisy = Noisy(16, 16, 0.4f, 0.03f);
  auto out   = kernels::Denoise(noisy, {});
  EXPECT_EQ(MaxAbsDiff(noisy, out), 0.0);

  DenoiseOp op{nlohmann::json{{"denoise", {{"strength", 0.0}}}}};
  EXPECT_TRUE(op.IsIdentity());
}

TEST_F(OperationTests, NoiseEstimateTracksNoise) {
  const float clean = kernels::EstimateNoiseLevel(Uniform(32, 32, cv::Scalar::all(0.5)));
  const float noisy = kernels::EstimateNoiseLevel(Noisy(32, 32, 0.5f, 0.1f));
  EXPECT_FLOAT_EQ(clean, 0.0f);
  EXPECT_GT(noisy, clean);
  EXPECT_LE(noisy, 1.0f);
}

TEST_F(OperationTests, AdaptiveDenoiseRuns) {
  auto      noisy = Noisy(32, 32, 0.4f, 0.05f);
  auto      copy  = noisy.Clone();
  DenoiseOp op{nlohmann::json{{"denoise", {{"strength", 0.6}, {"adaptive", true}}}}};
  op.Apply(noisy);
  EXPECT_GT(MaxAbsDiff(noisy, copy), 0.0);
  EXPECT_EQ(noisy.Rows(), 32);
  EXPECT_EQ(noisy.Channels(), 3);
}
