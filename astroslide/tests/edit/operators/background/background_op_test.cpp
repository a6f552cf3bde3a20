#include "edit/operators/CPU_kernels/background_kernels.hpp"
#include "edit/operators/background/background_extract_op.hpp"

#include "../op_test_fixation.hpp"

using namespace astroslide;

namespace {
// Sky glow rising from left to right, identical in every channel
auto SkyGradient(int rows, int cols) -> PixelBuffer {
  cv::Mat data(rows, cols, CV_32FC3);
  for (int r = 0; r < rows; ++r) {
    auto* row = data.ptr<cv::Vec3f>(r);
    for (int c = 0; c < cols; ++c) {
      const float v = 0.1f + 0.3f * static_cast<float>(c) / static_cast<float>(cols - 1);
      row[c]        = {v, v, v};
    }
  }
  return PixelBuffer::FromFloatMat(std::move(data), ColorSpace::RGB);
}

auto StdDev(const PixelBuffer& buffer) -> double {
  cv::Scalar mean, stddev;
  cv::meanStdDev(buffer.GetCPUData().reshape(1), mean, stddev);
  return stddev[0];
}
}  // namespace

TEST_F(OperationTests, BackgroundOfFlatPlaneIsFlat) {
  cv::Mat plane(40, 40, CV_32FC1, cv::Scalar(0.2));
  cv::Mat bg = kernels::EstimateBackground(plane, 8, 50.0);
  ASSERT_EQ(bg.size(), plane.size());
  EXPECT_LT(cv::norm(bg, plane, cv::NORM_INF), 1e-5);
}

TEST_F(OperationTests, NoiseMapMatchesGaussianSigma) {
  cv::Mat plane(128, 128, CV_32FC1);
  cv::RNG rng(11);
  rng.fill(plane, cv::RNG::NORMAL, cv::Scalar(0.3), cv::Scalar(0.05));
  cv::Mat noise = kernels::EstimateNoiseMap(plane, 4);
  EXPECT_NEAR(cv::mean(noise)[0], 0.05, 0.01);
}

TEST_F(OperationTests, BackgroundExtractionFlattensGradient) {
  auto                buffer = SkyGradient(96, 128);
  const double        before = StdDev(buffer);
  BackgroundExtractOp op{nlohmann::json{
      {"background_extract", {{"grid_size", 8}, {"percentile", 25.0}, {"amount", 1.0}}}}};
  op.Apply(buffer);
  EXPECT_LT(StdDev(buffer), 0.3 * before);
}

TEST_F(OperationTests, BackgroundExtractionAtZeroAmountIsIdentity) {
  BackgroundExtractOp op{nlohmann::json{{"background_extract", {{"amount", 0.0}}}}};
  EXPECT_TRUE(op.IsIdentity());
}
