#include "edit/star/star_reducer.hpp"

#include "../operators/op_test_fixation.hpp"
#include "edit/operators/operator_factory.hpp"
#include "edit/star/star_detector.hpp"
#include "type/enhance_error.hpp"

using namespace astroslide;

namespace {
auto MaskedMax(const PixelBuffer& buffer, const cv::Mat& mask) -> double {
  double lo = 0.0, hi = 0.0;
  std::vector<cv::Mat> planes;
  cv::split(buffer.GetCPUData(), planes);
  cv::minMaxLoc(planes[0], &lo, &hi, nullptr, nullptr, mask);
  return hi;
}
}  // namespace

TEST_F(OperationTests, DetectsCompactStar) {
  auto         buffer = StarField(100, 100, 0.1f, {{50, 50}}, 5);
  StarDetector detector{StarDetectionConfig{}};
  auto         stars = detector.Detect(buffer);
  ASSERT_EQ(stars.size(), 1u);
  EXPECT_NEAR(stars[0].center_.x, 50.0f, 0.5f);
  EXPECT_NEAR(stars[0].center_.y, 50.0f, 0.5f);
  EXPECT_NEAR(stars[0].radius_, 5.0f, 0.5f);
  EXPECT_NEAR(stars[0].peak_, 1.0f, 1e-4);
  EXPECT_NEAR(stars[0].background_, 0.1f, 1e-3);
}

TEST_F(OperationTests, IgnoresExtendedAndElongatedRegions) {
  // A disk far larger than max_radius, like a planet or a bright nebula core
  auto                nebula = StarField(128, 128, 0.1f, {{64, 64}}, 30, 0.8f);
  StarDetectionConfig coarse;
  coarse.background_grid_ = 2;
  EXPECT_TRUE(StarDetector{coarse}.Detect(nebula).empty());

  StarDetector detector{StarDetectionConfig{}};

  cv::Mat streak(64, 64, CV_32FC3, cv::Scalar::all(0.1));
  cv::line(streak, {10, 32}, {40, 32}, cv::Scalar::all(0.9), 2);
  auto satellite = PixelBuffer::FromFloatMat(std::move(streak), ColorSpace::RGB);
  EXPECT_TRUE(detector.Detect(satellite).empty());
}

TEST_F(OperationTests, RejectsInconsistentThresholds) {
  StarDetectionConfig config;
  config.max_elongation_ = 0.5f;
  EXPECT_THROW(StarDetector{config}, EnhanceException);

  StarDetectionConfig reducer_config;
  reducer_config.mask_scale_ = 0.0f;
  EXPECT_THROW(StarReducer{reducer_config}, EnhanceException);
}

TEST_F(OperationTests, ReduceStarsAtZeroKeepsInput) {
  auto        buffer = StarField(64, 64, 0.1f, {{20, 20}, {44, 40}}, 3);
  StarReducer reducer{StarDetectionConfig{}};
  auto        out = reducer.ReduceStars(buffer, 0.0f);
  EXPECT_EQ(MaxAbsDiff(buffer, out), 0.0);
}

TEST_F(OperationTests, ReduceStarsAtOneRemovesPeaks) {
  auto         buffer = StarField(96, 96, 0.1f, {{20, 20}, {70, 30}, {48, 75}}, 3);
  StarDetector detector{StarDetectionConfig{}};
  StarReducer  reducer{StarDetectionConfig{}};
  auto         stars = detector.Detect(buffer);
  ASSERT_EQ(stars.size(), 3u);

  auto    out  = reducer.Reduce(buffer, stars, 1.0f);
  cv::Mat mask = reducer.BuildStarMask(buffer.GetCPUData().size(), stars);
  EXPECT_LT(MaskedMax(out, mask), 1.0);
  EXPECT_LT(MaskedMax(out, mask), 0.2);
}

TEST_F(OperationTests, PartialReductionStaysInsideMask) {
  auto         buffer = StarField(100, 100, 0.1f, {{50, 50}}, 5);
  StarDetector detector{StarDetectionConfig{}};
  StarReducer  reducer{StarDetectionConfig{}};
  auto         stars = detector.Detect(buffer);
  ASSERT_EQ(stars.size(), 1u);

  auto    out  = reducer.ReduceStars(buffer, 0.5f);
  cv::Mat mask = reducer.BuildStarMask(buffer.GetCPUData().size(), stars);

  // Bit-exact outside the mask
  cv::Mat outside;
  cv::bitwise_not(mask, outside);
  cv::Mat diff;
  cv::absdiff(buffer.GetCPUData(), out.GetCPUData(), diff);
  double lo = 0.0, hi = 0.0;
  cv::minMaxLoc(diff.reshape(1), &lo, &hi, nullptr, nullptr, outside);
  EXPECT_EQ(hi, 0.0);

  // Halfway between the star and the surrounding sky
  const double peak = MaskedMax(out, mask);
  EXPECT_GT(peak, 0.1);
  EXPECT_LT(peak, 1.0);
  EXPECT_NEAR(peak, 0.55, 0.05);
}

TEST_F(OperationTests, OverlappingStarMasksMerge) {
  StarReducer reducer{StarDetectionConfig{}};
  StarMap     stars(2);
  stars[0].center_ = {20.0f, 20.0f};
  stars[0].radius_ = 3.0f;
  stars[1].center_ = {27.0f, 20.0f};
  stars[1].radius_ = 3.0f;
  cv::Mat mask     = reducer.BuildStarMask({48, 40}, stars);
  cv::Mat labels;
  // One background label plus a single merged region
  EXPECT_EQ(cv::connectedComponents(mask, labels, 8), 2);
}

TEST_F(OperationTests, ReduceStarsValidatesAmount) {
  auto        buffer = StarField(32, 32, 0.1f, {{16, 16}}, 2);
  StarReducer reducer{StarDetectionConfig{}};
  try {
    reducer.ReduceStars(buffer, 1.5f);
    FAIL() << "expected INVALID_PARAMETER";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::INVALID_PARAMETER);
  }
}

TEST_F(OperationTests, StarReduceStageReadsThresholds) {
  auto op = OperatorFactory::Instance().Create("star_reduce", {{"amount", 1.0}, {"sigma_k", 3.0}});
  auto params = op->GetParams();
  EXPECT_FLOAT_EQ(params["star_reduce"]["sigma_k"].get<float>(), 3.0f);
  EXPECT_FALSE(op->IsIdentity());

  auto buffer = StarField(64, 64, 0.1f, {{32, 32}}, 3);
  op->Apply(buffer);
  EXPECT_LT(buffer.GetCPUData().at<cv::Vec3f>(32, 32)[0], 0.5f);
}
