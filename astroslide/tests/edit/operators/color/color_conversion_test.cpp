#include "edit/operators/utils/color_conversion.hpp"

#include "../op_test_fixation.hpp"
#include "type/enhance_error.hpp"

using namespace astroslide;

TEST_F(OperationTests, LabConversionReturnsToRGB) {
  auto rgb  = Gradient(16, 32);
  auto lab  = ColorCvt::RGB2LAB(rgb);
  EXPECT_EQ(lab.GetColorSpace(), ColorSpace::LAB);

  // L of a [0, 1] image lives in [0, 100]
  double l_min = 0.0, l_max = 0.0;
  std::vector<cv::Mat> planes;
  cv::split(lab.GetCPUData(), planes);
  cv::minMaxLoc(planes[0], &l_min, &l_max);
  EXPECT_GE(l_min, 0.0);
  EXPECT_LE(l_max, 100.0 + 1e-3);

  auto back = ColorCvt::LAB2RGB(lab);
  EXPECT_EQ(back.GetColorSpace(), ColorSpace::RGB);
  EXPECT_LT(MaxAbsDiff(rgb, back), 1e-3);
}

TEST_F(OperationTests, HSVBackConversionClampsScaledSaturation) {
  auto rgb = Gradient(8, 8);
  auto hsv = ColorCvt::RGB2HSV(rgb);
  hsv      = ColorCvt::ScaleChannel(hsv, 1, 10.0f);
  auto out = ColorCvt::HSV2RGB(hsv);

  double lo = 0.0, hi = 0.0;
  cv::minMaxLoc(out.GetCPUData().reshape(1), &lo, &hi);
  EXPECT_GE(lo, 0.0);
  EXPECT_LE(hi, 1.0);
}

TEST_F(OperationTests, ConversionRejectsWrongColorSpace) {
  auto gray = Uniform(4, 4, cv::Scalar(0.5), 1);
  try {
    ColorCvt::RGB2LAB(gray);
    FAIL() << "expected INVALID_PARAMETER";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::INVALID_PARAMETER);
  }
  auto rgb = Uniform(4, 4, cv::Scalar::all(0.5));
  EXPECT_THROW(ColorCvt::LAB2RGB(rgb), EnhanceException);
}

TEST_F(OperationTests, ScaleChannelTouchesOnlyOneChannel) {
  auto rgb    = Uniform(4, 4, cv::Scalar(0.2, 0.4, 0.6));
  auto scaled = ColorCvt::ScaleChannel(rgb, 1, 2.0f);
  auto px     = scaled.GetCPUData().at<cv::Vec3f>(2, 2);
  EXPECT_FLOAT_EQ(px[0], 0.2f);
  EXPECT_FLOAT_EQ(px[1], 0.8f);
  EXPECT_FLOAT_EQ(px[2], 0.6f);
  // Input untouched
  EXPECT_FLOAT_EQ(rgb.GetCPUData().at<cv::Vec3f>(2, 2)[1], 0.4f);

  EXPECT_THROW(ColorCvt::ScaleChannel(rgb, 3, 2.0f), EnhanceException);
}

TEST_F(OperationTests, LuminanceUsesPerceptualWeights) {
  auto rgb  = Uniform(2, 2, cv::Scalar(1.0, 0.0, 0.0));
  auto luma = ColorCvt::Luminance(rgb);
  EXPECT_EQ(luma.type(), CV_32FC1);
  EXPECT_NEAR(luma.at<float>(0, 0), 0.299f, 1e-6);

  auto white = Uniform(2, 2, cv::Scalar::all(1.0));
  EXPECT_NEAR(ColorCvt::Luminance(white).at<float>(1, 1), 1.0f, 1e-5);
}
