#include "analysis/histogram_analyzer.hpp"

#include <numeric>

#include "edit/operators/op_test_fixation.hpp"
#include "type/enhance_error.hpp"

using namespace astroslide;

namespace {
auto Sum(const HistogramBins& bins) -> uint64_t {
  return std::accumulate(bins.begin(), bins.end(), uint64_t{0});
}
}  // namespace

TEST_F(OperationTests, HistogramCountsEveryPixel) {
  auto result = HistogramAnalyzer::Compute(Noisy(37, 53, 0.5f, 0.3f));
  const uint64_t pixels = 37 * 53;
  EXPECT_EQ(Sum(result.red_), pixels);
  EXPECT_EQ(Sum(result.green_), pixels);
  EXPECT_EQ(Sum(result.blue_), pixels);
  EXPECT_EQ(Sum(result.luminance_), pixels);
}

TEST_F(OperationTests, UniformGrayLandsInOneBin) {
  auto result = HistogramAnalyzer::Compute(Uniform(10, 10, cv::Scalar::all(0.5)));
  EXPECT_EQ(result.red_[127], 100u);
  EXPECT_EQ(result.green_[127], 100u);
  EXPECT_EQ(result.blue_[127], 100u);
  EXPECT_EQ(result.luminance_[127], 100u);
}

TEST_F(OperationTests, HistogramBinsClampAtTheEnds) {
  EXPECT_EQ(HistogramAnalyzer::BinOf(0.0f), 0);
  EXPECT_EQ(HistogramAnalyzer::BinOf(1.0f), 255);
  EXPECT_EQ(HistogramAnalyzer::BinOf(0.999f), 254);

  auto result = HistogramAnalyzer::Compute(Uniform(4, 4, cv::Scalar(1.0, 0.0, 0.0)));
  EXPECT_EQ(result.red_[255], 16u);
  EXPECT_EQ(result.green_[0], 16u);
  // 0.299 * 255 = 76.2
  EXPECT_EQ(result.luminance_[76], 16u);
}

TEST_F(OperationTests, GrayHistogramRepeatsThePlane) {
  auto result = HistogramAnalyzer::Compute(Uniform(6, 6, cv::Scalar(0.25), 1));
  EXPECT_EQ(result.red_, result.luminance_);
  EXPECT_EQ(result.blue_, result.luminance_);
  EXPECT_EQ(result.luminance_[63], 36u);
}

TEST_F(OperationTests, HistogramJsonHasFourSeries) {
  auto json = HistogramAnalyzer::Compute(Gradient(8, 8)).ToJson();
  for (const char* key : {"red", "green", "blue", "luminance"}) {
    ASSERT_TRUE(json.contains(key)) << key;
    EXPECT_EQ(json[key].size(), 256u);
  }
}

TEST_F(OperationTests, HistogramRejectsEmptyBuffer) {
  PixelBuffer empty;
  EXPECT_THROW(HistogramAnalyzer::Compute(empty), EnhanceException);
}
