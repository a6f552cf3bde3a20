#include "edit/pipeline/preview_generator.hpp"

#include "pipeline_test_fixation.hpp"
#include "type/enhance_error.hpp"

using namespace astroslide;

TEST_F(PipelineTests, FitSizeKeepsAspectWithinTarget) {
  EXPECT_EQ(PreviewGenerator::FitSize({4000, 3000}, 512), cv::Size(512, 384));
  EXPECT_EQ(PreviewGenerator::FitSize({3000, 4000}, 512), cv::Size(384, 512));
  EXPECT_EQ(PreviewGenerator::FitSize({300, 200}, 512), cv::Size(300, 200));
  // Never below one pixel on a side
  EXPECT_EQ(PreviewGenerator::FitSize({1, 5000}, 100), cv::Size(1, 100));
}

TEST_F(PipelineTests, PreviewIsBoundedByTargetSize) {
  PreviewGenerator preview{*engine_};
  auto             input  = Gradient(100, 200);
  auto             output = preview.Generate(input, "general", 64);
  EXPECT_EQ(output.Cols(), 64);
  EXPECT_EQ(output.Rows(), 32);
  EXPECT_EQ(output.Channels(), 3);

  // Already small enough, only enhanced
  auto small = preview.Generate(Gradient(20, 30), "general", 64);
  EXPECT_EQ(small.Cols(), 30);
  EXPECT_EQ(small.Rows(), 20);
}

TEST_F(PipelineTests, PreviewMatchesEngineOnSmallInput) {
  PreviewGenerator preview{*engine_};
  auto             input = LunarDisk(48);
  auto             a     = preview.Generate(input, "moon_hdr", 64);
  auto             b     = engine_->Run(input, "moon_hdr", 1.0f);
  EXPECT_EQ(MaxAbsDiff(a, b), 0.0);
}

TEST_F(PipelineTests, PreviewRejectsBadRequests) {
  PreviewGenerator preview{*engine_};
  auto             input = Gradient(16, 16);
  try {
    preview.Generate(input, "general", 0);
    FAIL() << "expected INVALID_PARAMETER";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::INVALID_PARAMETER);
  }
  EXPECT_THROW(preview.Generate(input, "andromeda", 8), EnhanceException);
}
