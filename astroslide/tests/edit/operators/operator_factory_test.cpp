#include "edit/operators/operator_factory.hpp"

#include "op_test_fixation.hpp"
#include "type/enhance_error.hpp"

using namespace astroslide;

TEST_F(OperationTests, FactoryKnowsEveryStageKind) {
  auto& factory = OperatorFactory::Instance();
  for (const char* name :
       {"white_balance", "gamma_curve", "lab_channel_scale", "hsv_saturation_scale",
        "clahe_contrast", "unsharp_mask", "denoise", "star_reduce", "histogram_stretch",
        "background_extract", "tone_curve"}) {
    ASSERT_TRUE(factory.Contains(name)) << name;
    auto op = factory.Create(name);
    EXPECT_EQ(op->GetScriptName(), name);
    EXPECT_FALSE(factory.GetStrengthParams(name).empty()) << name;
  }
  EXPECT_EQ(factory.GetType("denoise"), OperatorType::DENOISE);
}

TEST_F(OperationTests, FactoryRejectsUnknownOperator) {
  try {
    OperatorFactory::Instance().Create("warp_drive");
    FAIL() << "expected INVALID_PARAMETER";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::INVALID_PARAMETER);
  }
}

TEST_F(OperationTests, FactoryPassesParameters) {
  auto op     = OperatorFactory::Instance().Create("lab_channel_scale", {{"gain_a", 1.6}});
  auto params = op->GetParams();
  EXPECT_FLOAT_EQ(params["lab_channel_scale"]["gain_a"].get<float>(), 1.6f);
  EXPECT_FLOAT_EQ(params["lab_channel_scale"]["gain_l"].get<float>(), 1.0f);

  // Values of the wrong type are invalid parameters
  EXPECT_THROW(OperatorFactory::Instance().Create("gamma_curve", {{"gamma", "bright"}}),
               EnhanceException);
}
