#include "edit/preset/preset_registry.hpp"

#include "../operators/op_test_fixation.hpp"
#include "type/enhance_error.hpp"

using namespace astroslide;

TEST_F(OperationTests, BuiltInPresetsAreAllPresent) {
  auto registry = PresetRegistry::BuiltIn();
  for (const char* id : {"general", "deep_sky", "mineral_moon_subtle", "mineral_moon",
                         "mineral_moon_vivid", "moon_hdr", "nebula_starless"}) {
    EXPECT_TRUE(registry.Contains(id)) << id;
  }
  EXPECT_EQ(registry.Size(), 7u);

  auto infos = registry.List();
  ASSERT_EQ(infos.size(), 7u);
  EXPECT_EQ(infos.front().id_, "general");
  for (const auto& info : infos) {
    EXPECT_FALSE(info.name_.empty()) << info.id_;
    EXPECT_FALSE(info.description_.empty()) << info.id_;
  }
}

TEST_F(OperationTests, MineralPresetsShareStageKinds) {
  auto registry = PresetRegistry::BuiltIn();
  auto kinds    = [&registry](const char* id) {
    std::vector<std::string> ops;
    for (const auto& stage : registry.Get(id).stages_) {
      ops.push_back(stage.op_);
    }
    return ops;
  };
  EXPECT_EQ(kinds("mineral_moon_subtle"), kinds("mineral_moon"));
  EXPECT_EQ(kinds("mineral_moon"), kinds("mineral_moon_vivid"));

  const auto& moon = registry.Get("mineral_moon");
  ASSERT_TRUE(moon.subject_mask_.has_value());
  EXPECT_TRUE(moon.subject_mask_->black_background_);
}

TEST_F(OperationTests, UnknownPresetIsInvalidParameter) {
  auto registry = PresetRegistry::BuiltIn();
  try {
    registry.Get("andromeda");
    FAIL() << "expected INVALID_PARAMETER";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::INVALID_PARAMETER);
  }
}

TEST_F(OperationTests, ExtendReplacesAndAppends) {
  auto base     = PresetRegistry::BuiltIn();
  auto doc      = nlohmann::json::parse(R"({"presets": [
    {"id": "general", "name": "Plain", "stages": [{"op": "gamma_curve", "params": {"gamma": 0.9}}]},
    {"id": "comet", "name": "Comet", "stages": [{"op": "denoise", "params": {"strength": 0.5}}]}
  ]})");
  auto extended = base.Extend(doc);

  EXPECT_EQ(extended.Size(), 8u);
  EXPECT_EQ(extended.Get("general").name_, "Plain");
  EXPECT_EQ(extended.Get("general").stages_.size(), 1u);
  EXPECT_EQ(extended.List().back().id_, "comet");
  // The original registry is immutable
  EXPECT_EQ(base.Get("general").stages_.size(), 3u);
  EXPECT_FALSE(base.Contains("comet"));
}

TEST_F(OperationTests, MalformedPresetDocumentsAreRejected) {
  auto registry = PresetRegistry::BuiltIn();
  EXPECT_THROW(registry.Extend(nlohmann::json::array()), EnhanceException);
  EXPECT_THROW(registry.Extend(nlohmann::json::parse(R"({"presets": [{"name": "no id"}]})")),
               EnhanceException);
  EXPECT_THROW(registry.Extend(nlohmann::json::parse(
                   R"({"presets": [{"id": "x", "stages": [{"op": "warp_drive"}]}]})")),
               EnhanceException);
}

TEST_F(OperationTests, RegistryJsonLoadsBack) {
  auto registry = PresetRegistry::BuiltIn();
  auto reloaded = PresetRegistry::FromJson(registry.ToJson());
  EXPECT_EQ(reloaded.Size(), registry.Size());
  EXPECT_EQ(reloaded.Get("moon_hdr").stages_.size(), registry.Get("moon_hdr").stages_.size());
}
