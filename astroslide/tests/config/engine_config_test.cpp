#include "config/engine_config.hpp"

#include <gtest/gtest.h>

#include "type/enhance_error.hpp"

using namespace astroslide;

TEST(EngineConfigTests, MissingKeysKeepDefaults) {
  auto config = EngineConfig::FromJson(nlohmann::json::object());
  EXPECT_EQ(config.scheduler_.worker_count_, 4u);
  EXPECT_EQ(config.scheduler_.max_queue_depth_, 16u);
  EXPECT_EQ(config.scheduler_.timeout_.count(), 120000);
  EXPECT_EQ(config.preview_.target_size_, 512);
  EXPECT_EQ(config.log_level_, "info");
  EXPECT_FALSE(config.presets_.has_value());
}

TEST(EngineConfigTests, ReadsEverySection) {
  auto config = EngineConfig::FromString(R"({
    "scheduler": {"worker_count": 2, "max_inflight_pixels": 1000, "max_queue_depth": 3,
                  "timeout_ms": 250},
    "preview": {"target_size": 256},
    "star_detection": {"sigma_k": 4.0, "inpaint_radius": 5},
    "denoise": {"max_radius": 6, "edge_threshold": 0.1},
    "log_level": "debug"
  })");
  EXPECT_EQ(config.scheduler_.worker_count_, 2u);
  EXPECT_EQ(config.scheduler_.max_inflight_pixels_, 1000u);
  EXPECT_EQ(config.scheduler_.max_queue_depth_, 3u);
  EXPECT_EQ(config.scheduler_.timeout_.count(), 250);
  EXPECT_EQ(config.preview_.target_size_, 256);
  EXPECT_FLOAT_EQ(config.star_detection_.sigma_k_, 4.0f);
  EXPECT_EQ(config.star_detection_.inpaint_radius_, 5);
  EXPECT_EQ(config.denoise_.max_radius_, 6);
  EXPECT_FLOAT_EQ(config.denoise_.edge_threshold_, 0.1f);
  EXPECT_EQ(config.log_level_, "debug");

  // Written back the same way
  auto again = EngineConfig::FromJson(config.ToJson());
  EXPECT_EQ(again.scheduler_.timeout_, config.scheduler_.timeout_);
  EXPECT_FLOAT_EQ(again.star_detection_.sigma_k_, 4.0f);
}

TEST(EngineConfigTests, WrongTypesAreInvalidParameters) {
  try {
    EngineConfig::FromString(R"({"preview": {"target_size": "large"}})");
    FAIL() << "expected INVALID_PARAMETER";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::INVALID_PARAMETER);
  }
  EXPECT_THROW(EngineConfig::FromString(R"({"scheduler": []})"), EnhanceException);
  EXPECT_THROW(EngineConfig::FromString(R"({"scheduler": {"timeout_ms": 0}})"), EnhanceException);
  EXPECT_THROW(EngineConfig::FromString(R"({"presets": 3})"), EnhanceException);
  EXPECT_THROW(EngineConfig::FromString("{not json"), EnhanceException);
}

TEST(EngineConfigTests, NegativeCountsAreInvalidParameters) {
  for (const char* key : {"worker_count", "max_inflight_pixels", "max_queue_depth"}) {
    nlohmann::json doc = {{"scheduler", {{key, -1}}}};
    try {
      EngineConfig::FromJson(doc);
      FAIL() << key << " = -1 was accepted";
    } catch (const EnhanceException& e) {
      EXPECT_EQ(e.Code(), EnhanceErrorCode::INVALID_PARAMETER) << key;
    }
  }
  EXPECT_THROW(EngineConfig::FromString(R"({"scheduler": {"worker_count": 0}})"), EnhanceException);

  // An empty queue is allowed, it only means every submission must be admitted immediately
  auto config = EngineConfig::FromString(R"({"scheduler": {"max_queue_depth": 0}})");
  EXPECT_EQ(config.scheduler_.max_queue_depth_, 0u);
}

TEST(EngineConfigTests, PresetArrayIsWrappedIntoDocument) {
  auto config = EngineConfig::FromString(R"({"presets": [{"id": "mine", "stages": []}]})");
  ASSERT_TRUE(config.presets_.has_value());
  ASSERT_TRUE(config.presets_->contains("presets"));
  EXPECT_EQ((*config.presets_)["presets"][0]["id"], "mine");
}
