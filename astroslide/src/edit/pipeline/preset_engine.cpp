//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "edit/pipeline/preset_engine.hpp"

#include <easy/profiler.h>

#include <cmath>
#include <format>
#include <memory>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <utility>

#include "edit/operators/op_base.hpp"
#include "edit/operators/operator_factory.hpp"
#include "edit/operators/operator_registeration.hpp"
#include "edit/operators/utils/color_conversion.hpp"
#include "type/enhance_error.hpp"
#include "utils/log/logger.hpp"

namespace astroslide {
namespace {
struct PreparedStage {
  std::string                    op_;
  std::shared_ptr<IOperatorBase> operator_;
};

/**
 * @brief Keep the enhanced pixels on the subject, restore the sky from the original and darken it
 * toward black with the intensity when requested
 *
 */
void ComposeSubject(const PixelBuffer& original, PixelBuffer& enhanced,
                    const SubjectMaskDefinition& definition, float intensity) {
  const cv::Mat mask = BuildSubjectMask(original, definition);
  cv::Mat       sky_mask;
  cv::bitwise_not(mask, sky_mask);

  cv::Mat sky = original.GetCPUData().clone();
  if (definition.black_background_) {
    sky *= static_cast<double>(1.0f - intensity);
  }
  cv::Mat out = enhanced.GetCPUData();
  sky.copyTo(out, sky_mask);
}
}  // namespace

auto BuildSubjectMask(const PixelBuffer& buffer, const SubjectMaskDefinition& mask) -> cv::Mat {
  const cv::Mat luma = ColorCvt::Luminance(buffer);
  cv::Mat       subject;
  cv::compare(luma, static_cast<double>(mask.threshold_), subject, cv::CMP_GT);
  if (mask.cleanup_kernel_ > 0) {
    const cv::Mat kernel = cv::getStructuringElement(
        cv::MORPH_ELLIPSE, cv::Size(mask.cleanup_kernel_, mask.cleanup_kernel_));
    cv::morphologyEx(subject, subject, cv::MORPH_CLOSE, kernel);
    cv::morphologyEx(subject, subject, cv::MORPH_OPEN, kernel);
  }
  return subject;
}

PresetEngine::PresetEngine(std::shared_ptr<const PresetRegistry> registry,
                           const EngineConfig&                   config)
    : registry_(std::move(registry)), config_(config) {
  if (!registry_) {
    throw std::invalid_argument("PresetEngine: registry must not be null");
  }
  RegisterAllOperators();
}

auto PresetEngine::WithDefaults(const std::string& op, const nlohmann::json& params) const
    -> nlohmann::json {
  nlohmann::json merged;
  if (op == "denoise") {
    merged = {{"max_radius", config_.denoise_.max_radius_},
              {"edge_threshold", config_.denoise_.edge_threshold_}};
  } else if (op == "star_reduce") {
    merged = config_.star_detection_.ToJson();
  } else {
    merged = nlohmann::json::object();
  }
  merged.update(params);
  return merged;
}

auto PresetEngine::ResolveStages(const PresetDefinition& preset, float intensity) const
    -> std::vector<ResolvedStage> {
  const auto&                factory = OperatorFactory::Instance();
  std::vector<ResolvedStage> resolved;
  resolved.reserve(preset.stages_.size());

  for (const auto& stage : preset.stages_) {
    ResolvedStage out{stage.op_, WithDefaults(stage.op_, stage.params_), true};
    for (const auto& strength : factory.GetStrengthParams(stage.op_)) {
      const std::string name    = std::string(strength.name_);
      float             nominal = strength.off_;
      if (out.params_.contains(name)) {
        if (!out.params_[name].is_number()) {
          throw EnhanceException(
              EnhanceErrorCode::INVALID_PARAMETER,
              std::format("preset {}: {}.{} must be a number", preset.id_, stage.op_, name));
        }
        nominal = out.params_[name].get<float>();
      }
      const float value  = strength.off_ + intensity * (nominal - strength.off_);
      out.params_[name] = value;
      if (value != strength.off_) {
        out.identity_ = false;
      }
    }
    resolved.push_back(std::move(out));
  }
  return resolved;
}

auto PresetEngine::ResolveStages(const preset_id_t& preset_id, float intensity) const
    -> std::vector<ResolvedStage> {
  return ResolveStages(registry_->Get(preset_id), intensity);
}

auto PresetEngine::Run(const PixelBuffer& input, const preset_id_t& preset_id, float intensity,
                       PipelineRun* run, const std::vector<StageDefinition>& overrides) const
    -> PixelBuffer {
  EASY_FUNCTION(profiler::colors::Green);
  auto         logger = log::GetLogger();
  PipelineRun  local_run;
  PipelineRun& state  = run ? *run : local_run;

  state.Transition(RunState::VALIDATING);

  const PresetDefinition*    preset = nullptr;
  std::vector<PreparedStage> prepared;
  try {
    if (!std::isfinite(intensity) || intensity < 0.0f || intensity > 1.0f) {
      throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                             std::format("intensity must be in [0, 1], got {}", intensity));
    }
    ValidateBuffer(input, "Enhance");
    preset      = &registry_->Get(preset_id);
    auto stages = ResolveStages(*preset, intensity);
    for (const auto& stage : stages) {
      if (stage.identity_) {
        continue;
      }
      prepared.push_back({stage.op_, OperatorFactory::Instance().Create(stage.op_, stage.params_)});
    }
    for (const auto& stage : overrides) {
      auto op = OperatorFactory::Instance().Create(stage.op_, WithDefaults(stage.op_, stage.params_));
      if (!op->IsIdentity()) {
        prepared.push_back({stage.op_, std::move(op)});
      }
    }
  } catch (const EnhanceException& e) {
    logger->warn("Rejected run of preset \"{}\": {}", preset_id, e.what());
    state.Fail(e.Code(), e.what());
    throw;
  }

  logger->info("Running preset \"{}\" at intensity {:.3f}: {} active stages on {}x{}x{}",
               preset_id, intensity, prepared.size(), input.Cols(), input.Rows(),
               input.Channels());
  state.BeginStages(prepared.size());

  PixelBuffer working = input.Clone();
  for (size_t i = 0; i < prepared.size(); ++i) {
    if (state.IsCancelRequested()) {
      state.Cancel();
      logger->info("Preset \"{}\" canceled before stage {}", preset_id, i);
      throw EnhanceException(EnhanceErrorCode::CANCELED,
                             std::format("preset {} canceled before stage {}", preset_id, i));
    }
    state.EnterStage(i);
    EASY_BLOCK("Stage");
    logger->debug("Stage {}/{}: {}", i + 1, prepared.size(), prepared[i].op_);
    try {
      prepared[i].operator_->Apply(working);
    } catch (const EnhanceException& e) {
      logger->warn("Stage {} ({}) of preset \"{}\" failed: {}", i, prepared[i].op_, preset_id,
                   e.what());
      state.Fail(e.Code(), e.what());
      throw;
    } catch (const cv::Exception& e) {
      EnhanceException failure(EnhanceErrorCode::DEGENERATE_INPUT,
                               std::format("stage {} ({}): {}", i, prepared[i].op_, e.what()));
      logger->warn("Stage {} ({}) of preset \"{}\" failed: {}", i, prepared[i].op_, preset_id,
                   e.what());
      state.Fail(failure.Code(), failure.what());
      throw failure;
    }
  }

  if (state.IsCancelRequested()) {
    state.Cancel();
    throw EnhanceException(EnhanceErrorCode::CANCELED,
                           std::format("preset {} canceled, result discarded", preset_id));
  }

  if (preset->subject_mask_.has_value()) {
    ComposeSubject(input, working, *preset->subject_mask_, intensity);
  }

  state.Transition(RunState::DONE);
  logger->info("Preset \"{}\" done", preset_id);
  return working;
}
};  // namespace astroslide
