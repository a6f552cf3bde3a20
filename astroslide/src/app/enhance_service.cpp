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

#include "app/enhance_service.hpp"

#include <cmath>
#include <format>
#include <utility>

#include "type/enhance_error.hpp"
#include "utils/log/logger.hpp"

namespace astroslide {
namespace {
// Each task owns its own copy of the request buffer
auto Share(const PixelBuffer& buffer, const char* who) -> std::shared_ptr<const PixelBuffer> {
  ValidateBuffer(buffer, who);
  return std::make_shared<const PixelBuffer>(buffer.Clone());
}

// Scalar arguments are checked on the caller thread so a bad request never takes a queue slot
void CheckFraction(float value, const char* name, const char* who) {
  if (!std::isfinite(value) || value < 0.0f || value > 1.0f) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("{}: {} must be in [0, 1], got {}", who, name, value));
  }
}
}  // namespace

auto EnhanceService::MakeRegistry(const EngineConfig& config)
    -> std::shared_ptr<const PresetRegistry> {
  auto built_in = PresetRegistry::BuiltIn();
  if (config.presets_.has_value()) {
    return std::make_shared<const PresetRegistry>(built_in.Extend(*config.presets_));
  }
  return std::make_shared<const PresetRegistry>(std::move(built_in));
}

EnhanceService::EnhanceService() : EnhanceService(EngineConfig{}) {}

EnhanceService::EnhanceService(const EngineConfig& config)
    : config_(config),
      registry_(MakeRegistry(config)),
      engine_(registry_, config_),
      preview_(engine_),
      star_reducer_(config_.star_detection_),
      scheduler_(std::make_unique<RenderScheduler>(config_.scheduler_)) {
  log::SetLevel(config_.log_level_);
  log::GetLogger()->info("Enhancement service ready: {} presets, {} workers", registry_->Size(),
                         scheduler_->GetConfig().worker_count_);
}

auto EnhanceService::Enhance(const PixelBuffer& buffer, const preset_id_t& preset_id,
                             float intensity) const -> PixelBuffer {
  return engine_.Run(buffer, preset_id, intensity);
}

auto EnhanceService::EnhanceWithOverrides(const PixelBuffer& buffer, const preset_id_t& preset_id,
                                          float                               intensity,
                                          const std::vector<StageDefinition>& overrides) const
    -> PixelBuffer {
  return engine_.Run(buffer, preset_id, intensity, nullptr, overrides);
}

auto EnhanceService::ComputeHistogram(const PixelBuffer& buffer) const -> HistogramResult {
  return HistogramAnalyzer::Compute(buffer);
}

auto EnhanceService::GeneratePreview(const PixelBuffer& buffer, const preset_id_t& preset_id,
                                     int target_size) const -> PixelBuffer {
  return preview_.Generate(buffer, preset_id, target_size);
}

auto EnhanceService::GeneratePreview(const PixelBuffer& buffer, const preset_id_t& preset_id) const
    -> PixelBuffer {
  return preview_.Generate(buffer, preset_id, config_.preview_.target_size_);
}

auto EnhanceService::ReduceStars(const PixelBuffer& buffer, float amount) const -> PixelBuffer {
  return star_reducer_.ReduceStars(buffer, amount);
}

auto EnhanceService::ListPresets() const -> std::vector<PresetInfo> { return registry_->List(); }

auto EnhanceService::SubmitEnhance(const PixelBuffer& buffer, const preset_id_t& preset_id,
                                   float intensity) -> RenderTicket<PixelBuffer> {
  return SubmitEnhanceWithOverrides(buffer, preset_id, intensity, {});
}

auto EnhanceService::SubmitEnhanceWithOverrides(const PixelBuffer& buffer,
                                                const preset_id_t& preset_id, float intensity,
                                                std::vector<StageDefinition> overrides)
    -> RenderTicket<PixelBuffer> {
  CheckFraction(intensity, "intensity", "SubmitEnhance");
  auto input = Share(buffer, "SubmitEnhance");
  // Unknown presets are rejected before the task is queued
  registry_->Get(preset_id);
  return scheduler_->Submit<PixelBuffer>(
      input->PixelCount(), [this, input, preset_id, intensity,
                            overrides = std::move(overrides)](PipelineRun& run) {
        return engine_.Run(*input, preset_id, intensity, &run, overrides);
      });
}

auto EnhanceService::SubmitHistogram(const PixelBuffer& buffer) -> RenderTicket<HistogramResult> {
  auto input = Share(buffer, "SubmitHistogram");
  return scheduler_->Submit<HistogramResult>(
      input->PixelCount(),
      [input](PipelineRun&) { return HistogramAnalyzer::Compute(*input); });
}

auto EnhanceService::SubmitPreview(const PixelBuffer& buffer, const preset_id_t& preset_id,
                                   int target_size) -> RenderTicket<PixelBuffer> {
  if (target_size <= 0) {
    throw EnhanceException(
        EnhanceErrorCode::INVALID_PARAMETER,
        std::format("SubmitPreview: target size must be positive, got {}", target_size));
  }
  auto input = Share(buffer, "SubmitPreview");
  registry_->Get(preset_id);
  return scheduler_->Submit<PixelBuffer>(
      input->PixelCount(), [this, input, preset_id, target_size](PipelineRun& run) {
        return preview_.Generate(*input, preset_id, target_size, &run);
      });
}

auto EnhanceService::SubmitReduceStars(const PixelBuffer& buffer, float amount)
    -> RenderTicket<PixelBuffer> {
  CheckFraction(amount, "amount", "SubmitReduceStars");
  auto input = Share(buffer, "SubmitReduceStars");
  return scheduler_->Submit<PixelBuffer>(
      input->PixelCount(),
      [this, input, amount](PipelineRun&) { return star_reducer_.ReduceStars(*input, amount); });
}
};  // namespace astroslide
