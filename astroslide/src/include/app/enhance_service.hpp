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

#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "analysis/histogram_analyzer.hpp"
#include "config/engine_config.hpp"
#include "edit/pipeline/preset_engine.hpp"
#include "edit/pipeline/preview_generator.hpp"
#include "edit/preset/preset_definition.hpp"
#include "edit/preset/preset_registry.hpp"
#include "edit/star/star_reducer.hpp"
#include "image/pixel_buffer.hpp"
#include "renderer/render_scheduler.hpp"
#include "type/type.hpp"

namespace astroslide {
/**
 * @brief Entry point of the enhancement core. The synchronous calls run on the calling thread,
 * the Submit variants go through the bounded scheduler and return a ticket.
 *
 */
class EnhanceService {
 private:
  EngineConfig                          config_;
  std::shared_ptr<const PresetRegistry> registry_;
  PresetEngine                          engine_;
  PreviewGenerator                      preview_;
  StarReducer                           star_reducer_;

  // Scheduler, should be destroyed before the engine its tasks run on
  std::unique_ptr<RenderScheduler>      scheduler_;

  static auto MakeRegistry(const EngineConfig& config) -> std::shared_ptr<const PresetRegistry>;

 public:
  EnhanceService();
  explicit EnhanceService(const EngineConfig& config);
  ~EnhanceService() = default;

  EnhanceService(const EnhanceService&)            = delete;
  EnhanceService& operator=(const EnhanceService&) = delete;

  /**
   * @brief Run a preset at the given intensity
   *
   * @param buffer
   * @param preset_id
   * @param intensity in [0, 1]
   * @return PixelBuffer
   */
  auto Enhance(const PixelBuffer& buffer, const preset_id_t& preset_id, float intensity) const
      -> PixelBuffer;
  /**
   * @brief Run a preset followed by caller supplied stages, whose parameters are used verbatim
   *
   */
  auto EnhanceWithOverrides(const PixelBuffer& buffer, const preset_id_t& preset_id,
                            float intensity, const std::vector<StageDefinition>& overrides) const
      -> PixelBuffer;
  auto ComputeHistogram(const PixelBuffer& buffer) const -> HistogramResult;
  auto GeneratePreview(const PixelBuffer& buffer, const preset_id_t& preset_id,
                       int target_size) const -> PixelBuffer;
  auto GeneratePreview(const PixelBuffer& buffer, const preset_id_t& preset_id) const
      -> PixelBuffer;
  auto ReduceStars(const PixelBuffer& buffer, float amount) const -> PixelBuffer;
  auto ListPresets() const -> std::vector<PresetInfo>;

  auto SubmitEnhance(const PixelBuffer& buffer, const preset_id_t& preset_id, float intensity)
      -> RenderTicket<PixelBuffer>;
  auto SubmitEnhanceWithOverrides(const PixelBuffer& buffer, const preset_id_t& preset_id,
                                  float intensity, std::vector<StageDefinition> overrides)
      -> RenderTicket<PixelBuffer>;
  auto SubmitHistogram(const PixelBuffer& buffer) -> RenderTicket<HistogramResult>;
  auto SubmitPreview(const PixelBuffer& buffer, const preset_id_t& preset_id, int target_size)
      -> RenderTicket<PixelBuffer>;
  auto SubmitReduceStars(const PixelBuffer& buffer, float amount) -> RenderTicket<PixelBuffer>;

  auto GetConfig() const -> const EngineConfig& { return config_; }
  auto GetEngine() const -> const PresetEngine& { return engine_; }
  auto GetScheduler() -> RenderScheduler& { return *scheduler_; }
};
};  // namespace astroslide
